/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_JSON_HPP
#define CTAP_TURBO_CBOR_JSON_HPP

#include <ct/json.hpp>
#include <ct/cbor/value.hpp>

namespace ctap_turbo::cbor {
    /*
     * A lossy JSON projection following RFC 8949 section 6.1:
     * byte strings and bignums become unpadded base64url strings (signed bignums prefixed with '~'),
     * integers outside of the 64-bit range become decimal strings,
     * non-finite floats and simple values other than booleans become null,
     * maps become objects keyed by a text key or by the JSON serialization of any other key,
     * other tags project their content. With duplicate keys the first pair wins.
     */
    extern json::value to_json(const value &v);
}

#endif // !CTAP_TURBO_CBOR_JSON_HPP
