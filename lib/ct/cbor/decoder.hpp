/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_DECODER_HPP
#define CTAP_TURBO_CBOR_DECODER_HPP

#include <ct/cbor/value.hpp>

namespace ctap_turbo::cbor {
    struct decode_options {
        // containers and tags nested deeper than this are rejected as malformed
        size_t max_depth = default_max_depth;
    };

    // decodes exactly one data item that must span the whole of data
    extern value decode(buffer data, const decode_options &opts={});
    // decodes one data item starting at offset and moves offset past it
    extern value decode_item(buffer data, size_t &offset, const decode_options &opts={});
}

#endif // !CTAP_TURBO_CBOR_DECODER_HPP
