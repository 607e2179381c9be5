/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_VALIDATOR_HPP
#define CTAP_TURBO_CBOR_VALIDATOR_HPP

#include <optional>
#include <ct/common/bytes.hpp>
#include <ct/cbor/types.hpp>

namespace ctap_turbo::cbor {
    /*
     * Checks that a well-formed data item starts at offset and moves offset past it.
     * With exact set, the item must also end exactly at the end of data.
     * Never allocates. On failure offset is left unchanged.
     */
    extern bool validate(buffer data, size_t &offset, bool exact, size_t max_depth=default_max_depth) noexcept;

    inline bool validate(const buffer data, const size_t max_depth=default_max_depth) noexcept
    {
        size_t offset = 0;
        return validate(data, offset, true, max_depth);
    }

    // the bytes of the well-formed data item at offset; offset is moved past it
    extern std::optional<buffer> skip(buffer data, size_t &offset, size_t max_depth=default_max_depth) noexcept;
}

#endif // !CTAP_TURBO_CBOR_VALIDATOR_HPP
