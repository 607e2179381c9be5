/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/cbor/head.hpp>
#include <ct/cbor/validator.hpp>

namespace ctap_turbo::cbor {
    static bool skip_item(const buffer data, size_t &pos, const size_t depth, const size_t max_depth) noexcept
    {
        if (depth > max_depth) [[unlikely]]
            return false;
        head h {};
        if (read_head(buffer { data.data() + pos, data.size() - pos }, h) != head_status::ok) [[unlikely]]
            return false;
        pos += h.size;
        const auto remaining = data.size() - pos;
        switch (h.type) {
            case major_type::uint:
            case major_type::nint:
                return true;
            case major_type::bytes:
            case major_type::text:
                if (h.arg > remaining) [[unlikely]]
                    return false;
                pos += h.arg;
                return true;
            case major_type::array:
                if (h.arg > remaining) [[unlikely]]
                    return false;
                for (uint64_t i = 0; i < h.arg; ++i) {
                    if (!skip_item(data, pos, depth + 1, max_depth))
                        return false;
                }
                return true;
            case major_type::map:
                if (h.arg > remaining / 2) [[unlikely]]
                    return false;
                for (uint64_t i = 0; i < h.arg * 2; ++i) {
                    if (!skip_item(data, pos, depth + 1, max_depth))
                        return false;
                }
                return true;
            case major_type::tag:
                return skip_item(data, pos, depth + 1, max_depth);
            case major_type::simple:
                // 0..19 are unassigned and the two-byte form is valid only for 32..255
                if (h.ai < static_cast<uint8_t>(special_val::s_false)) [[unlikely]]
                    return false;
                if (h.ai == static_cast<uint8_t>(special_val::one_byte) && h.arg < min_extended_simple) [[unlikely]]
                    return false;
                return true;
            default:
                return false;
        }
    }

    bool validate(const buffer data, size_t &offset, const bool exact, const size_t max_depth) noexcept
    {
        if (offset > data.size()) [[unlikely]]
            return false;
        size_t pos = offset;
        if (!skip_item(data, pos, 0, max_depth))
            return false;
        if (exact && pos != data.size())
            return false;
        offset = pos;
        return true;
    }

    std::optional<buffer> skip(const buffer data, size_t &offset, const size_t max_depth) noexcept
    {
        const auto start = offset;
        if (!validate(data, offset, false, max_depth))
            return {};
        return buffer { data.data() + start, offset - start };
    }
}
