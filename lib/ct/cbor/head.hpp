/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_HEAD_HPP
#define CTAP_TURBO_CBOR_HEAD_HPP

#include <limits>
#include <ct/common/bytes.hpp>
#include <ct/cbor/types.hpp>

namespace ctap_turbo::cbor {
    enum class head_status: uint8_t {
        ok,
        truncated,
        reserved_ai,
        indefinite
    };

    /*
     * The initial byte of a data item together with its argument.
     * For major type 7 with ai 25..27 the argument holds the raw bits of a float.
     */
    struct head {
        major_type type = major_type::uint;
        uint8_t ai = 0;
        uint8_t size = 0;
        uint64_t arg = 0;
    };

    // the number of bytes following the initial byte in the shortest encoding of val
    inline size_t argument_size(const uint64_t val) noexcept
    {
        if (val < 24)
            return 0;
        if (val <= std::numeric_limits<uint8_t>::max())
            return 1;
        if (val <= std::numeric_limits<uint16_t>::max())
            return 2;
        if (val <= std::numeric_limits<uint32_t>::max())
            return 4;
        return 8;
    }

    inline uint8_t initial_byte(const major_type typ, const uint8_t ai) noexcept
    {
        return (static_cast<uint8_t>(typ) << 5) | (ai & 0x1F);
    }

    inline void write_head(uint8_vector &out, const major_type typ, const uint64_t val)
    {
        switch (argument_size(val)) {
            case 0:
                out << initial_byte(typ, static_cast<uint8_t>(val));
                break;
            case 1:
                out << initial_byte(typ, static_cast<uint8_t>(special_val::one_byte));
                out << static_cast<uint8_t>(val);
                break;
            case 2:
                out << initial_byte(typ, static_cast<uint8_t>(special_val::two_bytes));
                out << buffer::from(host_to_net(static_cast<uint16_t>(val)));
                break;
            case 4:
                out << initial_byte(typ, static_cast<uint8_t>(special_val::four_bytes));
                out << buffer::from(host_to_net(static_cast<uint32_t>(val)));
                break;
            default:
                out << initial_byte(typ, static_cast<uint8_t>(special_val::eight_bytes));
                out << buffer::from(host_to_net(val));
                break;
        }
    }

    // floats keep their width regardless of the value
    inline void write_float_head(uint8_vector &out, const special_val width, const uint64_t bits)
    {
        out << initial_byte(major_type::simple, static_cast<uint8_t>(width));
        switch (width) {
            case special_val::two_bytes:
                out << buffer::from(host_to_net(static_cast<uint16_t>(bits)));
                break;
            case special_val::four_bytes:
                out << buffer::from(host_to_net(static_cast<uint32_t>(bits)));
                break;
            case special_val::eight_bytes:
                out << buffer::from(host_to_net(bits));
                break;
            default:
                throw ctap_turbo::error(fmt::format("unsupported float width: {}", static_cast<int>(width)));
        }
    }

    inline head_status read_head(const buffer data, head &h) noexcept
    {
        if (data.empty()) [[unlikely]]
            return head_status::truncated;
        h.type = static_cast<major_type>(data[0] >> 5);
        h.ai = data[0] & 0x1F;
        if (h.ai < 24) [[likely]] {
            h.arg = h.ai;
            h.size = 1;
            return head_status::ok;
        }
        if (h.ai > 27) [[unlikely]]
            return h.ai == 31 ? head_status::indefinite : head_status::reserved_ai;
        const size_t num_bytes = size_t { 1 } << (h.ai - 24);
        if (data.size() < 1 + num_bytes) [[unlikely]]
            return head_status::truncated;
        h.arg = 0;
        for (size_t i = 1; i <= num_bytes; ++i)
            h.arg = (h.arg << 8) | data[i];
        h.size = static_cast<uint8_t>(1 + num_bytes);
        return head_status::ok;
    }
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::head_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::head_status;
            switch (v) {
                case head_status::ok: return fmt::format_to(ctx.out(), "ok");
                case head_status::truncated: return fmt::format_to(ctx.out(), "truncated");
                case head_status::reserved_ai: return fmt::format_to(ctx.out(), "reserved_ai");
                case head_status::indefinite: return fmt::format_to(ctx.out(), "indefinite");
                default: return fmt::format_to(ctx.out(), "head_status: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CTAP_TURBO_CBOR_HEAD_HPP
