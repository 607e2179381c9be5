/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_TYPES_HPP
#define CTAP_TURBO_CBOR_TYPES_HPP

#include <cstdint>
#include <span>
#include <string_view>
#include <ct/common/error.hpp>
#include <ct/common/format.hpp>

namespace ctap_turbo::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    // the first simple code that requires the two-byte form
    static constexpr uint8_t min_extended_simple = 32;
    static constexpr size_t default_max_depth = 256;

    enum class error_kind: uint8_t {
        reserved_additional_information,
        malformed,
        indefinite_length,
        unassigned,
        reserved_simple_value,
        out_of_memory,
        empty_stack,
        invalid_container_type,
        invalid_pair_count,
        malformed_cbor,
        invalid_state
    };
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::error_kind;
            switch (v) {
                case error_kind::reserved_additional_information: return fmt::format_to(ctx.out(), "reserved_additional_information");
                case error_kind::malformed: return fmt::format_to(ctx.out(), "malformed");
                case error_kind::indefinite_length: return fmt::format_to(ctx.out(), "indefinite_length");
                case error_kind::unassigned: return fmt::format_to(ctx.out(), "unassigned");
                case error_kind::reserved_simple_value: return fmt::format_to(ctx.out(), "reserved_simple_value");
                case error_kind::out_of_memory: return fmt::format_to(ctx.out(), "out_of_memory");
                case error_kind::empty_stack: return fmt::format_to(ctx.out(), "empty_stack");
                case error_kind::invalid_container_type: return fmt::format_to(ctx.out(), "invalid_container_type");
                case error_kind::invalid_pair_count: return fmt::format_to(ctx.out(), "invalid_pair_count");
                case error_kind::malformed_cbor: return fmt::format_to(ctx.out(), "malformed_cbor");
                case error_kind::invalid_state: return fmt::format_to(ctx.out(), "invalid_state");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace ctap_turbo::cbor {
    struct error: ctap_turbo::error {
        explicit error(const error_kind kind):
            error(kind, fmt::format("cbor error: {}", kind))
        {
        }

        explicit error(const error_kind kind, const std::string_view msg):
            ctap_turbo::error(msg), _kind { kind }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };

    inline bool is_ascii(const std::span<const uint8_t> b)
    {
        for (const uint8_t *p = b.data(), *end = p + b.size(); p < end; ++p) {
            if (*p < 32 || *p > 126) [[unlikely]]
                return false;
        }
        return true;
    }
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CTAP_TURBO_CBOR_TYPES_HPP
