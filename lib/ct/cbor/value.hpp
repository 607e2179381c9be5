/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_CBOR_VALUE_HPP
#define CTAP_TURBO_CBOR_VALUE_HPP

#include <bit>
#include <memory>
#include <source_location>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <ct/big-int.hpp>
#include <ct/common/bytes.hpp>
#include <ct/cbor/types.hpp>

namespace ctap_turbo::cbor {
    // wide enough for both [-2^64, -1] and [0, 2^64-1]
    using int_type = int128_t;

    // the declaration order is the rank used by the canonical key ordering
    enum class item_type: uint8_t {
        integer,
        bytes,
        text,
        array,
        map,
        tag,
        simple,
        floating
    };

    enum class float_width: uint8_t {
        f16,
        f32,
        f64
    };

    // IEEE 754 binary16 to binary64, see RFC 8949 Appendix D
    extern double half_to_double(uint16_t bits);

    // the stored bits are the value: +0.0 and -0.0 differ and NaN payloads are kept
    struct float_item {
        float_width width = float_width::f64;
        uint64_t bits = 0;

        static float_item from_half(const uint16_t bits) noexcept
        {
            return { float_width::f16, bits };
        }

        static float_item from_float(const float v) noexcept
        {
            return { float_width::f32, std::bit_cast<uint32_t>(v) };
        }

        static float_item from_double(const double v) noexcept
        {
            return { float_width::f64, std::bit_cast<uint64_t>(v) };
        }

        double to_double() const;

        bool operator==(const float_item &o) const noexcept =default;
    };

    struct simple_item {
        uint8_t code = static_cast<uint8_t>(special_val::s_null);

        bool operator==(const simple_item &o) const noexcept =default;
    };

    struct value;
    using array_type = std::vector<value>;
    using map_item = std::pair<value, value>;
    using map_type = std::vector<map_item>;

    struct tag_item {
        uint64_t number = 0;
        std::unique_ptr<value> content {};

        bool operator==(const tag_item &o) const;
    };

    // throws unassigned for 0..19 and reserved_simple_value for 24..31
    extern simple_item check_simple(uint8_t code);

    struct value {
        using content_type = std::variant<int_type, uint8_vector, std::string, array_type, map_type, tag_item, simple_item, float_item>;

        static const int_type &min_int();
        static const int_type &max_int();

        static value from_int(const int_type &v);
        static value from_bytes(buffer bytes);
        static value from_text(std::string_view text);
        static value from_array(array_type &&items);
        static value from_map(map_type &&items);
        static value from_tag(uint64_t number, value &&content);
        // tag 2 over the big-endian magnitude
        static value from_unsigned_bignum(buffer magnitude);
        // tag 3 over the big-endian n of the value -1 - n
        static value from_signed_bignum(buffer magnitude);
        static value from_simple(uint8_t code);
        static value from_bool(bool v);
        static value null();
        static value undefined();
        static value from_float16(uint16_t bits);
        static value from_float32(float v);
        static value from_float64(double v);
        static value from_float(const float_item &f);

        template<typename... Args>
        static value make_array(Args&&... items)
        {
            array_type arr {};
            arr.reserve(sizeof...(items));
            (arr.emplace_back(std::forward<Args>(items)), ...);
            return from_array(std::move(arr));
        }

        value(): _content { simple_item {} }
        {
        }

        value(value &&) =default;
        value(const value &) =delete;
        value &operator=(value &&) =default;
        value &operator=(const value &) =delete;

        item_type type() const noexcept
        {
            return static_cast<item_type>(_content.index());
        }

        bool is_int() const noexcept { return type() == item_type::integer; }
        bool is_bytes() const noexcept { return type() == item_type::bytes; }
        bool is_text() const noexcept { return type() == item_type::text; }
        bool is_array() const noexcept { return type() == item_type::array; }
        bool is_map() const noexcept { return type() == item_type::map; }
        bool is_tag() const noexcept { return type() == item_type::tag; }
        bool is_simple() const noexcept { return type() == item_type::simple; }
        bool is_float() const noexcept { return type() == item_type::floating; }
        bool is_bool() const noexcept;
        bool is_null() const noexcept;
        bool is_undefined() const noexcept;
        // tag 2 over a byte string
        bool is_unsigned_bignum() const noexcept;
        // tag 3 over a byte string
        bool is_signed_bignum() const noexcept;

        const int_type &integer(const std::source_location &loc=std::source_location::current()) const;
        const uint8_vector &bytes(const std::source_location &loc=std::source_location::current()) const;
        const std::string &text(const std::source_location &loc=std::source_location::current()) const;
        const array_type &array(const std::source_location &loc=std::source_location::current()) const;
        array_type &array(const std::source_location &loc=std::source_location::current());
        const map_type &map(const std::source_location &loc=std::source_location::current()) const;
        map_type &map(const std::source_location &loc=std::source_location::current());
        const tag_item &tag(const std::source_location &loc=std::source_location::current()) const;
        uint8_t simple(const std::source_location &loc=std::source_location::current()) const;
        bool boolean(const std::source_location &loc=std::source_location::current()) const;
        const float_item &floating(const std::source_location &loc=std::source_location::current()) const;
        // ints and bignum tags
        cpp_int big_int(const std::source_location &loc=std::source_location::current()) const;

        // nullptr when not an array or when the index is out of bounds
        const value *get(size_t idx) const noexcept;
        value *get(size_t idx) noexcept;
        // the first pair whose key equals key, nullptr when not a map or not found
        const value *get_value(const value &key) const noexcept;
        value *get_value(const value &key) noexcept;
        const value *get_value_by_string(std::string_view key) const noexcept;
        value *get_value_by_string(std::string_view key) noexcept;

        bool operator==(const value &o) const
        {
            return _content == o._content;
        }

        const content_type &content() const noexcept
        {
            return _content;
        }

        std::string stringify() const;
    private:
        content_type _content;

        explicit value(content_type &&content): _content { std::move(content) }
        {
        }

        template<typename T>
        const T &_get(item_type exp_type, const std::source_location &loc) const;
    };

    // the canonical (CTAP2) key ordering, a strict weak order
    extern bool canonical_less(const value &a, const value &b);

    inline bool canonical_less_item(const map_item &a, const map_item &b)
    {
        return canonical_less(a.first, b.first);
    }

    // sorts map pairs at every nesting level with a stable sort
    extern void canonicalize(value &v);
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::item_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::item_type;
            switch (v) {
                case item_type::integer: return fmt::format_to(ctx.out(), "int");
                case item_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case item_type::text: return fmt::format_to(ctx.out(), "text");
                case item_type::array: return fmt::format_to(ctx.out(), "array");
                case item_type::map: return fmt::format_to(ctx.out(), "map");
                case item_type::tag: return fmt::format_to(ctx.out(), "tag");
                case item_type::simple: return fmt::format_to(ctx.out(), "simple");
                case item_type::floating: return fmt::format_to(ctx.out(), "float");
                default: return fmt::format_to(ctx.out(), "item_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<ctap_turbo::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.stringify());
        }
    };
}

#endif // !CTAP_TURBO_CBOR_VALUE_HPP
