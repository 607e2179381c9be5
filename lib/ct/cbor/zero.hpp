/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * A zero-copy view over CBOR data. The data is validated once when the root view is created,
 * after that every accessor re-derives the type from the item's head and iterators walk the
 * nested items in place. Views borrow the underlying bytes: the bytes must outlive every view
 * and iterator derived from them and must not change while those are in use.
 */
#ifndef CTAP_TURBO_CBOR_ZERO_HPP
#define CTAP_TURBO_CBOR_ZERO_HPP

#include <limits>
#include <optional>
#include <utility>
#include <ct/cbor/head.hpp>
#include <ct/cbor/validator.hpp>
#include <ct/cbor/value.hpp>

namespace ctap_turbo::cbor::zero {
    // the data has been validated, so nesting is already bounded
    static constexpr size_t validated_depth = std::numeric_limits<size_t>::max();

    struct value;

    struct array_iterator {
        explicit array_iterator(buffer items, uint64_t size);

        array_iterator &skip(size_t num_items);

        value next();

        bool done() const noexcept
        {
            return _pos >= _size;
        }

        uint64_t size() const noexcept
        {
            return _size;
        }
    private:
        buffer _items;
        size_t _offset = 0;
        uint64_t _pos = 0;
        uint64_t _size;
    };

    struct map_iterator {
        explicit map_iterator(buffer items, uint64_t size);

        map_iterator &skip(size_t num_items);

        std::pair<value, value> next();

        bool done() const noexcept
        {
            return _pos >= _size;
        }

        uint64_t size() const noexcept
        {
            return _size;
        }
    private:
        buffer _items;
        size_t _offset = 0;
        uint64_t _pos = 0;
        uint64_t _size;
    };

    struct value {
        using tag_item = std::pair<uint64_t, value>;

        // throws malformed unless data holds exactly one well-formed data item
        explicit value(const buffer data, const size_t max_depth=default_max_depth)
        {
            size_t offset = 0;
            if (!validate(data, offset, true, max_depth)) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("not a well-formed CBOR data item: {}", data));
            _init(data);
        }

        major_type type() const noexcept
        {
            return _head.type;
        }

        std::optional<int_type> integer() const
        {
            switch (_head.type) {
                case major_type::uint: return int_type { _head.arg };
                case major_type::nint: return int_type { -1 } - _head.arg;
                default: return {};
            }
        }

        std::optional<buffer> bytes() const noexcept
        {
            if (_head.type == major_type::bytes)
                return _raw.subbuf(_head.size);
            return {};
        }

        std::optional<std::string_view> text() const noexcept
        {
            if (_head.type == major_type::text)
                return _raw.subbuf(_head.size).string_view();
            return {};
        }

        std::optional<array_iterator> array() const
        {
            if (_head.type == major_type::array)
                return array_iterator { _raw.subbuf(_head.size), _head.arg };
            return {};
        }

        std::optional<map_iterator> map() const
        {
            if (_head.type == major_type::map)
                return map_iterator { _raw.subbuf(_head.size), _head.arg };
            return {};
        }

        std::optional<tag_item> tagged() const;

        // only for actual simple values, not for floats
        std::optional<uint8_t> simple() const noexcept
        {
            if (_head.type != major_type::simple)
                return {};
            if (_head.ai <= static_cast<uint8_t>(special_val::s_undefined) || _head.ai == static_cast<uint8_t>(special_val::one_byte))
                return static_cast<uint8_t>(_head.arg);
            return {};
        }

        std::optional<bool> boolean() const noexcept
        {
            if (const auto s = simple(); s) {
                if (*s == static_cast<uint8_t>(special_val::s_false))
                    return false;
                if (*s == static_cast<uint8_t>(special_val::s_true))
                    return true;
            }
            return {};
        }

        bool is_null() const noexcept
        {
            return simple() == static_cast<uint8_t>(special_val::s_null);
        }

        bool is_undefined() const noexcept
        {
            return simple() == static_cast<uint8_t>(special_val::s_undefined);
        }

        std::optional<float_item> floating() const noexcept
        {
            if (_head.type != major_type::simple)
                return {};
            switch (_head.ai) {
                case static_cast<uint8_t>(special_val::two_bytes): return float_item { float_width::f16, _head.arg };
                case static_cast<uint8_t>(special_val::four_bytes): return float_item { float_width::f32, _head.arg };
                case static_cast<uint8_t>(special_val::eight_bytes): return float_item { float_width::f64, _head.arg };
                default: return {};
            }
        }

        // the number of items of an array or pairs of a map
        std::optional<uint64_t> size() const noexcept
        {
            if (_head.type == major_type::array || _head.type == major_type::map)
                return _head.arg;
            return {};
        }

        std::optional<value> at(size_t idx) const;
        // the value of the first pair with a text key equal to key
        std::optional<value> get(std::string_view key) const;

        buffer raw_span() const noexcept
        {
            return _raw;
        }

        // an owned copy of the data item
        cbor::value to_value() const;

        bool operator==(const value &o) const noexcept
        {
            return _raw == o._raw;
        }

        std::string stringify() const;
    private:
        friend array_iterator;
        friend map_iterator;

        buffer _raw;
        head _head {};

        struct validated_t {};

        explicit value(validated_t, const buffer data)
        {
            _init(data);
        }

        void _init(const buffer data)
        {
            if (read_head(data, _head) != head_status::ok) [[unlikely]]
                throw error(error_kind::malformed, "a data item with an invalid head");
            _raw = data;
        }

        static value _next(const buffer items, size_t &offset)
        {
            const auto item = cbor::skip(items, offset, validated_depth);
            if (!item) [[unlikely]]
                throw error(error_kind::malformed, fmt::format("a malformed data item at offset {}", offset));
            return value { validated_t {}, *item };
        }
    };

    inline array_iterator::array_iterator(const buffer items, const uint64_t size):
        _items { items }, _size { size }
    {
    }

    inline value array_iterator::next()
    {
        if (_pos < _size) [[likely]] {
            ++_pos;
            return value::_next(_items, _offset);
        }
        throw ctap_turbo::error("iteration past the end of the array!");
    }

    inline array_iterator &array_iterator::skip(const size_t num_items)
    {
        for (size_t i = 0; i < num_items; ++i)
            next();
        return *this;
    }

    inline map_iterator::map_iterator(const buffer items, const uint64_t size):
        _items { items }, _size { size }
    {
    }

    inline std::pair<value, value> map_iterator::next()
    {
        if (_pos < _size) [[likely]] {
            ++_pos;
            auto key = value::_next(_items, _offset);
            auto val = value::_next(_items, _offset);
            return { std::move(key), std::move(val) };
        }
        throw ctap_turbo::error("iteration past the end of the map!");
    }

    inline map_iterator &map_iterator::skip(const size_t num_items)
    {
        for (size_t i = 0; i < num_items; ++i)
            next();
        return *this;
    }

    inline std::optional<value::tag_item> value::tagged() const
    {
        if (_head.type != major_type::tag)
            return {};
        size_t offset = 0;
        return tag_item { _head.arg, _next(_raw.subbuf(_head.size), offset) };
    }

    inline std::optional<value> value::at(const size_t idx) const
    {
        auto it = array();
        if (!it || idx >= it->size())
            return {};
        return it->skip(idx).next();
    }

    inline std::optional<value> value::get(const std::string_view key) const
    {
        auto it = map();
        if (!it)
            return {};
        while (!it->done()) {
            auto [k, v] = it->next();
            if (k.text() == key)
                return v;
        }
        return {};
    }

    inline value parse(const buffer data)
    {
        return value { data };
    }
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::zero::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.stringify());
        }
    };
}

#endif // !CTAP_TURBO_CBOR_ZERO_HPP
