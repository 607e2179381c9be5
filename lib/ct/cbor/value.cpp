/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <ct/cbor/value.hpp>

namespace ctap_turbo::cbor {
    double half_to_double(const uint16_t bits)
    {
        const int exp = (bits >> 10) & 0x1F;
        const int mant = bits & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else
            val = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
        return bits & 0x8000 ? -val : val;
    }

    double float_item::to_double() const
    {
        switch (width) {
            case float_width::f16: return half_to_double(static_cast<uint16_t>(bits));
            case float_width::f32: return std::bit_cast<float>(static_cast<uint32_t>(bits));
            case float_width::f64: return std::bit_cast<double>(bits);
            default: throw ctap_turbo::error(fmt::format("unsupported float width: {}", static_cast<int>(width)));
        }
    }

    bool tag_item::operator==(const tag_item &o) const
    {
        if (number != o.number)
            return false;
        if (!content || !o.content)
            return content == o.content;
        return *content == *o.content;
    }

    simple_item check_simple(const uint8_t code)
    {
        if (code < static_cast<uint8_t>(special_val::s_false)) [[unlikely]]
            throw error(error_kind::unassigned, fmt::format("simple value {} is unassigned", code));
        if (code > static_cast<uint8_t>(special_val::s_undefined) && code < min_extended_simple) [[unlikely]]
            throw error(error_kind::reserved_simple_value, fmt::format("simple value {} is reserved", code));
        return simple_item { code };
    }

    const int_type &value::min_int()
    {
        static const int_type min_val = int_type { -1 } - std::numeric_limits<uint64_t>::max();
        return min_val;
    }

    const int_type &value::max_int()
    {
        static const int_type max_val { std::numeric_limits<uint64_t>::max() };
        return max_val;
    }

    value value::from_int(const int_type &v)
    {
        if (v < min_int() || v > max_int()) [[unlikely]]
            throw ctap_turbo::error(fmt::format("integer {} is outside of the range representable in CBOR", v));
        return value { content_type { std::in_place_index<0>, v } };
    }

    value value::from_bytes(const buffer bytes)
    {
        return value { content_type { std::in_place_index<1>, uint8_vector { bytes } } };
    }

    value value::from_text(const std::string_view text)
    {
        return value { content_type { std::in_place_index<2>, text } };
    }

    value value::from_array(array_type &&items)
    {
        return value { content_type { std::in_place_index<3>, std::move(items) } };
    }

    value value::from_map(map_type &&items)
    {
        return value { content_type { std::in_place_index<4>, std::move(items) } };
    }

    value value::from_tag(const uint64_t number, value &&content)
    {
        return value { content_type { std::in_place_index<5>, tag_item { number, std::make_unique<value>(std::move(content)) } } };
    }

    value value::from_unsigned_bignum(const buffer magnitude)
    {
        return from_tag(2, from_bytes(magnitude));
    }

    value value::from_signed_bignum(const buffer magnitude)
    {
        return from_tag(3, from_bytes(magnitude));
    }

    value value::from_simple(const uint8_t code)
    {
        return value { content_type { std::in_place_index<6>, check_simple(code) } };
    }

    value value::from_bool(const bool v)
    {
        return from_simple(static_cast<uint8_t>(v ? special_val::s_true : special_val::s_false));
    }

    value value::null()
    {
        return from_simple(static_cast<uint8_t>(special_val::s_null));
    }

    value value::undefined()
    {
        return from_simple(static_cast<uint8_t>(special_val::s_undefined));
    }

    value value::from_float16(const uint16_t bits)
    {
        return value { content_type { std::in_place_index<7>, float_item::from_half(bits) } };
    }

    value value::from_float32(const float v)
    {
        return value { content_type { std::in_place_index<7>, float_item::from_float(v) } };
    }

    value value::from_float64(const double v)
    {
        return value { content_type { std::in_place_index<7>, float_item::from_double(v) } };
    }

    value value::from_float(const float_item &f)
    {
        return value { content_type { std::in_place_index<7>, f } };
    }

    bool value::is_bool() const noexcept
    {
        if (const auto *s = std::get_if<simple_item>(&_content); s)
            return s->code == static_cast<uint8_t>(special_val::s_false) || s->code == static_cast<uint8_t>(special_val::s_true);
        return false;
    }

    bool value::is_null() const noexcept
    {
        const auto *s = std::get_if<simple_item>(&_content);
        return s && s->code == static_cast<uint8_t>(special_val::s_null);
    }

    bool value::is_undefined() const noexcept
    {
        const auto *s = std::get_if<simple_item>(&_content);
        return s && s->code == static_cast<uint8_t>(special_val::s_undefined);
    }

    bool value::is_unsigned_bignum() const noexcept
    {
        const auto *t = std::get_if<tag_item>(&_content);
        return t && t->number == 2 && t->content && t->content->is_bytes();
    }

    bool value::is_signed_bignum() const noexcept
    {
        const auto *t = std::get_if<tag_item>(&_content);
        return t && t->number == 3 && t->content && t->content->is_bytes();
    }

    template<typename T>
    const T &value::_get(const item_type exp_type, const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<T>(&_content); v) [[likely]]
            return *v;
        throw ctap_turbo::error(fmt::format("invalid cbor value access, expecting type {} while the present value is {} at {}",
            exp_type, type(), loc));
    }

    const int_type &value::integer(const std::source_location &loc) const
    {
        return _get<int_type>(item_type::integer, loc);
    }

    const uint8_vector &value::bytes(const std::source_location &loc) const
    {
        return _get<uint8_vector>(item_type::bytes, loc);
    }

    const std::string &value::text(const std::source_location &loc) const
    {
        return _get<std::string>(item_type::text, loc);
    }

    const array_type &value::array(const std::source_location &loc) const
    {
        return _get<array_type>(item_type::array, loc);
    }

    array_type &value::array(const std::source_location &loc)
    {
        return const_cast<array_type &>(_get<array_type>(item_type::array, loc));
    }

    const map_type &value::map(const std::source_location &loc) const
    {
        return _get<map_type>(item_type::map, loc);
    }

    map_type &value::map(const std::source_location &loc)
    {
        return const_cast<map_type &>(_get<map_type>(item_type::map, loc));
    }

    const tag_item &value::tag(const std::source_location &loc) const
    {
        return _get<tag_item>(item_type::tag, loc);
    }

    uint8_t value::simple(const std::source_location &loc) const
    {
        return _get<simple_item>(item_type::simple, loc).code;
    }

    bool value::boolean(const std::source_location &loc) const
    {
        if (is_bool()) [[likely]]
            return simple(loc) == static_cast<uint8_t>(special_val::s_true);
        throw ctap_turbo::error(fmt::format("expected a boolean but got {} at {}", stringify(), loc));
    }

    const float_item &value::floating(const std::source_location &loc) const
    {
        return _get<float_item>(item_type::floating, loc);
    }

    cpp_int value::big_int(const std::source_location &loc) const
    {
        if (const auto *i = std::get_if<int_type>(&_content); i)
            return cpp_int { *i };
        if (is_unsigned_bignum())
            return big_int_from_bytes(tag(loc).content->bytes(loc));
        if (is_signed_bignum())
            return cpp_int { -1 } - big_int_from_bytes(tag(loc).content->bytes(loc));
        throw ctap_turbo::error(fmt::format("cannot interpret cbor value as a bigint: {} at {}", stringify(), loc));
    }

    const value *value::get(const size_t idx) const noexcept
    {
        if (const auto *arr = std::get_if<array_type>(&_content); arr && idx < arr->size())
            return &(*arr)[idx];
        return nullptr;
    }

    value *value::get(const size_t idx) noexcept
    {
        return const_cast<value *>(std::as_const(*this).get(idx));
    }

    const value *value::get_value(const value &key) const noexcept
    {
        if (const auto *m = std::get_if<map_type>(&_content); m) {
            for (const auto &[k, v]: *m) {
                if (k == key)
                    return &v;
            }
        }
        return nullptr;
    }

    value *value::get_value(const value &key) noexcept
    {
        return const_cast<value *>(std::as_const(*this).get_value(key));
    }

    const value *value::get_value_by_string(const std::string_view key) const noexcept
    {
        if (const auto *m = std::get_if<map_type>(&_content); m) {
            for (const auto &[k, v]: *m) {
                if (const auto *t = std::get_if<std::string>(&k._content); t && *t == key)
                    return &v;
            }
        }
        return nullptr;
    }

    value *value::get_value_by_string(const std::string_view key) noexcept
    {
        return const_cast<value *>(std::as_const(*this).get_value_by_string(key));
    }

    static std::strong_ordering compare_strings(const buffer a, const buffer b)
    {
        if (a.size() != b.size())
            return a.size() <=> b.size();
        return a <=> b;
    }

    static bool float_less(const float_item &a, const float_item &b)
    {
        // wider floats come first
        if (a.width != b.width)
            return a.width > b.width;
        const auto x = a.to_double();
        const auto y = b.to_double();
        // NaNs form a single class that follows all numbers of the same width
        if (std::isnan(x))
            return false;
        if (std::isnan(y))
            return true;
        return x < y;
    }

    bool canonical_less(const value &a, const value &b)
    {
        if (a.type() != b.type())
            return a.type() < b.type();
        switch (a.type()) {
            case item_type::integer:
                return a.integer() < b.integer();
            case item_type::bytes:
                return compare_strings(a.bytes(), b.bytes()) == std::strong_ordering::less;
            case item_type::text:
                return compare_strings(buffer { a.text() }, buffer { b.text() }) == std::strong_ordering::less;
            case item_type::array:
            case item_type::map:
            case item_type::tag:
                return false;
            case item_type::simple:
                return a.simple() < b.simple();
            case item_type::floating:
                return float_less(a.floating(), b.floating());
            default:
                throw ctap_turbo::error(fmt::format("unsupported item type: {}", a.type()));
        }
    }

    void canonicalize(value &v)
    {
        switch (v.type()) {
            case item_type::array:
                for (auto &item: v.array())
                    canonicalize(item);
                break;
            case item_type::map: {
                auto &m = v.map();
                for (auto &[k, val]: m) {
                    canonicalize(k);
                    canonicalize(val);
                }
                std::stable_sort(m.begin(), m.end(), canonical_less_item);
                break;
            }
            case item_type::tag:
                canonicalize(*v.tag().content);
                break;
            default:
                break;
        }
    }

    static std::back_insert_iterator<std::string> stringify_to(std::back_insert_iterator<std::string> out_it, const value &v, const size_t depth)
    {
        switch (v.type()) {
            case item_type::integer:
                return fmt::format_to(out_it, "I {}", v.integer());
            case item_type::bytes: {
                const auto &b = v.bytes();
                if (!b.empty() && is_ascii(b))
                    return fmt::format_to(out_it, "B #{} ('{}')", b, b.str());
                return fmt::format_to(out_it, "B #{}", b);
            }
            case item_type::text:
                return fmt::format_to(out_it, "T '{}'", v.text());
            case item_type::array: {
                const auto &arr = v.array();
                out_it = fmt::format_to(out_it, "[(items: {})", arr.size());
                if (!arr.empty()) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; i < arr.size(); ++i) {
                        out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                        out_it = stringify_to(out_it, arr[i], depth + 1);
                        out_it = fmt::format_to(out_it, "\n");
                    }
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                return fmt::format_to(out_it, "]");
            }
            case item_type::map: {
                const auto &m = v.map();
                out_it = fmt::format_to(out_it, "{{(items: {})", m.size());
                if (!m.empty()) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (const auto &[key, val]: m) {
                        out_it = fmt::format_to(out_it, "{:{}}    ", "", depth * 4);
                        out_it = stringify_to(out_it, key, depth + 1);
                        out_it = fmt::format_to(out_it, ": ");
                        out_it = stringify_to(out_it, val, depth + 1);
                        out_it = fmt::format_to(out_it, "\n");
                    }
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                return fmt::format_to(out_it, "}}");
            }
            case item_type::tag: {
                const auto &t = v.tag();
                out_it = fmt::format_to(out_it, "TAG {} ", t.number);
                return stringify_to(out_it, *t.content, depth);
            }
            case item_type::simple:
                switch (const auto code = v.simple(); code) {
                    case static_cast<uint8_t>(special_val::s_false): return fmt::format_to(out_it, "false");
                    case static_cast<uint8_t>(special_val::s_true): return fmt::format_to(out_it, "true");
                    case static_cast<uint8_t>(special_val::s_null): return fmt::format_to(out_it, "null");
                    case static_cast<uint8_t>(special_val::s_undefined): return fmt::format_to(out_it, "undefined");
                    default: return fmt::format_to(out_it, "simple({})", code);
                }
            case item_type::floating: {
                const auto &f = v.floating();
                switch (f.width) {
                    case float_width::f16: return fmt::format_to(out_it, "F16 {}", f.to_double());
                    case float_width::f32: return fmt::format_to(out_it, "F32 {}", std::bit_cast<float>(static_cast<uint32_t>(f.bits)));
                    default: return fmt::format_to(out_it, "F64 {}", f.to_double());
                }
            }
            default:
                throw ctap_turbo::error(fmt::format("unsupported item type: {}", v.type()));
        }
    }

    std::string value::stringify() const
    {
        std::string res {};
        stringify_to(std::back_inserter(res), *this, 0);
        return res;
    }
}
