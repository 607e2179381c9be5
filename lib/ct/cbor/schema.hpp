/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * Maps C++ structs to CBOR maps and back using an explicit per-type schema:
 *
 *   template<>
 *   struct cbor::schema<make_credential_response> {
 *       static auto fields()
 *       {
 *           return std::make_tuple(
 *               cbor::field(1, &make_credential_response::fmt),
 *               cbor::field(2, &make_credential_response::auth_data),
 *               cbor::field(3, &make_credential_response::att_stmt, { "attStmt" }));
 *       }
 *   };
 *
 * Fields of std::optional type, and fields explicitly marked optional, may be absent in the input.
 * Absent std::optional fields are not written. Keys not named by the schema are ignored on input.
 */
#ifndef CTAP_TURBO_CBOR_SCHEMA_HPP
#define CTAP_TURBO_CBOR_SCHEMA_HPP

#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/encoder.hpp>

namespace ctap_turbo::cbor {
    enum class schema_error_kind: uint8_t {
        unexpected_item,
        unexpected_item_value,
        duplicate_field,
        missing_field
    };

    struct schema_error: ctap_turbo::error {
        explicit schema_error(const schema_error_kind kind, const std::string_view msg):
            ctap_turbo::error(msg), _kind { kind }
        {
        }

        schema_error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        schema_error_kind _kind;
    };

    using field_key = std::variant<int64_t, std::string>;

    template<typename T, typename M>
    struct field_def {
        field_key key;
        M T::*member;
        std::vector<field_key> aliases {};
        bool optional = false;

        bool matches(const value &k) const
        {
            if (_matches(key, k))
                return true;
            for (const auto &a: aliases) {
                if (_matches(a, k))
                    return true;
            }
            return false;
        }
    private:
        static bool _matches(const field_key &fk, const value &k)
        {
            if (const auto *i = std::get_if<int64_t>(&fk); i)
                return k.is_int() && k.integer() == *i;
            return k.is_text() && k.text() == std::get<std::string>(fk);
        }
    };

    template<typename T, typename M>
    field_def<T, M> field(field_key key, M T::*member, std::vector<field_key> aliases={})
    {
        return { std::move(key), member, std::move(aliases) };
    }

    // a field that keeps its default value when absent
    template<typename T, typename M>
    field_def<T, M> optional_field(field_key key, M T::*member, std::vector<field_key> aliases={})
    {
        return { std::move(key), member, std::move(aliases), true };
    }

    // specializations provide a static fields() returning a tuple of field_def
    template<typename T>
    struct schema {
    };

    template<typename T>
    concept has_schema = requires {
        schema<T>::fields();
    };

    template<typename T>
    struct is_optional: std::false_type {};
    template<typename T>
    struct is_optional<std::optional<T>>: std::true_type {};

    template<typename T>
    struct is_vector: std::false_type {};
    template<typename T, typename A>
    struct is_vector<std::vector<T, A>>: std::true_type {};

    inline value key_value(const field_key &k)
    {
        if (const auto *i = std::get_if<int64_t>(&k); i)
            return value::from_int(*i);
        return value::from_text(std::get<std::string>(k));
    }

    template<typename T, typename M>
    void add_field(map_type &items, const T &obj, const field_def<T, M> &f);
    template<typename T, typename M>
    void read_field(T &obj, const map_type &items, const field_def<T, M> &f);

    template<typename T>
    value to_value(const T &v)
    {
        if constexpr (std::is_same_v<T, bool>) {
            return value::from_bool(v);
        } else if constexpr (std::is_integral_v<T>) {
            return value::from_int(int_type { v });
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value::from_text(v);
        } else if constexpr (std::is_same_v<T, uint8_vector>) {
            return value::from_bytes(v);
        } else if constexpr (is_optional<T>::value) {
            if (!v)
                return value::null();
            return to_value(*v);
        } else if constexpr (is_vector<T>::value) {
            array_type items {};
            items.reserve(v.size());
            for (const auto &item: v)
                items.emplace_back(to_value(item));
            return value::from_array(std::move(items));
        } else if constexpr (has_schema<T>) {
            map_type items {};
            std::apply([&](const auto &...fields) {
                (add_field(items, v, fields), ...);
            }, schema<T>::fields());
            return value::from_map(std::move(items));
        } else {
            static_assert(has_schema<T>, "a type without a CBOR mapping");
        }
    }

    template<typename T, typename M>
    void add_field(map_type &items, const T &obj, const field_def<T, M> &f)
    {
        const auto &member = obj.*(f.member);
        if constexpr (is_optional<M>::value) {
            if (!member)
                return;
        }
        items.emplace_back(key_value(f.key), to_value(member));
    }

    template<typename T>
    T from_value(const value &v)
    {
        if constexpr (std::is_same_v<T, bool>) {
            if (!v.is_simple()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected a boolean but got {}", v.type()));
            if (!v.is_bool()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item_value, fmt::format("expected a boolean but got {}", v));
            return v.boolean();
        } else if constexpr (std::is_integral_v<T>) {
            if (!v.is_int()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected an integer but got {}", v.type()));
            const auto &i = v.integer();
            if (i < std::numeric_limits<T>::min() || i > std::numeric_limits<T>::max()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item_value, fmt::format("integer {} does not fit the field's type", i));
            return static_cast<T>(i);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (!v.is_text()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected a text string but got {}", v.type()));
            return v.text();
        } else if constexpr (std::is_same_v<T, uint8_vector>) {
            if (!v.is_bytes()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected a byte string but got {}", v.type()));
            return v.bytes();
        } else if constexpr (is_optional<T>::value) {
            if (v.is_null() || v.is_undefined())
                return T {};
            return T { from_value<typename T::value_type>(v) };
        } else if constexpr (is_vector<T>::value) {
            if (!v.is_array()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected an array but got {}", v.type()));
            T res {};
            res.reserve(v.array().size());
            for (const auto &item: v.array())
                res.emplace_back(from_value<typename T::value_type>(item));
            return res;
        } else if constexpr (has_schema<T>) {
            if (!v.is_map()) [[unlikely]]
                throw schema_error(schema_error_kind::unexpected_item, fmt::format("expected a map but got {}", v.type()));
            T res {};
            std::apply([&](const auto &...fields) {
                (read_field(res, v.map(), fields), ...);
            }, schema<T>::fields());
            return res;
        } else {
            static_assert(has_schema<T>, "a type without a CBOR mapping");
        }
    }

    template<typename T, typename M>
    void read_field(T &obj, const map_type &items, const field_def<T, M> &f)
    {
        const value *found = nullptr;
        for (const auto &[k, v]: items) {
            if (f.matches(k)) {
                if (found) [[unlikely]]
                    throw schema_error(schema_error_kind::duplicate_field, fmt::format("field {} is present more than once", k));
                found = &v;
            }
        }
        if (found) {
            obj.*(f.member) = from_value<M>(*found);
            return;
        }
        if (!f.optional && !is_optional<M>::value) [[unlikely]]
            throw schema_error(schema_error_kind::missing_field, fmt::format("a required field is missing: {}", key_value(f.key)));
    }

    template<typename T>
    uint8_vector to_cbor(const T &obj)
    {
        return encode(to_value(obj));
    }

    template<typename T>
    T from_cbor(const buffer data, const decode_options &opts={})
    {
        return from_value<T>(decode(data, opts));
    }
}

namespace fmt {
    template<>
    struct formatter<ctap_turbo::cbor::schema_error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ctap_turbo::cbor::schema_error_kind;
            switch (v) {
                case schema_error_kind::unexpected_item: return fmt::format_to(ctx.out(), "unexpected_item");
                case schema_error_kind::unexpected_item_value: return fmt::format_to(ctx.out(), "unexpected_item_value");
                case schema_error_kind::duplicate_field: return fmt::format_to(ctx.out(), "duplicate_field");
                case schema_error_kind::missing_field: return fmt::format_to(ctx.out(), "missing_field");
                default: return fmt::format_to(ctx.out(), "schema_error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CTAP_TURBO_CBOR_SCHEMA_HPP
