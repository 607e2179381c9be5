/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/cbor/decoder.hpp>
#include <ct/cbor/zero.hpp>

namespace ctap_turbo::cbor::zero {
    cbor::value value::to_value() const
    {
        return decode(_raw, decode_options { .max_depth=validated_depth });
    }

    static std::back_insert_iterator<std::string> stringify_to(std::back_insert_iterator<std::string> out_it, const value &v, const size_t depth)
    {
        switch (v.type()) {
            case major_type::uint:
            case major_type::nint:
                return fmt::format_to(out_it, "I {}", *v.integer());
            case major_type::bytes: {
                const auto b = *v.bytes();
                if (!b.empty() && is_ascii(b))
                    return fmt::format_to(out_it, "B #{} ('{}')", b, b.string_view());
                return fmt::format_to(out_it, "B #{}", b);
            }
            case major_type::text:
                return fmt::format_to(out_it, "T '{}'", *v.text());
            case major_type::array: {
                auto it = *v.array();
                out_it = fmt::format_to(out_it, "[(items: {})", it.size());
                if (!it.done()) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; !it.done(); ++i) {
                        out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                        out_it = stringify_to(out_it, it.next(), depth + 1);
                        out_it = fmt::format_to(out_it, "\n");
                    }
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                return fmt::format_to(out_it, "]");
            }
            case major_type::map: {
                auto it = *v.map();
                out_it = fmt::format_to(out_it, "{{(items: {})", it.size());
                if (!it.done()) {
                    out_it = fmt::format_to(out_it, "\n");
                    while (!it.done()) {
                        const auto [key, val] = it.next();
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
            case major_type::tag: {
                const auto t = *v.tagged();
                out_it = fmt::format_to(out_it, "TAG {} ", t.first);
                return stringify_to(out_it, t.second, depth);
            }
            case major_type::simple: {
                if (const auto f = v.floating(); f) {
                    switch (f->width) {
                        case float_width::f16: return fmt::format_to(out_it, "F16 {}", f->to_double());
                        case float_width::f32: return fmt::format_to(out_it, "F32 {}", std::bit_cast<float>(static_cast<uint32_t>(f->bits)));
                        default: return fmt::format_to(out_it, "F64 {}", f->to_double());
                    }
                }
                switch (const auto code = *v.simple(); code) {
                    case static_cast<uint8_t>(special_val::s_false): return fmt::format_to(out_it, "false");
                    case static_cast<uint8_t>(special_val::s_true): return fmt::format_to(out_it, "true");
                    case static_cast<uint8_t>(special_val::s_null): return fmt::format_to(out_it, "null");
                    case static_cast<uint8_t>(special_val::s_undefined): return fmt::format_to(out_it, "undefined");
                    default: return fmt::format_to(out_it, "simple({})", code);
                }
            }
            default:
                throw ctap_turbo::error(fmt::format("unsupported major type: {}", v.type()));
        }
    }

    std::string value::stringify() const
    {
        std::string res {};
        stringify_to(std::back_inserter(res), *this, 0);
        return res;
    }
}
