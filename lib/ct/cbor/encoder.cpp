/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <new>
#include <ct/cbor/encoder.hpp>

namespace ctap_turbo::cbor {
    encoder &encoder::floating(const float_item &f)
    {
        switch (f.width) {
            case float_width::f16:
                write_float_head(_buf, special_val::two_bytes, f.bits);
                break;
            case float_width::f32:
                write_float_head(_buf, special_val::four_bytes, f.bits);
                break;
            case float_width::f64:
                write_float_head(_buf, special_val::eight_bytes, f.bits);
                break;
            default:
                throw ctap_turbo::error(fmt::format("unsupported float width: {}", static_cast<int>(f.width)));
        }
        return *this;
    }

    encoder &encoder::item(const value &v)
    {
        switch (v.type()) {
            case item_type::integer:
                return integer(v.integer());
            case item_type::bytes:
                return bytes(v.bytes());
            case item_type::text:
                return text(v.text());
            case item_type::array: {
                const auto &items = v.array();
                array(items.size());
                for (const auto &it: items)
                    item(it);
                return *this;
            }
            case item_type::map: {
                const auto &pairs = v.map();
                // sorts pointers so that the value stays untouched
                std::vector<const map_item *> order {};
                order.reserve(pairs.size());
                for (const auto &p: pairs)
                    order.emplace_back(&p);
                std::stable_sort(order.begin(), order.end(), [](const auto *a, const auto *b) {
                    return canonical_less_item(*a, *b);
                });
                map(pairs.size());
                for (const auto *p: order) {
                    item(p->first);
                    item(p->second);
                }
                return *this;
            }
            case item_type::tag: {
                const auto &t = v.tag();
                tag(t.number);
                return item(*t.content);
            }
            case item_type::simple:
                return simple(v.simple());
            case item_type::floating:
                return floating(v.floating());
            default:
                throw ctap_turbo::error(fmt::format("unsupported item type: {}", v.type()));
        }
    }

    void encode(encoder &enc, const value &v)
    {
        try {
            enc.item(v);
        } catch (const std::bad_alloc &) {
            throw error(error_kind::out_of_memory);
        }
    }

    uint8_vector encode(const value &v)
    {
        encoder enc {};
        encode(enc, v);
        return std::move(enc.cbor());
    }
}
