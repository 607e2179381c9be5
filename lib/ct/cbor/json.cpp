/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <ct/base64.hpp>
#include <ct/cbor/json.hpp>

namespace ctap_turbo::cbor {
    static json::value int_to_json(const int_type &v)
    {
        if (v >= 0 && v <= std::numeric_limits<uint64_t>::max())
            return json::value(static_cast<uint64_t>(v));
        if (v >= std::numeric_limits<int64_t>::min())
            return json::value(static_cast<int64_t>(v));
        return json::string { fmt::format("{}", v) };
    }

    static std::string key_to_json(const value &k)
    {
        if (k.is_text())
            return k.text();
        return json::serialize(to_json(k));
    }

    json::value to_json(const value &v)
    {
        switch (v.type()) {
            case item_type::integer:
                return int_to_json(v.integer());
            case item_type::bytes:
                return json::string { base64::encode_url(v.bytes()) };
            case item_type::text:
                return json::string { v.text() };
            case item_type::array: {
                json::array res {};
                res.reserve(v.array().size());
                for (const auto &item: v.array())
                    res.emplace_back(to_json(item));
                return res;
            }
            case item_type::map: {
                json::object res {};
                for (const auto &[key, val]: v.map())
                    res.emplace(key_to_json(key), to_json(val));
                return res;
            }
            case item_type::tag: {
                if (v.is_unsigned_bignum())
                    return json::string { base64::encode_url(v.tag().content->bytes()) };
                if (v.is_signed_bignum())
                    return json::string { "~" + base64::encode_url(v.tag().content->bytes()) };
                return to_json(*v.tag().content);
            }
            case item_type::simple:
                switch (v.simple()) {
                    case static_cast<uint8_t>(special_val::s_false): return false;
                    case static_cast<uint8_t>(special_val::s_true): return true;
                    default: return nullptr;
                }
            case item_type::floating: {
                const auto d = v.floating().to_double();
                if (std::isfinite(d))
                    return d;
                return nullptr;
            }
            default:
                throw ctap_turbo::error(fmt::format("unsupported item type: {}", v.type()));
        }
    }
}
