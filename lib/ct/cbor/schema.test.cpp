/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/common/test.hpp>
#include <ct/cbor/schema.hpp>

using namespace ctap_turbo;
using namespace ctap_turbo::cbor;

namespace {
    struct rp_entity {
        std::string id {};
        std::optional<std::string> name {};

        bool operator==(const rp_entity &o) const =default;
    };

    struct credential_params {
        rp_entity rp {};
        uint8_vector client_data_hash {};
        std::vector<int64_t> algs {};
        bool resident_key = false;
        uint32_t timeout = 30000;

        bool operator==(const credential_params &o) const =default;
    };
}

namespace ctap_turbo::cbor {
    template<>
    struct schema<rp_entity> {
        static auto fields()
        {
            return std::make_tuple(
                field("id", &rp_entity::id),
                field("name", &rp_entity::name));
        }
    };

    template<>
    struct schema<credential_params> {
        static auto fields()
        {
            return std::make_tuple(
                field(1, &credential_params::client_data_hash, { "clientDataHash" }),
                field(2, &credential_params::rp),
                field(3, &credential_params::algs),
                field(4, &credential_params::resident_key, { "rk" }),
                optional_field(5, &credential_params::timeout));
        }
    };
}

namespace {
    std::optional<schema_error_kind> parse_error(const std::string_view hex)
    {
        try {
            from_cbor<credential_params>(uint8_vector::from_hex(hex));
        } catch (const schema_error &ex) {
            return ex.kind();
        }
        return {};
    }
}

suite cbor_schema_suite = [] {
    "cbor::schema"_test = [] {
        "to_cbor"_test = [] {
            const credential_params p { rp_entity { "example.com", {} }, uint8_vector::from_hex("0102"), { -7, -257 }, true, 5 };
            // {1: h'0102', 2: {"id": "example.com"}, 3: [-7, -257], 4: true, 5: 5}
            test_same(to_cbor(p), uint8_vector::from_hex(
                "A5" "01420102" "02A16269646B6578616D706C652E636F6D" "038226390100" "04F5" "0505"));
        };
        "round trip"_test = [] {
            const credential_params p { rp_entity { "example.com", "Example" }, uint8_vector::from_hex("DEADBEEF"), { -7 }, false, 60000 };
            expect(from_cbor<credential_params>(to_cbor(p)) == p);
        };
        "aliases, optional fields and unknown keys"_test = [] {
            // {"clientDataHash": h'01', 2: {"id": "a"}, 3: [], "rk": true, 9: null}
            const auto p = from_cbor<credential_params>(uint8_vector::from_hex(
                "A5" "6E636C69656E744461746148617368" "4101" "02A1626964" "6161" "0380" "62726BF5" "09F6"));
            test_same(p.client_data_hash, uint8_vector::from_hex("01"));
            test_same(p.rp.id, std::string { "a" });
            expect(!p.rp.name);
            expect(p.algs.empty());
            expect(p.resident_key);
            test_same(p.timeout, uint32_t { 30000 });
        };
        "errors"_test = [] {
            // a map without key 3
            expect(parse_error("A3" "014101" "02A1626964" "6161" "04F4") == schema_error_kind::missing_field);
            // key 4 given both directly and through its alias
            expect(parse_error("A5" "014101" "02A1626964" "6161" "0380" "04F4" "62726BF5") == schema_error_kind::duplicate_field);
            // a text string for a byte string field
            expect(parse_error("A4" "016101" "02A1626964" "6161" "0380" "04F4") == schema_error_kind::unexpected_item);
            // null for a boolean
            expect(parse_error("A4" "014101" "02A1626964" "6161" "0380" "04F6") == schema_error_kind::unexpected_item_value);
            // a timeout that does not fit uint32_t
            expect(parse_error("A5" "014101" "02A1626964" "6161" "0380" "04F4" "051B0000000100000000") == schema_error_kind::unexpected_item_value);
            // not a map at all
            expect(parse_error("80") == schema_error_kind::unexpected_item);
        };
    };
};
