/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/common/test.hpp>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/encoder.hpp>

using namespace ctap_turbo;
using namespace ctap_turbo::cbor;

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "minimal integers"_test = [] {
            const auto enc = [](const int_type &v) {
                return encode(value::from_int(v));
            };
            test_same(enc(0), uint8_vector::from_hex("00"));
            test_same(enc(23), uint8_vector::from_hex("17"));
            test_same(enc(24), uint8_vector::from_hex("1818"));
            test_same(enc(255), uint8_vector::from_hex("18FF"));
            test_same(enc(256), uint8_vector::from_hex("190100"));
            test_same(enc(65535), uint8_vector::from_hex("19FFFF"));
            test_same(enc(65536), uint8_vector::from_hex("1A00010000"));
            test_same(enc(int_type { 0x100000000LL }), uint8_vector::from_hex("1B0000000100000000"));
            test_same(enc(-1), uint8_vector::from_hex("20"));
            test_same(enc(-24), uint8_vector::from_hex("37"));
            test_same(enc(-25), uint8_vector::from_hex("3818"));
            test_same(enc(-998877), uint8_vector::from_hex("3A000F3DDC"));
            test_same(enc(value::max_int()), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
            test_same(enc(value::min_int()), uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"));
        };
        "integer range"_test = [] {
            encoder enc {};
            expect(throws([&] { enc.integer(value::max_int() + 1); }));
            expect(throws([&] { enc.integer(value::min_int() - 1); }));
            expect(enc.cbor().empty());
        };
        "fluent"_test = [] {
            encoder enc {};
            enc.array(25);
            for (uint64_t i = 1; i <= 25; ++i)
                enc.uint(i);
            test_same(enc.cbor(), uint8_vector::from_hex("98190102030405060708090A0B0C0D0E0F101112131415161718181819"));
        };
        "strings and tags"_test = [] {
            encoder enc {};
            enc.array(3).bytes(uint8_vector::from_hex("1011121314")).text("IETF").tag(1).uint(1363896240);
            test_same(enc.cbor(), uint8_vector::from_hex("83451011121314644945544" "6C11A514B67B0"));
        };
        "simple values"_test = [] {
            encoder enc {};
            enc.s_false().s_true().s_null().s_undefined().simple(32).simple(255);
            test_same(enc.cbor(), uint8_vector::from_hex("F4F5F6F7F820F8FF"));
            try {
                enc.simple(19);
                expect(false);
            } catch (const cbor::error &ex) {
                expect(ex.kind() == error_kind::unassigned);
            }
            try {
                enc.simple(24);
                expect(false);
            } catch (const cbor::error &ex) {
                expect(ex.kind() == error_kind::reserved_simple_value);
            }
        };
        "floats keep their width"_test = [] {
            encoder enc {};
            enc.float16(0x0000).float16(0x8000).float32(std::numeric_limits<float>::max()).float64(-4.1);
            test_same(enc.cbor(), uint8_vector::from_hex("F90000F98000FA7F7FFFFFFBC010666666666666"));
            test_same(encode(value::from_float32(1.0F)), uint8_vector::from_hex("FA3F800000"));
            test_same(encode(value::from_float16(0x7E00)), uint8_vector::from_hex("F97E00"));
        };
        "map keys are sorted"_test = [] {
            map_type m {};
            m.emplace_back(value::from_text("b"), value::from_int(1));
            m.emplace_back(value::from_text("a"), value::from_int(2));
            m.emplace_back(value::from_int(10), value::from_int(3));
            m.emplace_back(value::from_int(-1), value::from_int(4));
            m.emplace_back(value::from_bytes(uint8_vector::from_hex("00")), value::from_int(5));
            m.emplace_back(value::from_text("aa"), value::from_int(6));
            const auto v = value::from_map(std::move(m));
            test_same(encode(v), uint8_vector::from_hex("A6" "2004" "0A03" "410005" "616102" "616201" "62616106"));
            // the value itself keeps the insertion order
            test_same(v.map().front().first.text(), std::string { "b" });
        };
        "float keys of mixed widths"_test = [] {
            map_type m {};
            m.emplace_back(value::from_float16(0x3C00), value::from_int(1));
            m.emplace_back(value::from_float32(1.0F), value::from_int(2));
            m.emplace_back(value::from_float64(1.0), value::from_int(3));
            m.emplace_back(value::from_float16(0x3800), value::from_int(4));
            test_same(encode(value::from_map(std::move(m))),
                uint8_vector::from_hex("A4" "FB3FF000000000000003" "FA3F80000002" "F9380004" "F93C0001"));
        };
        "nested maps are sorted"_test = [] {
            map_type inner {};
            inner.emplace_back(value::from_int(3), value::from_int(4));
            inner.emplace_back(value::from_int(1), value::from_int(2));
            map_type outer {};
            outer.emplace_back(value::from_int(2), value::from_map(std::move(inner)));
            outer.emplace_back(value::from_int(1), value::null());
            test_same(encode(value::from_map(std::move(outer))), uint8_vector::from_hex("A201F602A201020304"));
        };
        "raw_cbor and custom"_test = [] {
            encoder enc {};
            enc.array(2).raw_cbor(uint8_vector::from_hex("820203")).custom([](auto &e) {
                e.map(1).uint(1).uint(2);
            });
            test_same(enc.cbor(), uint8_vector::from_hex("82820203A10102"));
            encoder outer {};
            outer.array(1);
            outer << enc;
            test_same(outer.cbor(), uint8_vector::from_hex("8182820203A10102"));
        };
        "decode of encode"_test = [] {
            map_type m {};
            m.emplace_back(value::from_int(1), value::from_text("packed"));
            m.emplace_back(value::from_int(2), value::from_bytes(uint8_vector::from_hex("DEADBEEF")));
            m.emplace_back(value::from_int(3), value::make_array(value::from_bool(true), value::from_tag(2, value::from_bytes(uint8_vector::from_hex("0100")))));
            const auto v = value::from_map(std::move(m));
            test_same(decode(encode(v)), v);
        };
    };
};
