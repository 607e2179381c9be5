/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/common/test.hpp>
#include <ct/cbor/builder.hpp>
#include <ct/cbor/decoder.hpp>

using namespace ctap_turbo;
using namespace ctap_turbo::cbor;

namespace {
    template<typename T>
    std::optional<error_kind> builder_error(const T &action)
    {
        try {
            action();
        } catch (const cbor::error &ex) {
            return ex.kind();
        }
        return {};
    }
}

suite cbor_builder_suite = [] {
    "cbor::builder"_test = [] {
        "integers"_test = [] {
            test_same(builder {}.push_int(12345678900LL).finish(), uint8_vector::from_hex("1B00000002DFDC1C34"));
            test_same(builder {}.push_int(-998877).finish(), uint8_vector::from_hex("3A000F3DDC"));
            test_same(builder {}.push_int(value::min_int()).finish(), uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"));
            test_same(builder {}.push_int(value::max_int()).finish(), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
        };
        "nested arrays"_test = [] {
            builder b {};
            b.enter(frame_type::array).push_int(1)
                .enter(frame_type::array).push_int(2).push_int(3).leave()
                .enter(frame_type::array).push_int(4).push_int(5).leave()
                .leave();
            test_same(b.finish(), uint8_vector::from_hex("8301820203820405"));
        };
        "long array"_test = [] {
            builder b {};
            b.enter(frame_type::array);
            for (int i = 1; i <= 25; ++i)
                b.push_int(i);
            test_same(b.finish(), uint8_vector::from_hex("98190102030405060708090A0B0C0D0E0F101112131415161718181819"));
        };
        "maps"_test = [] {
            test_same(builder {}.enter(frame_type::map).push_int(1).push_int(2).push_int(3).push_int(4).leave().finish(),
                uint8_vector::from_hex("A201020304"));
            builder b {};
            b.enter(frame_type::map).push_text("a").push_int(1).push_text("b")
                .enter(frame_type::array).push_int(2).push_int(3).leave()
                .leave();
            test_same(b.finish(), uint8_vector::from_hex("A26161016162820203"));
            builder b2 {};
            b2.enter(frame_type::array).push_text("a").enter(frame_type::map).push_text("b").push_text("c");
            test_same(b2.finish(), uint8_vector::from_hex("826161A161626163"));
        };
        "initial map frame"_test = [] {
            builder b { frame_type::map };
            test_same(b.depth(), size_t { 2 });
            b.push_int(1).push_bytes(uint8_vector::from_hex("1011121314"));
            test_same(b.finish(), uint8_vector::from_hex("A101451011121314"));
        };
        "tags"_test = [] {
            test_same(builder {}.push_tag(0).push_text("2013-03-21T20:04:00Z").finish(),
                uint8_vector::from_hex("C074323031332D30332D32315432303A30343A30305A"));
            // the tag and its content count as a single item
            builder b {};
            b.enter(frame_type::array).push_tag(2).push_bytes(uint8_vector::from_hex("0100")).push_int(1);
            test_same(b.finish(), uint8_vector::from_hex("82C242010001"));
        };
        "a tag requires content"_test = [] {
            builder b {};
            b.enter(frame_type::array).push_tag(1);
            expect(builder_error([&] { b.leave(); }) == error_kind::malformed);
            expect(!b.valid());
            expect(builder_error([&] { b.finish(); }) == error_kind::invalid_state);
            expect(builder_error([] { builder {}.push_tag(1).finish(); }) == error_kind::malformed);
            expect(builder_error([] { builder { frame_type::array }.push_int(1).push_tag(1).finish(); }) == error_kind::malformed);
            expect(builder_error([] { builder {}.push_tag(1).push_tag(2).finish(); }) == error_kind::malformed);
        };
        "tagged containers"_test = [] {
            builder b {};
            b.push_tag(1).enter(frame_type::array).push_int(1).leave();
            test_same(b.finish(), uint8_vector::from_hex("C18101"));
            test_same(builder {}.push_tag(1).push_tag(2).push_int(3).finish(), uint8_vector::from_hex("C1C203"));
            // finish closes a container that completes a pending tag
            builder b2 {};
            b2.enter(frame_type::array).push_tag(5).enter(frame_type::array).push_int(1);
            test_same(b2.finish(), uint8_vector::from_hex("81C58101"));
        };
        "simple values and floats"_test = [] {
            builder b {};
            b.enter(frame_type::array)
                .push_bool(false).push_bool(true).push_null().push_undefined().push_simple(255)
                .push_float16(0x0000).push_float16(0x8000)
                .push_float32(std::numeric_limits<float>::max()).push_float64(-4.1);
            test_same(b.finish(), uint8_vector::from_hex("89F4F5F6F7F8FFF90000F98000FA7F7FFFFFFBC010666666666666"));
        };
        "push_cbor"_test = [] {
            builder b {};
            b.enter(frame_type::array).push_cbor(uint8_vector::from_hex("A10102")).push_int(7);
            test_same(b.finish(), uint8_vector::from_hex("82A1010207"));
        };
        "errors"_test = [] {
            expect(builder_error([] { builder {}.leave(); }) == error_kind::empty_stack);
            expect(builder_error([] { builder {}.enter(frame_type::root); }) == error_kind::invalid_container_type);
            expect(builder_error([] { builder {}.enter(frame_type::map).push_int(1).leave(); }) == error_kind::invalid_pair_count);
            expect(builder_error([] { builder { frame_type::map }.push_int(1).finish(); }) == error_kind::invalid_pair_count);
            expect(builder_error([] { builder {}.push_cbor(uint8_vector::from_hex("81")); }) == error_kind::malformed_cbor);
            expect(builder_error([] { builder {}.push_cbor(uint8_vector::from_hex("0000")); }) == error_kind::malformed_cbor);
            expect(builder_error([] { builder {}.push_simple(19); }) == error_kind::unassigned);
            expect(builder_error([] { builder {}.push_simple(24); }) == error_kind::reserved_simple_value);
        };
        "unusable after a failure"_test = [] {
            builder b {};
            b.enter(frame_type::array).push_int(1);
            expect(builder_error([&] { b.enter(frame_type::root); }) == error_kind::invalid_container_type);
            expect(!b.valid());
            test_same(b.depth(), size_t { 0 });
            expect(builder_error([&] { b.push_int(2); }) == error_kind::invalid_state);
            expect(builder_error([&] { b.finish(); }) == error_kind::invalid_state);
        };
        "unusable after finish"_test = [] {
            builder b {};
            b.push_int(1);
            test_same(b.finish(), uint8_vector::from_hex("01"));
            expect(builder_error([&] { b.push_int(2); }) == error_kind::invalid_state);
        };
        "agrees with the encoder"_test = [] {
            builder b { frame_type::map };
            b.push_int(1).push_text("packed")
                .push_int(2).push_bytes(uint8_vector::from_hex("DEADBEEF"))
                .push_int(3).enter(frame_type::map).push_text("alg").push_int(-7).push_text("sig").push_bytes(uint8_vector::from_hex("3045")).leave();
            const auto built = b.finish();
            const auto decoded = decode(built);
            test_same(encode(decoded), built);
            expect(decoded.get_value(value::from_int(3))->get_value_by_string("alg")->integer() == int_type { -7 });
        };
    };
};
