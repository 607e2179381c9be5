/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/common/test.hpp>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/validator.hpp>

using namespace ctap_turbo;
using namespace ctap_turbo::cbor;

suite cbor_validator_suite = [] {
    "cbor::validator"_test = [] {
        "well-formed"_test = [] {
            for (const auto hex: { "00", "187B", "3A000F3DDC", "3BFFFFFFFFFFFFFFFF", "451011121314", "60",
                    "8301820203820405", "A201020304", "C11A514B67B0", "F4", "F7", "F820", "F98000", "FBC010666666666666" }) {
                expect(validate(uint8_vector::from_hex(hex))) << hex;
            }
        };
        "ill-formed"_test = [] {
            for (const auto hex: { "", "81", "18", "0000", "1C", "5F", "9F01FF", "FF", "E0", "F813", "F818", "FC",
                    "A101", "5AFFFFFFFF", "9BFFFFFFFFFFFFFFFF" }) {
                expect(!validate(uint8_vector::from_hex(hex))) << hex;
            }
        };
        "agrees with decode"_test = [] {
            for (const auto hex: { "00", "81", "820102", "8201", "A1010203", "A10102", "C2420100", "C2", "F5", "F3",
                    "F81F", "F820", "7F", "6161", "61", "1BFFFFFFFFFFFFFFFF", "1B00", "FA3F800000", "FA3F80" }) {
                const auto data = uint8_vector::from_hex(hex);
                bool decoded = true;
                try {
                    decode(data);
                } catch (const cbor::error &) {
                    decoded = false;
                }
                test_same(hex, validate(data), decoded);
            }
        };
        "offset"_test = [] {
            const auto data = uint8_vector::from_hex("0182020381");
            size_t offset = 0;
            expect(validate(data, offset, false));
            test_same(offset, size_t { 1 });
            expect(!validate(data, offset, true));
            test_same(offset, size_t { 1 });
            expect(validate(data, offset, false));
            test_same(offset, size_t { 4 });
            expect(!validate(data, offset, false));
            test_same(offset, size_t { 4 });
        };
        "skip"_test = [] {
            const auto data = uint8_vector::from_hex("A1616182F401F6");
            size_t offset = 0;
            const auto item = skip(data, offset);
            expect(item.has_value());
            test_same(item->size(), size_t { 6 });
            test_same(offset, size_t { 6 });
            const auto last = skip(data, offset);
            expect(last.has_value());
            test_same(*last, uint8_vector::from_hex("F6").span());
            expect(!skip(data, offset));
        };
        "depth limit"_test = [] {
            std::string hex {};
            for (size_t i = 0; i < 300; ++i)
                hex += "81";
            hex += "00";
            const auto data = uint8_vector::from_hex(hex);
            expect(!validate(data));
            expect(validate(data, 300));
            expect(!validate(data, 299));
        };
    };
};
