/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/common/bytes.hpp>
#include <ct/common/test.hpp>

using namespace ctap_turbo;

suite bytes_suite = [] {
    "bytes"_test = [] {
        "host_to_net"_test = [] {
            test_same(buffer::from(host_to_net(uint16_t { 0x0102 })), uint8_vector::from_hex("0102").span());
            test_same(buffer::from(host_to_net(uint32_t { 0x01020304 })), uint8_vector::from_hex("01020304").span());
            test_same(net_to_host(host_to_net(uint64_t { 0x0102030405060708ULL })), uint64_t { 0x0102030405060708ULL });
            test_same(uint8_vector::from_hex("BEEF").span().to_host<uint16_t>(), uint16_t { 0xBEEF });
            expect(throws([] { uint8_vector::from_hex("BE").span().to_host<uint16_t>(); }));
        };
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("00aBfF");
            test_same(v.size(), size_t { 3 });
            test_same(v[1], uint8_t { 0xAB });
            test_same(v[2], uint8_t { 0xFF });
            expect(throws([] { uint8_vector::from_hex("0"); }));
            expect(throws([] { uint8_vector::from_hex("0G"); }));
        };
        "subbuf"_test = [] {
            const auto v = uint8_vector::from_hex("0001020304");
            test_same(v.span().subbuf(1, 2), uint8_vector::from_hex("0102").span());
            test_same(v.span().subbuf(5).size(), size_t { 0 });
            expect(throws([&] { v.span().subbuf(4, 2); }));
            expect(throws([&] { v.span().subbuf(6); }));
        };
        "ordering"_test = [] {
            expect(uint8_vector::from_hex("00") < uint8_vector::from_hex("01"));
            expect(uint8_vector::from_hex("00") < uint8_vector::from_hex("0000"));
            expect(uint8_vector::from_hex("FF") > uint8_vector::from_hex("00FF"));
            expect(uint8_vector {} == buffer {});
        };
        "format"_test = [] {
            test_same(fmt::format("{}", uint8_vector::from_hex("00abff")), std::string { "00ABFF" });
            uint8_vector out {};
            out << uint8_t { 0x01 } << uint8_vector::from_hex("0203").span();
            test_same(out, uint8_vector::from_hex("010203"));
        };
    };
};
