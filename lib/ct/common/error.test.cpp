/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <ct/common/error.hpp>
#include <ct/common/test.hpp>
#include <ct/cbor/types.hpp>

using namespace ctap_turbo;

namespace {
    template<typename F>
    std::string error_message(const F &f)
    {
        try {
            f();
        } catch (const error &ex) {
            return ex.what();
        }
        return {};
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "message"_test = [] {
            test_same(error_message([] { throw error("Hello!"); }), std::string { "Hello!" });
            test_same(error_message([] { throw error(fmt::format("Hello {}!", 123)); }), std::string { "Hello 123!" });
        };
        "caused by"_test = [] {
            const auto msg = error_message([] { throw error("outer", std::runtime_error("inner")); });
            expect(msg.starts_with("outer caused by ")) << msg;
            expect(msg.ends_with(": inner")) << msg;
        };
        "error_sys"_test = [] {
            const auto msg = error_message([] {
                errno = ENOENT;
                throw error_sys("open");
            });
            expect(msg.starts_with("open errno: ")) << msg;
            expect(msg.find("strerror: ") != msg.npos) << msg;
        };
        "stacktrace"_test = [] {
            try {
                throw error("with a trace");
            } catch (const error &ex) {
                const auto trace = ex.stacktrace();
                expect(trace.size() < 0x2000);
                expect(trace.data()[trace.size()] == 0);
            }
        };
        "cbor error kinds"_test = [] {
            try {
                throw cbor::error(cbor::error_kind::indefinite_length);
            } catch (const error &ex) {
                test_same(std::string { ex.what() }, std::string { "cbor error: indefinite_length" });
            }
            const cbor::error ex(cbor::error_kind::malformed, "offset 7");
            expect(ex.kind() == cbor::error_kind::malformed);
            test_same(std::string { ex.what() }, std::string { "offset 7" });
            test_same(fmt::format("{}", cbor::error_kind::invalid_pair_count), std::string { "invalid_pair_count" });
        };
    };
};
