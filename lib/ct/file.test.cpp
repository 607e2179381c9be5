/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <ct/common/test.hpp>
#include <ct/file.hpp>

using namespace ctap_turbo;

suite file_suite = [] {
    "file"_test = [] {
        "write and read"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "ct-file-test.cbor").string();
            const auto data = uint8_vector::from_hex("A201020304");
            file::write(path, data);
            test_same(file::read(path), data);
            file::write(path, buffer {});
            test_same(file::read(path).size(), size_t { 0 });
            std::filesystem::remove(path);
        };
        "missing file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "ct-file-test-missing.cbor").string();
            std::filesystem::remove(path);
            expect(throws<error_sys>([&] { file::read(path); }));
        };
    };
};
