/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <memory>
#include <ct/file.hpp>

namespace ctap_turbo::file {
    struct file_closer {
        void operator()(std::FILE *f) const
        {
            std::fclose(f);
        }
    };
    using file_ptr = std::unique_ptr<std::FILE, file_closer>;

    static file_ptr open(const std::string &path, const char *mode)
    {
        file_ptr f { std::fopen(path.c_str(), mode) };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {}", path));
        return f;
    }

    void read(const std::string &path, uint8_vector &buf)
    {
        const auto f = open(path, "rb");
        if (std::fseek(f.get(), 0, SEEK_END) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek to the end of {}", path));
        const auto sz = std::ftell(f.get());
        if (sz < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        if (std::fseek(f.get(), 0, SEEK_SET) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek to the beginning of {}", path));
        buf.resize(static_cast<size_t>(sz));
        if (!buf.empty() && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }

    void write(const std::string &path, const buffer data)
    {
        const auto f = open(path, "wb");
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
