/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CTAP_TURBO_FILE_HPP
#define CTAP_TURBO_FILE_HPP

#include <string>
#include <ct/common/bytes.hpp>

namespace ctap_turbo::file {
    extern void read(const std::string &path, uint8_vector &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    extern void write(const std::string &path, buffer data);
}

#endif // !CTAP_TURBO_FILE_HPP
