/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef CTAP_TURBO_CLI_COMMON_HPP
#define CTAP_TURBO_CLI_COMMON_HPP

#include <ct/cli.hpp>
#include <ct/common/bytes.hpp>

namespace ctap_turbo::cli::common {
    // a file argument, the --hex option or the --base64url option
    extern void add_input_opts(config &cmd);
    extern uint8_vector load_input(const arguments &args, const options &opts);
}

#endif // !CTAP_TURBO_CLI_COMMON_HPP
