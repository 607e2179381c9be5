/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/cbor/zero.hpp>
#include <ct/cli/common.hpp>

namespace ctap_turbo::cli::dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "dump";
            cmd.desc = "print the structure of a CBOR data item";
            common::add_input_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = common::load_input(args, opts);
            logger::debug("dump: {} bytes", data.size());
            fmt::print("{}\n", cbor::zero::parse(data));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
