/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <string>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/validator.hpp>
#include <ct/cli/common.hpp>

namespace ctap_turbo::cli::validate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validate";
            cmd.desc = "check that the input is exactly one well-formed CBOR data item";
            common::add_input_opts(cmd);
            cmd.opts.try_emplace("max-depth", "the maximum nesting depth", std::to_string(cbor::default_max_depth));
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = common::load_input(args, opts);
            const auto max_depth = std::stoull(*opts.at("max-depth"));
            if (!cbor::validate(data, max_depth)) {
                // decoding reports the precise kind of the problem
                cbor::decode(data, cbor::decode_options { .max_depth=max_depth });
                throw cbor::error(cbor::error_kind::malformed);
            }
            fmt::print("well-formed: {} bytes\n", data.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
