/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/cbor/decoder.hpp>
#include <ct/cbor/json.hpp>
#include <ct/cli/common.hpp>

namespace ctap_turbo::cli::json_cmd {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "json";
            cmd.desc = "print the JSON projection of a CBOR data item";
            common::add_input_opts(cmd);
            cmd.opts.try_emplace("compact", "print the JSON on a single line");
            cmd.opts.try_emplace("out", option_config {
                .desc="write the indented JSON to a file instead of printing it",
                .validator=[](const std::optional<std::string> &val) -> std::optional<std::string> {
                    if (!val || val->empty())
                        return "a file path is required";
                    return {};
                }
            });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = common::load_input(args, opts);
            const auto jv = cbor::to_json(cbor::decode(data));
            if (const auto out_it = opts.find("out"); out_it != opts.end()) {
                json::save_pretty(*out_it->second, jv);
                logger::info("saved the JSON projection to {}", *out_it->second);
            } else if (opts.contains("compact"))
                fmt::print("{}\n", json::serialize(jv));
            else
                fmt::print("{}\n", json::pretty(jv));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
