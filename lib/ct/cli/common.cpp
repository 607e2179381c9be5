/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ct/base64.hpp>
#include <ct/cli/common.hpp>
#include <ct/file.hpp>

namespace ctap_turbo::cli::common {
    void add_input_opts(config &cmd)
    {
        cmd.args.expect({ "[<cbor-path>]" });
        cmd.opts.try_emplace("hex", option_config {
            .desc="the input as a hex string instead of a file",
            .validator=[](const std::optional<std::string> &val) -> std::optional<std::string> {
                if (!val)
                    return "a hex string is required";
                if (val->size() % 2 != 0)
                    return "the hex string must have an even number of characters";
                return {};
            }
        });
        cmd.opts.try_emplace("base64url", option_config {
            .desc="the input as a base64url string, the form WebAuthn uses for CBOR-encoded fields",
            .validator=[](const std::optional<std::string> &val) -> std::optional<std::string> {
                if (!val || val->empty())
                    return "a base64url string is required";
                return {};
            }
        });
    }

    uint8_vector load_input(const arguments &args, const options &opts)
    {
        const auto hex_it = opts.find("hex");
        const auto b64_it = opts.find("base64url");
        const size_t num_sources = (hex_it != opts.end()) + (b64_it != opts.end()) + !args.empty();
        if (num_sources > 1)
            throw error("only one of a file path, the --hex option and the --base64url option is allowed");
        if (num_sources == 0)
            throw error("a file path, the --hex option or the --base64url option is required");
        if (hex_it != opts.end())
            return uint8_vector::from_hex(*hex_it->second);
        if (b64_it != opts.end())
            return base64::decode_url(*b64_it->second);
        logger::debug("reading {}", args.at(0));
        return file::read(args.at(0));
    }
}
