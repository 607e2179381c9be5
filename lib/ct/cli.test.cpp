/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <ct/cli.hpp>
#include <ct/common/test.hpp>
#include <ct/file.hpp>

using namespace ctap_turbo;

namespace {
    struct echo_cmd: cli::command {
        mutable cli::parse_result last {};

        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "remembers its arguments";
            cmd.args.expect({ "<first>", "[<rest>...]" });
            cmd.opts.try_emplace("mode", "an option with a default", "fast");
            cmd.opts.try_emplace("flag", "an option without a value");
        }

        void run(const cli::arguments &args, const cli::options &opts) const override
        {
            last = { args, opts };
        }
    };

    int run_cli(const std::initializer_list<const char *> &args)
    {
        std::vector<const char *> argv { "ct" };
        argv.insert(argv.end(), args.begin(), args.end());
        return cli::run(static_cast<int>(argv.size()), argv.data());
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "argument_config"_test = [] {
            cli::argument_config a {};
            a.expect({ "<path>", "[<extra>]" });
            test_same(*a.min, size_t { 1 });
            test_same(*a.max, size_t { 2 });
            a.expect({ "<path>", "[<extra>...]" });
            test_same(*a.max, std::numeric_limits<size_t>::max());
        };
        "parse"_test = [] {
            const echo_cmd cmd {};
            cli::config cfg {};
            cmd.configure(cfg);
            const auto pr = cmd.parse(cfg, { "a", "--flag", "b", "c" });
            test_same(pr.args.size(), size_t { 3 });
            expect(pr.opts.contains("flag"));
            expect(!pr.opts.at("flag"));
            test_same(*pr.opts.at("mode"), std::string { "fast" });
            const auto pr2 = cmd.parse(cfg, { "a", "--mode=slow" });
            test_same(*pr2.opts.at("mode"), std::string { "slow" });
            expect(throws([&] { cmd.parse(cfg, {}); }));
            expect(throws([&] { cmd.parse(cfg, { "a", "--unknown" }); }));
            expect(throws([&] { cmd.parse(cfg, { "a", "--flag", "--flag" }); }));
        };
        "describe"_test = [] {
            test_same(std::string { cli::describe(cbor::error_kind::unassigned) }, std::string { "simple values 0..19 currently unassigned" });
            test_same(std::string { cli::describe(cbor::error_kind::indefinite_length) }, std::string { "indefinite-length items not supported" });
            expect(throws([] { cli::describe(static_cast<cbor::error_kind>(200)); }));
        };
        "run with a custom registry"_test = [] {
            const auto cmd = std::make_shared<echo_cmd>();
            const cli::command::command_list commands { cmd };
            const char *argv[] { "ct", "echo", "x", "--mode=slow" };
            test_same(cli::run(4, argv, commands), 0);
            test_same(cmd->last.args.size(), size_t { 1 });
            test_same(*cmd->last.opts.at("mode"), std::string { "slow" });
            const char *bad_argv[] { "ct", "missing" };
            test_same(cli::run(2, bad_argv, commands), 1);
            test_same(cli::run(1, argv, commands), 1);
        };
        "cbor commands"_test = [] {
            test_same(run_cli({ "validate", "--hex=8301820203820405" }), 0);
            test_same(run_cli({ "validate", "--hex=81" }), 1);
            test_same(run_cli({ "validate", "--hex=5F" }), 1);
            test_same(run_cli({ "validate", "--hex=8181818100", "--max-depth=3" }), 1);
            test_same(run_cli({ "validate", "--hex=811" }), 1);
            test_same(run_cli({ "dump", "--hex=A201820203616" "1F5" }), 0);
            test_same(run_cli({ "json", "--hex=A201820203616" "1F5", "--compact" }), 0);
            test_same(run_cli({ "json", "--hex=F813" }), 1);
            const auto path = (std::filesystem::temp_directory_path() / "ct-cli-test.cbor").string();
            file::write(path, uint8_vector::from_hex("C11A514B67B0"));
            test_same(run_cli({ "dump", path.c_str() }), 0);
            test_same(run_cli({ "dump", path.c_str(), "--hex=00" }), 1);
            std::filesystem::remove(path);
        };
        "base64url input"_test = [] {
            test_same(run_cli({ "validate", "--base64url=gwGCAgOCBAU" }), 0);
            test_same(run_cli({ "dump", "--base64url=ogGCAgNhYfU" }), 0);
            test_same(run_cli({ "validate", "--base64url=gwGCAgOCBA" }), 1);
            test_same(run_cli({ "validate", "--base64url=g+GC" }), 1);
            test_same(run_cli({ "validate", "--base64url=gwGCAgOCBAU", "--hex=00" }), 1);
            test_same(run_cli({ "validate" }), 1);
        };
        "json output file"_test = [] {
            const auto out_path = (std::filesystem::temp_directory_path() / "ct-cli-test.json").string();
            const auto out_opt = fmt::format("--out={}", out_path);
            test_same(run_cli({ "json", "--hex=A201820203616" "1F5", out_opt.c_str() }), 0);
            test_same(std::string { file::read(out_path).str() }, std::string { "{\n  \"1\": [\n    2,\n    3\n  ],\n  \"a\": true\n}" });
            test_same(run_cli({ "json", "--hex=00", "--out" }), 1);
            std::filesystem::remove(out_path);
        };
    };
};
