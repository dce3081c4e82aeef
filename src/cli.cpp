// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "env_vars.hpp"
#include "version.hpp"

#include <cstdlib>

#include <CLI/CLI.hpp>

namespace conformance {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"Schema conformance harness v" + std::string(SERVICE_VERSION) + " (" +
                 GIT_COMMIT + ")"};

    app.add_option("-c,--config", config.config_path, "Harness configuration file")
        ->envname(env::CONFIG)
        ->default_str("config/harness.json");

    app.add_option("--config-schema", config.config_schema_path,
                   "JSON schema the configuration file must satisfy")
        ->envname(env::CONFIG_SCHEMA)
        ->default_str("schema/config.schema.json");

    app.add_option("-l,--log-level", config.log_level, "Log level (trace|debug|info|warn|error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error"}));

    app.add_option("--spec-dir", config.spec_dir, "Directory of schema-spec fixtures");

    app.add_option("--data-dir", config.data_dir, "Directory of data fixtures");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    return config;
}

} // namespace conformance
