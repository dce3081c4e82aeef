// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace conformance {

/**
 * @brief Command-line interface configuration result.
 *
 * Empty override fields leave the configured value in place.
 */
struct CliConfig {
    std::string config_path = "config/harness.json";
    std::string config_schema_path = "schema/config.schema.json";
    std::string log_level;
    std::string spec_dir;
    std::string data_dir;
};

/**
 * @brief Parse command-line arguments and configure application.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 *
 * Exits the process on invalid arguments or --help.
 */
CliConfig parse_cli_args(int argc, char* argv[]);

} // namespace conformance
