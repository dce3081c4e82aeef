// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <cstdlib>
#include <iostream>
#include <memory>

#include "cli.hpp"
#include "config_loader.hpp"
#include "errors.hpp"
#include "fixture_store.hpp"
#include "logger.hpp"
#include "rapidjson_engine.hpp"
#include "reporter.hpp"
#include "test_runner.hpp"

namespace {

void apply_cli_overrides(conformance::HarnessConfig& config,
                         const conformance::CliConfig& cli_config) {
    if (!cli_config.log_level.empty()) {
        config.observability.logging.level = cli_config.log_level;
    }
    if (!cli_config.spec_dir.empty()) {
        config.fixtures.spec_dir = cli_config.spec_dir;
    }
    if (!cli_config.data_dir.empty()) {
        config.fixtures.data_dir = cli_config.data_dir;
    }
}

std::unique_ptr<conformance::RapidjsonSchemaEngine>
make_engine(const conformance::EngineConfig& config) {
    if (config.meta_schema) {
        return conformance::RapidjsonSchemaEngine::from_meta_schema_file(*config.meta_schema);
    }
    return std::make_unique<conformance::RapidjsonSchemaEngine>();
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments (bootstrap only)
    auto cli_config = conformance::parse_cli_args(argc, argv);

    // Load and validate harness configuration from JSON file
    conformance::HarnessConfig config;
    try {
        config = conformance::load_config(cli_config.config_path, cli_config.config_schema_path);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return conformance::exit_code::HARNESS_ERROR;
    }
    apply_cli_overrides(config, cli_config);

    conformance::Logger::init(config.observability.logging.level);
    LOG_INFO("Conformance harness starting (specs: {}, data: {})",
             config.fixtures.spec_dir.string(), config.fixtures.data_dir.string());

    int status = conformance::exit_code::SUCCESS;
    try {
        // Data fixtures load before schema specs so wildcards see every entry
        auto store = conformance::FixtureStore::load(
            conformance::find_fixture_files(config.fixtures.spec_dir),
            conformance::find_fixture_files(config.fixtures.data_dir));
        LOG_INFO("Loaded {} schema specs and {} data fixtures", store.schema_fixtures().size(),
                 store.data_fixtures().size());

        auto engine = make_engine(config.engine);
        conformance::TestRunner runner(store, config.known_failures);
        conformance::TapReporter reporter(std::cout);

        runner.run(*engine, reporter);
        reporter.finish();

        if (!reporter.summary().success()) {
            status = conformance::exit_code::TEST_FAILURES;
        }
    } catch (const conformance::HarnessError& e) {
        LOG_ERROR_ENTRY(conformance::LogEntry("Conformance run aborted")
                            .component("harness")
                            .error({"HarnessError", e.what()}));
        std::cerr << "Harness error: " << e.what() << "\n";
        status = conformance::exit_code::HARNESS_ERROR;
    }

    // Shutdown logger last
    conformance::Logger::shutdown();
    return status;
}
