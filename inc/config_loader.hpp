// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "known_failures.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace conformance {

/**
 * @brief Where the fixture files live.
 */
struct FixturesConfig {
    std::filesystem::path spec_dir;
    std::filesystem::path data_dir;
};

/**
 * @brief Validation engine settings.
 */
struct EngineConfig {
    /// Meta-schema every schema definition must satisfy; none means object-only check
    std::optional<std::filesystem::path> meta_schema;
};

/**
 * @brief Logging configuration.
 */
struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Observability settings.
 */
struct ObservabilityConfig {
    LoggingConfig logging;
};

/**
 * @brief Harness configuration loaded from JSON config file.
 *
 * Relative paths are resolved against the directory of the config file.
 * Values can be overridden by environment variables with CONFORMANCE_ prefix.
 */
struct HarnessConfig {
    FixturesConfig fixtures;
    EngineConfig engine;
    KnownFailureRegistry known_failures;
    ObservabilityConfig observability;
};

/// JSON Pointer paths (RFC6901) for extracting HarnessConfig values
namespace json {
constexpr char FIXTURES_SPEC_DIR[] = "/fixtures/spec_dir";
constexpr char FIXTURES_DATA_DIR[] = "/fixtures/data_dir";
constexpr char ENGINE_META_SCHEMA[] = "/engine/meta_schema";
constexpr char KNOWN_FAILURES[] = "/known_failures";
constexpr char OBSERVABILITY_LOGGING_LEVEL[] = "/observability/logging/level";
} // namespace json

/**
 * @brief Load and validate harness configuration from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (CONFORMANCE_LOG_LEVEL, CONFORMANCE_SPEC_DIR, ...)
 * 2. JSON configuration file
 *
 * Command-line overrides are applied by the caller on top of the result.
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return HarnessConfig Validated configuration
 *
 * @throws HarnessError if config file not found, invalid JSON, or schema validation fails
 */
HarnessConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path);

} // namespace conformance
