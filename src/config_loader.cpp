// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace conformance {

namespace {

/**
 * @brief Load and parse JSON schema from file.
 */
rapidjson::SchemaDocument load_schema(const std::filesystem::path& schema_path) {
    std::ifstream ifs(schema_path);
    if (!ifs.is_open()) {
        throw HarnessError("Failed to open schema file: " + schema_path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document schema_doc;
    schema_doc.ParseStream(isw);

    if (schema_doc.HasParseError()) {
        throw HarnessError("Failed to parse JSON schema: " + schema_path.string() +
                           " at offset " + std::to_string(schema_doc.GetErrorOffset()));
    }

    return rapidjson::SchemaDocument(schema_doc);
}

/**
 * @brief Validate JSON document against schema.
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const rapidjson::SchemaDocument& schema,
                             const std::filesystem::path& config_path) {
    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidDocumentPointer().StringifyUriFragment(sb);
        throw HarnessError("Config validation failed for " + config_path.string() +
                           " at: " + sb.GetString() +
                           ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

/**
 * @brief Get optional environment variable value.
 * @note Empty strings are treated as unset
 */
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

/**
 * @brief Parse and validate log level from string.
 * @throws HarnessError if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" ||
        level == "warning" || level == "error") {
        return level;
    }
    throw HarnessError("Invalid " + source + ": " + level +
                       " (must be trace|debug|info|warn|error)");
}

/**
 * @brief Resolve a configured path against the config file's directory.
 */
std::filesystem::path resolve_path(const std::filesystem::path& base_dir, const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_relative()) {
        return (base_dir / path).lexically_normal();
    }
    return path;
}

/**
 * @brief Apply environment variable override to a field if the env var is set.
 * @tparam T Field type
 * @tparam Parser Callable that takes (string value, string source) and returns T
 */
template <typename T, typename Parser>
void apply_env(T& field, const char* env_name, Parser parser) {
    if (auto val = get_env(env_name); val.has_value()) {
        field = parser(val.value(), env_name);
    }
}

/// Path overrides are taken as given, relative to the working directory.
std::filesystem::path parse_path(const std::string& value, const std::string& /* source */) {
    return std::filesystem::path(value);
}

} // namespace

HarnessConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path) {
    // Load and parse config file
    std::ifstream config_ifs(config_path);
    if (!config_ifs.is_open()) {
        throw HarnessError("Failed to open config file: " + config_path.string());
    }

    rapidjson::IStreamWrapper config_isw(config_ifs);
    rapidjson::Document config_doc;
    config_doc.ParseStream(config_isw);

    if (config_doc.HasParseError()) {
        throw HarnessError("Failed to parse config JSON: " + config_path.string() +
                           " at offset " + std::to_string(config_doc.GetErrorOffset()));
    }

    // Load schema and validate
    auto schema = load_schema(schema_path);
    validate_against_schema(config_doc, schema, config_path);

    // Extract values from JSON with defaults using JSON Pointers (RFC6901)
    using rapidjson::GetValueByPointer;
    using rapidjson::GetValueByPointerWithDefault;

    const auto base_dir = config_path.parent_path();
    HarnessConfig config;

    // Fixtures (required)
    if (auto* spec_dir = GetValueByPointer(config_doc, json::FIXTURES_SPEC_DIR)) {
        config.fixtures.spec_dir = resolve_path(base_dir, spec_dir->GetString());
    } else {
        throw HarnessError("Missing required config: " + std::string(json::FIXTURES_SPEC_DIR));
    }

    if (auto* data_dir = GetValueByPointer(config_doc, json::FIXTURES_DATA_DIR)) {
        config.fixtures.data_dir = resolve_path(base_dir, data_dir->GetString());
    } else {
        throw HarnessError("Missing required config: " + std::string(json::FIXTURES_DATA_DIR));
    }

    // Engine (optional)
    if (auto* meta_schema = GetValueByPointer(config_doc, json::ENGINE_META_SCHEMA)) {
        config.engine.meta_schema = resolve_path(base_dir, meta_schema->GetString());
    }

    // Known failures (optional)
    if (auto* known_failures = GetValueByPointer(config_doc, json::KNOWN_FAILURES)) {
        config.known_failures = KnownFailureRegistry::from_json(*known_failures);
    }

    // Observability - Logging (optional)
    config.observability.logging.level =
        GetValueByPointerWithDefault(config_doc, json::OBSERVABILITY_LOGGING_LEVEL, "info")
            .GetString();

    // Apply environment variable overrides
    apply_env(config.observability.logging.level, conformance::env::LOG_LEVEL, parse_log_level);
    apply_env(config.fixtures.spec_dir, conformance::env::SPEC_DIR, parse_path);
    apply_env(config.fixtures.data_dir, conformance::env::DATA_DIR, parse_path);

    if (auto meta_schema = get_env(conformance::env::META_SCHEMA); meta_schema.has_value()) {
        config.engine.meta_schema = parse_path(meta_schema.value(), conformance::env::META_SCHEMA);
    }

    return config;
}

} // namespace conformance
