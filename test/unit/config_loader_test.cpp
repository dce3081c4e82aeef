// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "errors.hpp"
#include "utils/scoped_env.hpp"
#include "utils/temp_file.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace conformance {
namespace {

using test::ScopedEnv;
using test::TempFile;

/**
 * @brief Get path to the schema file (production schema used in tests).
 */
std::filesystem::path get_schema_path() {
#ifdef TEST_SCHEMA_DIR
    return std::filesystem::path(TEST_SCHEMA_DIR) / "config.schema.json";
#else
    const auto this_file = std::filesystem::weakly_canonical(std::filesystem::path(__FILE__));
    const auto project_root = this_file.parent_path().parent_path().parent_path();
    return project_root / "schema" / "config.schema.json";
#endif
}

//
// Valid configuration tests
//

// Minimal valid config JSON (fixtures is required)
const char* MINIMAL_CONFIG = R"({
  "fixtures": {"spec_dir": "spec", "data_dir": "data"}
})";

// Helper to create config with observability.logging.level
std::string config_with_log_level(const std::string& level) {
    return R"({
      "fixtures": {"spec_dir": "spec", "data_dir": "data"},
      "observability": {"logging": {"level": ")" +
           level + R"("}}
    })";
}

TEST(ConfigLoaderTest, LoadValidConfig) {
    TempFile config_file(R"({
      "fixtures": {"spec_dir": "fixtures/spec", "data_dir": "/abs/data"},
      "engine": {"meta_schema": "../schema/meta.json"},
      "known_failures": {
        "int": {"floats": "engine treats 1.0 as integer"}
      },
      "observability": {"logging": {"level": "debug"}}
    })");
    const auto base_dir = config_file.path().parent_path();

    auto config = load_config(config_file.path(), get_schema_path());

    EXPECT_EQ(config.observability.logging.level, "debug");
    // Relative paths resolve against the config file directory
    EXPECT_EQ(config.fixtures.spec_dir, (base_dir / "fixtures/spec").lexically_normal());
    EXPECT_EQ(config.fixtures.data_dir, std::filesystem::path("/abs/data"));
    ASSERT_TRUE(config.engine.meta_schema.has_value());
    EXPECT_EQ(*config.engine.meta_schema, (base_dir / "../schema/meta.json").lexically_normal());
    EXPECT_EQ(config.known_failures.size(), 1u);
    EXPECT_EQ(config.known_failures.reason_for("int", "floats", "any"),
              std::optional<std::string>("engine treats 1.0 as integer"));
}

TEST(ConfigLoaderTest, LoadAllLogLevels) {
    for (const auto& level : {"trace", "debug", "info", "warn", "warning", "error"}) {
        TempFile config_file(config_with_log_level(level));
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.observability.logging.level, level);
    }
}

TEST(ConfigLoaderTest, DefaultValues) {
    // Minimal config: log_level="info", no meta-schema, no known failures
    TempFile config_file(MINIMAL_CONFIG);
    auto config = load_config(config_file.path(), get_schema_path());
    EXPECT_EQ(config.observability.logging.level, "info");
    EXPECT_FALSE(config.engine.meta_schema.has_value());
    EXPECT_TRUE(config.known_failures.empty());
}

//
// Environment variable override tests
//

TEST(ConfigLoaderTest, EnvOverrides) {
    TempFile config_file(config_with_log_level("info"));

    // Override log level only
    {
        ScopedEnv env(env::LOG_LEVEL, "trace");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.observability.logging.level, "trace");
        EXPECT_EQ(config.fixtures.spec_dir.filename(), "spec");
    }

    // Override fixture directories; taken as given
    {
        ScopedEnv env({{env::SPEC_DIR, "/other/spec"}, {env::DATA_DIR, "rel/data"}});
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.observability.logging.level, "info");
        EXPECT_EQ(config.fixtures.spec_dir, std::filesystem::path("/other/spec"));
        EXPECT_EQ(config.fixtures.data_dir, std::filesystem::path("rel/data"));
    }

    // Meta-schema can be set without a config entry
    {
        ScopedEnv env(env::META_SCHEMA, "/etc/meta.json");
        auto config = load_config(config_file.path(), get_schema_path());
        ASSERT_TRUE(config.engine.meta_schema.has_value());
        EXPECT_EQ(*config.engine.meta_schema, std::filesystem::path("/etc/meta.json"));
    }
}

//
// Error handling tests
//

TEST(ConfigLoaderTest, MissingFilesThrow) {
    TempFile valid_config(MINIMAL_CONFIG);

    EXPECT_THROW(load_config("/nonexistent/config.json", get_schema_path()), HarnessError);
    EXPECT_THROW(load_config(valid_config.path(), "/nonexistent/schema.json"), HarnessError);
}

TEST(ConfigLoaderTest, InvalidJsonThrows) {
    // Invalid config JSON
    {
        TempFile config_file(R"({invalid json})");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), HarnessError);
    }

    // Invalid schema JSON
    {
        TempFile valid_config(MINIMAL_CONFIG);
        TempFile bad_schema(R"({not valid json)");
        EXPECT_THROW(load_config(valid_config.path(), bad_schema.path()), HarnessError);
    }
}

TEST(ConfigLoaderTest, SchemaValidationErrors) {
    // Missing required fixtures
    {
        TempFile empty_config(R"({})");
        EXPECT_THROW(load_config(empty_config.path(), get_schema_path()), HarnessError);
    }
    {
        TempFile missing_data(R"({"fixtures": {"spec_dir": "spec"}})");
        EXPECT_THROW(load_config(missing_data.path(), get_schema_path()), HarnessError);
    }

    // Invalid log level
    {
        TempFile invalid_level(config_with_log_level("invalid"));
        EXPECT_THROW(load_config(invalid_level.path(), get_schema_path()), HarnessError);
    }

    // Known failure reasons must be strings
    {
        TempFile bad_reason(R"({
            "fixtures": {"spec_dir": "spec", "data_dir": "data"},
            "known_failures": {"int": {"floats": 42}}
        })");
        EXPECT_THROW(load_config(bad_reason.path(), get_schema_path()), HarnessError);
    }

    // Extra properties not allowed at root level
    {
        TempFile extra_property(R"({
            "fixtures": {"spec_dir": "spec", "data_dir": "data"},
            "extra": "value"
        })");
        EXPECT_THROW(load_config(extra_property.path(), get_schema_path()), HarnessError);
    }
}

TEST(ConfigLoaderTest, EnvValidationErrors) {
    TempFile config_file(MINIMAL_CONFIG);

    ScopedEnv env(env::LOG_LEVEL, "invalid_level");
    EXPECT_THROW(load_config(config_file.path(), get_schema_path()), HarnessError);
}

//
// Empty environment variable tests (should be treated as unset)
// This is important for CI environments that may export variables with empty values
//

TEST(ConfigLoaderTest, EmptyEnvVarsTreatedAsUnset) {
    TempFile config_file(config_with_log_level("debug"));

    ScopedEnv env({{env::LOG_LEVEL, ""},
                   {env::SPEC_DIR, ""},
                   {env::DATA_DIR, ""},
                   {env::META_SCHEMA, ""}});

    auto config = load_config(config_file.path(), get_schema_path());
    EXPECT_EQ(config.observability.logging.level, "debug");
    EXPECT_EQ(config.fixtures.spec_dir,
              (config_file.path().parent_path() / "spec").lexically_normal());
    EXPECT_FALSE(config.engine.meta_schema.has_value());
}

//
// Shipped configuration
//

TEST(ConfigLoaderTest, ShippedConfigIsValid) {
#ifdef TEST_CONFIG_DIR
    const auto config_path = std::filesystem::path(TEST_CONFIG_DIR) / "harness.json";
#else
    const auto config_path = std::filesystem::path(__FILE__).parent_path().parent_path().parent_path() /
                             "config" / "harness.json";
#endif
    auto config = load_config(config_path, get_schema_path());

    EXPECT_TRUE(std::filesystem::is_directory(config.fixtures.spec_dir));
    EXPECT_TRUE(std::filesystem::is_directory(config.fixtures.data_dir));
    ASSERT_TRUE(config.engine.meta_schema.has_value());
    EXPECT_TRUE(std::filesystem::exists(*config.engine.meta_schema));
    EXPECT_FALSE(config.known_failures.empty());
}

} // namespace
} // namespace conformance
