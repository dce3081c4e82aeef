// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "declaration.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace conformance {

/**
 * @brief Derive a fixture name from its file path (base name, extension stripped).
 *
 * `spec/int-range.json` → `int-range`
 */
std::string fixture_name_from_path(const std::filesystem::path& path);

/**
 * @brief List the `*.json` fixture files of a directory in lexical order.
 *
 * @throws HarnessError if the directory does not exist
 */
std::vector<std::filesystem::path> find_fixture_files(const std::filesystem::path& directory);

/**
 * @brief Parses fixture files and clones sample values.
 *
 * Owned by the FixtureStore; there is no process-wide decoder.
 */
class JsonDecoder {
public:
    /**
     * @brief Parse a JSON file.
     * @throws HarnessError if the file cannot be opened or parsed
     */
    [[nodiscard]] rapidjson::Document decode_file(const std::filesystem::path& path) const;

    /**
     * @brief Deep-copy a value into a fresh, independently owned document.
     */
    [[nodiscard]] rapidjson::Document clone(const rapidjson::Value& value) const;
};

/**
 * @brief Named collection of sample values.
 */
struct DataFixture {
    std::string name;
    rapidjson::Document entries; ///< Always an object: entry name → raw value

    /**
     * @brief Raw value of an entry, or nullptr if the fixture has no such entry.
     */
    [[nodiscard]] const rapidjson::Value* entry(const std::string& entry_name) const;

    /**
     * @brief Entry names in lexical order.
     */
    [[nodiscard]] std::vector<std::string> entry_names() const;
};

/**
 * @brief Schema definition plus its raw pass/fail declarations.
 */
struct SchemaSpecFixture {
    std::string name;
    bool invalid = false;      ///< Schema construction is expected to fail
    rapidjson::Document schema; ///< Null when the fixture has no `schema` field
    std::map<std::string, Declaration> pass; ///< Keyed by data fixture name
    std::map<std::string, Declaration> fail;
};

/**
 * @brief Loads and owns every data and schema-spec fixture of a run.
 *
 * Fixtures are loaded once, before any expansion, and are read-only afterwards.
 * Every structural problem is a HarnessError: the run cannot continue on
 * broken fixture data.
 */
class FixtureStore {
public:
    FixtureStore() = default;

    FixtureStore(const FixtureStore&) = delete;
    FixtureStore& operator=(const FixtureStore&) = delete;
    FixtureStore(FixtureStore&&) = default;
    FixtureStore& operator=(FixtureStore&&) = default;

    /**
     * @brief Load data fixtures then schema-spec fixtures.
     */
    [[nodiscard]] static FixtureStore load(const std::vector<std::filesystem::path>& schema_files,
                                           const std::vector<std::filesystem::path>& data_files);

    void load_data_fixtures(const std::vector<std::filesystem::path>& paths);
    void load_schema_fixtures(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Register a parsed data fixture.
     *
     * A sequence becomes a mapping in which every element is keyed by its own
     * textual form (see entry_name_of()).
     *
     * @throws HarnessError on a duplicate name, a duplicate entry name, or a
     *         document that is neither a mapping nor a sequence
     */
    void add_data_fixture(const std::string& name, rapidjson::Document document);

    /**
     * @brief Register a parsed schema-spec fixture.
     *
     * The pass/fail declarations are parsed here, so malformed shapes fail at
     * load time. Wildcards are resolved later by the ExpectationExpander.
     *
     * @throws HarnessError on a duplicate name or a malformed fixture
     */
    void add_schema_fixture(const std::string& name, rapidjson::Document document);

    [[nodiscard]] bool has_data_fixture(const std::string& name) const;

    /**
     * @throws HarnessError if no data fixture of that name was loaded
     */
    [[nodiscard]] const DataFixture& data_fixture(const std::string& name) const;

    [[nodiscard]] const std::map<std::string, DataFixture>& data_fixtures() const {
        return data_;
    }

    /// Schema-spec fixtures in lexical name order.
    [[nodiscard]] const std::map<std::string, SchemaSpecFixture>& schema_fixtures() const {
        return specs_;
    }

    [[nodiscard]] const JsonDecoder& decoder() const { return decoder_; }

private:
    JsonDecoder decoder_;
    std::map<std::string, DataFixture> data_;
    std::map<std::string, SchemaSpecFixture> specs_;
};

} // namespace conformance
