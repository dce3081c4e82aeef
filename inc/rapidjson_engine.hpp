// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "schema_engine.hpp"

#include <filesystem>
#include <memory>

#include <rapidjson/document.h>
#include <rapidjson/schema.h>

namespace conformance {

/**
 * @brief JSON Schema compiled by RapidJSON.
 *
 * A rejection maps RapidJSON's validator state as follows:
 * - path-to-value: tokens of GetInvalidDocumentPointer()
 * - path-to-check: tokens of GetInvalidSchemaPointer()
 * - failure type:  GetInvalidSchemaKeyword() (`type`, `minimum`, `required`, ...)
 */
class RapidjsonSchema : public ISchema {
public:
    explicit RapidjsonSchema(const rapidjson::Value& definition) : schema_(definition) {}

    [[nodiscard]] ValidationResult validate(const rapidjson::Value& input) const override;

private:
    rapidjson::SchemaDocument schema_;
};

/**
 * @brief Schema-validation engine backed by RapidJSON's JSON Schema support.
 *
 * RapidJSON accepts nearly any object as a schema, so definitions are first
 * checked against a meta-schema describing the keyword shapes the harness
 * treats as well formed. Without a meta-schema only the "must be an object"
 * rule applies.
 */
class RapidjsonSchemaEngine : public ISchemaEngine {
public:
    RapidjsonSchemaEngine() = default;

    /**
     * @param meta_schema JSON Schema every schema definition must satisfy
     */
    explicit RapidjsonSchemaEngine(const rapidjson::Value& meta_schema);

    /**
     * @brief Construct the engine with the meta-schema read from a file.
     *
     * @throws HarnessError if the file cannot be opened or parsed
     */
    [[nodiscard]] static std::unique_ptr<RapidjsonSchemaEngine>
    from_meta_schema_file(const std::filesystem::path& meta_schema_path);

    [[nodiscard]] std::unique_ptr<ISchema>
    build(const rapidjson::Value& definition) const override;

private:
    std::unique_ptr<rapidjson::SchemaDocument> meta_schema_;
};

} // namespace conformance
