// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace conformance {

/// Sequence of path segments (object keys or array indices in decimal form).
using PathSegments = std::vector<std::string>;

/**
 * @brief The validator accepted the value.
 */
struct Accepted {};

/**
 * @brief The validator rejected the value.
 */
struct Rejected {
    std::vector<std::string> failure_types;
    PathSegments path_to_value; ///< Locates the offending value inside the input
    PathSegments path_to_check; ///< Locates the failing rule inside the schema
};

/// Outcome of validating one value against one schema.
using ValidationResult = std::variant<Accepted, Rejected>;

/**
 * @brief A constructed schema, ready to validate values.
 */
class ISchema {
public:
    virtual ~ISchema() = default;

    /**
     * @brief Validate a value against the schema.
     *
     * @param input Value to check (not modified)
     * @return Accepted, or Rejected with the structured failure details
     */
    [[nodiscard]] virtual ValidationResult validate(const rapidjson::Value& input) const = 0;
};

/**
 * @brief Abstract schema-validation engine under test.
 *
 * Enables dependency injection and mocking for unit tests.
 */
class ISchemaEngine {
public:
    virtual ~ISchemaEngine() = default;

    /**
     * @brief Construct a schema from its definition.
     *
     * @param definition Raw schema definition (any JSON value)
     * @return Constructed schema, never null
     *
     * @throws SchemaBuildError if the definition is not a valid schema
     */
    [[nodiscard]] virtual std::unique_ptr<ISchema>
    build(const rapidjson::Value& definition) const = 0;
};

} // namespace conformance
