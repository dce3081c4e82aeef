// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "schema_engine.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace conformance {

/// Entry name (or whole declaration) standing for every entry of a data fixture.
constexpr const char* WILDCARD = "*";

/**
 * @brief Expected shape of a rejection. Absent fields are not checked.
 */
struct ExpectedDetail {
    std::optional<PathSegments> value;
    std::optional<PathSegments> check;
    std::optional<std::vector<std::string>> error; ///< Kept sorted
};

/// Explicit entry names, each with its own optional detail.
struct EntrySet {
    std::map<std::string, std::optional<ExpectedDetail>> entries;
};

/// Explicit entry names without details.
struct EntryList {
    std::vector<std::string> entries;
};

/// Every entry of the referenced data fixture, all sharing one optional detail.
struct Wildcard {
    std::optional<ExpectedDetail> detail;
};

/**
 * @brief One `pass`/`fail` declaration for a single data source.
 */
using Declaration = std::variant<EntrySet, EntryList, Wildcard>;

/**
 * @brief Parse a raw pass/fail declaration.
 *
 * Accepted shapes:
 * - `"*"`, `{"*": detail}` or `["*"]`: Wildcard
 * - `{"entry": detail, ...}`: EntrySet (a null detail means no detail)
 * - `["entry", ...]`: EntryList
 *
 * @throws HarnessError for any other shape, quoting the offending value
 */
Declaration parse_declaration(const rapidjson::Value& raw);

/**
 * @brief Parse a detail object with optional `value`, `check` and `error` arrays.
 *
 * @return std::nullopt when @p raw is null
 * @throws HarnessError if the detail is not an object or a field is malformed
 */
std::optional<ExpectedDetail> parse_detail(const rapidjson::Value& raw);

} // namespace conformance
