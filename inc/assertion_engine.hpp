// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "declaration.hpp"
#include "reporter.hpp"
#include "schema_engine.hpp"

#include <optional>
#include <string>

#include <rapidjson/document.h>

namespace conformance {

/**
 * @brief Identifies one check in test point descriptions.
 */
struct CheckContext {
    std::string schema_desc; ///< Schema spec name
    std::string input_desc;  ///< `<source>/<entry>`
    std::optional<std::string> todo; ///< Known-failure reason applied to every point
};

/**
 * @brief Render a path for a test point description: `[ a b ]`, or `(empty)` for the root.
 */
[[nodiscard]] std::string format_path(const PathSegments& path);

/**
 * @brief One-line rendering of a rejection, for diagnostics.
 */
[[nodiscard]] std::string describe(const Rejected& rejection);

/**
 * @brief Validates values and records the outcome as test points.
 *
 * Every sub-assertion is its own test point; a mismatch in one never
 * suppresses the others.
 */
class AssertionEngine {
public:
    explicit AssertionEngine(IReporter& reporter) : reporter_(reporter) {}

    /**
     * @brief Expect @p schema to accept @p input.
     *
     * Records `VALID  : <input> against <schema>`. A rejection is followed by
     * a diagnostic describing it.
     */
    void assert_pass(const ISchema& schema, const rapidjson::Value& input,
                     const CheckContext& context);

    /**
     * @brief Expect @p schema to reject @p input.
     *
     * Records `INVALID: <input> against <schema>`. On rejection it also checks
     * that the rejection is structured and then, for each field present in
     * @p expected, the path-to-value, the path-to-check and the sorted failure
     * types. Nothing beyond the first point is recorded if the value was
     * accepted.
     */
    void assert_fail(const ISchema& schema, const rapidjson::Value& input,
                     const CheckContext& context, const std::optional<ExpectedDetail>& expected);

private:
    void record(bool ok, std::string description, const CheckContext& context);

    IReporter& reporter_;
};

} // namespace conformance
