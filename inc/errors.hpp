// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace conformance {

/**
 * @brief Unrecoverable harness misconfiguration.
 *
 * Raised for broken fixture data or harness invocation: unreadable or duplicate
 * fixtures, malformed pass/fail declarations, unknown fixture references, or a
 * schema that should be valid failing to build. Never used for validation
 * outcomes under test.
 */
class HarnessError : public std::runtime_error {
public:
    explicit HarnessError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Schema definition rejected by the validation engine.
 *
 * Whether this is fatal depends on the schema spec's `invalid` flag, so the runner
 * catches it explicitly.
 */
class SchemaBuildError : public std::runtime_error {
public:
    explicit SchemaBuildError(const std::string& message) : std::runtime_error(message) {}
};

/// Process exit status of the harness executable.
namespace exit_code {
constexpr int SUCCESS = 0;       ///< Every test point passed (known failures excluded)
constexpr int TEST_FAILURES = 1; ///< At least one test point failed
constexpr int HARNESS_ERROR = 2; ///< Configuration or fixture error; the run was aborted
} // namespace exit_code

} // namespace conformance
