// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "declaration.hpp"
#include "fixture_store.hpp"

#include <map>
#include <optional>
#include <string>

namespace conformance {

enum class Disposition {
    Pass, ///< The value must be accepted
    Fail  ///< The value must be rejected
};

[[nodiscard]] const char* to_string(Disposition disposition);

/// Entry name → optional expected detail, for one data source.
using EntryExpectations = std::map<std::string, std::optional<ExpectedDetail>>;

/// Data source name → its expanded entries.
using SourceExpectations = std::map<std::string, EntryExpectations>;

/**
 * @brief Concrete expectations of one schema spec.
 */
struct SpecExpectations {
    SourceExpectations pass;
    SourceExpectations fail;

    [[nodiscard]] const SourceExpectations& of(Disposition disposition) const {
        return disposition == Disposition::Pass ? pass : fail;
    }

    /// Number of individual (source, entry) checks across both dispositions.
    [[nodiscard]] std::size_t size() const;
};

/**
 * @brief Resolves pass/fail declarations into concrete per-entry expectations.
 *
 * Wildcards read the data fixture as it is at expansion time, so every data
 * fixture must be loaded before expanding.
 */
class ExpectationExpander {
public:
    explicit ExpectationExpander(const FixtureStore& store) : store_(store) {}

    /**
     * @brief Expand one declaration against its data source.
     *
     * @throws HarnessError if a wildcard names a data fixture that was never loaded
     */
    [[nodiscard]] EntryExpectations expand(const Declaration& declaration,
                                           const std::string& source) const;

    /**
     * @brief Expand every declaration of a schema spec.
     */
    [[nodiscard]] SpecExpectations expand(const SchemaSpecFixture& spec) const;

private:
    const FixtureStore& store_;
};

} // namespace conformance
