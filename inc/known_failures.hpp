// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <rapidjson/document.h>

namespace conformance {

/// One reason covering every entry of a (schema, source) pair.
struct UniformReason {
    std::string reason;
};

/// Reasons for individually named entries of a (schema, source) pair.
struct PerEntryReason {
    std::map<std::string, std::string> reasons;
};

using KnownFailure = std::variant<UniformReason, PerEntryReason>;

/**
 * @brief Reason a given entry is expected to diverge, if any.
 *
 * An empty reason counts as no reason.
 */
[[nodiscard]] std::optional<std::string> resolve(const KnownFailure& known_failure,
                                                 const std::string& entry);

/**
 * @brief Checks that currently diverge from their declared outcome.
 *
 * A known failure does not skip the check: it still runs and is reported,
 * flagged as TODO so it does not fail the run.
 */
class KnownFailureRegistry {
public:
    KnownFailureRegistry() = default;

    /**
     * @brief Build the registry from configuration.
     *
     * Expected shape: `{"<schema>": {"<source>": "reason" | {"<entry>": "reason"}}}`
     *
     * @throws HarnessError on any other shape
     */
    [[nodiscard]] static KnownFailureRegistry from_json(const rapidjson::Value& config);

    /**
     * @brief Register (or replace) the known failure of a (schema, source) pair.
     */
    void add(const std::string& schema, const std::string& source, KnownFailure known_failure);

    [[nodiscard]] std::optional<std::string> reason_for(const std::string& schema,
                                                        const std::string& source,
                                                        const std::string& entry) const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::map<std::pair<std::string, std::string>, KnownFailure> entries_;
};

} // namespace conformance
