// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "known_failures.hpp"

#include "errors.hpp"
#include "json_utils.hpp"

#include <type_traits>

namespace conformance {

namespace {

std::string to_std_string(const rapidjson::Value& value) {
    return std::string(value.GetString(), value.GetStringLength());
}

KnownFailure parse_known_failure(const rapidjson::Value& raw, const std::string& where) {
    if (raw.IsString()) {
        return UniformReason{to_std_string(raw)};
    }
    if (raw.IsObject()) {
        PerEntryReason per_entry;
        for (const auto& member : raw.GetObject()) {
            if (!member.value.IsString()) {
                throw HarnessError("known failure " + where + "/" + to_std_string(member.name) +
                                   ": reason must be a string, got " +
                                   to_compact_json(member.value));
            }
            per_entry.reasons[to_std_string(member.name)] = to_std_string(member.value);
        }
        return per_entry;
    }
    throw HarnessError("known failure " + where +
                       ": expected a reason or an entry -> reason mapping, got " +
                       to_compact_json(raw));
}

} // namespace

std::optional<std::string> resolve(const KnownFailure& known_failure, const std::string& entry) {
    const std::string* reason = std::visit(
        [&](const auto& kf) -> const std::string* {
            using T = std::decay_t<decltype(kf)>;
            if constexpr (std::is_same_v<T, UniformReason>) {
                return &kf.reason;
            } else {
                auto it = kf.reasons.find(entry);
                return it == kf.reasons.end() ? nullptr : &it->second;
            }
        },
        known_failure);

    if (reason == nullptr || reason->empty()) {
        return std::nullopt;
    }
    return *reason;
}

KnownFailureRegistry KnownFailureRegistry::from_json(const rapidjson::Value& config) {
    KnownFailureRegistry registry;
    if (config.IsNull()) {
        return registry;
    }
    if (!config.IsObject()) {
        throw HarnessError("known failures must be an object keyed by schema name");
    }

    for (const auto& schema : config.GetObject()) {
        auto schema_name = to_std_string(schema.name);
        if (!schema.value.IsObject()) {
            throw HarnessError("known failures for " + schema_name +
                               " must be an object keyed by data source");
        }
        for (const auto& source : schema.value.GetObject()) {
            auto source_name = to_std_string(source.name);
            registry.add(schema_name, source_name,
                         parse_known_failure(source.value, schema_name + "/" + source_name));
        }
    }
    return registry;
}

void KnownFailureRegistry::add(const std::string& schema, const std::string& source,
                               KnownFailure known_failure) {
    entries_.insert_or_assign({schema, source}, std::move(known_failure));
}

std::optional<std::string> KnownFailureRegistry::reason_for(const std::string& schema,
                                                            const std::string& source,
                                                            const std::string& entry) const {
    auto it = entries_.find({schema, source});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return resolve(it->second, entry);
}

} // namespace conformance
