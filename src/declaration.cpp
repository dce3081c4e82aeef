// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "declaration.hpp"

#include "errors.hpp"
#include "json_utils.hpp"

#include <algorithm>
#include <string>

namespace conformance {

namespace {

bool is_wildcard_string(const rapidjson::Value& value) {
    return value.IsString() && std::string(value.GetString(), value.GetStringLength()) == WILDCARD;
}

/**
 * @brief Parse a path array. Segments are strings or non-negative integers.
 */
PathSegments parse_path(const rapidjson::Value& raw, const char* field) {
    if (!raw.IsArray()) {
        throw HarnessError(std::string("invalid detail field '") + field +
                           "': expected an array, got " + to_compact_json(raw));
    }
    PathSegments path;
    path.reserve(raw.Size());
    for (const auto& segment : raw.GetArray()) {
        if (segment.IsString()) {
            path.emplace_back(segment.GetString(), segment.GetStringLength());
        } else if (segment.IsUint64()) {
            path.push_back(std::to_string(segment.GetUint64()));
        } else {
            throw HarnessError(std::string("invalid path segment in '") + field +
                               "': " + to_compact_json(segment));
        }
    }
    return path;
}

std::vector<std::string> parse_failure_types(const rapidjson::Value& raw) {
    if (!raw.IsArray()) {
        throw HarnessError("invalid detail field 'error': expected an array, got " +
                           to_compact_json(raw));
    }
    std::vector<std::string> types;
    types.reserve(raw.Size());
    for (const auto& type : raw.GetArray()) {
        if (!type.IsString()) {
            throw HarnessError("invalid failure type: " + to_compact_json(type));
        }
        types.emplace_back(type.GetString(), type.GetStringLength());
    }
    std::sort(types.begin(), types.end());
    return types;
}

} // namespace

std::optional<ExpectedDetail> parse_detail(const rapidjson::Value& raw) {
    if (raw.IsNull()) {
        return std::nullopt;
    }
    if (!raw.IsObject()) {
        throw HarnessError("invalid expectation detail: " + to_compact_json(raw));
    }

    ExpectedDetail detail;
    if (auto it = raw.FindMember("value"); it != raw.MemberEnd()) {
        detail.value = parse_path(it->value, "value");
    }
    if (auto it = raw.FindMember("check"); it != raw.MemberEnd()) {
        detail.check = parse_path(it->value, "check");
    }
    if (auto it = raw.FindMember("error"); it != raw.MemberEnd()) {
        detail.error = parse_failure_types(it->value);
    }
    return detail;
}

Declaration parse_declaration(const rapidjson::Value& raw) {
    if (is_wildcard_string(raw)) {
        return Wildcard{};
    }

    if (raw.IsObject()) {
        if (raw.MemberCount() == 1 && is_wildcard_string(raw.MemberBegin()->name)) {
            return Wildcard{parse_detail(raw.MemberBegin()->value)};
        }
        EntrySet set;
        for (const auto& member : raw.GetObject()) {
            std::string entry(member.name.GetString(), member.name.GetStringLength());
            set.entries[entry] = parse_detail(member.value);
        }
        return set;
    }

    if (raw.IsArray()) {
        if (raw.Size() == 1 && is_wildcard_string(raw[0])) {
            return Wildcard{};
        }
        EntryList list;
        list.entries.reserve(raw.Size());
        for (const auto& entry : raw.GetArray()) {
            list.entries.push_back(entry_name_of(entry));
        }
        return list;
    }

    throw HarnessError("invalid test spec: " + to_compact_json(raw));
}

} // namespace conformance
