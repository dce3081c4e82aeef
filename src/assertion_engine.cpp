// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "assertion_engine.hpp"

#include <algorithm>

namespace conformance {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ' ';
        }
        result += item;
    }
    return result;
}

std::string mismatch(const PathSegments& expected, const PathSegments& got) {
    return "expected " + format_path(expected) + ", got " + format_path(got);
}

} // namespace

std::string format_path(const PathSegments& path) {
    if (path.empty()) {
        return "(empty)";
    }
    return "[ " + join(path) + " ]";
}

std::string describe(const Rejected& rejection) {
    return "rejected (" + join(rejection.failure_types) + ") at value " +
           format_path(rejection.path_to_value) + " by check " +
           format_path(rejection.path_to_check);
}

void AssertionEngine::record(bool ok, std::string description, const CheckContext& context) {
    reporter_.record(TestPoint{ok, std::move(description), context.todo});
}

void AssertionEngine::assert_pass(const ISchema& schema, const rapidjson::Value& input,
                                  const CheckContext& context) {
    auto description = "VALID  : " + context.input_desc + " against " + context.schema_desc;
    auto result = schema.validate(input);

    if (const auto* rejection = std::get_if<Rejected>(&result)) {
        record(false, std::move(description), context);
        reporter_.diag(describe(*rejection));
        return;
    }
    record(true, std::move(description), context);
}

void AssertionEngine::assert_fail(const ISchema& schema, const rapidjson::Value& input,
                                  const CheckContext& context,
                                  const std::optional<ExpectedDetail>& expected) {
    auto description = "INVALID: " + context.input_desc + " against " + context.schema_desc;
    auto result = schema.validate(input);

    const auto* rejection = std::get_if<Rejected>(&result);
    if (rejection == nullptr) {
        record(false, std::move(description), context);
        return;
    }
    record(true, std::move(description), context);
    record(!rejection->failure_types.empty(), "...rejection is structured", context);

    if (!expected) {
        return;
    }

    if (expected->value) {
        bool ok = rejection->path_to_value == *expected->value;
        record(ok, "...value: " + format_path(*expected->value), context);
        if (!ok) {
            reporter_.diag(mismatch(*expected->value, rejection->path_to_value));
        }
    }

    if (expected->check) {
        bool ok = rejection->path_to_check == *expected->check;
        record(ok, "...check: " + format_path(*expected->check), context);
        if (!ok) {
            reporter_.diag(mismatch(*expected->check, rejection->path_to_check));
        }
    }

    if (expected->error) {
        auto got = rejection->failure_types;
        std::sort(got.begin(), got.end());
        auto want = *expected->error;
        std::sort(want.begin(), want.end());

        bool ok = got == want;
        record(ok, "...failure type(s): " + join(want), context);
        if (!ok) {
            reporter_.diag("expected failure types [" + join(want) + "], got [" + join(got) + "]");
        }
    }
}

} // namespace conformance
