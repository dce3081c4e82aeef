// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "expectation_expander.hpp"

#include <type_traits>

namespace conformance {

const char* to_string(Disposition disposition) {
    switch (disposition) {
        case Disposition::Pass:
            return "pass";
        case Disposition::Fail:
            return "fail";
    }
    return "unknown";
}

std::size_t SpecExpectations::size() const {
    std::size_t count = 0;
    for (const auto* sources : {&pass, &fail}) {
        for (const auto& [source, entries] : *sources) {
            count += entries.size();
        }
    }
    return count;
}

EntryExpectations ExpectationExpander::expand(const Declaration& declaration,
                                              const std::string& source) const {
    return std::visit(
        [&](const auto& decl) -> EntryExpectations {
            using T = std::decay_t<decltype(decl)>;
            if constexpr (std::is_same_v<T, EntrySet>) {
                return decl.entries;
            } else if constexpr (std::is_same_v<T, EntryList>) {
                EntryExpectations entries;
                for (const auto& name : decl.entries) {
                    entries.emplace(name, std::nullopt);
                }
                return entries;
            } else {
                EntryExpectations entries;
                for (const auto& name : store_.data_fixture(source).entry_names()) {
                    entries.emplace(name, decl.detail);
                }
                return entries;
            }
        },
        declaration);
}

SpecExpectations ExpectationExpander::expand(const SchemaSpecFixture& spec) const {
    SpecExpectations expectations;
    for (const auto& [source, declaration] : spec.pass) {
        expectations.pass.emplace(source, expand(declaration, source));
    }
    for (const auto& [source, declaration] : spec.fail) {
        expectations.fail.emplace(source, expand(declaration, source));
    }
    return expectations;
}

} // namespace conformance
