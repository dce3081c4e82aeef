// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "fixture_store.hpp"

#include "errors.hpp"
#include "json_utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <fstream>
#include <set>

#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

namespace conformance {

namespace {

constexpr const char* FIXTURE_EXTENSION = ".json";

std::string member_name(const rapidjson::Value& name) {
    return std::string(name.GetString(), name.GetStringLength());
}

/**
 * @brief Parse the `pass` or `fail` block of a schema spec.
 */
std::map<std::string, Declaration> parse_declarations(const rapidjson::Value& spec,
                                                      const char* disposition,
                                                      const std::string& spec_name) {
    std::map<std::string, Declaration> declarations;
    auto it = spec.FindMember(disposition);
    if (it == spec.MemberEnd() || it->value.IsNull()) {
        return declarations;
    }
    if (!it->value.IsObject()) {
        throw HarnessError("schema spec " + spec_name + ": '" + disposition +
                           "' must map data fixture names to entries, got " +
                           to_compact_json(it->value));
    }

    for (const auto& member : it->value.GetObject()) {
        std::string source = member_name(member.name);
        try {
            declarations.emplace(source, parse_declaration(member.value));
        } catch (const HarnessError& e) {
            throw HarnessError("schema spec " + spec_name + " (" + disposition + "/" + source +
                               "): " + e.what());
        }
    }
    return declarations;
}

} // namespace

std::string fixture_name_from_path(const std::filesystem::path& path) {
    return path.stem().string();
}

std::vector<std::filesystem::path> find_fixture_files(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw HarnessError("fixture directory not found: " + directory.string());
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == FIXTURE_EXTENSION) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw HarnessError("Failed to list fixture directory " + directory.string() + ": " +
                           ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// --------------------------------------------------------------------------
// JsonDecoder
// --------------------------------------------------------------------------

rapidjson::Document JsonDecoder::decode_file(const std::filesystem::path& path) const {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw HarnessError("Failed to open fixture file: " + path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document document;
    document.ParseStream<rapidjson::kParseFullPrecisionFlag>(isw);

    if (document.HasParseError()) {
        throw HarnessError(std::string(rapidjson::GetParseError_En(document.GetParseError())) +
                           " at offset " + std::to_string(document.GetErrorOffset()) + " (in " +
                           path.string() + ")");
    }
    return document;
}

rapidjson::Document JsonDecoder::clone(const rapidjson::Value& value) const {
    rapidjson::Document copy;
    copy.CopyFrom(value, copy.GetAllocator());
    return copy;
}

// --------------------------------------------------------------------------
// DataFixture
// --------------------------------------------------------------------------

const rapidjson::Value* DataFixture::entry(const std::string& entry_name) const {
    rapidjson::Value key(rapidjson::StringRef(entry_name.data(),
                                              static_cast<rapidjson::SizeType>(entry_name.size())));
    auto it = entries.FindMember(key);
    if (it == entries.MemberEnd()) {
        return nullptr;
    }
    return &it->value;
}

std::vector<std::string> DataFixture::entry_names() const {
    std::vector<std::string> names;
    names.reserve(entries.MemberCount());
    for (const auto& member : entries.GetObject()) {
        names.push_back(member_name(member.name));
    }
    std::sort(names.begin(), names.end());
    return names;
}

// --------------------------------------------------------------------------
// FixtureStore
// --------------------------------------------------------------------------

FixtureStore FixtureStore::load(const std::vector<std::filesystem::path>& schema_files,
                                const std::vector<std::filesystem::path>& data_files) {
    FixtureStore store;
    store.load_data_fixtures(data_files);
    store.load_schema_fixtures(schema_files);
    return store;
}

void FixtureStore::load_data_fixtures(const std::vector<std::filesystem::path>& paths) {
    for (const auto& path : paths) {
        auto name = fixture_name_from_path(path);
        if (data_.count(name) != 0) {
            throw HarnessError("already loaded data called " + name + " (" + path.string() + ")");
        }
        add_data_fixture(name, decoder_.decode_file(path));
        LOG_DEBUG_ENTRY(LogEntry("Loaded data fixture")
                            .component("fixtures")
                            .fixture({.source = name, .file = path.string()}));
    }
    LOG_DEBUG_ENTRY(LogEntry("Loaded " + std::to_string(data_.size()) + " data fixtures")
                        .component("fixtures"));
}

void FixtureStore::load_schema_fixtures(const std::vector<std::filesystem::path>& paths) {
    for (const auto& path : paths) {
        auto name = fixture_name_from_path(path);
        if (specs_.count(name) != 0) {
            throw HarnessError("already loaded schema spec tests for " + name + " (" +
                               path.string() + ")");
        }
        add_schema_fixture(name, decoder_.decode_file(path));
        LOG_DEBUG_ENTRY(LogEntry("Loaded schema spec")
                            .component("fixtures")
                            .fixture({.schema = name, .file = path.string()}));
    }
    LOG_DEBUG_ENTRY(LogEntry("Loaded " + std::to_string(specs_.size()) + " schema specs")
                        .component("fixtures"));
}

void FixtureStore::add_data_fixture(const std::string& name, rapidjson::Document document) {
    if (data_.count(name) != 0) {
        throw HarnessError("already loaded data called " + name);
    }

    DataFixture fixture;
    fixture.name = name;

    if (document.IsArray()) {
        auto& allocator = fixture.entries.GetAllocator();
        fixture.entries.SetObject();
        std::set<std::string> seen;
        for (const auto& element : document.GetArray()) {
            auto entry_name = entry_name_of(element);
            // Equal elements collapse into a single entry.
            if (!seen.insert(entry_name).second) {
                continue;
            }
            rapidjson::Value key(entry_name.c_str(),
                                 static_cast<rapidjson::SizeType>(entry_name.size()), allocator);
            rapidjson::Value value(element, allocator);
            fixture.entries.AddMember(key, value, allocator);
        }
    } else if (document.IsObject()) {
        std::set<std::string> seen;
        for (const auto& member : document.GetObject()) {
            if (!seen.insert(member_name(member.name)).second) {
                throw HarnessError("data fixture " + name + " repeats entry " +
                                   member_name(member.name));
            }
        }
        fixture.entries = std::move(document);
    } else {
        throw HarnessError("data fixture " + name +
                           " must be a JSON object or array, got " + to_compact_json(document));
    }

    data_.emplace(name, std::move(fixture));
}

void FixtureStore::add_schema_fixture(const std::string& name, rapidjson::Document document) {
    if (specs_.count(name) != 0) {
        throw HarnessError("already loaded schema spec tests for " + name);
    }
    if (!document.IsObject()) {
        throw HarnessError("schema spec " + name + " must be a JSON object");
    }

    SchemaSpecFixture spec;
    spec.name = name;

    if (auto it = document.FindMember("invalid"); it != document.MemberEnd()) {
        if (!it->value.IsBool() && !it->value.IsNull()) {
            throw HarnessError("schema spec " + name + ": 'invalid' must be a boolean, got " +
                               to_compact_json(it->value));
        }
        spec.invalid = it->value.IsTrue();
    }

    if (auto it = document.FindMember("schema"); it != document.MemberEnd()) {
        spec.schema.CopyFrom(it->value, spec.schema.GetAllocator());
    }

    spec.pass = parse_declarations(document, "pass", name);
    spec.fail = parse_declarations(document, "fail", name);

    specs_.emplace(name, std::move(spec));
}

bool FixtureStore::has_data_fixture(const std::string& name) const {
    return data_.count(name) != 0;
}

const DataFixture& FixtureStore::data_fixture(const std::string& name) const {
    auto it = data_.find(name);
    if (it == data_.end()) {
        throw HarnessError("no such test data: " + name);
    }
    return it->second;
}

} // namespace conformance
