// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "rapidjson_engine.hpp"

#include "errors.hpp"
#include "json_utils.hpp"

#include <fstream>

#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/stringbuffer.h>

namespace conformance {

namespace {

template <typename PointerType>
PathSegments to_segments(const PointerType& pointer) {
    PathSegments segments;
    segments.reserve(pointer.GetTokenCount());
    const auto* tokens = pointer.GetTokens();
    for (std::size_t i = 0; i < pointer.GetTokenCount(); ++i) {
        segments.emplace_back(tokens[i].name, tokens[i].length);
    }
    return segments;
}

template <typename PointerType>
std::string to_uri_fragment(const PointerType& pointer) {
    rapidjson::StringBuffer sb;
    pointer.StringifyUriFragment(sb);
    return sb.GetString();
}

} // namespace

ValidationResult RapidjsonSchema::validate(const rapidjson::Value& input) const {
    rapidjson::SchemaValidator validator(schema_);
    if (input.Accept(validator)) {
        return Accepted{};
    }

    Rejected rejection;
    if (const char* keyword = validator.GetInvalidSchemaKeyword(); keyword != nullptr) {
        rejection.failure_types.emplace_back(keyword);
    }
    rejection.path_to_value = to_segments(validator.GetInvalidDocumentPointer());
    rejection.path_to_check = to_segments(validator.GetInvalidSchemaPointer());
    return rejection;
}

RapidjsonSchemaEngine::RapidjsonSchemaEngine(const rapidjson::Value& meta_schema)
    : meta_schema_(std::make_unique<rapidjson::SchemaDocument>(meta_schema)) {}

std::unique_ptr<RapidjsonSchemaEngine>
RapidjsonSchemaEngine::from_meta_schema_file(const std::filesystem::path& meta_schema_path) {
    std::ifstream ifs(meta_schema_path);
    if (!ifs.is_open()) {
        throw HarnessError("Failed to open meta-schema file: " + meta_schema_path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document meta_doc;
    meta_doc.ParseStream(isw);

    if (meta_doc.HasParseError()) {
        throw HarnessError("Failed to parse meta-schema: " + meta_schema_path.string() + ": " +
                           rapidjson::GetParseError_En(meta_doc.GetParseError()) +
                           " at offset " + std::to_string(meta_doc.GetErrorOffset()));
    }

    return std::make_unique<RapidjsonSchemaEngine>(meta_doc);
}

std::unique_ptr<ISchema> RapidjsonSchemaEngine::build(const rapidjson::Value& definition) const {
    if (!definition.IsObject()) {
        throw SchemaBuildError("schema definition must be a JSON object, got " +
                               to_compact_json(definition));
    }

    if (meta_schema_) {
        rapidjson::SchemaValidator validator(*meta_schema_);
        if (!definition.Accept(validator)) {
            throw SchemaBuildError(
                "schema definition is malformed at: " +
                to_uri_fragment(validator.GetInvalidDocumentPointer()) +
                ", keyword: " + validator.GetInvalidSchemaKeyword() +
                " (meta-schema " + to_uri_fragment(validator.GetInvalidSchemaPointer()) + ")");
        }
    }

    return std::make_unique<RapidjsonSchema>(definition);
}

} // namespace conformance
