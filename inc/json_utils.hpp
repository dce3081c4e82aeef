// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace conformance {

/**
 * @brief Serialize a JSON value in compact form.
 */
inline std::string to_compact_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

/**
 * @brief Entry name of a value listed in a sequence.
 *
 * Strings name themselves by their contents; any other value is named by its
 * compact JSON text (`5.1`, `true`, `[1,2]`).
 */
inline std::string entry_name_of(const rapidjson::Value& value) {
    if (value.IsString()) {
        return std::string(value.GetString(), value.GetStringLength());
    }
    return to_compact_json(value);
}

} // namespace conformance
