// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include <array>
#include <filesystem>
#include <utility>

#include <quill/sinks/StreamSink.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace conformance {

namespace {

constexpr std::array<std::pair<std::string_view, quill::LogLevel>, 6> LEVELS{{
    {"trace", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warn", quill::LogLevel::Warning},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
}};

quill::LogLevel parse_level(std::string_view name) {
    for (const auto& [level_name, level] : LEVELS) {
        if (level_name == name) {
            return level;
        }
    }
    return quill::LogLevel::Info;
}

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_member(JsonWriter& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_member(JsonWriter& writer, const char* key, const std::optional<std::string>& value) {
    if (value) {
        write_member(writer, key, *value);
    }
}

/// JSON string literal of @p text without its surrounding quotes.
std::string escaped(const std::string& text) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    return std::string(buffer.GetString() + 1, buffer.GetSize() - 2);
}

} // namespace

// --------------------------------------------------------------------------
// BackendHandle
// --------------------------------------------------------------------------

std::mutex BackendHandle::mutex_;
std::weak_ptr<BackendHandle> BackendHandle::weak_instance_;

BackendHandle::BackendHandle() {
    quill::Backend::start(quill::BackendOptions{});
}

std::shared_ptr<BackendHandle> BackendHandle::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto handle = weak_instance_.lock();
    if (!handle) {
        handle = std::shared_ptr<BackendHandle>(new BackendHandle());
        weak_instance_ = handle;
    }
    return handle;
}

// --------------------------------------------------------------------------
// Logger
// --------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

std::shared_ptr<quill::Sink> Logger::diagnostics_sink() {
    return quill::Frontend::create_or_get_sink<quill::StreamSink>(
        DIAGNOSTICS_SINK_NAME, std::filesystem::path("stderr"));
}

void Logger::init(std::string_view level, std::shared_ptr<quill::Sink> sink) {
    auto& inst = instance();
    if (inst.logger_ != nullptr) {
        return;
    }

    inst.backend_ = BackendHandle::acquire();

    // {{ and }} are literal braces in Quill patterns
    static constexpr const char* json_pattern =
        "{{\"timestamp\":\"%(time)\",\"level\":\"%(log_level)\",\"msg\":\"%(message)\""
        ",\"service\":\"" CONFORMANCE_SERVICE_NAME "\",\"version\":\"" CONFORMANCE_SERVICE_VERSION
        "\",\"commit\":\"" CONFORMANCE_GIT_COMMIT "\"}}";

    quill::PatternFormatterOptions formatter_options{json_pattern, "%Y-%m-%dT%H:%M:%S.%QmsZ",
                                                     quill::Timezone::GmtTime};

    inst.logger_ =
        quill::Frontend::create_or_get_logger(SERVICE_NAME, std::move(sink), formatter_options);
    inst.logger_->set_log_level(parse_level(level));
}

void Logger::shutdown() {
    auto& inst = instance();
    if (inst.logger_ != nullptr) {
        inst.logger_->flush_log();
        quill::Frontend::remove_logger(inst.logger_);
        inst.logger_ = nullptr;
    }
    inst.backend_.reset();
}

bool Logger::is_initialized() {
    return instance().logger_ != nullptr;
}

quill::Logger* Logger::get() {
    return instance().logger_;
}

void Logger::log(quill::LogLevel level, const LogEntry& entry) {
    if (auto* logger = instance().logger_) {
        QUILL_LOG_DYNAMIC(logger, level, "{}", entry.build());
    }
}

// --------------------------------------------------------------------------
// LogEntry
// --------------------------------------------------------------------------

std::string LogEntry::build() const {
    if (!component_ && !operation_ && !fixture_ && !error_) {
        return escaped(msg_);
    }

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    write_member(writer, "component", component_);
    write_member(writer, "operation", operation_);
    if (fixture_) {
        writer.Key("fixture");
        writer.StartObject();
        write_member(writer, "schema", fixture_->schema);
        write_member(writer, "source", fixture_->source);
        write_member(writer, "entry", fixture_->entry);
        write_member(writer, "file", fixture_->file);
        writer.EndObject();
    }
    if (error_) {
        writer.Key("error");
        writer.StartObject();
        write_member(writer, "type", error_->type);
        write_member(writer, "message", error_->message);
        writer.EndObject();
    }
    writer.EndObject();

    // Splice the members (without the enclosing braces) between msg and "_"
    std::string members(buffer.GetString() + 1, buffer.GetSize() - 2);
    return escaped(msg_) + "\"," + members + ",\"_\":\"";
}

} // namespace conformance
