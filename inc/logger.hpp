// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Structured JSON Logger for the Conformance Harness
//
// Log lines go to stderr by default: stdout is reserved for the TAP stream.
//
// Usage:
//   Logger::init("debug");
//
//   LOG_INFO("Loaded {} data fixtures", count);
//   LOG_DEBUG_ENTRY(LogEntry("Running schema spec").component("runner").fixture({.schema = "str"}));
//
//   Logger::shutdown();
//
// Output (one JSON object per line):
//   {"timestamp":"2024-01-15T10:30:00.123Z","level":"INFO","msg":"Loaded 9 data fixtures",
//    "service":"conformance-harness","version":"0.1.0","commit":"abc123"}
// -----------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>

#include "version.hpp"

namespace conformance {

/// Identifies the fixture data a log line is about.
struct FixtureContext {
    std::optional<std::string> schema;
    std::optional<std::string> source;
    std::optional<std::string> entry;
    std::optional<std::string> file;
};

struct ErrorContext {
    std::string type;
    std::string message;
};

/**
 * @brief Fluent builder for a structured log line.
 */
class LogEntry {
public:
    explicit LogEntry(std::string_view message) : msg_(message) {}

    LogEntry& component(std::string_view comp) {
        component_ = std::string(comp);
        return *this;
    }

    LogEntry& operation(std::string_view op) {
        operation_ = std::string(op);
        return *this;
    }

    LogEntry& fixture(const FixtureContext& ctx) {
        fixture_ = ctx;
        return *this;
    }

    LogEntry& error(const ErrorContext& ctx) {
        error_ = ctx;
        return *this;
    }

    /**
     * @brief Payload substituted for `%(message)` in the JSON line pattern.
     *
     * The pattern wraps the payload in quotes, so structured fields close the
     * `msg` string early and reopen a trailing `"_"` member for the pattern's
     * closing quote.
     */
    [[nodiscard]] std::string build() const;

private:
    std::string msg_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<FixtureContext> fixture_;
    std::optional<ErrorContext> error_;
};

} // namespace conformance

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/Sink.h>

#include <memory>
#include <mutex>

namespace conformance {

/// Name under which the default stderr sink is registered with Quill.
constexpr const char* DIAGNOSTICS_SINK_NAME = "conformance-stderr";

/**
 * @brief Reference-counted owner of the Quill backend thread.
 *
 * The first handle starts the backend, the last one stops it.
 */
class BackendHandle {
public:
    ~BackendHandle() { quill::Backend::stop(); }

    BackendHandle(const BackendHandle&) = delete;
    BackendHandle& operator=(const BackendHandle&) = delete;

    [[nodiscard]] static std::shared_ptr<BackendHandle> acquire();

private:
    BackendHandle();

    static std::mutex mutex_;
    static std::weak_ptr<BackendHandle> weak_instance_;
};

/**
 * @brief Process-wide logger.
 *
 * Every method is a no-op before init() and after shutdown(), so library code
 * may log unconditionally through the `*_ENTRY` macros.
 */
class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Sink writing to stderr, shared by every caller.
     */
    [[nodiscard]] static std::shared_ptr<quill::Sink> diagnostics_sink();

    /**
     * @brief Create the logger. A second call is a no-op.
     *
     * @param level trace|debug|info|warn|warning|error; anything else means info
     * @param sink  destination, stderr unless a test injects its own
     */
    static void init(std::string_view level = "info",
                     std::shared_ptr<quill::Sink> sink = diagnostics_sink());

    /// Flush pending lines and release the backend.
    static void shutdown();

    [[nodiscard]] static bool is_initialized();

    /// Underlying Quill logger for the plain macros; null when not initialized.
    [[nodiscard]] static quill::Logger* get();

    /**
     * @brief Emit a structured entry at @p level.
     */
    static void log(quill::LogLevel level, const LogEntry& entry);

private:
    Logger() = default;
    ~Logger() = default;

    static Logger& instance();

    std::shared_ptr<BackendHandle> backend_;
    quill::Logger* logger_ = nullptr;
};

} // namespace conformance

// -----------------------------------------------------------------------------
// Logging macros. Quill needs the format string at compile time.
// The plain forms require an initialized logger; the *_ENTRY forms do not.
// -----------------------------------------------------------------------------

#ifdef LOG_DEBUG
    #undef LOG_DEBUG
#endif
#ifdef LOG_INFO
    #undef LOG_INFO
#endif
#ifdef LOG_ERROR
    #undef LOG_ERROR
#endif

#define LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(conformance::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) QUILL_LOG_INFO(conformance::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(conformance::Logger::get(), fmt, ##__VA_ARGS__)

#define LOG_DEBUG_ENTRY(entry) conformance::Logger::log(quill::LogLevel::Debug, entry)
#define LOG_INFO_ENTRY(entry) conformance::Logger::log(quill::LogLevel::Info, entry)
#define LOG_WARN_ENTRY(entry) conformance::Logger::log(quill::LogLevel::Warning, entry)
#define LOG_ERROR_ENTRY(entry) conformance::Logger::log(quill::LogLevel::Error, entry)
