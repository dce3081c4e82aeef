// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace conformance {

/**
 * @brief One recorded check.
 */
struct TestPoint {
    bool ok = false;
    std::string description;
    std::optional<std::string> todo; ///< Known-failure reason; a failure here is tolerated
};

/**
 * @brief Aggregate counts of a run.
 */
struct RunSummary {
    int total = 0;
    int passed = 0;
    int failed = 0;      ///< Failures that count against the run
    int todo_failed = 0; ///< Known failures that failed as expected
    int todo_passed = 0; ///< Known failures that unexpectedly passed

    void add(const TestPoint& point);

    [[nodiscard]] bool success() const { return failed == 0; }
};

/**
 * @brief Sink for recorded test points.
 *
 * Enables dependency injection and recording reporters in unit tests.
 */
class IReporter {
public:
    virtual ~IReporter() = default;

    virtual void record(const TestPoint& point) = 0;

    /**
     * @brief Emit free-form diagnostic text attached to the last test point.
     */
    virtual void diag(std::string_view message) = 0;

    [[nodiscard]] virtual RunSummary summary() const = 0;
};

/**
 * @brief Writes test points in TAP (Test Anything Protocol) format.
 *
 * Output:
 *   ok 1 - VALID  : strings/a against str
 *   not ok 2 - INVALID: numbers/one against str # TODO num/str confusion
 *   # rejected: type at [ ] by [ ]
 *   1..2
 *
 * The plan line is written by finish(), after the last point. Every line
 * reaches the stream as a single write.
 */
class TapReporter : public IReporter {
public:
    explicit TapReporter(std::ostream& out) : out_(out) {}

    void record(const TestPoint& point) override;
    void diag(std::string_view message) override;
    [[nodiscard]] RunSummary summary() const override { return summary_; }

    /**
     * @brief Write the plan line. Call once, after the last test point.
     */
    void finish();

private:
    void write_line(const std::string& line);

    std::ostream& out_;
    RunSummary summary_;
};

} // namespace conformance
