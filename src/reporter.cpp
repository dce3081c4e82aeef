// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "reporter.hpp"

#include <string>

namespace conformance {

namespace {

// TAP reserves '#' for directives; a literal one in a description must be escaped.
std::string escape_description(std::string_view description) {
    std::string result;
    result.reserve(description.size());
    for (char c : description) {
        if (c == '#') {
            result += "\\#";
        } else if (c == '\n' || c == '\r') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace

void RunSummary::add(const TestPoint& point) {
    ++total;
    if (point.todo) {
        if (point.ok) {
            ++todo_passed;
        } else {
            ++todo_failed;
        }
        return;
    }
    if (point.ok) {
        ++passed;
    } else {
        ++failed;
    }
}

void TapReporter::record(const TestPoint& point) {
    summary_.add(point);

    std::string line = point.ok ? "ok " : "not ok ";
    line += std::to_string(summary_.total);
    if (!point.description.empty()) {
        line += " - " + escape_description(point.description);
    }
    if (point.todo) {
        line += " # TODO " + escape_description(*point.todo);
    }
    line += '\n';
    write_line(line);
}

void TapReporter::diag(std::string_view message) {
    std::string_view rest = message;
    while (true) {
        auto newline = rest.find('\n');
        std::string line = "# ";
        line += rest.substr(0, newline);
        line += '\n';
        write_line(line);
        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }
}

void TapReporter::finish() {
    write_line("1.." + std::to_string(summary_.total) + "\n");
    out_.flush();
}

// Each line goes out in one insertion so no other writer can split it.
void TapReporter::write_line(const std::string& line) {
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
}

} // namespace conformance
