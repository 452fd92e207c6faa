/******************************************************************************
 * test_diagnostic_log.cpp
 *
 * Unit tests for per-scene diagnostic logs
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "diagnostic_log.h"
#include "test_support.h"
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace brs;
using brs::test::TempDir;
namespace fs = std::filesystem;

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

void test_log_path_beside_scene() {
    assert(diagnostic_log_path("/shots/A.blend") == fs::path("/shots/A.log"));
    assert(diagnostic_log_path("/shots/v2.final.blend") == fs::path("/shots/v2.final.log"));

    std::cout << "test_log_path_beside_scene: PASSED\n";
}

void test_report_contents_appended() {
    TempDir dir;
    const fs::path scene = dir.touch("A.blend");

    DiagnosticReport report;
    report.error_message = "Could not start Blender: No such file or directory";
    report.failure_kind = "LaunchError";
    report.context = {{"scene", scene.string()}, {"crash_count", "2"}};

    const fs::path written = write_diagnostic_log(scene, report);
    assert(written == dir.path() / "A.log");

    std::string text = read_file(written);
    assert(text.find("Error: Could not start Blender") != std::string::npos);
    assert(text.find("Kind: LaunchError") != std::string::npos);
    assert(text.find("  crash_count: 2") != std::string::npos);
    assert(text.find("=== Stack Backtrace ===") != std::string::npos);

    // A second failure is appended, not overwritten
    report.failure_kind = "OutputDirectoryError";
    write_diagnostic_log(scene, report);
    text = read_file(written);
    assert(count_occurrences(text, "==== ") == 2);
    assert(text.find("Kind: LaunchError") < text.find("Kind: OutputDirectoryError"));

    std::cout << "test_report_contents_appended: PASSED\n";
}

void test_unwritable_location_reports_empty_path() {
    TempDir dir;
    DiagnosticReport report;
    report.error_message = "x";

    const fs::path written = write_diagnostic_log(dir.path() / "missing_dir" / "A.blend", report);
    assert(written.empty());

    std::cout << "test_unwritable_location_reports_empty_path: PASSED\n";
}

int main() {
    std::cout << "Running diagnostic log tests...\n";

    test_log_path_beside_scene();
    test_report_contents_appended();
    test_unwritable_location_reports_empty_path();

    std::cout << "All diagnostic log tests passed!\n";
    return 0;
}
