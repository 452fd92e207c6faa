/*
 * File:        diagnostic_log.cpp
 * Module:      brs-common
 * Purpose:     Per-scene diagnostic log implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/diagnostic_log.h"
#include "include/logging.h"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <execinfo.h>
#endif

namespace fs = std::filesystem;

namespace brs {

static std::string get_timestamp() {
    auto now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string get_backtrace() {
    std::ostringstream trace;
    trace << "=== Stack Backtrace ===\n";

#if defined(__linux__) || defined(__APPLE__)
    void* buffer[64];
    int nptrs = backtrace(buffer, 64);
    char** strings = backtrace_symbols(buffer, nptrs);

    if (strings != nullptr) {
        for (int i = 0; i < nptrs; i++) {
            trace << "#" << std::setw(2) << i << " " << strings[i] << "\n";
        }
        free(strings);
    } else {
        trace << "Unable to obtain backtrace\n";
    }
#else
    trace << "Backtrace not available on this platform\n";
#endif

    return trace.str();
}

fs::path diagnostic_log_path(const fs::path& scene_file) {
    fs::path log = scene_file;
    log.replace_extension(".log");
    return log;
}

fs::path write_diagnostic_log(const fs::path& scene_file, const DiagnosticReport& report) {
    const fs::path out = diagnostic_log_path(scene_file);

    std::ofstream ofs(out, std::ios::app);
    if (!ofs) {
        BRS_LOG_ERROR("Unable to write diagnostic log {}", out.string());
        return {};
    }

    ofs << "==== " << get_timestamp() << " ====\n";
    ofs << "Error: " << report.error_message << "\n";
    if (!report.failure_kind.empty()) {
        ofs << "Kind: " << report.failure_kind << "\n";
    }
    if (!report.context.empty()) {
        ofs << "Context:\n";
        for (const auto& [key, value] : report.context) {
            ofs << "  " << key << ": " << value << "\n";
        }
    }
    ofs << get_backtrace() << "\n";

    if (!ofs) {
        BRS_LOG_ERROR("Diagnostic log {} may be incomplete (write failed)", out.string());
        return {};
    }

    BRS_LOG_INFO("Diagnostic log written to {}", out.string());
    return out;
}

} // namespace brs
