/*
 * File:        output_parsing.h
 * Module:      brs-core
 * Purpose:     Parsers for the renderer's console output
 *
 * Both the probe protocol and the render progress protocol are scraped from
 * the renderer's stdout, which also carries large amounts of unrelated log
 * output. All knowledge of the textual markers lives here.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace brs::parsing {

// Probe protocol tags, printed by the generated probe script
constexpr const char* PROBE_START_FRAME = "[PROBE] START_FRAME";
constexpr const char* PROBE_END_FRAME = "[PROBE] END_FRAME";
constexpr const char* PROBE_OUTPUT_DIR = "[PROBE] OUTPUT_DIR";
constexpr const char* PROBE_OUTPUT_FORMAT = "[PROBE] OUTPUT_FORMAT";

// Render progress markers
constexpr const char* FRAME_MARKER = "Fra:";
constexpr const char* DONE_MARKER = "[DONE]";
constexpr const char* ERROR_MARKER = "[ERROR]";

/**
 * @brief Raw values collected from probe output
 *
 * A field stays unset if its tag never appeared or its value was unparseable.
 * output_dir is kept verbatim (possibly empty or "//"); path resolution is the
 * prober's job.
 */
struct ProbeValues {
    std::optional<int32_t> start_frame;
    std::optional<int32_t> end_frame;
    std::optional<std::string> output_dir;
    std::optional<std::string> output_format;
};

/**
 * @brief Accumulates probe values line by line
 */
class ProbeOutputParser {
public:
    /// Inspect one line; returns true if it carried a probe tag
    bool feed_line(const std::string& line);

    const ProbeValues& values() const { return values_; }

private:
    ProbeValues values_;
};

/**
 * @brief Classification of one line of render output
 */
struct ProgressLine {
    std::optional<int32_t> frame;  ///< Frame number from a "Fra:" marker
    bool malformed_frame = false;  ///< "Fra:" present but no integer followed
    bool done = false;             ///< Completion marker present
    bool error = false;            ///< Error marker present
};

ProgressLine parse_progress_line(const std::string& line);

/**
 * @brief Parse a whole string as a signed 32-bit integer
 *
 * Surrounding whitespace is ignored; anything else makes the parse fail.
 */
std::optional<int32_t> parse_int(const std::string& text);

/// Strip leading/trailing whitespace
std::string trim(const std::string& text);

/// Lowercase ASCII copy
std::string to_lower(const std::string& text);

/**
 * @brief File extension the renderer writes for an image format token
 *
 * Accepts either the renderer's enum spelling ("OPEN_EXR") or its lowercase
 * form ("open_exr"). Unknown tokens are returned lowercased.
 */
std::string file_extension_for_format(const std::string& format);

/// "<prefix><5-digit zero padded frame>.<extension>"
std::string frame_file_name(const std::string& prefix, int32_t frame, const std::string& extension);

} // namespace brs::parsing
