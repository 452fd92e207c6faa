/*
 * File:        output_parsing.cpp
 * Module:      brs-core
 * Purpose:     Parsers for the renderer's console output
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "output_parsing.h"
#include "logging.h"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <map>
#include <sstream>

namespace brs::parsing {

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string to_lower(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<int32_t> parse_int(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) {
        return std::nullopt;
    }

    int32_t value = 0;
    const char* begin = t.data();
    const char* end = t.data() + t.size();
    // from_chars rejects a leading '+'
    if (*begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Text following a tag, trimmed; nullopt if the tag is absent
static std::optional<std::string> value_after(const std::string& line, const char* tag) {
    auto pos = line.find(tag);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return trim(line.substr(pos + std::strlen(tag)));
}

// Frame values are the last whitespace-delimited token on the line
static std::string last_token(const std::string& text) {
    std::istringstream tokens(text);
    std::string token, last;
    while (tokens >> token) last = token;
    return last;
}

bool ProbeOutputParser::feed_line(const std::string& line) {
    if (line.find("[PROBE]") == std::string::npos) {
        return false;
    }

    if (auto v = value_after(line, PROBE_START_FRAME)) {
        if (auto n = parse_int(last_token(*v))) {
            values_.start_frame = *n;
        } else {
            BRS_LOG_WARN("Unparseable probe start frame: '{}'", line);
        }
        return true;
    }
    if (auto v = value_after(line, PROBE_END_FRAME)) {
        if (auto n = parse_int(last_token(*v))) {
            values_.end_frame = *n;
        } else {
            BRS_LOG_WARN("Unparseable probe end frame: '{}'", line);
        }
        return true;
    }
    if (auto v = value_after(line, PROBE_OUTPUT_DIR)) {
        values_.output_dir = *v;
        return true;
    }
    if (auto v = value_after(line, PROBE_OUTPUT_FORMAT)) {
        if (!v->empty()) {
            values_.output_format = to_lower(*v);
        }
        return true;
    }

    return false;
}

ProgressLine parse_progress_line(const std::string& line) {
    ProgressLine result;

    auto pos = line.find(FRAME_MARKER);
    if (pos != std::string::npos) {
        std::istringstream rest(line.substr(pos + std::strlen(FRAME_MARKER)));
        std::string token;
        rest >> token;
        if (auto frame = parse_int(token)) {
            result.frame = *frame;
        } else {
            result.malformed_frame = true;
        }
    }

    result.done = line.find(DONE_MARKER) != std::string::npos;
    result.error = line.find(ERROR_MARKER) != std::string::npos;
    return result;
}

std::string file_extension_for_format(const std::string& format) {
    static const std::map<std::string, std::string> extensions = {
        {"png", "png"},
        {"jpeg", "jpg"},
        {"jpeg2000", "jp2"},
        {"open_exr", "exr"},
        {"open_exr_multilayer", "exr"},
        {"tiff", "tif"},
        {"targa", "tga"},
        {"targa_raw", "tga"},
        {"bmp", "bmp"},
        {"iris", "rgb"},
        {"cineon", "cin"},
        {"dpx", "dpx"},
        {"hdr", "hdr"},
        {"webp", "webp"},
    };

    const std::string key = to_lower(trim(format));
    auto it = extensions.find(key);
    return it != extensions.end() ? it->second : key;
}

std::string frame_file_name(const std::string& prefix, int32_t frame, const std::string& extension) {
    return fmt::format("{}{:05d}.{}", prefix, frame, extension);
}

} // namespace brs::parsing
