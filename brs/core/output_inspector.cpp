/*
 * File:        output_inspector.cpp
 * Module:      brs-core
 * Purpose:     Detects already-rendered frames and computes the resume point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "output_inspector.h"
#include "output_parsing.h"
#include "render_errors.h"
#include "logging.h"

#include <fmt/format.h>
#include <array>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace brs {

// Escape regex metacharacters in an extension token
static std::string regex_escape(const std::string& text) {
    static const std::string meta = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : text) {
        if (meta.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::set<int32_t> scan_rendered_frames(const fs::path& directory, const std::string& extension) {
    const std::string ext = regex_escape(parsing::to_lower(extension));
    const auto flags = std::regex::ECMAScript | std::regex::icase;

    // A name matching several patterns still contributes its frame once
    const std::array<std::regex, 3> patterns = {
        std::regex(fmt::format(R"(^(?:.*\D)?(\d+)\.{}$)", ext), flags),
        std::regex(fmt::format(R"(^(?:.*\D)?(\d+)_L\.{}$)", ext), flags),
        std::regex(fmt::format(R"(^(?:.*\D)?(\d+)_R\.{}$)", ext), flags),
    };

    std::set<int32_t> rendered;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw OutputDirectoryError(fmt::format("Cannot read output directory {}: {}",
                                               directory.string(), ec.message()));
    }

    const std::string wanted_ext = "." + parsing::to_lower(extension);
    try {
        for (const auto& entry : it) {
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec)) {
                continue;
            }
            if (parsing::to_lower(entry.path().extension().string()) != wanted_ext) {
                continue;
            }

            const std::string name = entry.path().filename().string();
            for (const auto& pattern : patterns) {
                std::smatch match;
                if (std::regex_match(name, match, pattern)) {
                    if (auto frame = parsing::parse_int(match[1].str())) {
                        rendered.insert(*frame);
                    }
                    break;
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw OutputDirectoryError(fmt::format("Error while scanning output directory {}: {}",
                                               directory.string(), e.what()));
    }

    BRS_LOG_DEBUG("Found {} rendered frame(s) in {}", rendered.size(), directory.string());
    return rendered;
}

InspectionResult compute_resume(const std::set<int32_t>& rendered, const FrameRange& range) {
    std::vector<int32_t> missing;
    for (int32_t frame = range.start; frame <= range.end; ++frame) {
        if (rendered.count(frame) == 0) {
            missing.push_back(frame);
        }
    }

    InspectionResult result;
    if (missing.empty()) {
        result.start_frame = range.end + 1;
        return result;
    }

    result.start_frame = missing.front();
    const auto span = static_cast<size_t>(missing.back() - missing.front()) + 1;
    if (span != missing.size()) {
        result.missing_frames = std::move(missing);
    }
    return result;
}

InspectionResult inspect_output(const fs::path& directory,
                                const std::string& image_format,
                                const FrameRange& range) {
    const auto rendered = scan_rendered_frames(directory, parsing::file_extension_for_format(image_format));
    auto result = compute_resume(rendered, range);

    if (result.start_frame > range.end) {
        BRS_LOG_INFO("All frames {}-{} already present in {}", range.start, range.end, directory.string());
    } else if (result.missing_frames) {
        BRS_LOG_INFO("Resuming with {} non-contiguous missing frame(s), first {}",
                     result.missing_frames->size(), result.start_frame);
    } else if (result.start_frame != range.start) {
        BRS_LOG_INFO("Resuming at frame {} (frames {}-{} present)",
                     result.start_frame, range.start, result.start_frame - 1);
    }
    return result;
}

void apply_inspection(SceneJob& job, const InspectionResult& result) {
    job.start_frame = result.start_frame;
    job.missing_frames = result.missing_frames;
}

} // namespace brs
