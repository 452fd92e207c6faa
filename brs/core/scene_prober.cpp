/*
 * File:        scene_prober.cpp
 * Module:      brs-core
 * Purpose:     Reads frame range and output settings from a scene file
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "scene_prober.h"
#include "logging.h"

#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace brs {

const char* const PROBE_SCRIPT = R"(import sys
import bpy

scene = bpy.context.scene
print("[PROBE] START_FRAME", scene.frame_start)
print("[PROBE] END_FRAME", scene.frame_end)
print("[PROBE] OUTPUT_DIR", scene.render.filepath)
print("[PROBE] OUTPUT_FORMAT", scene.render.image_settings.file_format)
sys.stdout.flush()
)";

static constexpr const char* RELATIVE_MARKER = "//";

// Control characters cannot come from a sensible render path
static bool is_malformed_path(const std::string& path) {
    return std::any_of(path.begin(), path.end(),
                       [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

fs::path resolve_output_directory(const std::string& probed, const fs::path& scene_file) {
    const fs::path scene_abs = fs::absolute(scene_file);
    const fs::path scene_dir = scene_abs.parent_path();
    const std::string output = parsing::trim(probed);

    fs::path resolved;
    if (output.empty() || output == RELATIVE_MARKER || is_malformed_path(output)) {
        resolved = scene_dir / (scene_abs.stem().string() + "_output");
    } else if (output.rfind(RELATIVE_MARKER, 0) == 0) {
        resolved = scene_dir / output.substr(2);
    } else {
        fs::path p(output);
        resolved = p.is_absolute() ? p : scene_dir / p;
    }

    resolved = fs::absolute(resolved).lexically_normal();
    // "/renders/" -> "/renders"
    if (!resolved.has_filename() && resolved.has_parent_path() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

ProbeResult build_probe_result(const parsing::ProbeValues& values, const fs::path& scene_file) {
    if (!values.start_frame || !values.end_frame) {
        throw ProbeError(fmt::format("Probe of {} did not report a frame range", scene_file.string()));
    }

    ProbeResult result;
    result.frame_range = FrameRange{*values.start_frame, *values.end_frame};
    result.output_directory = resolve_output_directory(values.output_dir.value_or(""), scene_file);
    result.image_format = values.output_format.value_or("png");
    return result;
}

void ensure_output_directory(const fs::path& directory) {
    std::error_code ec;
    if (fs::is_directory(directory, ec)) {
        return;
    }

    fs::create_directories(directory, ec);
    if (ec) {
        throw OutputDirectoryError(fmt::format("Cannot create output directory {}: {}",
                                               directory.string(), ec.message()));
    }
    if (!fs::is_directory(directory, ec)) {
        throw OutputDirectoryError(fmt::format("Output path {} is not a directory", directory.string()));
    }
    BRS_LOG_INFO("Created output directory {}", directory.string());
}

// === SceneProber ===

SceneProber::SceneProber(std::unique_ptr<ProcessRunner> runner, std::chrono::milliseconds timeout)
    : runner_(std::move(runner))
    , timeout_(timeout)
{
}

SceneProber::~SceneProber()
{
    if (active_) {
        runner_->kill();
    }
    remove_script();
}

fs::path SceneProber::write_probe_script()
{
    static std::atomic<uint32_t> counter{0};
    std::random_device rd;

    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        throw ProbeError(fmt::format("No temporary directory for probe script: {}", ec.message()));
    }

    fs::path path = dir / fmt::format("brs_probe_{:08x}_{}.py", rd(), counter.fetch_add(1));
    std::ofstream out(path, std::ios::trunc);
    out << PROBE_SCRIPT;
    out.close();
    if (!out) {
        throw ProbeError(fmt::format("Cannot write probe script {}", path.string()));
    }
    return path;
}

void SceneProber::remove_script()
{
    if (script_path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(script_path_, ec);
    if (ec) {
        BRS_LOG_WARN("Could not remove probe script {}: {}", script_path_.string(), ec.message());
    }
    script_path_.clear();
}

void SceneProber::probe(const fs::path& scene_file,
                        const std::string& renderer_path,
                        ProbeCallback callback)
{
    if (active_) {
        BRS_LOG_WARN("SceneProber: probe already running, ignoring request for {}", scene_file.string());
        return;
    }

    scene_file_ = scene_file;
    callback_ = std::move(callback);
    parser_ = parsing::ProbeOutputParser{};

    try {
        script_path_ = write_probe_script();
    } catch (const ProbeError& e) {
        ProbeOutcome outcome;
        outcome.failure = FailureKind::Probe;
        outcome.error = e.what();
        finish(outcome);
        return;
    }

    ProcessSpec spec;
    spec.program = renderer_path;
    spec.arguments = {"-b", scene_file.string(), "-P", script_path_.string()};
    spec.merge_stderr = true;
    spec.timeout = timeout_;

    ProcessCallbacks callbacks;
    callbacks.on_output_line = [this](const std::string& line) { handle_line(line); };
    callbacks.on_finished = [this](const ProcessExit& exit) { handle_finished(exit); };

    BRS_LOG_INFO("Probing {}", scene_file.string());
    active_ = true;
    runner_->start(spec, std::move(callbacks));
}

void SceneProber::cancel()
{
    if (!active_) {
        return;
    }
    BRS_LOG_INFO("Probe of {} cancelled", scene_file_.string());
    runner_->kill();
    active_ = false;
    callback_ = nullptr;
    remove_script();
}

void SceneProber::handle_line(const std::string& line)
{
    BRS_LOG_TRACE("[probe] {}", line);
    parser_.feed_line(line);
}

void SceneProber::handle_finished(const ProcessExit& exit)
{
    ProbeOutcome outcome;
    outcome.failure = FailureKind::Probe;

    if (exit.status == ExitStatus::FailedToStart) {
        outcome.error = fmt::format("Could not start Blender for probing: {}", exit.error);
        finish(outcome);
        return;
    }
    if (exit.status == ExitStatus::TimedOut) {
        outcome.error = fmt::format("Probing {} timed out", scene_file_.filename().string());
        finish(outcome);
        return;
    }

    // Blender's own exit code is not meaningful here; the tags are
    if (exit.status != ExitStatus::Normal || exit.exit_code != 0) {
        BRS_LOG_DEBUG("Probe process ended {} with code {}", to_string(exit.status), exit.exit_code);
    }

    try {
        ProbeResult result = build_probe_result(parser_.values(), scene_file_);
        try {
            ensure_output_directory(result.output_directory);
        } catch (const OutputDirectoryError& e) {
            outcome.failure = FailureKind::OutputDirectory;
            outcome.error = e.what();
            finish(outcome);
            return;
        }

        BRS_LOG_INFO("Probe: frames {}-{}, format '{}', output {}",
                     result.frame_range.start, result.frame_range.end,
                     result.image_format, result.output_directory.string());
        outcome.failure = FailureKind::None;
        outcome.result = std::move(result);
    } catch (const ProbeError& e) {
        outcome.error = e.what();
        if (exit.status != ExitStatus::Normal || exit.exit_code != 0) {
            outcome.error += fmt::format(" (process {}, exit code {})", to_string(exit.status), exit.exit_code);
        }
    }

    finish(outcome);
}

void SceneProber::finish(const ProbeOutcome& outcome)
{
    active_ = false;
    remove_script();

    if (!outcome.ok()) {
        BRS_LOG_ERROR("Probe failed: {}", outcome.error);
    }

    // The callback may start the next probe
    auto callback = std::move(callback_);
    callback_ = nullptr;
    if (callback) {
        callback(outcome);
    }
}

} // namespace brs
