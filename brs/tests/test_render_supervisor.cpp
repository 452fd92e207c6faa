/******************************************************************************
 * test_render_supervisor.cpp
 *
 * Unit tests for render supervision: progress, completion, crash recovery,
 * cancellation and launch failures
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "render_supervisor.h"
#include "output_inspector.h"
#include "output_parsing.h"
#include "diagnostic_log.h"
#include "test_support.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace brs;
using brs::test::FakeClock;
using brs::test::FakeProcessRunner;
using brs::test::TempDir;
namespace fs = std::filesystem;

/**
 * One supervisor wired to a fake runner, with everything it reports recorded
 */
struct Harness {
    TempDir dir;
    FakeClock clock;
    FakeProcessRunner::Counters counters;
    FakeProcessRunner* runner = nullptr;
    std::unique_ptr<RenderSupervisor> supervisor;
    RenderLaunchConfig config;

    std::vector<ProgressSnapshot> progress;
    int restarts = 0;
    int finished = 0;

    Harness() {
        runner = new FakeProcessRunner(&counters);
        supervisor = std::make_unique<RenderSupervisor>(std::unique_ptr<ProcessRunner>(runner), clock.source());
        supervisor->set_progress_handler([this](const ProgressSnapshot& s) { progress.push_back(s); });
        supervisor->set_restart_handler([this](const SceneJob&) { restarts++; });
        supervisor->set_finished_handler([this](SceneJob&) { finished++; });

        config.renderer_path = "/opt/blender/blender";
        config.render_driver_script = dir.touch("scripts/render_driver.py");
        config.frame_prefix = "frame_";
        fs::create_directories(dir.path() / "out");
    }

    SceneJob make_job(int start, int end) {
        SceneJob job(dir.touch("A.blend"));
        job.frame_range = FrameRange{start, end};
        job.output_directory = dir.path() / "out";
        job.image_format = "png";
        job.start_frame = start;
        apply_inspection(job, inspect_output(job.output_directory, job.image_format, job.frame_range));
        return job;
    }

    void write_frame(int frame) {
        dir.touch("out/" + parsing::frame_file_name("frame_", frame, "png"));
    }

    // Emit "Fra: n" one second apart, writing each frame once the next starts
    void render_frames(int first, int last) {
        for (int f = first; f <= last; ++f) {
            if (f > first) write_frame(f - 1);
            clock.advance(std::chrono::seconds(1));
            runner->emit_line("Fra: " + std::to_string(f));
        }
    }
};

static bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

void test_render_arguments() {
    SceneJob job("/shots/A.blend");
    job.output_directory = "/shots/out";
    RenderLaunchConfig config;
    config.render_driver_script = "/app/scripts/render_driver.py";

    auto args = build_render_arguments(job, config);
    const std::vector<std::string> expected = {
        "-b", "/shots/A.blend", "-P", "/app/scripts/render_driver.py", "--",
        "--output_dir", "/shots/out", "--prefix", "frame_", "--resume", "true",
    };
    assert(args == expected);

    job.missing_frames = std::vector<int32_t>{3, 6, 9};
    args = build_render_arguments(job, config);
    assert(args.size() == expected.size() + 2);
    assert(args[args.size() - 2] == "--missing_frames");
    assert(args.back() == "3,6,9");

    std::cout << "test_render_arguments: PASSED\n";
}

void test_three_frame_render_completes() {
    Harness h;
    SceneJob job = h.make_job(1, 3);

    h.supervisor->start(job, h.config);
    assert(h.supervisor->state() == SupervisorState::Launching);
    assert(job.status == JobStatus::Rendering);
    assert(h.runner->last_spec().program == "/opt/blender/blender");
    assert(h.runner->last_spec().merge_stderr);
    assert(h.runner->last_spec().timeout.count() == 0);

    h.runner->emit_started();
    assert(h.supervisor->state() == SupervisorState::Running);
    h.render_frames(1, 3);
    h.clock.advance(std::chrono::seconds(1));
    h.runner->emit_line("[DONE] Rendering completed.");
    h.runner->emit_finished(ExitStatus::Normal, 0);

    assert(h.finished == 1);
    assert(h.restarts == 0);
    assert(h.supervisor->state() == SupervisorState::Finished);
    assert(job.status == JobStatus::Completed);
    assert(job.frames_rendered == 3);
    assert(job.crash_count == 0);
    assert(job.render_duration == std::chrono::seconds(4));
    assert(job.status_message.find("Rendering finished! 3 frames rendered to:") == 0);
    assert(h.progress.back().progress_value == h.progress.back().progress_maximum);

    std::cout << "test_three_frame_render_completes: PASSED\n";
}

void test_progress_is_monotonic() {
    Harness h;
    SceneJob job = h.make_job(1, 8);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.render_frames(1, 8);
    h.runner->emit_line("[DONE]");
    h.runner->emit_finished();

    int previous = 0;
    for (const auto& s : h.progress) {
        assert(s.progress_maximum == 8);
        assert(s.progress_value >= previous);
        assert(s.progress_value <= s.progress_maximum);
        previous = s.progress_value;
    }

    std::cout << "test_progress_is_monotonic: PASSED\n";
}

void test_estimate_follows_frame_times() {
    Harness h;
    SceneJob job = h.make_job(1, 5);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.render_frames(1, 3);

    // Frames 1 and 2 closed at one second each
    const auto& s = h.progress.back();
    assert(h.supervisor->frame_times().size() == 2);
    assert(!s.estimate.is_calculating());
    assert(s.estimate.total_frames == 5);
    assert(std::abs(s.estimate.average_frame_time->count() - 1.0) < 1e-9);
    assert(std::abs(s.estimate.estimated_remaining->count() - 3.0) < 1e-9);

    std::cout << "test_estimate_follows_frame_times: PASSED\n";
}

void test_frames_below_start_are_ignored() {
    Harness h;
    for (int f = 1; f <= 4; ++f) h.write_frame(f);
    SceneJob job = h.make_job(1, 10);
    assert(job.start_frame == 5);

    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.runner->emit_line("Fra: 3");
    auto s = h.supervisor->snapshot();
    assert(!s.frame_seen);
    assert(s.progress_value == 0);
    assert(s.progress_maximum == 6);

    h.runner->emit_line("Fra: 6");
    s = h.supervisor->snapshot();
    assert(s.current_frame == 6);
    assert(s.progress_value == 1);

    h.runner->emit_line("Fra: garbage");
    assert(h.supervisor->snapshot().current_frame == 6);

    std::cout << "test_frames_below_start_are_ignored: PASSED\n";
}

void test_crash_resumes_from_disk() {
    Harness h;
    SceneJob job = h.make_job(1, 20);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();

    // Frames 1..10 reach the disk, then the renderer dies
    h.render_frames(1, 10);
    h.write_frame(10);
    h.runner->emit_finished(ExitStatus::Crashed, 11, "segfault");

    assert(h.restarts == 1);
    assert(h.finished == 0);
    assert(job.crash_count == 1);
    assert(job.start_frame == 11);
    assert(!job.missing_frames);
    assert(h.counters.starts == 2);
    assert(h.supervisor->is_active());
    assert(contains(h.runner->last_spec().arguments, "--resume"));
    assert(!contains(h.runner->last_spec().arguments, "--missing_frames"));

    auto s = h.supervisor->snapshot();
    assert(s.start_frame == 11);
    assert(s.progress_maximum == 10);
    assert(s.crash_count == 1);

    h.runner->emit_started();
    h.render_frames(11, 20);
    h.runner->emit_line("[DONE]");
    h.runner->emit_finished();

    assert(h.finished == 1);
    assert(job.status == JobStatus::Completed);
    assert(job.crash_count == 1);
    assert(job.status_message.find("Crashes: 1") != std::string::npos);

    // Frame 10 was in flight at the crash but reached the disk
    assert(job.frames_rendered == 20);
    assert(job.status_message.rfind("Rendering finished! 20 frames rendered to:", 0) == 0);

    std::cout << "test_crash_resumes_from_disk: PASSED\n";
}

void test_crash_mid_frame_does_not_credit_frame() {
    Harness h;
    SceneJob job = h.make_job(1, 5);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();

    // Frame 3 starts but never reaches the disk
    h.render_frames(1, 3);
    h.runner->emit_finished(ExitStatus::Crashed, 139);
    assert(job.start_frame == 3);
    assert(job.frames_rendered == 2);

    h.runner->emit_started();
    h.render_frames(3, 5);
    h.runner->emit_line("[DONE]");
    h.runner->emit_finished();

    assert(job.status == JobStatus::Completed);
    assert(job.frames_rendered == 5);
    assert(job.status_message.rfind("Rendering finished! 5 frames rendered to:", 0) == 0);

    std::cout << "test_crash_mid_frame_does_not_credit_frame: PASSED\n";
}

void test_done_marker_wins_over_crash_exit() {
    Harness h;
    SceneJob job = h.make_job(1, 1);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();

    h.runner->emit_line("Fra: 1");
    h.write_frame(1);
    h.runner->emit_line("[DONE]");
    // The renderer can segfault while shutting down after a finished render
    h.runner->emit_finished(ExitStatus::Crashed, 139);

    assert(h.finished == 1);
    assert(job.status == JobStatus::Completed);
    assert(job.crash_count == 0);
    assert(h.restarts == 0);
    assert(h.counters.starts == 1);
    assert(job.frames_rendered == 1);

    std::cout << "test_done_marker_wins_over_crash_exit: PASSED\n";
}

void test_crash_with_gaps_requests_missing_frames() {
    Harness h;
    for (int f : {1, 2, 4, 5}) h.write_frame(f);
    SceneJob job = h.make_job(1, 6);
    assert(job.missing_frames && (*job.missing_frames == std::vector<int32_t>{3, 6}));

    h.supervisor->start(job, h.config);
    assert(contains(h.runner->last_spec().arguments, "3,6"));

    h.runner->emit_started();
    h.runner->emit_line("Fra: 3");
    h.runner->emit_line("[ERROR] Rendering failed at frame 3: out of memory");
    h.runner->emit_finished(ExitStatus::Normal, 1);

    // Nothing new on disk: same request again
    assert(job.crash_count == 1);
    assert(job.start_frame == 3);
    assert(contains(h.runner->last_spec().arguments, "3,6"));

    std::cout << "test_crash_with_gaps_requests_missing_frames: PASSED\n";
}

void test_exit_after_last_frame_completes() {
    Harness h;
    SceneJob job = h.make_job(1, 3);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.render_frames(1, 3);
    h.runner->emit_finished(ExitStatus::Normal, 0);

    assert(job.status == JobStatus::Completed);
    assert(job.crash_count == 0);

    std::cout << "test_exit_after_last_frame_completes: PASSED\n";
}

void test_exit_without_output_is_a_crash() {
    Harness h;
    SceneJob job = h.make_job(5, 5);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.runner->emit_finished(ExitStatus::Normal, 0);

    assert(job.crash_count == 1);
    assert(h.restarts == 1);
    assert(h.finished == 0);

    // Reaching the last frame counts as finished whatever the exit
    h.runner->emit_started();
    h.runner->emit_line("Fra: 5");
    h.write_frame(5);
    h.runner->emit_finished(ExitStatus::Crashed, 139);
    assert(job.status == JobStatus::Completed);
    assert(job.crash_count == 1);

    std::cout << "test_exit_without_output_is_a_crash: PASSED\n";
}

void test_cancel_kills_without_restart() {
    Harness h;
    SceneJob job = h.make_job(1, 10);
    h.supervisor->start(job, h.config);
    h.runner->emit_started();
    h.render_frames(1, 2);

    h.supervisor->cancel();
    assert(h.counters.kills == 1);
    assert(h.finished == 1);
    assert(h.restarts == 0);
    assert(job.status == JobStatus::Cancelled);
    assert(job.status_message == "Rendering cancelled.");
    assert(h.supervisor->state() == SupervisorState::Cancelled);
    assert(!h.supervisor->is_active());
    assert(!h.runner->is_running());

    // A second cancel is a no-op
    h.supervisor->cancel();
    assert(h.finished == 1);

    std::cout << "test_cancel_kills_without_restart: PASSED\n";
}

void test_launch_failure_writes_log() {
    Harness h;
    SceneJob job = h.make_job(1, 3);
    h.supervisor->start(job, h.config);
    h.runner->emit_finished(ExitStatus::FailedToStart, -1, "No such file or directory");

    assert(h.finished == 1);
    assert(h.restarts == 0);
    assert(job.status == JobStatus::Failed);
    assert(h.supervisor->state() == SupervisorState::Failed);

    const fs::path log = diagnostic_log_path(job.path);
    assert(fs::exists(log));
    std::ifstream in(log);
    std::stringstream text;
    text << in.rdbuf();
    assert(text.str().find("LaunchError") != std::string::npos);
    assert(text.str().find("No such file or directory") != std::string::npos);
    assert(text.str().find("/opt/blender/blender") != std::string::npos);

    std::cout << "test_launch_failure_writes_log: PASSED\n";
}

void test_missing_driver_fails_without_spawn() {
    Harness h;
    SceneJob job = h.make_job(1, 3);
    h.config.render_driver_script = h.dir.path() / "nope.py";
    h.supervisor->start(job, h.config);

    assert(h.counters.starts == 0);
    assert(h.finished == 1);
    assert(job.status == JobStatus::Failed);

    std::cout << "test_missing_driver_fails_without_spawn: PASSED\n";
}

int main() {
    std::cout << "Running render supervisor tests...\n";

    test_render_arguments();
    test_three_frame_render_completes();
    test_progress_is_monotonic();
    test_estimate_follows_frame_times();
    test_frames_below_start_are_ignored();
    test_crash_resumes_from_disk();
    test_crash_mid_frame_does_not_credit_frame();
    test_done_marker_wins_over_crash_exit();
    test_crash_with_gaps_requests_missing_frames();
    test_exit_after_last_frame_completes();
    test_exit_without_output_is_a_crash();
    test_cancel_kills_without_restart();
    test_launch_failure_writes_log();
    test_missing_driver_fails_without_spawn();

    std::cout << "All render supervisor tests passed!\n";
    return 0;
}
