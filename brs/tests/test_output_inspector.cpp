/******************************************************************************
 * test_output_inspector.cpp
 *
 * Unit tests for rendered-frame detection and resume computation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "output_inspector.h"
#include "output_parsing.h"
#include "render_errors.h"
#include "test_support.h"
#include <cassert>
#include <iostream>

using namespace brs;
using brs::test::TempDir;

static void render_frames(const TempDir& dir, std::initializer_list<int> frames, const std::string& ext = "png") {
    for (int f : frames) {
        dir.touch(parsing::frame_file_name("frame_", f, ext));
    }
}

void test_all_frames_present() {
    for (int s = -2; s <= 3; ++s) {
        for (int e = s; e <= s + 4; ++e) {
            std::set<int32_t> rendered;
            for (int f = s; f <= e; ++f) rendered.insert(f);

            auto r = compute_resume(rendered, FrameRange{s, e});
            assert(r.start_frame == e + 1);
            assert(!r.missing_frames);
        }
    }

    std::cout << "test_all_frames_present: PASSED\n";
}

void test_gap_produces_missing_list() {
    TempDir dir;
    render_frames(dir, {1, 2, 4, 5});

    auto r = inspect_output(dir.path(), "png", FrameRange{1, 6});
    assert(r.start_frame == 3);
    assert(r.missing_frames);
    assert((*r.missing_frames == std::vector<int32_t>{3, 6}));

    std::cout << "test_gap_produces_missing_list: PASSED\n";
}

void test_contiguous_tail_is_range_resume() {
    TempDir dir;
    render_frames(dir, {1, 2, 3});

    auto r = inspect_output(dir.path(), "PNG", FrameRange{1, 10});
    assert(r.start_frame == 4);
    assert(!r.missing_frames);

    // Nothing rendered yet
    TempDir empty;
    auto fresh = inspect_output(empty.path(), "png", FrameRange{1, 10});
    assert(fresh.start_frame == 1);
    assert(!fresh.missing_frames);

    std::cout << "test_contiguous_tail_is_range_resume: PASSED\n";
}

void test_inspection_is_idempotent() {
    TempDir dir;
    render_frames(dir, {2, 3, 7});

    auto first = inspect_output(dir.path(), "png", FrameRange{1, 8});
    auto second = inspect_output(dir.path(), "png", FrameRange{1, 8});
    assert(first == second);

    std::cout << "test_inspection_is_idempotent: PASSED\n";
}

void test_naming_conventions() {
    TempDir dir;
    dir.touch("frame_00001.PNG");        // extension case
    dir.touch("frame_00002_L.png");      // stereo left
    dir.touch("frame_00002_R.png");      // stereo right, same frame
    dir.touch("shot2_0003.png");         // other prefix, digits in prefix
    dir.touch("0004.png");               // digits only
    dir.touch("frame_00005.jpg");        // other format
    dir.touch("frame_00006.png.tmp");    // partial write
    dir.touch("notes.png");              // no frame number
    std::filesystem::create_directories(dir.path() / "frame_00007.png");  // not a file

    auto frames = scan_rendered_frames(dir.path(), "png");
    assert((frames == std::set<int32_t>{1, 2, 3, 4}));

    auto jpg = scan_rendered_frames(dir.path(), parsing::file_extension_for_format("JPEG"));
    assert((jpg == std::set<int32_t>{5}));

    std::cout << "test_naming_conventions: PASSED\n";
}

void test_format_maps_to_extension() {
    TempDir dir;
    render_frames(dir, {1, 2}, "exr");

    auto r = inspect_output(dir.path(), "open_exr", FrameRange{1, 2});
    assert(r.start_frame == 3);

    std::cout << "test_format_maps_to_extension: PASSED\n";
}

void test_missing_directory_throws() {
    TempDir dir;
    bool thrown = false;
    try {
        scan_rendered_frames(dir.path() / "does_not_exist", "png");
    } catch (const OutputDirectoryError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "test_missing_directory_throws: PASSED\n";
}

void test_apply_inspection() {
    SceneJob job("/tmp/A.blend");
    job.frame_range = FrameRange{1, 6};
    apply_inspection(job, compute_resume({1, 2, 4, 5}, job.frame_range));
    assert(job.start_frame == 3);
    assert(job.frames_to_render() == 2);

    apply_inspection(job, compute_resume({1, 2, 3, 4, 5, 6}, job.frame_range));
    assert(job.start_frame == 7);
    assert(!job.missing_frames);
    assert(job.frames_to_render() == 0);

    std::cout << "test_apply_inspection: PASSED\n";
}

int main() {
    std::cout << "Running output inspector tests...\n";

    test_all_frames_present();
    test_gap_produces_missing_list();
    test_contiguous_tail_is_range_resume();
    test_inspection_is_idempotent();
    test_naming_conventions();
    test_format_maps_to_extension();
    test_missing_directory_throws();
    test_apply_inspection();

    std::cout << "All output inspector tests passed!\n";
    return 0;
}
