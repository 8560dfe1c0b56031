// test_integrate.cpp
// Encode a synthetic image to PNG, decode it the way the CLI does, recolor it
// through the worker pool, encode the result and verify the decoded pixels.

#include <iostream>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "src/include/pixrecolor.hpp"
#include "src/core/microblocks/color_match.h"
#include "src/opencv_bridge.hpp"
#include "src/recolor_engine.hpp"

using namespace pixrecolor;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAILED: " << what << std::endl;
        ++failures;
    }
}

// ----------------------------- Fixture -----------------------------
// Left half opaque red, right half semi-transparent blue, a green stripe on row 0.
static cv::Mat make_fixture(int width, int height) {
    cv::Mat bgra(height, width, CV_8UC4);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            cv::Vec4b px = (x < width / 2) ? cv::Vec4b(0, 0, 250, 255) : cv::Vec4b(255, 0, 0, 128);
            if (y == 0) px = cv::Vec4b(0, 255, 0, 255);
            bgra.at<cv::Vec4b>(y, x) = px;
        }
    }
    return bgra;
}

// ----------------------------- Main -----------------------------
int main() {
    const int width = 640, height = 480;
    std::string dir = "/tmp/pixrecolor_integrate_" + std::to_string(::getpid());
    std::string in_path = dir + "_in.png";
    std::string out_path = dir + "_out.png";

    cv::Mat fixture = make_fixture(width, height);
    if (!cv::imwrite(in_path, fixture)) {
        std::cerr << "Failed to write fixture to: " << in_path << std::endl;
        return 1;
    }

    cv::Mat decoded = cv::imread(in_path, cv::IMREAD_UNCHANGED);
    cv::Mat rgba;
    expect(to_rgba(decoded, rgba), "decode fixture to RGBA");

    ReplacementRequest req;
    expect(parse_color("#FF0000", req.target), "parse target");
    expect(parse_color("255,255,0,200", req.replacement), "parse replacement");
    req.tolerance = 0.05; // 250 vs 255 is within, the other colors are not

    EngineConfig cfg;
    cfg.worker_count = 4;
    cfg.pixels_per_task = 4096;
    cfg.verbose = true;
    RecolorEngine engine(cfg);
    RecolorResult res = engine.recolor(view_of(rgba), req);
    expect(res.ok(), "recolor succeeds");
    expect(res.bitmap.width == (uint32_t)width && res.bitmap.height == (uint32_t)height, "dimensions preserved");

    if (!cv::imwrite(out_path, to_bgra(res.bitmap))) {
        std::cerr << "Failed to write image to: " << out_path << std::endl;
        return 1;
    }

    cv::Mat reread = cv::imread(out_path, cv::IMREAD_UNCHANGED);
    expect(reread.rows == height && reread.cols == width && reread.type() == CV_8UC4, "reread layout");
    if (failures == 0) {
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                cv::Vec4b got = reread.at<cv::Vec4b>(y, x);
                cv::Vec4b want;
                if (y == 0) want = cv::Vec4b(0, 255, 0, 255);
                else if (x < width / 2) want = cv::Vec4b(0, 255, 255, 200);
                else want = cv::Vec4b(255, 0, 0, 128);
                if (got != want) {
                    expect(false, "pixel (" + std::to_string(x) + "," + std::to_string(y) + ")");
                    y = height;
                    break;
                }
            }
        }
    }

    std::remove(in_path.c_str());
    std::remove(out_path.c_str());

    if (failures) {
        std::cerr << failures << " integration check(s) failed\n";
        return 1;
    }
    std::cout << "Integration test PASSED\n";
    return 0;
}
