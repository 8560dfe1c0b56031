#include "opencv_bridge.hpp"
#include <opencv2/imgproc.hpp>
#include <iostream>

namespace pixrecolor {

bool to_rgba(const cv::Mat& decoded, cv::Mat& rgba) {
    if (decoded.empty()) return false;
    if (decoded.depth() != CV_8U) {
        std::cerr << "[OpenCVBridge] UNSUPPORTED_DEPTH depth=" << decoded.depth() << "\n";
        return false;
    }
    switch (decoded.channels()) {
    case 1: cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA); return true;
    case 3: cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA); return true;
    case 4: cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA); return true;
    default:
        std::cerr << "[OpenCVBridge] UNSUPPORTED_CHANNELS channels=" << decoded.channels() << "\n";
        return false;
    }
}

BitmapView view_of(const cv::Mat& rgba) {
    BitmapView v;
    // a submatrix's last row may end before its stride does
    if (rgba.empty() || rgba.type() != CV_8UC4 || rgba.isSubmatrix()) return v;
    v.data = rgba.data;
    v.width = static_cast<uint32_t>(rgba.cols);
    v.height = static_cast<uint32_t>(rgba.rows);
    v.bytes_per_row = rgba.step[0];
    v.bytes_per_pixel = static_cast<uint32_t>(rgba.elemSize());
    v.length = v.bytes_per_row * v.height;
    return v;
}

cv::Mat to_bgra(const Bitmap& bitmap) {
    if (bitmap.empty()) return cv::Mat();
    // header over the engine buffer; cvtColor writes a fresh matrix
    cv::Mat rgba(static_cast<int>(bitmap.height), static_cast<int>(bitmap.width), CV_8UC4,
                 const_cast<uint8_t*>(bitmap.pixels.data()), bitmap.bytes_per_row);
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
    return bgra;
}

} // namespace pixrecolor
