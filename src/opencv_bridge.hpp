#pragma once
#include "include/pixrecolor.hpp"
#include <opencv2/core.hpp>

namespace pixrecolor {

// Converts an 8-bit gray, BGR or BGRA image to RGBA. Returns false (rgba
// untouched) for empty images or other depths/channel counts.
bool to_rgba(const cv::Mat& decoded, cv::Mat& rgba);

// Non-owning view on a CV_8UC4 matrix; Mat::step becomes bytes_per_row.
// Other types and submatrices (ROIs) give an empty view. rgba must outlive the view.
BitmapView view_of(const cv::Mat& rgba);

// Engine output back to OpenCV channel order for encoding.
cv::Mat to_bgra(const Bitmap& bitmap);

} // namespace pixrecolor
