#include "include/pixrecolor.hpp"
#include "core/microblocks/color_match.h"
#include <limits>
#include <stdexcept>

namespace pixrecolor {

Color Color::from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    Color c;
    c.red = channel_from_byte(r);
    c.green = channel_from_byte(g);
    c.blue = channel_from_byte(b);
    c.alpha = channel_from_byte(a);
    return c;
}

std::array<uint8_t, 4> Color::to_rgba8() const {
    return {channel_to_byte(red), channel_to_byte(green), channel_to_byte(blue), channel_to_byte(alpha)};
}

Bitmap Bitmap::allocate(uint32_t width, uint32_t height, size_t bytes_per_row) {
    size_t packed = static_cast<size_t>(width) * kBytesPerPixel;
    if (bytes_per_row == 0) bytes_per_row = packed;
    if (bytes_per_row < packed) {
        throw std::invalid_argument("bytes_per_row smaller than width * bytes_per_pixel");
    }
    if (height != 0 && bytes_per_row > std::numeric_limits<size_t>::max() / height) {
        throw std::invalid_argument("bytes_per_row * height overflows");
    }
    Bitmap bm;
    bm.width = width;
    bm.height = height;
    bm.bytes_per_row = bytes_per_row;
    bm.bytes_per_pixel = kBytesPerPixel;
    bm.pixels.assign(bytes_per_row * height, 0);
    return bm;
}

BitmapView Bitmap::view() const {
    BitmapView v;
    v.data = pixels.data();
    v.length = pixels.size();
    v.width = width;
    v.height = height;
    v.bytes_per_row = bytes_per_row;
    v.bytes_per_pixel = bytes_per_pixel;
    return v;
}

std::array<uint8_t, 4> Bitmap::pixel(uint32_t x, uint32_t y) const {
    size_t off = y * bytes_per_row + static_cast<size_t>(x) * bytes_per_pixel;
    return {pixels.at(off), pixels.at(off + 1), pixels.at(off + 2), pixels.at(off + 3)};
}

void Bitmap::set_pixel(uint32_t x, uint32_t y, const std::array<uint8_t, 4>& rgba) {
    size_t off = y * bytes_per_row + static_cast<size_t>(x) * bytes_per_pixel;
    for (size_t c = 0; c < 4; ++c) pixels.at(off + c) = rgba[c];
}

const char* to_string(EngineError err) {
    switch (err) {
    case EngineError::None: return "None";
    case EngineError::InvalidBuffer: return "InvalidBuffer";
    case EngineError::UnsupportedLayout: return "UnsupportedLayout";
    }
    return "Unknown";
}

} // namespace pixrecolor
