#pragma once
#include <cstddef>
#include <cstdint>
#include <array>
#include <vector>

namespace pixrecolor {

// Only 8-bit RGBA is supported (red, green, blue, alpha in that byte order).
constexpr uint32_t kBytesPerPixel = 4;

// Color: four normalized channels in [0,1]
struct Color {
    double red = 0.0;
    double green = 0.0;
    double blue = 0.0;
    double alpha = 1.0;

    static Color from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
    // Clamps each channel to [0,1] and rounds to the nearest byte.
    std::array<uint8_t, 4> to_rgba8() const;
};

struct BitmapView;

// Bitmap: owning pixel buffer with row stride
struct Bitmap {
    uint32_t width = 0;
    uint32_t height = 0;
    size_t bytes_per_row = 0;
    uint32_t bytes_per_pixel = kBytesPerPixel;
    std::vector<uint8_t> pixels;

    // Zero-filled bitmap; bytes_per_row == 0 means tightly packed.
    // Throws std::invalid_argument when bytes_per_row < width * 4 or when
    // bytes_per_row * height does not fit in size_t.
    static Bitmap allocate(uint32_t width, uint32_t height, size_t bytes_per_row = 0);

    bool empty() const { return pixels.empty(); }
    BitmapView view() const;

    std::array<uint8_t, 4> pixel(uint32_t x, uint32_t y) const;
    void set_pixel(uint32_t x, uint32_t y, const std::array<uint8_t, 4>& rgba);
};

// BitmapView: read-only window on a caller-owned buffer (decoder output etc.)
struct BitmapView {
    const uint8_t* data = nullptr;
    size_t length = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    size_t bytes_per_row = 0;
    uint32_t bytes_per_pixel = kBytesPerPixel;
};

struct ReplacementRequest {
    Color target;
    Color replacement;
    double tolerance = 0.5;
};

enum class EngineError : uint8_t {
    None = 0,
    InvalidBuffer,
    UnsupportedLayout,
};

const char* to_string(EngineError err);

struct RecolorResult {
    EngineError error = EngineError::None;
    Bitmap bitmap; // empty unless ok()
    bool ok() const { return error == EngineError::None; }
};

struct EngineConfig {
    size_t worker_count = 0;        // 0 = hardware_concurrency
    size_t pixels_per_task = 16384; // 0 = default
    bool verbose = false;
};

} // namespace pixrecolor
