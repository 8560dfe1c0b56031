#include "recolor_engine.hpp"
#include "core/microblocks/pixel_replace.h"
#include <atomic>
#include <iostream>
#include <limits>

namespace pixrecolor {

namespace {
constexpr size_t kDefaultPixelsPerTask = 16384;

EngineConfig normalize(EngineConfig config) {
    if (config.pixels_per_task == 0) config.pixels_per_task = kDefaultPixelsPerTask;
    return config;
}
} // namespace

RecolorEngine::RecolorEngine(EngineConfig config)
    : config_(normalize(config)), pool_(config_.worker_count, config_.verbose) {}

EngineError RecolorEngine::validate(const BitmapView& src) {
    if (src.bytes_per_pixel != kBytesPerPixel) return EngineError::UnsupportedLayout;
    if (src.width == 0 || src.height == 0) return EngineError::InvalidBuffer;
    if (src.data == nullptr) return EngineError::InvalidBuffer;

    const size_t packed = static_cast<size_t>(src.width) * src.bytes_per_pixel;
    if (src.bytes_per_row < packed) return EngineError::InvalidBuffer;
    if (src.bytes_per_row > std::numeric_limits<size_t>::max() / src.height) return EngineError::InvalidBuffer;
    if (src.length != src.bytes_per_row * src.height) return EngineError::InvalidBuffer;
    return EngineError::None;
}

RecolorResult RecolorEngine::recolor(const BitmapView& src, const ReplacementRequest& request) {
    RecolorResult res;
    res.error = validate(src);
    if (!res.ok()) {
        std::cerr << "[RecolorEngine] RECOLOR_REJECTED reason=" << to_string(res.error)
                  << " width=" << src.width << " height=" << src.height
                  << " bytes_per_row=" << src.bytes_per_row
                  << " bytes_per_pixel=" << src.bytes_per_pixel
                  << " length=" << src.length << "\n";
        return res;
    }

    Bitmap out;
    out.width = src.width;
    out.height = src.height;
    out.bytes_per_row = src.bytes_per_row;
    out.bytes_per_pixel = src.bytes_per_pixel;
    out.pixels.resize(src.length);

    const PixelReplace kernel(request);
    const size_t pixel_count = static_cast<size_t>(src.width) * src.height;
    uint8_t* dst = out.pixels.data();
    std::atomic<size_t> replaced{0};

    if (pixel_count <= config_.pixels_per_task) {
        replaced.store(kernel.process(src, dst, 0, pixel_count));
    } else {
        pool_.parallel_for(pixel_count, config_.pixels_per_task, [&](size_t begin, size_t end) {
            replaced.fetch_add(kernel.process(src, dst, begin, end), std::memory_order_relaxed);
        });
    }

    if (config_.verbose) {
        std::cout << "[RecolorEngine] RECOLOR_DONE pixels=" << pixel_count
                  << " replaced=" << replaced.load()
                  << " tolerance=" << kernel.tolerance() << "\n";
    }
    res.bitmap = std::move(out);
    return res;
}

RecolorResult RecolorEngine::recolor(const Bitmap& src, const ReplacementRequest& request) {
    return recolor(src.view(), request);
}

RecolorResult recolor(const Bitmap& src, const ReplacementRequest& request, const EngineConfig& config) {
    RecolorEngine engine(config);
    return engine.recolor(src, request);
}

} // namespace pixrecolor
