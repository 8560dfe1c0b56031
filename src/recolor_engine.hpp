#pragma once
#include "include/pixrecolor.hpp"
#include "worker_pool.hpp"

namespace pixrecolor {

// Color replacement over a whole bitmap. Holds no per-image state; one engine
// may serve concurrent callers.
class RecolorEngine {
public:
    explicit RecolorEngine(EngineConfig config = EngineConfig());

    // The input is never modified. The output has the input's dimensions and
    // stride; pixels within tolerance of request.target take request.replacement.
    RecolorResult recolor(const BitmapView& src, const ReplacementRequest& request);
    RecolorResult recolor(const Bitmap& src, const ReplacementRequest& request);

    // Checks layout and buffer length without touching pixel data.
    static EngineError validate(const BitmapView& src);

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    WorkerPool pool_;
};

// One-shot convenience: builds a temporary engine with the given config.
RecolorResult recolor(const Bitmap& src, const ReplacementRequest& request,
                      const EngineConfig& config = EngineConfig());

} // namespace pixrecolor
