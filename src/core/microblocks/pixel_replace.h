#pragma once
#include "../../include/pixrecolor.hpp"
#include <array>
#include <cstdint>

namespace pixrecolor {

// Replaces matching pixels of one pixel-index range [begin, end).
// Ranges handed to different threads never share bytes of dst.
class PixelReplace {
public:
  explicit PixelReplace(const ReplacementRequest& request);
  ~PixelReplace() = default;

  // src and dst share width/height/bytes_per_row. Returns the number of replaced pixels.
  size_t process(const BitmapView& src, uint8_t* dst, size_t begin, size_t end) const;

  double tolerance() const { return tolerance_; }

private:
  Color target_;
  std::array<uint8_t, 4> replacement_;
  double tolerance_;
};

} // namespace pixrecolor
