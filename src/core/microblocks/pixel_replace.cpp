#include "pixel_replace.h"
#include "color_match.h"
#include <cstring>

namespace pixrecolor {

PixelReplace::PixelReplace(const ReplacementRequest& request)
  : target_(request.target),
    replacement_(request.replacement.to_rgba8()),
    tolerance_(clamp_tolerance(request.tolerance)) {}

size_t PixelReplace::process(const BitmapView& src, uint8_t* dst, size_t begin, size_t end) const {
  const size_t width = src.width;
  const size_t row_bytes = width * src.bytes_per_pixel;
  const size_t padding = src.bytes_per_row - row_bytes;
  size_t replaced = 0;

  size_t row = begin / width;
  size_t col = begin % width;
  for (size_t p = begin; p < end; ++p) {
    const size_t off = row * src.bytes_per_row + col * src.bytes_per_pixel;
    const uint8_t* in = src.data + off;
    uint8_t* out = dst + off;

    Color candidate = Color::from_rgba8(in[0], in[1], in[2], in[3]);
    if (matches(candidate, target_, tolerance_)) {
      out[0] = replacement_[0];
      out[1] = replacement_[1];
      out[2] = replacement_[2];
      out[3] = replacement_[3];
      ++replaced;
    } else {
      std::memcpy(out, in, 4);
    }

    if (++col == width) {
      // the range owning a row's last pixel also owns its padding
      if (padding) {
        const size_t pad_off = row * src.bytes_per_row + row_bytes;
        std::memcpy(dst + pad_off, src.data + pad_off, padding);
      }
      col = 0;
      ++row;
    }
  }
  return replaced;
}

} // namespace pixrecolor
