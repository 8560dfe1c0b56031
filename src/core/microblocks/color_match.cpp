#include "color_match.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace pixrecolor {

uint8_t channel_to_byte(double channel) {
  if (std::isnan(channel)) return 0;
  double c = std::min(1.0, std::max(0.0, channel));
  return static_cast<uint8_t>(std::lround(c * 255.0));
}

double clamp_tolerance(double tolerance) {
  if (std::isnan(tolerance)) return 0.0;
  return std::min(1.0, std::max(0.0, tolerance));
}

bool matches(const Color& candidate, const Color& target, double tolerance) {
  const double bound = tolerance + kMatchEpsilon;
  return std::fabs(candidate.red - target.red) <= bound
      && std::fabs(candidate.green - target.green) <= bound
      && std::fabs(candidate.blue - target.blue) <= bound
      && std::fabs(candidate.alpha - target.alpha) <= bound;
}

static bool parse_hex_byte(const std::string& s, size_t pos, uint8_t& out) {
  int v = 0;
  for (size_t i = pos; i < pos + 2; ++i) {
    char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    v <<= 4;
    if (ch >= '0' && ch <= '9') v |= ch - '0';
    else if (ch >= 'a' && ch <= 'f') v |= ch - 'a' + 10;
    else return false;
  }
  out = static_cast<uint8_t>(v);
  return true;
}

bool parse_color(const std::string& text, Color& out) {
  uint8_t rgba[4] = {0, 0, 0, 255};

  if (!text.empty() && text[0] == '#') {
    if (text.size() != 7 && text.size() != 9) return false;
    size_t channels = (text.size() - 1) / 2;
    for (size_t c = 0; c < channels; ++c) {
      if (!parse_hex_byte(text, 1 + 2 * c, rgba[c])) return false;
    }
  } else {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
      size_t comma = text.find(',', start);
      parts.push_back(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
      if (comma == std::string::npos) break;
      start = comma + 1;
    }
    if (parts.size() != 3 && parts.size() != 4) return false;
    for (size_t c = 0; c < parts.size(); ++c) {
      const std::string& p = parts[c];
      if (p.empty() || p.size() > 3) return false;
      for (char ch : p) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
      }
      long v = std::strtol(p.c_str(), nullptr, 10);
      if (v > 255) return false;
      rgba[c] = static_cast<uint8_t>(v);
    }
  }

  out = Color::from_rgba8(rgba[0], rgba[1], rgba[2], rgba[3]);
  return true;
}

} // namespace pixrecolor
