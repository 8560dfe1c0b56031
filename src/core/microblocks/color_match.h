#pragma once
#include "../../include/pixrecolor.hpp"
#include <cstdint>
#include <string>

namespace pixrecolor {

// Slack added to the tolerance so that k/255 accepts a byte difference of k.
constexpr double kMatchEpsilon = 1e-9;

inline double channel_from_byte(uint8_t b) { return b / 255.0; }

// clamp to [0,1], then round to nearest
uint8_t channel_to_byte(double channel);

// Tolerance outside [0,1] is clamped, NaN becomes 0.
double clamp_tolerance(double tolerance);

// Per-channel bound: every one of r, g, b, a must differ by at most tolerance.
bool matches(const Color& candidate, const Color& target, double tolerance);

// "#RRGGBB", "#RRGGBBAA", "r,g,b" or "r,g,b,a" (bytes). Leaves out untouched on failure.
bool parse_color(const std::string& text, Color& out);

} // namespace pixrecolor
