#include "core/microblocks/color_match.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace pixrecolor;

int main() {
    Color red = Color::from_rgba8(255, 0, 0, 255);
    Color green = Color::from_rgba8(0, 255, 0, 255);

    // tolerance 0: exact equality only
    assert(matches(red, red, 0.0));
    assert(!matches(red, Color::from_rgba8(254, 0, 0, 255), 0.0));
    assert(!matches(red, green, 0.0));

    // tolerance 1: everything
    assert(matches(red, green, 1.0));
    assert(matches(Color::from_rgba8(0, 0, 0, 0), Color::from_rgba8(255, 255, 255, 255), 1.0));

    // 200 vs 255 is 55/255 ~ 0.216
    assert(matches(Color::from_rgba8(200, 0, 0, 255), red, 0.25));
    assert(!matches(Color::from_rgba8(200, 0, 0, 255), red, 0.2));

    // k/255 accepts a byte difference of exactly k
    assert(matches(Color::from_rgba8(10, 20, 30, 40), Color::from_rgba8(13, 17, 33, 37), 3 / 255.0));
    assert(!matches(Color::from_rgba8(10, 20, 30, 40), Color::from_rgba8(14, 20, 30, 40), 3 / 255.0));

    // all four channels must hold, alpha included
    assert(!matches(Color::from_rgba8(255, 0, 0, 0), red, 0.5));
    assert(!matches(Color::from_rgba8(255, 0, 200, 255), red, 0.5));

    // rounding policy
    assert(channel_to_byte(0.0) == 0);
    assert(channel_to_byte(1.0) == 255);
    assert(channel_to_byte(0.5) == 128);
    assert(channel_to_byte(0.499) == 127);
    assert(channel_to_byte(-0.2) == 0);
    assert(channel_to_byte(1.7) == 255);
    for (int b = 0; b < 256; ++b) assert(channel_to_byte(channel_from_byte(static_cast<uint8_t>(b))) == b);

    // tolerance clamping
    assert(clamp_tolerance(-1.0) == 0.0);
    assert(clamp_tolerance(3.0) == 1.0);
    assert(clamp_tolerance(0.3) == 0.3);
    assert(clamp_tolerance(std::numeric_limits<double>::quiet_NaN()) == 0.0);

    // parsing
    Color c;
    assert(parse_color("#FF8000", c));
    assert((c.to_rgba8() == std::array<uint8_t, 4>{255, 128, 0, 255}));
    assert(parse_color("#ff800040", c));
    assert((c.to_rgba8() == std::array<uint8_t, 4>{255, 128, 0, 64}));
    assert(parse_color("0,0,255", c));
    assert((c.to_rgba8() == std::array<uint8_t, 4>{0, 0, 255, 255}));
    assert(parse_color("1,2,3,4", c));
    assert((c.to_rgba8() == std::array<uint8_t, 4>{1, 2, 3, 4}));

    Color untouched = Color::from_rgba8(9, 9, 9, 9);
    Color probe = untouched;
    assert(!parse_color("", probe));
    assert(!parse_color("#FFF", probe));
    assert(!parse_color("#GG0000", probe));
    assert(!parse_color("256,0,0", probe));
    assert(!parse_color("1,2", probe));
    assert(!parse_color("1,,3", probe));
    assert(!parse_color("1,2,3,4,5", probe));
    assert(!parse_color("-1,2,3", probe));
    assert((probe.to_rgba8() == untouched.to_rgba8()));

    std::cout << "ColorMatch test PASSED\n";
    return 0;
}
