#pragma once
#include "include/pixrecolor.hpp"
#include <cstddef>
#include <ostream>
#include <string>

namespace pixrecolor {

constexpr size_t kMaxCliWorkers = 1024;
constexpr size_t kMaxCliPixelsPerTask = size_t(1) << 30;

struct CliOptions {
    std::string in_path;
    std::string out_path;
    ReplacementRequest request;
    EngineConfig config;
};

void print_usage(const char* prog, std::ostream& err);

// Fills out from argv. On a missing flag, an unknown option, a bad color or a
// bad number it writes the reason and usage to err and returns false.
bool parse_args(int argc, const char* const* argv, CliOptions& out, std::ostream& err);

} // namespace pixrecolor
