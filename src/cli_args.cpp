#include "cli_args.hpp"
#include "core/microblocks/color_match.h"
#include <cmath>
#include <exception>

namespace pixrecolor {

namespace {

// Whole-string signed parse so "-1" and "12x" are refused rather than wrapped.
bool parse_count(const std::string& text, size_t max_value, size_t& out) {
    long long v = 0;
    size_t used = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    if (used != text.size() || v < 0 || static_cast<unsigned long long>(v) > max_value) return false;
    out = static_cast<size_t>(v);
    return true;
}

bool parse_fraction(const std::string& text, double& out) {
    double v = 0.0;
    size_t used = 0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    if (used != text.size() || std::isnan(v)) return false;
    out = v;
    return true;
}

} // namespace

void print_usage(const char* prog, std::ostream& err) {
    err << "usage: " << prog << " --in <image> --out <image> --target <color> --replacement <color>\n"
        << "       [--tolerance <0..1>] [--workers <0.." << kMaxCliWorkers << ">] [--chunk <pixels>] [--verbose]\n"
        << "colors: #RRGGBB, #RRGGBBAA, r,g,b or r,g,b,a\n";
}

bool parse_args(int argc, const char* const* argv, CliOptions& out, std::ostream& err) {
    const char* prog = argc > 0 ? argv[0] : "pixrecolor";
    std::string target_text, replacement_text;

    auto fail = [&](const std::string& reason) {
        err << reason << "\n";
        print_usage(prog, err);
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() { return (i + 1 < argc) ? std::string(argv[++i]) : std::string(); };
        if (a == "--in") out.in_path = next();
        else if (a == "--out") out.out_path = next();
        else if (a == "--target") target_text = next();
        else if (a == "--replacement") replacement_text = next();
        else if (a == "--tolerance") {
            std::string v = next();
            if (!parse_fraction(v, out.request.tolerance)) return fail("Invalid tolerance: " + v);
        } else if (a == "--workers") {
            std::string v = next();
            if (!parse_count(v, kMaxCliWorkers, out.config.worker_count)) return fail("Invalid worker count: " + v);
        } else if (a == "--chunk") {
            std::string v = next();
            if (!parse_count(v, kMaxCliPixelsPerTask, out.config.pixels_per_task)) return fail("Invalid chunk size: " + v);
        } else if (a == "--verbose") out.config.verbose = true;
        else return fail("Unknown option: " + a);
    }

    if (out.in_path.empty() || out.out_path.empty() || target_text.empty() || replacement_text.empty()) {
        return fail("Missing required option");
    }
    if (!parse_color(target_text, out.request.target)) return fail("Invalid target color: " + target_text);
    if (!parse_color(replacement_text, out.request.replacement)) return fail("Invalid replacement color: " + replacement_text);
    return true;
}

} // namespace pixrecolor
