#include "include/pixrecolor.hpp"
#include "cli_args.hpp"
#include "opencv_bridge.hpp"
#include "recolor_engine.hpp"
#include <opencv2/imgcodecs.hpp>
#include <exception>
#include <iostream>
#include <string>

using namespace pixrecolor;

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts, std::cerr)) return 2;
    const std::string& in_path = opts.in_path;
    const std::string& out_path = opts.out_path;

    try {
        cv::Mat decoded = cv::imread(in_path, cv::IMREAD_UNCHANGED);
        cv::Mat rgba;
        if (!to_rgba(decoded, rgba)) {
            std::cerr << "Failed to load image: " << in_path << std::endl;
            return 1;
        }

        RecolorEngine engine(opts.config);
        RecolorResult res = engine.recolor(view_of(rgba), opts.request);
        if (!res.ok()) {
            std::cerr << "Recolor failed: " << to_string(res.error) << std::endl;
            return 1;
        }

        if (!cv::imwrite(out_path, to_bgra(res.bitmap))) {
            std::cerr << "Failed to write image to: " << out_path << std::endl;
            return 1;
        }
        std::cout << "Saved recolored image to: " << out_path << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Recolor error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
