// Cross-checks monotri against mapbox earcut on the same polygon (triangle
// count and covered area).
#include "monotri/polygon_io.hpp"
#include "monotri/triangulate.hpp"
#include "monotri/verify.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <mapbox/earcut.hpp>

using Clock = std::chrono::high_resolution_clock;

namespace {

struct Args {
    std::string input;
    std::string output;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if ((token == "-i" || token == "--input") && i + 1 < argc) {
            args.input = argv[++i];
        } else if ((token == "-o" || token == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else {
            std::ostringstream oss;
            oss << "Unknown or incomplete argument: " << token;
            throw std::runtime_error(oss.str());
        }
    }

    if (args.input.empty()) {
        throw std::runtime_error("Missing --input argument");
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const auto polygon = monotri::read_polygon(args.input);

        // Earcut input (single contour, no holes)
        std::vector<std::vector<std::array<double, 2>>> poly_data(1);
        poly_data[0].reserve(polygon.size());
        for (const auto& p : polygon) {
            poly_data[0].push_back({p.x, p.y});
        }

        auto start = Clock::now();
        const auto reference = mapbox::earcut<monotri::Index>(poly_data);
        auto stop = Clock::now();
        const double earcut_ms = std::chrono::duration<double, std::milli>(stop - start).count();

        start = Clock::now();
        const auto ours = monotri::triangulate_polygon(polygon);
        stop = Clock::now();
        const double monotri_ms = std::chrono::duration<double, std::milli>(stop - start).count();

        const auto ref_report = monotri::verify_triangulation(polygon, reference);
        const auto our_report = monotri::verify_triangulation(polygon, ours);

        if (!args.output.empty()) {
            monotri::write_triangulation(polygon, reference, args.output);
        }

        const bool match = our_report.ok() &&
                           ref_report.triangles == our_report.triangles &&
                           std::abs(ref_report.triangle_area - our_report.triangle_area) <=
                               1e-9 * std::max(1.0, ref_report.polygon_area);

        std::cout << "earcut,vertices=" << polygon.size()
                  << ",triangles=" << ref_report.triangles
                  << ",monotri_triangles=" << our_report.triangles
                  << ",time_ms=" << earcut_ms
                  << ",monotri_time_ms=" << monotri_ms
                  << ",match=" << (match ? 1 : 0) << "\n";
        return match ? EXIT_SUCCESS : 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
