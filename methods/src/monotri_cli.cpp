/**
 * Triangulation CLI.
 *
 * Reads a `.poly` file, triangulates it and writes a `.tri` file. Prints one
 * summary line on stdout:
 *
 *   monotri,vertices=<n>,triangles=<t>,expected=<n-2>,diagonals=<d>,pieces=<p>,time_ms=<ms>
 *
 * With --check the result is verified (count, indices, winding, area) and the
 * exit code is 2 when verification fails.
 */

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "monotri/monotone_partition.hpp"
#include "monotri/polygon_io.hpp"
#include "monotri/triangulate.hpp"
#include "monotri/verify.hpp"

using Clock = std::chrono::high_resolution_clock;

namespace {

struct Args {
    std::string input;
    std::string output;
    bool check = false;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <polygon.poly> --output <output.tri> [--check] [--verbose]\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string token = argv[i];
        if ((token == "-i" || token == "--input") && i + 1 < argc) {
            args.input = argv[++i];
        } else if ((token == "-o" || token == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else if (token == "--check") {
            args.check = true;
        } else if (token == "-v" || token == "--verbose") {
            args.verbose = true;
        } else {
            std::ostringstream oss;
            oss << "Unknown or incomplete argument: " << token;
            throw std::runtime_error(oss.str());
        }
    }

    if (args.input.empty()) {
        throw std::runtime_error("Missing --input argument");
    }
    if (args.output.empty()) {
        throw std::runtime_error("Missing --output argument");
    }
    return args;
}

void print_pieces(const monotri::Polygon& polygon, const monotri::Triangulator& triangulator) {
    std::vector<monotri::VertexType> types;
    monotri::partition_polygon(polygon, triangulator.clockwise(), &types);

    std::size_t reflex = 0;
    for (auto type : types) {
        if (type == monotri::VertexType::Split || type == monotri::VertexType::Merge) ++reflex;
    }

    std::cerr << "winding: " << (triangulator.clockwise() ? "clockwise" : "counter-clockwise")
              << ", split/merge vertices: " << reflex << "\n";
    for (const auto& d : triangulator.diagonals()) {
        std::cerr << "diagonal " << d.a << " (" << monotri::to_string(types[d.a]) << ") - "
                  << d.b << " (" << monotri::to_string(types[d.b]) << ")\n";
    }
    for (std::size_t i = 0; i < triangulator.pieces().size(); ++i) {
        std::cerr << "piece " << i << ": " << triangulator.pieces()[i].size() << " vertices\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const auto polygon = monotri::read_polygon(args.input);

        monotri::Triangulator triangulator;
        const auto start = Clock::now();
        const auto& triangles = triangulator.triangulate(polygon);
        const auto stop = Clock::now();
        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(stop - start).count();

        if (args.verbose) {
            print_pieces(polygon, triangulator);
        }

        monotri::write_triangulation(polygon, triangles, args.output);

        std::cout << "monotri,vertices=" << polygon.size()
                  << ",triangles=" << triangles.size() / 3
                  << ",expected=" << (polygon.size() - 2)
                  << ",diagonals=" << triangulator.diagonals().size()
                  << ",pieces=" << triangulator.pieces().size()
                  << ",time_ms=" << elapsed_ms << "\n";

        if (args.check) {
            const auto report = monotri::verify_triangulation(polygon, triangles);
            if (!report.ok()) {
                std::cerr << "Check failed: triangles=" << report.triangles
                          << " expected=" << report.expected
                          << " indices_valid=" << report.indices_valid
                          << " winding_consistent=" << report.winding_consistent
                          << " area_error=" << report.area_error() << "\n";
                return 2;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
