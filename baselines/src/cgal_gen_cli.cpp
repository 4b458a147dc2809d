// Random-polygon sweep for monotri. CGAL generates `--count` polygons of
// `--n` vertices (random simple polygons in a disc, or convex hulls of points
// in a square); each one is triangulated by monotri and checked with
// verify_triangulation. With --output the first failing polygon is written
// as a `.poly` file, or the last generated one when every polygon passes.
//
//   cgal_gen --type random_simple --n 200 --count 50 --seed 7 [--output bad.poly]
//
// Exit code: 0 when every polygon verifies, 2 when any fails.
#include "monotri/geometry.hpp"
#include "monotri/polygon_io.hpp"
#include "monotri/triangulate.hpp"
#include "monotri/verify.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/point_generators_2.h>
#include <CGAL/random_polygon_2.h>
#include <CGAL/convex_hull_2.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using Clock = std::chrono::high_resolution_clock;

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using CgalPoint = K::Point_2;

struct Args {
  std::string type = "random_simple";   // random_simple | convex
  int n = 100;
  int count = 10;
  std::uint64_t seed = 1;
  double radius = 100.0;
  std::string output;
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string t = argv[i];
    if ((t == "--type") && i + 1 < argc) a.type = argv[++i];
    else if ((t == "--n") && i + 1 < argc) a.n = std::stoi(argv[++i]);
    else if ((t == "--count") && i + 1 < argc) a.count = std::stoi(argv[++i]);
    else if ((t == "--seed") && i + 1 < argc) a.seed = static_cast<std::uint64_t>(std::stoull(argv[++i]));
    else if ((t == "--radius") && i + 1 < argc) a.radius = std::stod(argv[++i]);
    else if ((t == "-o" || t == "--output") && i + 1 < argc) a.output = argv[++i];
    else {
      throw std::runtime_error("Unknown or incomplete argument: " + t);
    }
  }
  if (a.type != "random_simple" && a.type != "convex") {
    throw std::runtime_error("Unknown --type: " + a.type);
  }
  if (a.n < 3) throw std::runtime_error("--n must be >= 3");
  if (a.count < 1) throw std::runtime_error("--count must be >= 1");
  return a;
}

monotri::Polygon generate(const Args& args, CGAL::Random& rng) {
  std::vector<CgalPoint> samples;
  samples.reserve(static_cast<std::size_t>(args.n));
  std::vector<CgalPoint> boundary;

  if (args.type == "random_simple") {
    CGAL::Random_points_in_disc_2<CgalPoint> gen(args.radius, rng);
    for (int i = 0; i < args.n; ++i) samples.push_back(*gen++);
    CGAL::random_polygon_2(samples.size(), std::back_inserter(boundary), samples.begin());
  } else {
    CGAL::Random_points_in_square_2<CgalPoint> gen(args.radius, rng);
    for (int i = 0; i < args.n; ++i) samples.push_back(*gen++);
    CGAL::convex_hull_2(samples.begin(), samples.end(), std::back_inserter(boundary));
  }

  monotri::Polygon poly;
  poly.reserve(boundary.size());
  for (const auto& p : boundary) poly.push_back({CGAL::to_double(p.x()), CGAL::to_double(p.y())});
  return poly;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto args = parse_args(argc, argv);

    std::mt19937_64 seeds(args.seed);
    monotri::Triangulator triangulator;

    double gen_ms = 0.0;
    double tri_ms = 0.0;
    int failures = 0;
    std::size_t vertices = 0;
    monotri::Polygon keep;
    bool keep_is_failure = false;

    for (int round = 0; round < args.count; ++round) {
      CGAL::Random rng(static_cast<unsigned int>(seeds()));

      const auto t0 = Clock::now();
      const auto poly = generate(args, rng);
      const auto t1 = Clock::now();
      gen_ms += std::chrono::duration<double, std::milli>(t1 - t0).count();

      if (poly.size() < 3) continue;
      vertices += poly.size();

      bool ok = false;
      try {
        const auto t2 = Clock::now();
        const auto& tris = triangulator.triangulate(poly);
        const auto t3 = Clock::now();
        tri_ms += std::chrono::duration<double, std::milli>(t3 - t2).count();

        const auto report = monotri::verify_triangulation(poly, tris);
        ok = report.ok();
        if (!ok) {
          std::cerr << "round " << round << ": n=" << poly.size()
                    << " triangles=" << report.triangles
                    << " expected=" << report.expected
                    << " area_error=" << report.area_error() << "\n";
        }
      } catch (const std::logic_error& ex) {
        std::cerr << "round " << round << ": n=" << poly.size() << " " << ex.what() << "\n";
      }

      if (!ok) ++failures;
      if (!keep_is_failure) {
        keep = poly;
        keep_is_failure = !ok;
      }
    }

    if (!args.output.empty() && !keep.empty()) {
      monotri::write_polygon(keep, args.output);
    }

    std::cout << "cgal_gen,type=" << args.type << ",n=" << args.n
              << ",count=" << args.count << ",vertices=" << vertices
              << ",failures=" << failures << ",seed=" << args.seed
              << ",gen_ms=" << gen_ms << ",tri_ms=" << tri_ms << "\n";
    return failures == 0 ? EXIT_SUCCESS : 2;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
