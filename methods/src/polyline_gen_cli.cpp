/**
 * Writes a generated cross-section polyline as a `.poly` file.
 *
 *   monotri_gen --type regular|circle|star|rectangle|square|cube [--n <sides>]
 *               [--radius <r>] [--inner-radius <r>] [--width <w>] [--height <h>]
 *               [--clockwise] --output <file.poly>
 */

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "monotri/geometry.hpp"
#include "monotri/orientation.hpp"
#include "monotri/polygon_io.hpp"
#include "monotri/polylines.hpp"

namespace {

struct Args {
  std::string type;   // regular | circle | star | rectangle | square | cube
  int n = 12;
  double radius = 1.0;
  double inner_radius = 0.5;
  double width = 2.0;
  double height = 1.0;
  bool clockwise = false;
  std::string output;
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string t = argv[i];
    if ((t == "--type") && i + 1 < argc) a.type = argv[++i];
    else if ((t == "--n") && i + 1 < argc) a.n = std::stoi(argv[++i]);
    else if ((t == "--radius") && i + 1 < argc) a.radius = std::stod(argv[++i]);
    else if ((t == "--inner-radius") && i + 1 < argc) a.inner_radius = std::stod(argv[++i]);
    else if ((t == "--width") && i + 1 < argc) a.width = std::stod(argv[++i]);
    else if ((t == "--height") && i + 1 < argc) a.height = std::stod(argv[++i]);
    else if (t == "--clockwise") a.clockwise = true;
    else if ((t == "-o" || t == "--output") && i + 1 < argc) a.output = argv[++i];
    else {
      throw std::runtime_error("Unknown or incomplete argument: " + t);
    }
  }
  if (a.type.empty()) throw std::runtime_error("Missing --type");
  if (a.n < 3) throw std::runtime_error("--n must be >= 3");
  if (a.output.empty()) throw std::runtime_error("Missing --output");
  return a;
}

monotri::Polygon make_polyline(const Args& args) {
  const auto sides = static_cast<std::size_t>(args.n);
  if (args.type == "regular") return monotri::make_regular_polyline(args.radius, sides, args.clockwise);
  if (args.type == "circle") return monotri::make_circle_polyline(args.radius, args.clockwise, sides);
  if (args.type == "star") {
    return monotri::make_star_polyline(args.radius, args.inner_radius, sides, args.clockwise);
  }
  if (args.type == "rectangle") return monotri::make_rectangle_polyline(args.width, args.height, args.clockwise);
  if (args.type == "square") return monotri::make_square_polyline(args.width, args.clockwise);
  if (args.type == "cube") return monotri::make_cube_polyline(args.width, args.clockwise);
  throw std::runtime_error("Unknown --type: " + args.type);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto args = parse_args(argc, argv);
    const auto poly = make_polyline(args);

    monotri::write_polygon(poly, args.output);
    std::cout << "monotri_gen,type=" << args.type << ",n=" << poly.size()
              << ",clockwise=" << (monotri::polygon_is_clockwise(poly) ? 1 : 0)
              << ",area=" << monotri::signed_area(poly) << "\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
