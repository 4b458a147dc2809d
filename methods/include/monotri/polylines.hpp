#pragma once
/**
 * 2D cross-section builders (bases of prisms, pyramids and extrusions).
 *
 * All shapes are centred at the origin. Unless `clockwise` is set, points are
 * emitted in counter-clockwise order. Regular shapes start at +y and are
 * parametrised as (sin(angle), cos(angle)) * radius.
 */

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "monotri/geometry.hpp"

namespace monotri {

namespace detail {

inline Point on_circle(double angle, double radius) {
  return {std::sin(angle) * radius, std::cos(angle) * radius};
}

}  // namespace detail

inline Polygon make_regular_polyline(double radius, std::size_t sides, bool clockwise = false) {
  if (sides < 3) {
    throw std::invalid_argument(
        "a regular polyline needs at least 3 sides, got " + std::to_string(sides));
  }

  Polygon poly;
  poly.reserve(sides);
  for (std::size_t i = 0; i < sides; ++i) {
    const std::size_t j = clockwise ? i : (sides - 1 - i);
    const double angle = kTau * static_cast<double>(j) / static_cast<double>(sides);
    poly.push_back(detail::on_circle(angle, radius));
  }
  return poly;
}

inline Polygon make_circle_polyline(double radius, bool clockwise = false, std::size_t subdivisions = 12) {
  return make_regular_polyline(radius, subdivisions, clockwise);
}

inline Polygon make_star_polyline(double outer_radius,
                                  double inner_radius,
                                  std::size_t sides,
                                  bool clockwise = false) {
  if (sides < 3) {
    throw std::invalid_argument(
        "a star polyline needs at least 3 sides, got " + std::to_string(sides));
  }

  const double half_step = kTau / static_cast<double>(sides) / 2.0;

  Polygon poly;
  poly.reserve(sides * 2);
  for (std::size_t i = 0; i < sides; ++i) {
    const std::size_t j = clockwise ? i : (sides - 1 - i);
    const double outer_angle = kTau * static_cast<double>(j) / static_cast<double>(sides);
    const Point outer = detail::on_circle(outer_angle, outer_radius);
    const Point inner = detail::on_circle(outer_angle + half_step, inner_radius);

    if (clockwise) {
      poly.push_back(outer);
      poly.push_back(inner);
    } else {
      poly.push_back(inner);
      poly.push_back(outer);
    }
  }
  return poly;
}

inline Polygon make_rectangle_polyline(double width, double height, bool clockwise = false) {
  const double hw = width / 2.0;
  const double hh = height / 2.0;
  if (clockwise) {
    return {{hw, hh}, {hw, -hh}, {-hw, -hh}, {-hw, hh}};
  }
  return {{hw, hh}, {-hw, hh}, {-hw, -hh}, {hw, -hh}};
}

inline Polygon make_square_polyline(double length, bool clockwise = false) {
  return make_rectangle_polyline(length, length, clockwise);
}

// Base of a cube: a square of side `length`.
inline Polygon make_cube_polyline(double length, bool clockwise = false) {
  return make_square_polyline(length, clockwise);
}

}  // namespace monotri
