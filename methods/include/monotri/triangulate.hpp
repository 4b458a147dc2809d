#pragma once
/**
 * Simple-polygon triangulation: monotone decomposition, splitting along the
 * diagonals, then a linear sweep per monotone piece.
 *
 * Input: a simple polygon (no holes, no self-intersections) of n >= 3 points
 * in either winding. Output: 3 * (n - 2) indices into the input, every
 * triangle wound like the input polygon.
 *
 * Self-intersecting or degenerate input is not validated; it either produces
 * an unspecified triangulation or fails with std::logic_error.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "monotri/geometry.hpp"
#include "monotri/monotone_partition.hpp"
#include "monotri/monotone_triangulate.hpp"
#include "monotri/orientation.hpp"
#include "monotri/polygon_split.hpp"

namespace monotri {

/**
 * Reusable triangulation scratch space.
 *
 * Every call to triangulate() starts from a clean state; the accessors
 * describe the most recent call only. One instance must not be used from two
 * threads at once, but separate instances are independent.
 */
class Triangulator {
public:
  const std::vector<Index>& triangulate(const Polygon& pts) {
    triangles_.clear();
    diagonals_.clear();
    pieces_.clear();

    const std::size_t n = pts.size();
    detail::require_polygon_size(n);

    clockwise_ = polygon_is_clockwise(pts);
    diagonals_ = partition_polygon(pts, clockwise_);

    // Split the same counter-clockwise view the decomposition swept, then
    // flip the pieces back into the caller's winding.
    IndexLoop view(n);
    for (std::size_t i = 0; i < n; ++i) {
      view[i] = static_cast<Index>(clockwise_ ? n - 1 - i : i);
    }
    pieces_ = split_polygon(view, diagonals_, clockwise_);

    triangles_.reserve(3 * (n - 2));
    for (const auto& piece : pieces_) {
      triangulate_monotone(pts, piece, clockwise_, triangles_);
    }

    if (triangles_.size() != 3 * (n - 2)) {
      throw std::logic_error(
          "triangulation produced " + std::to_string(triangles_.size() / 3) +
          " triangles, expected " + std::to_string(n - 2) +
          " (diagonals=" + std::to_string(diagonals_.size()) +
          ", pieces=" + std::to_string(pieces_.size()) + ")");
    }

    return triangles_;
  }

  const std::vector<Index>& triangles() const { return triangles_; }
  const std::vector<Diagonal>& diagonals() const { return diagonals_; }
  const std::vector<IndexLoop>& pieces() const { return pieces_; }
  bool clockwise() const { return clockwise_; }

private:
  std::vector<Index> triangles_;
  std::vector<Diagonal> diagonals_;
  std::vector<IndexLoop> pieces_;
  bool clockwise_ = false;
};

inline std::vector<Index> triangulate_polygon(const Polygon& pts) {
  Triangulator triangulator;
  return triangulator.triangulate(pts);
}

// Appends to `out`; `out` is left untouched if triangulation fails.
inline void triangulate_polygon(const Polygon& pts, std::vector<Index>& out) {
  Triangulator triangulator;
  const auto& tris = triangulator.triangulate(pts);
  out.insert(out.end(), tris.begin(), tris.end());
}

}  // namespace monotri
