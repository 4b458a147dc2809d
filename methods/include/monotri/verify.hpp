#pragma once
/**
 * Post-hoc checks for a triangulation of a simple polygon.
 *
 * A valid result has n - 2 triangles, only in-range indices, no repeated index
 * within a triangle, every triangle wound like the polygon, and triangle areas
 * summing to the polygon area.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "monotri/geometry.hpp"
#include "monotri/orientation.hpp"

namespace monotri {

struct TriangulationReport {
  std::size_t triangles = 0;
  std::size_t expected = 0;
  double polygon_area = 0.0;
  double triangle_area = 0.0;
  bool indices_valid = true;
  bool winding_consistent = true;

  double area_error() const { return std::abs(triangle_area - polygon_area); }

  bool ok(double tolerance = 1e-9) const {
    const double scale = std::max(1.0, polygon_area);
    return triangles == expected && indices_valid && winding_consistent &&
           area_error() <= tolerance * scale;
  }
};

inline double triangle_area(const Point& a, const Point& b, const Point& c) {
  return 0.5 * std::abs((b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x));
}

inline TriangulationReport verify_triangulation(const Polygon& pts, const std::vector<Index>& indices) {
  TriangulationReport report;
  const std::size_t n = pts.size();
  report.expected = n >= 3 ? n - 2 : 0;
  report.triangles = indices.size() / 3;
  report.polygon_area = std::abs(signed_area(pts));
  if (indices.size() % 3 != 0) report.indices_valid = false;

  const bool clockwise = polygon_is_clockwise(pts);
  for (std::size_t i = 0; i + 2 < indices.size(); i += 3) {
    const Index a = indices[i];
    const Index b = indices[i + 1];
    const Index c = indices[i + 2];
    if (a >= n || b >= n || c >= n || a == b || b == c || a == c) {
      report.indices_valid = false;
      continue;
    }
    if (triangle_is_clockwise(pts[a], pts[b], pts[c]) != clockwise) {
      report.winding_consistent = false;
    }
    report.triangle_area += triangle_area(pts[a], pts[b], pts[c]);
  }
  return report;
}

}  // namespace monotri
