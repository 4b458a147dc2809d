#pragma once
/**
 * Winding tests for polygons and single triangles.
 *
 * Both tests accumulate (next.x - last.x) * (next.y + last.y) over the edges,
 * which is twice the clockwise signed area. A sum >= 0 counts as clockwise, so
 * zero-area input resolves to clockwise.
 */

#include <cstddef>

#include "monotri/geometry.hpp"

namespace monotri {

inline bool polygon_is_clockwise(const Polygon& pts) {
  const std::size_t n = pts.size();
  if (n == 0) return true;

  double sum = 0.0;
  const Point* last = &pts[n - 1];
  for (const auto& next : pts) {
    sum += (next.x - last->x) * (next.y + last->y);
    last = &next;
  }
  return sum >= 0.0;
}

inline bool triangle_is_clockwise(const Point& a, const Point& b, const Point& c) {
  return ((b.x - a.x) * (b.y + a.y) +
          (c.x - b.x) * (c.y + b.y) +
          (a.x - c.x) * (a.y + c.y)) >= 0.0;
}

// Shoelace area, positive for counter-clockwise input.
inline double signed_area(const Polygon& pts) {
  double area = 0.0;
  const std::size_t n = pts.size();
  for (std::size_t i = 0; i < n; ++i) {
    const auto& a = pts[i];
    const auto& b = pts[(i + 1) % n];
    area += a.x * b.y - b.x * a.y;
  }
  return area * 0.5;
}

}  // namespace monotri
