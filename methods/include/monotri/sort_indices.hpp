#pragma once
/**
 * Sweep order: x ascending, then y ascending.
 *
 * The sweep runs left to right, so x is the primary coordinate and y the
 * secondary one. Decomposition and monotone triangulation must agree on this
 * order. Sorting is stable, so duplicate points keep their input order.
 */

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

#include "monotri/geometry.hpp"

namespace monotri {

// True when p is swept before q.
inline bool sweep_precedes(const Point& p, const Point& q) {
  return p.x < q.x || (p.x == q.x && p.y < q.y);
}

inline std::vector<Index> sort_indices(const Polygon& pts) {
  std::vector<Index> order(pts.size());
  std::iota(order.begin(), order.end(), Index{0});
  std::stable_sort(order.begin(), order.end(), [&](Index a, Index b) {
    return sweep_precedes(pts[a], pts[b]);
  });
  return order;
}

// Positions 0..loop.size()-1 of a loop, ordered by the sweep order of the
// points they refer to.
inline std::vector<Index> sort_loop_positions(const Polygon& pts, const IndexLoop& loop) {
  std::vector<Index> order(loop.size());
  std::iota(order.begin(), order.end(), Index{0});
  std::stable_sort(order.begin(), order.end(), [&](Index a, Index b) {
    return sweep_precedes(pts[loop[a]], pts[loop[b]]);
  });
  return order;
}

}  // namespace monotri
