#pragma once
/**
 * Linear-time triangulation of one sweep-monotone polygon.
 *
 * Two-chain stack sweep (de Berg et al., section 3.3). The loop is processed
 * in loop positions; points are looked up through the loop and triangles are
 * emitted in original polygon indices. Every triangle is reoriented on output
 * to match `clockwise`, since the sweep itself visits vertices in no
 * particular rotational order.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "monotri/geometry.hpp"
#include "monotri/orientation.hpp"
#include "monotri/sort_indices.hpp"

namespace monotri {

namespace detail {

// Cyclic half-open interval [start, end) over loop positions.
inline bool in_cyclic_interval(Index i, Index start, Index end) {
  if (start > end) return i >= start || i < end;
  return i >= start && i < end;
}

}  // namespace detail

inline void triangulate_monotone(const Polygon& pts,
                                 const IndexLoop& loop,
                                 bool clockwise,
                                 std::vector<Index>& out) {
  const std::size_t m = loop.size();
  if (m < 3) {
    throw std::invalid_argument(
        "monotone loop must have at least 3 vertices, got " + std::to_string(m));
  }

  // Loops arrive in the winding of their source polygon.
  if (m == 3) {
    out.insert(out.end(), {loop[0], loop[1], loop[2]});
    return;
  }

  auto emit = [&](Index a, Index b, Index c) {
    const Index ia = loop[a];
    const Index ib = loop[b];
    const Index ic = loop[c];
    out.push_back(ia);
    if (triangle_is_clockwise(pts[ia], pts[ib], pts[ic]) == clockwise) {
      out.push_back(ib);
      out.push_back(ic);
    } else {
      out.push_back(ic);
      out.push_back(ib);
    }
  };

  const std::vector<Index> order = sort_loop_positions(pts, loop);

  // The second chain runs from the sweep-last vertex (inclusive) around to
  // the sweep-first vertex (exclusive).
  const Index second_start = order[m - 1];
  const Index second_end = order[0];
  auto on_second_chain = [&](Index pos) {
    return detail::in_cyclic_interval(pos, second_start, second_end);
  };

  std::vector<Index> stack{order[0], order[1]};

  for (std::size_t i = 2; i + 1 < m; ++i) {
    const Index cur = order[i];
    const Index top = stack.back();

    if (on_second_chain(cur) != on_second_chain(top)) {
      for (std::size_t j = 0; j + 1 < stack.size(); ++j) {
        emit(cur, stack[j], stack[j + 1]);
      }
      stack.assign({top, cur});
      continue;
    }

    Index last = top;
    stack.pop_back();

    // Orient the test so a positive cross product means the diagonal from
    // cur stays inside, whichever side of the loop the chain is on.
    const bool forward = cur == (last + 1) % static_cast<Index>(m);
    const double sign = (forward != clockwise) ? -1.0 : 1.0;
    const Point& p = pts[loop[cur]];

    while (!stack.empty()) {
      const Index candidate = stack.back();
      const Point& lp = pts[loop[last]];
      const Point& cp = pts[loop[candidate]];

      const double ex = sign * (lp.x - p.x);
      const double ey = sign * (lp.y - p.y);
      const double cross = ex * (cp.y - lp.y) - ey * (cp.x - lp.x);
      if (cross <= 0.0) break;

      stack.pop_back();
      emit(cur, last, candidate);
      last = candidate;
    }

    stack.push_back(last);
    stack.push_back(cur);
  }

  const Index final_pos = order[m - 1];
  for (std::size_t j = 0; j + 1 < stack.size(); ++j) {
    emit(final_pos, stack[j], stack[j + 1]);
  }
}

}  // namespace monotri
