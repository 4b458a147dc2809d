#pragma once
/**
 * Monotone decomposition of a simple polygon.
 *
 * Sweep-line construction from de Berg et al., "Computational Geometry:
 * Algorithms and Applications" (3rd ed., section 3.2), rotated so the sweep
 * runs along +x (see sort_indices.hpp). "Left" of a vertex means the status
 * edge crossing the sweep line closest below it in y.
 *
 * The algorithm is defined for counter-clockwise input. Clockwise input is
 * swept over a reversed index view; diagonals are always reported in the
 * caller's original indices.
 *
 * Status and helper bookkeeping are plain vectors: the status set is scanned
 * linearly by the left-edge lookup, which keeps the sweep O(n * s) where s is
 * the number of active edges.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "monotri/geometry.hpp"
#include "monotri/orientation.hpp"
#include "monotri/sort_indices.hpp"

namespace monotri {

enum class VertexType {
  Start,
  End,
  Regular,
  Split,
  Merge
};

inline const char* to_string(VertexType type) {
  switch (type) {
    case VertexType::Start: return "start";
    case VertexType::End: return "end";
    case VertexType::Regular: return "regular";
    case VertexType::Split: return "split";
    case VertexType::Merge: return "merge";
  }
  return "unknown";
}

namespace detail {

static constexpr Index kNoVertex = std::numeric_limits<Index>::max();

// Polygons must have at least 3 vertices and fit in Index.
inline void require_polygon_size(std::size_t n) {
  if (n < 3) {
    throw std::invalid_argument(
        "polygon must have at least 3 vertices, got " + std::to_string(n));
  }
  if (n > kMaxVertices) {
    throw std::invalid_argument(
        "polygon has " + std::to_string(n) + " vertices, at most " +
        std::to_string(kMaxVertices) + " are supported");
  }
}

// Angle at cur measured from prev to next through the interior of a
// counter-clockwise polygon, in [0, 2*pi).
inline double interior_angle(const Point& prev, const Point& cur, const Point& next) {
  const double prev_angle = -std::atan2(prev.y - cur.y, prev.x - cur.x);
  const double next_angle = -std::atan2(next.y - cur.y, next.x - cur.x);
  return std::fmod(std::fmod(next_angle - prev_angle, kTau) + kTau, kTau);
}

class SweepState {
public:
  SweepState(const Polygon& pts, const std::vector<Index>& view)
      : pts_(pts),
        view_(view),
        n_(static_cast<Index>(view.size())),
        helper_(view.size(), kNoVertex),
        types_(view.size(), VertexType::Regular) {}

  const Point& at(Index k) const { return pts_[view_[k]]; }
  Index prev(Index k) const { return (k + n_ - 1) % n_; }
  Index next(Index k) const { return (k + 1) % n_; }

  void classify(Index k, VertexType type) { types_[k] = type; }
  const std::vector<VertexType>& types() const { return types_; }

  void add_edge(Index k) {
    status_.push_back(k);
    helper_[k] = k;
  }

  void remove_edge(Index k) {
    auto it = std::find(status_.begin(), status_.end(), k);
    if (it != status_.end()) status_.erase(it);
  }

  Index helper(Index edge) const { return helper_[edge]; }
  void set_helper(Index edge, Index k) { helper_[edge] = k; }

  bool helper_is_merge(Index edge) const {
    const Index h = helper_[edge];
    return h != kNoVertex && types_[h] == VertexType::Merge;
  }

  // Connect k to the helper of `edge` when that helper is a merge vertex.
  void connect_merge_helper(Index k, Index edge) {
    if (helper_is_merge(edge)) emit(k, helper_[edge]);
  }

  void emit(Index a, Index b) {
    diagonals_.push_back({view_[a], view_[b]});
  }

  // Status edge whose supporting line crosses x = at(k).x closest below
  // at(k).y. Vertical edges have no single crossing and are skipped.
  Index left_edge(Index k) const {
    const Point& v = at(k);
    Index best = kNoVertex;
    double best_y = -std::numeric_limits<double>::infinity();

    for (Index edge : status_) {
      const Point& a = at(edge);
      const Point& b = at(next(edge));
      const Point& lo = (a.x > b.x) ? b : a;
      const Point& hi = (a.x > b.x) ? a : b;

      if (v.x < lo.x || v.x > hi.x || hi.x == lo.x) continue;

      const double t = (v.x - lo.x) / (hi.x - lo.x);
      const double y = lo.y + t * (hi.y - lo.y);
      if (y <= v.y && y >= best_y) {
        best_y = y;
        best = edge;
      }
    }

    if (best == kNoVertex) {
      throw std::logic_error(
          "no status edge to the left of vertex " + std::to_string(view_[k]) +
          " (active edges: " + std::to_string(status_.size()) + ")");
    }
    return best;
  }

  std::vector<Diagonal> take_diagonals() { return std::move(diagonals_); }

private:
  const Polygon& pts_;
  const std::vector<Index>& view_;
  Index n_;
  std::vector<Index> status_;
  std::vector<Index> helper_;
  std::vector<VertexType> types_;
  std::vector<Diagonal> diagonals_;
};

}  // namespace detail

/**
 * Compute the diagonals that split `pts` into sweep-monotone pieces.
 *
 * `clockwise` must be the winding of `pts` (see polygon_is_clockwise). When
 * `types` is non-null it receives the classification of every vertex, indexed
 * by original index.
 */
inline std::vector<Diagonal> partition_polygon(const Polygon& pts,
                                               bool clockwise,
                                               std::vector<VertexType>* types = nullptr) {
  const std::size_t n = pts.size();
  detail::require_polygon_size(n);

  std::vector<Index> view(n);
  for (std::size_t i = 0; i < n; ++i) {
    view[i] = static_cast<Index>(clockwise ? n - 1 - i : i);
  }

  detail::SweepState sweep(pts, view);

  for (Index k : sort_loop_positions(pts, view)) {
    const Index p = sweep.prev(k);
    const Index nx = sweep.next(k);
    const Point& prev_pt = sweep.at(p);
    const Point& pt = sweep.at(k);
    const Point& next_pt = sweep.at(nx);

    const bool before_prev = sweep_precedes(pt, prev_pt);
    const bool before_next = sweep_precedes(pt, next_pt);

    if (before_prev && before_next) {
      if (detail::interior_angle(prev_pt, pt, next_pt) < kTau / 2) {
        sweep.classify(k, VertexType::Start);
      } else {
        sweep.classify(k, VertexType::Split);
        const Index left = sweep.left_edge(k);
        sweep.emit(k, sweep.helper(left));
        sweep.set_helper(left, k);
      }
      sweep.add_edge(k);
    } else if (!before_prev && !before_next) {
      sweep.connect_merge_helper(k, p);
      sweep.remove_edge(p);

      if (detail::interior_angle(prev_pt, pt, next_pt) < kTau / 2) {
        sweep.classify(k, VertexType::End);
      } else {
        sweep.classify(k, VertexType::Merge);
        const Index left = sweep.left_edge(k);
        sweep.connect_merge_helper(k, left);
        sweep.set_helper(left, k);
      }
    } else {
      sweep.classify(k, VertexType::Regular);

      // On a counter-clockwise loop the interior lies to the right of a
      // vertex whose outgoing edge heads further along the sweep.
      if (before_next) {
        sweep.connect_merge_helper(k, p);
        sweep.remove_edge(p);
        sweep.add_edge(k);
      } else {
        const Index left = sweep.left_edge(k);
        sweep.connect_merge_helper(k, left);
        sweep.set_helper(left, k);
      }
    }
  }

  if (types != nullptr) {
    types->assign(n, VertexType::Regular);
    const auto& swept = sweep.types();
    for (std::size_t k = 0; k < n; ++k) (*types)[view[k]] = swept[k];
  }

  return sweep.take_diagonals();
}

inline std::vector<Diagonal> partition_polygon(const Polygon& pts) {
  return partition_polygon(pts, polygon_is_clockwise(pts));
}

}  // namespace monotri
