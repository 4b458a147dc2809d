#pragma once
/**
 * Partition an index cycle along a set of non-crossing diagonals.
 *
 * Each diagonal (s, e) cuts the current loop into the walk s -> e and the
 * walk e -> s (both inclusive of s and e). Remaining diagonals must lie wholly
 * inside one of the two halves. Pieces are produced in depth-first order:
 * everything cut from the s -> e half precedes the e -> s half.
 */

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "monotri/geometry.hpp"

namespace monotri {

namespace detail {

inline bool loop_contains(const IndexLoop& loop, Index v) {
  return std::find(loop.begin(), loop.end(), v) != loop.end();
}

// Indices visited walking forward along `loop` from `start` until `end`.
inline IndexLoop walk_loop(const IndexLoop& loop, Index start, Index end) {
  const std::size_t m = loop.size();
  const auto it = std::find(loop.begin(), loop.end(), start);
  if (it == loop.end()) {
    throw std::logic_error(
        "diagonal endpoint " + std::to_string(start) + " is not on the loop");
  }

  IndexLoop out{start};
  std::size_t i = (static_cast<std::size_t>(it - loop.begin()) + 1) % m;
  for (;; i = (i + 1) % m) {
    const Index v = loop[i];
    out.push_back(v);
    if (v == end) return out;
    if (v == start) {
      throw std::logic_error(
          "diagonal (" + std::to_string(start) + ", " + std::to_string(end) +
          ") does not close a loop");
    }
  }
}

}  // namespace detail

inline std::vector<IndexLoop> split_polygon(const IndexLoop& cycle,
                                            const std::vector<Diagonal>& diagonals,
                                            bool flip) {
  struct Piece {
    IndexLoop loop;
    std::vector<Diagonal> diagonals;
  };

  std::vector<IndexLoop> out;
  std::vector<Piece> work;
  work.push_back({cycle, diagonals});

  while (!work.empty()) {
    Piece piece = std::move(work.back());
    work.pop_back();

    if (piece.diagonals.empty()) {
      if (flip) std::reverse(piece.loop.begin(), piece.loop.end());
      out.push_back(std::move(piece.loop));
      continue;
    }

    const Diagonal cut = piece.diagonals.front();
    Piece a{detail::walk_loop(piece.loop, cut.a, cut.b), {}};
    Piece b{detail::walk_loop(piece.loop, cut.b, cut.a), {}};

    for (std::size_t i = 1; i < piece.diagonals.size(); ++i) {
      const Diagonal& d = piece.diagonals[i];
      if (detail::loop_contains(a.loop, d.a) && detail::loop_contains(a.loop, d.b)) {
        a.diagonals.push_back(d);
      } else if (detail::loop_contains(b.loop, d.a) && detail::loop_contains(b.loop, d.b)) {
        b.diagonals.push_back(d);
      } else {
        throw std::logic_error(
            "diagonal (" + std::to_string(d.a) + ", " + std::to_string(d.b) +
            ") crosses diagonal (" + std::to_string(cut.a) + ", " +
            std::to_string(cut.b) + ")");
      }
    }

    work.push_back(std::move(b));
    work.push_back(std::move(a));
  }

  return out;
}

// Split the full cycle 0..vertex_count-1.
inline std::vector<IndexLoop> split_polygon(std::size_t vertex_count,
                                            const std::vector<Diagonal>& diagonals,
                                            bool flip = false) {
  IndexLoop cycle(vertex_count);
  std::iota(cycle.begin(), cycle.end(), Index{0});
  return split_polygon(cycle, diagonals, flip);
}

}  // namespace monotri
