#pragma once
/**
 * Core value types shared by the triangulation engine.
 *
 * All engine bookkeeping is index arithmetic into a caller-owned Polygon;
 * points are never copied into intermediate structures.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace monotri {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

using Polygon = std::vector<Point>;

using Index = std::uint32_t;

// Largest polygon the engine can address with Index.
inline constexpr std::size_t kMaxVertices = std::numeric_limits<Index>::max();

inline constexpr double kTau = 6.283185307179586476925286766559;

// Unordered pair of vertex indices forming a new internal edge.
struct Diagonal {
  Index a = 0;
  Index b = 0;
};

// Ordered sub-cycle of polygon indices.
using IndexLoop = std::vector<Index>;

}  // namespace monotri
