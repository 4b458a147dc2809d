#pragma once

#include <string>
#include <vector>

#include "monotri/geometry.hpp"

namespace monotri {

// `.poly`: vertex count, then one "x y" line per vertex.
Polygon read_polygon(const std::string& path);
void write_polygon(const Polygon& poly, const std::string& path);

// `.tri`: the polygon's vertices followed by one "a b c" line per triangle.
void write_triangulation(const Polygon& poly,
                         const std::vector<Index>& indices,
                         const std::string& path);

} // namespace monotri
