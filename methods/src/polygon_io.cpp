#include "monotri/polygon_io.hpp"

#include <cstddef>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace monotri {

Polygon read_polygon(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open polygon file: " + path);
    }

    long long n = 0;
    if (!(in >> n)) {
        throw std::runtime_error("Missing vertex count in polygon file: " + path);
    }
    if (n < 3) {
        throw std::runtime_error("Polygon must have at least 3 vertices, got " +
                                 std::to_string(n) + ": " + path);
    }

    Polygon poly;
    poly.reserve(static_cast<std::size_t>(n));

    for (long long i = 0; i < n; ++i) {
        double x, y;
        if (!(in >> x >> y)) {
            throw std::runtime_error("Malformed polygon file (vertex " +
                                     std::to_string(i) + "): " + path);
        }
        poly.push_back({x, y});
    }

    return poly;
}

void write_polygon(const Polygon& poly, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }

    out << std::setprecision(17);
    out << poly.size() << "\n";
    for (const auto& p : poly) {
        out << p.x << " " << p.y << "\n";
    }
}

void write_triangulation(const Polygon& poly,
                         const std::vector<Index>& indices,
                         const std::string& path) {
    if (indices.size() % 3 != 0) {
        throw std::runtime_error("Index buffer length " + std::to_string(indices.size()) +
                                 " is not a multiple of 3");
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }

    out << "# vertices\n";
    out << poly.size() << "\n";
    out << std::setprecision(10);
    for (const auto& p : poly) {
        out << p.x << " " << p.y << "\n";
    }

    out << "# triangles\n";
    out << indices.size() / 3 << "\n";
    for (std::size_t i = 0; i < indices.size(); i += 3) {
        out << indices[i] << " " << indices[i + 1] << " " << indices[i + 2] << "\n";
    }
}

} // namespace monotri
