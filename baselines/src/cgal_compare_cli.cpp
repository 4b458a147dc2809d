// Cross-checks monotri against CGAL's constrained Delaunay triangulation of the
// same polygon. Both results go through verify_triangulation; the tool fails
// when monotri's result is invalid or the two triangle counts or areas differ.
#include "monotri/polygon_io.hpp"
#include "monotri/triangulate.hpp"
#include "monotri/verify.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Constrained_Delaunay_triangulation_2.h>
#include <CGAL/Constrained_triangulation_face_base_2.h>
#include <CGAL/Triangulation_face_base_with_info_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Clock = std::chrono::high_resolution_clock;

namespace {

struct FaceInfo {
    int nesting_level = -1;
    bool in_domain() const { return nesting_level % 2 == 1; }
};

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using Vb = CGAL::Triangulation_vertex_base_with_info_2<std::size_t, K>;
using Fb_base = CGAL::Constrained_triangulation_face_base_2<K>;
using Fb = CGAL::Triangulation_face_base_with_info_2<FaceInfo, K, Fb_base>;
using TDS = CGAL::Triangulation_data_structure_2<Vb, Fb>;
using Itag = CGAL::Exact_predicates_tag;
using CDT = CGAL::Constrained_Delaunay_triangulation_2<K, TDS, Itag>;
using Edge = CDT::Edge;
using Face_handle = CDT::Face_handle;

// Flood-fill nesting levels outward-in; odd levels are inside the polygon.
void mark_domains(CDT& cdt, Face_handle start, int index, std::list<Edge>& border) {
    if (start->info().nesting_level != -1) {
        return;
    }
    std::list<Face_handle> queue;
    queue.push_back(start);
    while (!queue.empty()) {
        Face_handle fh = queue.front();
        queue.pop_front();
        if (fh->info().nesting_level != -1) continue;
        fh->info().nesting_level = index;
        for (int i = 0; i < 3; i++) {
            Edge e(fh, i);
            Face_handle n = fh->neighbor(i);
            if (n->info().nesting_level != -1) continue;
            if (cdt.is_constrained(e)) {
                border.push_back(e);
            } else {
                queue.push_back(n);
            }
        }
    }
}

void mark_domains(CDT& cdt) {
    for (auto fit = cdt.all_faces_begin(); fit != cdt.all_faces_end(); ++fit) {
        fit->info().nesting_level = -1;
    }

    std::list<Edge> border;
    mark_domains(cdt, cdt.infinite_face(), 0, border);
    while (!border.empty()) {
        Edge e = border.front();
        border.pop_front();
        Face_handle n = e.first->neighbor(e.second);
        if (n->info().nesting_level == -1) {
            mark_domains(cdt, n, e.first->info().nesting_level + 1, border);
        }
    }
}

std::vector<monotri::Index> cdt_triangulate(const monotri::Polygon& polygon) {
    CDT cdt;
    std::vector<CDT::Vertex_handle> handles;
    handles.reserve(polygon.size());
    for (std::size_t i = 0; i < polygon.size(); ++i) {
        auto vh = cdt.insert(K::Point_2(polygon[i].x, polygon[i].y));
        vh->info() = i;
        handles.push_back(vh);
    }
    for (std::size_t i = 0; i < handles.size(); ++i) {
        cdt.insert_constraint(handles[i], handles[(i + 1) % handles.size()]);
    }
    mark_domains(cdt);

    std::vector<monotri::Index> indices;
    for (auto fit = cdt.finite_faces_begin(); fit != cdt.finite_faces_end(); ++fit) {
        if (!fit->info().in_domain()) continue;
        for (int i = 0; i < 3; ++i) {
            const std::size_t idx = fit->vertex(i)->info();
            if (idx >= polygon.size()) {
                throw std::runtime_error("CDT introduced a Steiner vertex; input is not simple");
            }
            indices.push_back(static_cast<monotri::Index>(idx));
        }
    }
    return indices;
}

struct Args {
    std::string input;
    std::string output;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if ((token == "-i" || token == "--input") && i + 1 < argc) {
            args.input = argv[++i];
        } else if ((token == "-o" || token == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else {
            std::ostringstream oss;
            oss << "Unknown or incomplete argument: " << token;
            throw std::runtime_error(oss.str());
        }
    }
    if (args.input.empty()) {
        throw std::runtime_error("Missing --input argument");
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const auto polygon = monotri::read_polygon(args.input);

        auto start = Clock::now();
        const auto reference = cdt_triangulate(polygon);
        auto stop = Clock::now();
        const double cdt_ms = std::chrono::duration<double, std::milli>(stop - start).count();

        start = Clock::now();
        const auto ours = monotri::triangulate_polygon(polygon);
        stop = Clock::now();
        const double monotri_ms = std::chrono::duration<double, std::milli>(stop - start).count();

        const auto ref_report = monotri::verify_triangulation(polygon, reference);
        const auto our_report = monotri::verify_triangulation(polygon, ours);

        if (!args.output.empty()) {
            monotri::write_triangulation(polygon, reference, args.output);
        }

        const bool match = our_report.ok() &&
                           ref_report.triangles == our_report.triangles &&
                           std::abs(ref_report.triangle_area - our_report.triangle_area) <=
                               1e-9 * std::max(1.0, ref_report.polygon_area);

        std::cout << "cgal_cdt,vertices=" << polygon.size()
                  << ",triangles=" << ref_report.triangles
                  << ",monotri_triangles=" << our_report.triangles
                  << ",time_ms=" << cdt_ms
                  << ",monotri_time_ms=" << monotri_ms
                  << ",match=" << (match ? 1 : 0) << "\n";
        return match ? EXIT_SUCCESS : 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
