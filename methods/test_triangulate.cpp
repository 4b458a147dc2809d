#include <gtest/gtest.h>

#include <random>
#include <stdexcept>
#include <vector>

#include "monotri/orientation.hpp"
#include "monotri/polylines.hpp"
#include "monotri/triangulate.hpp"
#include "monotri/verify.hpp"
#include "test_polygons.hpp"

using namespace monotri;

namespace {

void expect_valid(const Polygon& pts, const std::vector<Index>& tris, const char* label) {
  const auto report = verify_triangulation(pts, tris);
  EXPECT_EQ(report.triangles, report.expected) << label;
  EXPECT_TRUE(report.indices_valid) << label;
  EXPECT_TRUE(report.winding_consistent) << label;
  EXPECT_TRUE(report.ok()) << label << " area_error=" << report.area_error();
}

}  // namespace

TEST(TriangulateTest, SingleTriangle) {
  EXPECT_EQ(triangulate_polygon({{0, 0}, {1, 0}, {0, 1}}), (std::vector<Index>{0, 1, 2}));
  EXPECT_EQ(triangulate_polygon({{0, 0}, {0, 1}, {1, 0}}), (std::vector<Index>{0, 1, 2}));
}

TEST(TriangulateTest, Square) {
  const auto sq = test_util::square_ccw();
  const auto tris = triangulate_polygon(sq);
  EXPECT_EQ(tris, (std::vector<Index>{3, 1, 2, 0, 1, 3}));
  expect_valid(sq, tris, "square");
}

TEST(TriangulateTest, ClockwiseSquare) {
  const auto sq = test_util::reversed(test_util::square_ccw());
  const auto tris = triangulate_polygon(sq);
  ASSERT_EQ(tris.size(), 6u);
  for (std::size_t i = 0; i < tris.size(); i += 3) {
    EXPECT_TRUE(triangle_is_clockwise(sq[tris[i]], sq[tris[i + 1]], sq[tris[i + 2]]));
  }
  expect_valid(sq, tris, "clockwise square");
}

TEST(TriangulateTest, LShape) {
  const auto l = test_util::l_shape();
  const auto tris = triangulate_polygon(l);
  EXPECT_EQ(tris, (std::vector<Index>{3, 4, 5, 3, 5, 0, 1, 3, 0, 2, 3, 1}));
  expect_valid(l, tris, "L");
}

TEST(TriangulateTest, RegularPolygon) {
  const auto poly = make_regular_polyline(1.0, 12);
  const auto tris = triangulate_polygon(poly);
  EXPECT_EQ(tris.size(), 30u);
  EXPECT_NEAR(verify_triangulation(poly, tris).triangle_area, 3.0, 1e-12);
}

TEST(TriangulateTest, StarBothWindings) {
  for (bool clockwise : {false, true}) {
    const auto star = make_star_polyline(1.0, 0.5, 5, clockwise);
    expect_valid(star, triangulate_polygon(star), clockwise ? "star cw" : "star ccw");
  }
}

TEST(TriangulateTest, Comb) {
  const auto comb = test_util::comb();
  expect_valid(comb, triangulate_polygon(comb), "comb");
  expect_valid(test_util::reversed(comb), triangulate_polygon(test_util::reversed(comb)), "comb cw");
}

TEST(TriangulateTest, RotationAndReversalGiveSameTriangles) {
  const Polygon shapes[] = {test_util::l_shape(), test_util::comb(),
                            make_star_polyline(1.0, 0.5, 5)};
  for (const auto& poly : shapes) {
    const auto reference = test_util::geometry_of(poly, triangulate_polygon(poly));
    for (std::size_t k = 1; k < poly.size(); ++k) {
      const auto rot = test_util::rotated(poly, k);
      EXPECT_EQ(test_util::geometry_of(rot, triangulate_polygon(rot)), reference) << "rotation " << k;
    }
    const auto rev = test_util::reversed(poly);
    EXPECT_EQ(test_util::geometry_of(rev, triangulate_polygon(rev)), reference);
  }
}

TEST(TriangulateTest, RandomStarShapedPolygons) {
  std::mt19937 rng(7u);
  std::uniform_int_distribution<std::size_t> size_dist(3, 200);

  for (int round = 0; round < 200; ++round) {
    auto poly = test_util::random_star_shaped(rng, size_dist(rng));
    if (poly.size() < 3) continue;
    if (round % 2 == 1) poly = test_util::reversed(poly);

    const auto tris = triangulate_polygon(poly);
    const auto report = verify_triangulation(poly, tris);
    EXPECT_TRUE(report.ok()) << "round " << round << " n=" << poly.size()
                             << " area_error=" << report.area_error();
  }
}

TEST(TriangulateTest, TriangulatorReuse) {
  Triangulator triangulator;

  triangulator.triangulate(test_util::l_shape());
  EXPECT_EQ(triangulator.diagonals().size(), 1u);
  EXPECT_EQ(triangulator.pieces().size(), 2u);
  EXPECT_FALSE(triangulator.clockwise());

  const auto& tris = triangulator.triangulate(test_util::reversed(test_util::square_ccw()));
  EXPECT_EQ(tris.size(), 6u);
  EXPECT_EQ(&tris, &triangulator.triangles());
  EXPECT_TRUE(triangulator.diagonals().empty());
  EXPECT_EQ(triangulator.pieces().size(), 1u);
  EXPECT_TRUE(triangulator.clockwise());
}

TEST(TriangulateTest, PiecesFollowInputWinding) {
  Triangulator triangulator;
  triangulator.triangulate(test_util::reversed(test_util::l_shape()));
  const std::vector<IndexLoop> expected{{0, 1, 2}, {2, 3, 4, 5, 0}};
  EXPECT_EQ(triangulator.pieces(), expected);
}

TEST(TriangulateTest, AppendingOverload) {
  std::vector<Index> out{9, 9, 9};
  triangulate_polygon(test_util::square_ccw(), out);
  EXPECT_EQ(out, (std::vector<Index>{9, 9, 9, 3, 1, 2, 0, 1, 3}));
}

TEST(TriangulateTest, RejectsTooFewVertices) {
  EXPECT_THROW(triangulate_polygon(Polygon{{0, 0}, {1, 1}}), std::invalid_argument);

  std::vector<Index> out{1, 2, 3};
  EXPECT_THROW(triangulate_polygon(Polygon{}, out), std::invalid_argument);
  EXPECT_EQ(out, (std::vector<Index>{1, 2, 3}));
}

TEST(TriangulateTest, SelfIntersectingInputFailsCleanly) {
  const Polygon no_left_edge{{4, 0}, {4, 1}, {0, 1}, {3, 2}, {1, 3}};
  const Polygon crossing{{0, 0}, {1, 4}, {0, 1}, {2, 3}};

  std::vector<Index> out{5, 6, 7};
  EXPECT_THROW(triangulate_polygon(no_left_edge, out), std::logic_error);
  EXPECT_THROW(triangulate_polygon(crossing, out), std::logic_error);
  EXPECT_EQ(out, (std::vector<Index>{5, 6, 7}));
}
