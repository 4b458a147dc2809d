#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "monotri/orientation.hpp"
#include "monotri/polylines.hpp"

using namespace monotri;

namespace {

constexpr double kPi = 3.14159265358979323846;

double radius_of(const Point& p) { return std::sqrt(p.x * p.x + p.y * p.y); }

}  // namespace

TEST(PolylinesTest, RegularPolygonWinding) {
  const auto ccw = make_regular_polyline(1.0, 7);
  const auto cw = make_regular_polyline(1.0, 7, true);
  ASSERT_EQ(ccw.size(), 7u);
  ASSERT_EQ(cw.size(), 7u);
  EXPECT_FALSE(polygon_is_clockwise(ccw));
  EXPECT_TRUE(polygon_is_clockwise(cw));

  // Clockwise output starts at +y.
  EXPECT_NEAR(cw[0].x, 0.0, 1e-15);
  EXPECT_NEAR(cw[0].y, 1.0, 1e-15);
}

TEST(PolylinesTest, RegularPolygonArea) {
  const double r = 2.5;
  const std::size_t sides = 9;
  const double expected = 0.5 * sides * r * r * std::sin(2.0 * kPi / sides);
  EXPECT_NEAR(signed_area(make_regular_polyline(r, sides)), expected, 1e-12);
  EXPECT_NEAR(signed_area(make_regular_polyline(r, sides, true)), -expected, 1e-12);
}

TEST(PolylinesTest, CircleDefaultsToTwelveSides) {
  const auto circle = make_circle_polyline(1.0);
  ASSERT_EQ(circle.size(), 12u);
  EXPECT_NEAR(signed_area(circle), 3.0, 1e-12);
  EXPECT_EQ(make_circle_polyline(1.0, false, 32).size(), 32u);
}

TEST(PolylinesTest, StarAlternatesRadii) {
  for (bool clockwise : {false, true}) {
    const auto star = make_star_polyline(1.0, 0.4, 6, clockwise);
    ASSERT_EQ(star.size(), 12u);
    EXPECT_EQ(polygon_is_clockwise(star), clockwise);

    std::size_t outer = 0;
    std::size_t inner = 0;
    for (std::size_t i = 0; i < star.size(); ++i) {
      const double r = radius_of(star[i]);
      if (std::abs(r - 1.0) < 1e-12) ++outer;
      if (std::abs(r - 0.4) < 1e-12) ++inner;
      EXPECT_NE(radius_of(star[i]) > 0.7, radius_of(star[(i + 1) % star.size()]) > 0.7);
    }
    EXPECT_EQ(outer, 6u);
    EXPECT_EQ(inner, 6u);
  }
}

TEST(PolylinesTest, Rectangle) {
  const auto rect = make_rectangle_polyline(4.0, 2.0);
  ASSERT_EQ(rect.size(), 4u);
  EXPECT_DOUBLE_EQ(signed_area(rect), 8.0);
  EXPECT_DOUBLE_EQ(signed_area(make_rectangle_polyline(4.0, 2.0, true)), -8.0);
  EXPECT_DOUBLE_EQ(rect[0].x, 2.0);
  EXPECT_DOUBLE_EQ(rect[0].y, 1.0);
}

TEST(PolylinesTest, Square) {
  const auto sq = make_square_polyline(2.0);
  const Polygon expected{{1, 1}, {-1, 1}, {-1, -1}, {1, -1}};
  ASSERT_EQ(sq.size(), expected.size());
  for (std::size_t i = 0; i < sq.size(); ++i) {
    EXPECT_DOUBLE_EQ(sq[i].x, expected[i].x);
    EXPECT_DOUBLE_EQ(sq[i].y, expected[i].y);
  }
}

TEST(PolylinesTest, CubeBaseIsSquare) {
  for (bool clockwise : {false, true}) {
    const auto cube = make_cube_polyline(3.0, clockwise);
    const auto sq = make_square_polyline(3.0, clockwise);
    ASSERT_EQ(cube.size(), 4u);
    for (std::size_t i = 0; i < cube.size(); ++i) {
      EXPECT_DOUBLE_EQ(cube[i].x, sq[i].x);
      EXPECT_DOUBLE_EQ(cube[i].y, sq[i].y);
    }
    EXPECT_EQ(polygon_is_clockwise(cube), clockwise);
  }
}

TEST(PolylinesTest, SharedTurnConstant) {
  EXPECT_DOUBLE_EQ(kTau, 2.0 * kPi);
}

TEST(PolylinesTest, RejectsTooFewSides) {
  EXPECT_THROW(make_regular_polyline(1.0, 2), std::invalid_argument);
  EXPECT_THROW(make_star_polyline(1.0, 0.5, 2), std::invalid_argument);
}
