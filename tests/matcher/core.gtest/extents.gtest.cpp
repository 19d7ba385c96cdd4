#include "matcher/core/extents.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace valvescan::matcher::core {
namespace gtest {

static Primitive makeArc(cv::Point2d center, double radius, double startAngle, double endAngle) {
	Primitive arc{};
	arc.kind       = PrimitiveKind::Arc;
	arc.center     = center;
	arc.radius     = radius;
	arc.startAngle = startAngle;
	arc.endAngle   = endAngle;
	return arc;
}

TEST(ExtentsUnit, Line_BoxOfEndpoints) {
	Primitive line{};
	line.kind     = PrimitiveKind::Line;
	line.vertices = {{4.0, 1.0}, {-2.0, 3.0}};

	const auto box = extentsOf(line);
	ASSERT_TRUE(box.has_value());
	EXPECT_DOUBLE_EQ(box->min.x, -2.0);
	EXPECT_DOUBLE_EQ(box->min.y, 1.0);
	EXPECT_DOUBLE_EQ(box->max.x, 4.0);
	EXPECT_DOUBLE_EQ(box->max.y, 3.0);
}

TEST(ExtentsUnit, Circle_SquareAroundCenter) {
	Primitive circle{};
	circle.kind   = PrimitiveKind::Circle;
	circle.center = {10.0, 10.0};
	circle.radius = 2.5;

	const auto box = extentsOf(circle);
	ASSERT_TRUE(box.has_value());
	EXPECT_DOUBLE_EQ(box->min.x, 7.5);
	EXPECT_DOUBLE_EQ(box->max.y, 12.5);
}

TEST(ExtentsUnit, QuarterArc_OnlySweptQuadrant) {
	const auto box = extentsOf(makeArc({0.0, 0.0}, 1.0, 0.0, 90.0));
	ASSERT_TRUE(box.has_value());
	EXPECT_NEAR(box->min.x, 0.0, 1e-9);
	EXPECT_NEAR(box->min.y, 0.0, 1e-9);
	EXPECT_NEAR(box->max.x, 1.0, 1e-9);
	EXPECT_NEAR(box->max.y, 1.0, 1e-9);
}

TEST(ExtentsUnit, ArcCrossingZeroDegrees_IncludesRightExtreme) {
	const auto box = extentsOf(makeArc({0.0, 0.0}, 2.0, 315.0, 45.0));
	ASSERT_TRUE(box.has_value());
	EXPECT_NEAR(box->max.x, 2.0, 1e-9);
	EXPECT_NEAR(box->min.x, std::sqrt(2.0), 1e-9);
}

TEST(ExtentsUnit, HostBox_OverridesGeometry) {
	Primitive line{};
	line.kind     = PrimitiveKind::Line;
	line.vertices = {{0.0, 0.0}, {1.0, 1.0}};
	line.extents  = Extents{{-5.0, -5.0}, {5.0, 5.0}};

	const auto box = extentsOf(line);
	ASSERT_TRUE(box.has_value());
	EXPECT_DOUBLE_EQ(box->min.x, -5.0);
}

TEST(ExtentsUnit, DegenerateGeometry_NoBox) {
	Primitive line{};
	line.kind     = PrimitiveKind::Line;
	line.vertices = {{0.0, 0.0}};
	EXPECT_FALSE(extentsOf(line).has_value());

	Primitive circle{};
	circle.kind   = PrimitiveKind::Circle;
	circle.radius = 0.0;
	EXPECT_FALSE(extentsOf(circle).has_value());

	Primitive inverted{};
	inverted.kind     = PrimitiveKind::Hatch;
	inverted.vertices = {{0.0, 0.0}, {1.0, 1.0}};
	inverted.extents  = Extents{{2.0, 2.0}, {1.0, 1.0}};
	EXPECT_FALSE(extentsOf(inverted).has_value());

	Primitive nonFinite{};
	nonFinite.kind     = PrimitiveKind::Polyline;
	nonFinite.vertices = {{0.0, 0.0}, {std::numeric_limits<double>::quiet_NaN(), 1.0}};
	EXPECT_FALSE(extentsOf(nonFinite).has_value());
}

TEST(ExtentsUnit, BoxGap_ZeroWhenOverlapping) {
	const Extents a{{0.0, 0.0}, {2.0, 2.0}};
	const Extents b{{1.0, 1.0}, {3.0, 3.0}};
	EXPECT_DOUBLE_EQ(boxGap(a, b), 0.0);
}

TEST(ExtentsUnit, BoxGap_DiagonalIsEuclidean) {
	const Extents a{{0.0, 0.0}, {1.0, 1.0}};
	const Extents b{{4.0, 5.0}, {6.0, 6.0}};
	EXPECT_DOUBLE_EQ(boxGap(a, b), 5.0);
	EXPECT_DOUBLE_EQ(boxGap(b, a), 5.0);
}

TEST(ExtentsUnit, Contains_BoundaryIsInside) {
	const Extents box{{0.0, 0.0}, {10.0, 10.0}};
	EXPECT_TRUE(contains(box, {10.0, 5.0}));
	EXPECT_TRUE(contains(box, {0.0, 0.0}));
	EXPECT_FALSE(contains(box, {10.01, 5.0}));
}

} // namespace gtest
} // namespace valvescan::matcher::core
