#include "matcher/core/patternMatcher.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace valvescan::matcher::core {
namespace gtest {

static Candidate makeLine(EntityId id, cv::Point2d a, cv::Point2d b, std::string layer = "VALVES") {
	Primitive line{};
	line.id       = id;
	line.kind     = PrimitiveKind::Line;
	line.layer    = std::move(layer);
	line.vertices = {a, b};
	return {line, Extents{{std::min(a.x, b.x), std::min(a.y, b.y)}, {std::max(a.x, b.x), std::max(a.y, b.y)}}};
}

static Candidate makeCircle(EntityId id, cv::Point2d center, double radius) {
	Primitive circle{};
	circle.id     = id;
	circle.kind   = PrimitiveKind::Circle;
	circle.layer  = "VALVES";
	circle.center = center;
	circle.radius = radius;
	return {circle, Extents{center - cv::Point2d{radius, radius}, center + cv::Point2d{radius, radius}}};
}

static Candidate makePolyline(EntityId id, std::string layer, bool closed) {
	Primitive polyline{};
	polyline.id       = id;
	polyline.kind     = PrimitiveKind::Polyline;
	polyline.layer    = std::move(layer);
	polyline.closed   = closed;
	polyline.vertices = {{0.0, 0.0}, {4.0, 0.0}, {4.0, 4.0}};
	return {polyline, Extents{{0.0, 0.0}, {4.0, 4.0}}};
}

static Pattern makePattern(std::string name, std::size_t lines, std::size_t circles) {
	Pattern pattern{};
	pattern.name                                     = std::move(name);
	pattern.counts[kindIndex(PrimitiveKind::Line)]   = CountRange{lines, lines};
	pattern.counts[kindIndex(PrimitiveKind::Circle)] = CountRange{circles, circles};
	return pattern;
}

//! Two short lines and one circle.
static Cluster gateCluster() {
	return makeCluster({makeLine(1u, {0.0, 0.0}, {5.0, 5.0}), makeLine(2u, {0.0, 5.0}, {5.0, 0.0}), makeCircle(3u, {2.5, 2.5}, 1.0)});
}

TEST(PatternMatcherUnit, GateDeclaredBeforeGlobe_MatchesGate) {
	const PatternLibrary library = {makePattern("GATE", 2u, 1u), makePattern("GLOBE", 2u, 2u)};

	const Composition composition = composeCluster(gateCluster(), CompositionConfig{});
	EXPECT_EQ(matchPattern(composition, library), std::optional<std::string>("GATE"));
}

TEST(PatternMatcherUnit, BothSatisfied_FirstDeclaredWins) {
	Pattern anyLines = makePattern("ANY", 0u, 1u);
	anyLines.counts[kindIndex(PrimitiveKind::Line)] = CountRange{0u, CountRange::UNBOUNDED};

	const Composition composition = composeCluster(gateCluster(), CompositionConfig{});
	EXPECT_EQ(matchPattern(composition, {anyLines, makePattern("GATE", 2u, 1u)}), std::optional<std::string>("ANY"));
	EXPECT_EQ(matchPattern(composition, {makePattern("GATE", 2u, 1u), anyLines}), std::optional<std::string>("GATE"));
}

TEST(PatternMatcherUnit, NoPatternSatisfied_NoMatch) {
	const Composition composition = composeCluster(gateCluster(), CompositionConfig{});
	EXPECT_FALSE(matchPattern(composition, {makePattern("GLOBE", 2u, 2u)}).has_value());
	EXPECT_FALSE(matchPattern(composition, {}).has_value());
}

TEST(PatternMatcherUnit, LongLines_DroppedBeforeMatching) {
	Cluster cluster = gateCluster();
	cluster         = makeCluster({cluster.members[0], cluster.members[1], cluster.members[2], makeLine(4u, {-40.0, 2.5}, {40.0, 2.5})});

	const Composition composition = composeCluster(cluster, CompositionConfig{});
	EXPECT_EQ(composition.count(PrimitiveKind::Line), 2u);
	EXPECT_EQ(matchPattern(composition, {makePattern("GATE", 2u, 1u)}), std::optional<std::string>("GATE"));
}

TEST(PatternMatcherUnit, LineAtThreshold_Dropped) {
	CompositionConfig config{};
	config.maxLineLength = 10.0;

	const Composition composition = composeCluster(makeCluster({makeLine(1u, {0.0, 0.0}, {10.0, 0.0})}), config);
	EXPECT_EQ(composition.count(PrimitiveKind::Line), 0u);
}

TEST(PatternMatcherUnit, ZoneLayerPolylines_Dropped) {
	const Cluster cluster = makeCluster({makePolyline(1u, "area_zone", true), makePolyline(2u, "VALVES", true)});

	const Composition composition = composeCluster(cluster, CompositionConfig{});
	EXPECT_EQ(composition.count(PrimitiveKind::Polyline), 1u);
	EXPECT_EQ(composition.byKind[kindIndex(PrimitiveKind::Polyline)].front().id, 2u);
}

TEST(PatternMatcherUnit, EverythingFiltered_NeverMatches) {
	Pattern empty{};
	empty.name   = "EMPTY";
	empty.strict = false;

	const Composition composition = composeCluster(makeCluster({makePolyline(1u, "AREA_ZONE", true)}), CompositionConfig{});
	EXPECT_FALSE(matchPattern(composition, {empty}).has_value());
}

TEST(PatternMatcherUnit, StrictPattern_RejectsUnlistedKinds) {
	Cluster cluster = gateCluster();
	cluster         = makeCluster({cluster.members[0], cluster.members[1], cluster.members[2], makePolyline(4u, "VALVES", true)});

	const Composition composition = composeCluster(cluster, CompositionConfig{});

	Pattern gate = makePattern("GATE", 2u, 1u);
	EXPECT_FALSE(satisfies(composition, gate));

	gate.strict = false;
	EXPECT_TRUE(satisfies(composition, gate));
}

TEST(PatternMatcherUnit, Predicates_CircleRadiusAndClosedPolylines) {
	const Composition composition = composeCluster(gateCluster(), CompositionConfig{});

	Pattern gate         = makePattern("GATE", 2u, 1u);
	gate.minCircleRadius = 2.0;
	EXPECT_FALSE(satisfies(composition, gate));

	gate.minCircleRadius = 0.5;
	gate.maxCircleRadius = 1.5;
	gate.maxLineLength   = 8.0;
	EXPECT_TRUE(satisfies(composition, gate));

	gate.maxLineLength = 5.0; // Diagonals are ~7.07 long.
	EXPECT_FALSE(satisfies(composition, gate));

	Pattern box{};
	box.name                                       = "BOX";
	box.counts[kindIndex(PrimitiveKind::Polyline)] = CountRange{1u, 1u};
	box.closedPolylines                            = true;

	const Composition open = composeCluster(makeCluster({makePolyline(1u, "VALVES", false)}), CompositionConfig{});
	EXPECT_FALSE(satisfies(open, box));
}

} // namespace gtest
} // namespace valvescan::matcher::core
