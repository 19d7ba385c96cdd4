#include "matcher/snapshotIo.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace valvescan::matcher {
namespace gtest {

static std::filesystem::path tempFile(const char* name) {
	return std::filesystem::temp_directory_path() / name;
}

TEST(SnapshotIoUnit, ReadFixture_AllEntityKinds) {
	const auto snapshot = readSnapshot(std::filesystem::path(PATH_TEST_DATA) / "drawing.yml");
	ASSERT_TRUE(snapshot.has_value());

	ASSERT_EQ(snapshot->primitives.size(), 5u);
	const Primitive& line = snapshot->primitives[0];
	EXPECT_EQ(line.id, 11u);
	EXPECT_EQ(line.kind, PrimitiveKind::Line);
	EXPECT_EQ(line.layer, "VALVES");
	ASSERT_EQ(line.vertices.size(), 2u);
	EXPECT_DOUBLE_EQ(line.vertices[1].x, 55.0);
	EXPECT_EQ(line.colorIndex, 7);
	EXPECT_FALSE(line.extents.has_value());

	const Primitive& circle = snapshot->primitives[2];
	EXPECT_EQ(circle.kind, PrimitiveKind::Circle);
	EXPECT_DOUBLE_EQ(circle.radius, 2.0);
	EXPECT_DOUBLE_EQ(circle.center.y, 65.0);

	EXPECT_TRUE(snapshot->primitives[4].closed);

	ASSERT_EQ(snapshot->texts.size(), 3u);
	EXPECT_EQ(snapshot->texts[1].value, "xv7");

	ASSERT_EQ(snapshot->zones.size(), 1u);
	EXPECT_DOUBLE_EQ(snapshot->zones[0].extents.max.x, 200.0);
	EXPECT_EQ(snapshot->zones[0].metadata.at("FACILITY"), "PLANT-7");

	ASSERT_EQ(snapshot->markers.size(), 1u);
	EXPECT_EQ(snapshot->markers[0].kind, MarkerKind::Other);
}

TEST(SnapshotIoUnit, WriteThenRead_KeepsEntities) {
	DrawingSnapshot snapshot{};

	Primitive arc{};
	arc.id         = 5000000000u; // Beyond 32 bit.
	arc.kind       = PrimitiveKind::Arc;
	arc.layer      = "VALVES";
	arc.center     = {1.0, 2.0};
	arc.radius     = 3.0;
	arc.startAngle = 10.0;
	arc.endAngle   = 200.0;
	arc.extents    = Extents{{-2.0, -1.0}, {4.0, 5.0}};
	snapshot.primitives.push_back(arc);

	snapshot.texts.push_back({2u, {3.0, 4.0}, "HV1", "TEXT"});
	snapshot.zones.push_back({3u, Extents{{0.0, 0.0}, {10.0, 10.0}}, {{"FACILITY", "P1"}}});
	snapshot.markers.push_back({4u, MarkerKind::Unresolved, {3.0, 4.0}, 7.0});

	const auto path = tempFile("valvescan_snapshot_roundtrip.yml");
	ASSERT_TRUE(writeSnapshot(snapshot, path));

	const auto loaded = readSnapshot(path);
	std::filesystem::remove(path);
	ASSERT_TRUE(loaded.has_value());

	ASSERT_EQ(loaded->primitives.size(), 1u);
	EXPECT_EQ(loaded->primitives[0].id, 5000000000u);
	EXPECT_EQ(loaded->primitives[0].kind, PrimitiveKind::Arc);
	EXPECT_DOUBLE_EQ(loaded->primitives[0].endAngle, 200.0);
	ASSERT_TRUE(loaded->primitives[0].extents.has_value());
	EXPECT_DOUBLE_EQ(loaded->primitives[0].extents->max.y, 5.0);

	ASSERT_EQ(loaded->texts.size(), 1u);
	EXPECT_EQ(loaded->texts[0].value, "HV1");
	EXPECT_EQ(loaded->zones[0].metadata.at("FACILITY"), "P1");
	ASSERT_EQ(loaded->markers.size(), 1u);
	EXPECT_EQ(loaded->markers[0].kind, MarkerKind::Unresolved);
}

TEST(SnapshotIoUnit, UnknownPrimitiveKind_Fails) {
	const auto path = tempFile("valvescan_snapshot_bad.yml");
	{
		std::ofstream file(path);
		file << "%YAML:1.0\n---\nprimitives:\n   - { id: 1, kind: spline, layer: VALVES }\n";
	}

	EXPECT_FALSE(readSnapshot(path).has_value());
	std::filesystem::remove(path);
}

TEST(SnapshotIoUnit, MissingFile_Fails) {
	EXPECT_FALSE(readSnapshot(tempFile("valvescan_snapshot_missing.yml")).has_value());
}

TEST(SnapshotIoUnit, ApplyMutations_AddsWithFreshIds) {
	DrawingSnapshot snapshot{};
	snapshot.markers.push_back({7u, MarkerKind::Other, {0.0, 0.0}, 10.0});

	const std::vector<MarkerMutation> mutations = {
	        {MarkerMutation::Type::Add, {0u, MarkerKind::Unresolved, {1.0, 1.0}, 7.0}},
	        {MarkerMutation::Type::Add, {0u, MarkerKind::Unresolved, {2.0, 2.0}, 7.0}},
	};

	ASSERT_TRUE(applyMutations(snapshot, mutations));
	ASSERT_EQ(snapshot.markers.size(), 3u);
	EXPECT_EQ(snapshot.markers[1].id, 8u);
	EXPECT_EQ(snapshot.markers[2].id, 9u);
}

TEST(SnapshotIoUnit, ApplyMutations_InvalidRemoval_NothingApplied) {
	DrawingSnapshot snapshot{};
	snapshot.markers.push_back({1u, MarkerKind::Unresolved, {0.0, 0.0}, 7.0});
	snapshot.markers.push_back({2u, MarkerKind::Other, {5.0, 5.0}, 7.0});

	// Removes a valid marker first, then an unknown one.
	const std::vector<MarkerMutation> unknown = {
	        {MarkerMutation::Type::Remove, snapshot.markers[0]},
	        {MarkerMutation::Type::Add, {0u, MarkerKind::Unresolved, {9.0, 9.0}, 7.0}},
	        {MarkerMutation::Type::Remove, {99u, MarkerKind::Unresolved, {0.0, 0.0}, 7.0}},
	};
	EXPECT_FALSE(applyMutations(snapshot, unknown));
	ASSERT_EQ(snapshot.markers.size(), 2u);
	EXPECT_EQ(snapshot.markers[0].id, 1u);

	// Foreign markers are never removed.
	EXPECT_FALSE(applyMutations(snapshot, {{MarkerMutation::Type::Remove, snapshot.markers[1]}}));
	EXPECT_EQ(snapshot.markers.size(), 2u);
}

TEST(SnapshotIoUnit, ApplyMutations_RemoveMarkerAddedInSameBatch) {
	DrawingSnapshot snapshot{};

	const std::vector<MarkerMutation> mutations = {
	        {MarkerMutation::Type::Add, {0u, MarkerKind::Unresolved, {1.0, 1.0}, 7.0}},
	        {MarkerMutation::Type::Remove, {1u, MarkerKind::Unresolved, {1.0, 1.0}, 7.0}},
	};
	ASSERT_TRUE(applyMutations(snapshot, mutations));
	EXPECT_TRUE(snapshot.markers.empty());
}

} // namespace gtest
} // namespace valvescan::matcher
