#include "matcher/core/attributes.hpp"

#include <gtest/gtest.h>

namespace valvescan::matcher::core {
namespace gtest {

TEST(AttributesUnit, Merge_ZoneWinsOnCollision) {
	const AttributeMap merged = mergeAttributes({{"A", "1"}, {"B", "2"}}, {{"B", "9"}});
	EXPECT_EQ(merged, (AttributeMap{{"A", "1"}, {"B", "9"}}));
}

TEST(AttributesUnit, Merge_EmptySides) {
	EXPECT_EQ(mergeAttributes({}, {{"B", "9"}}), (AttributeMap{{"B", "9"}}));
	EXPECT_EQ(mergeAttributes({{"A", "1"}}, {}), (AttributeMap{{"A", "1"}}));
	EXPECT_TRUE(mergeAttributes({}, {}).empty());
}

TEST(AttributesUnit, ZoneFacility_TrimmedMetadata) {
	Zone zone{};
	zone.metadata = {{FACILITY_KEY, "  PLANT-7 "}, {SUB_FACILITY_KEY, "UNIT-2"}};

	const FacilityKey key = zoneFacility(&zone);
	EXPECT_EQ(key.facility, "PLANT-7");
	EXPECT_EQ(key.subFacility, "UNIT-2");
}

TEST(AttributesUnit, ZoneFacility_MissingDegradesToUnknown) {
	const FacilityKey none = zoneFacility(nullptr);
	EXPECT_EQ(none.facility, UNKNOWN_FACILITY);
	EXPECT_EQ(none.subFacility, UNKNOWN_FACILITY);

	Zone zone{};
	zone.metadata = {{FACILITY_KEY, "PLANT-7"}, {SUB_FACILITY_KEY, "   "}};
	const FacilityKey partial = zoneFacility(&zone);
	EXPECT_EQ(partial.facility, "PLANT-7");
	EXPECT_EQ(partial.subFacility, UNKNOWN_FACILITY);
}

TEST(AttributesUnit, FindZone_FirstContainingZone) {
	const std::vector<Zone> zones = {
	        {1u, Extents{{0.0, 0.0}, {10.0, 10.0}}, {}},
	        {2u, Extents{{5.0, 5.0}, {20.0, 20.0}}, {}},
	};

	ASSERT_NE(findZone({7.0, 7.0}, zones), nullptr);
	EXPECT_EQ(findZone({7.0, 7.0}, zones)->id, 1u);
	EXPECT_EQ(findZone({15.0, 15.0}, zones)->id, 2u);
	EXPECT_EQ(findZone({50.0, 50.0}, zones), nullptr);
}

TEST(AttributesUnit, Lookup_MissingEntriesAreEmpty) {
	const AttributeCatalog catalog = {{"GATE", {{"SIZE", "2in"}}}};
	EXPECT_EQ(lookup(catalog, "GATE").at("SIZE"), "2in");
	EXPECT_TRUE(lookup(catalog, "GLOBE").empty());

	FacilityTable table;
	table[FacilityKey{"PLANT-7", "UNIT-2"}] = {{"AREA", "North"}};
	EXPECT_EQ(lookup(table, FacilityKey{"PLANT-7", "UNIT-2"}).at("AREA"), "North");
	EXPECT_TRUE(lookup(table, FacilityKey{}).empty());
}

} // namespace gtest
} // namespace valvescan::matcher::core
