#include "matcher/core/ownershipResolver.hpp"

#include <gtest/gtest.h>

#include <set>
#include <vector>

namespace valvescan::matcher::core {
namespace gtest {

static Tag makeTag(EntityId id, cv::Point2d position, std::string text = "V1") {
	return {id, position, std::move(text)};
}

//! Cluster of unit boxes whose centers average to `centroid`.
static Cluster makeClusterAt(std::vector<EntityId> ids, cv::Point2d centroid) {
	std::vector<Candidate> members;
	for (const EntityId id: ids) {
		Primitive primitive{};
		primitive.id   = id;
		primitive.kind = PrimitiveKind::Line;
		members.push_back({primitive, Extents{centroid - cv::Point2d{0.5, 0.5}, centroid + cv::Point2d{0.5, 0.5}}});
	}
	return makeCluster(std::move(members));
}

TEST(OwnershipResolverUnit, TwoTags_ClusterGoesToNearestOnly) {
	const std::vector<Tag> tags = {makeTag(1u, {0.0, 0.0}), makeTag(2u, {100.0, 100.0})};
	const Cluster cluster       = makeClusterAt({10u}, {2.0, 2.0});

	EXPECT_TRUE(ownsCluster(cluster, tags[0].position, tags, 10.0));
	EXPECT_FALSE(ownsCluster(cluster, tags[1].position, tags, 10.0));
}

TEST(OwnershipResolverUnit, NoTags_NoOwnership) {
	const Cluster cluster = makeClusterAt({10u}, {2.0, 2.0});
	EXPECT_FALSE(ownsCluster(cluster, {0.0, 0.0}, {}, 10.0));
}

TEST(OwnershipResolverUnit, SingleTag_OwnsEveryCluster) {
	const std::vector<Tag> tags = {makeTag(1u, {0.0, 0.0})};
	EXPECT_TRUE(ownsCluster(makeClusterAt({1u}, {5.0, 0.0}), tags[0].position, tags, 10.0));
	EXPECT_TRUE(ownsCluster(makeClusterAt({2u}, {500.0, 0.0}), tags[0].position, tags, 10.0));
}

TEST(OwnershipResolverUnit, NearTie_BothTagsQualify) {
	const std::vector<Tag> tags = {makeTag(1u, {0.0, 0.0}), makeTag(2u, {20.0, 0.0})};
	const Cluster cluster       = makeClusterAt({10u}, {9.0, 0.0});

	EXPECT_TRUE(ownsCluster(cluster, tags[0].position, tags, 10.0));
	EXPECT_TRUE(ownsCluster(cluster, tags[1].position, tags, 10.0));
}

TEST(OwnershipResolverUnit, SelectOwnedCluster_PicksClosestOwned) {
	const std::vector<Tag> tags        = {makeTag(1u, {0.0, 0.0}), makeTag(2u, {40.0, 0.0})};
	const std::vector<Cluster> clusters = {
	        makeClusterAt({1u}, {8.0, 0.0}),  // Owned, farther.
	        makeClusterAt({2u}, {3.0, 0.0}),  // Owned, closest.
	        makeClusterAt({3u}, {38.0, 0.0}), // Belongs to the other tag.
	};

	const auto owned = selectOwnedCluster(clusters, tags[0].position, tags, OwnershipConfig{});
	ASSERT_TRUE(owned.has_value());
	EXPECT_EQ(owned->index, 1u);
	EXPECT_DOUBLE_EQ(owned->distance, 3.0);
}

TEST(OwnershipResolverUnit, SelectOwnedCluster_NoneOwned) {
	const std::vector<Tag> tags        = {makeTag(1u, {0.0, 0.0}), makeTag(2u, {40.0, 0.0})};
	const std::vector<Cluster> clusters = {makeClusterAt({3u}, {39.0, 0.0})};
	EXPECT_FALSE(selectOwnedCluster(clusters, tags[0].position, tags, OwnershipConfig{}).has_value());
}

TEST(ClaimLedgerUnit, SharedCluster_ClosestTagWins) {
	const Cluster shared = makeClusterAt({5u, 6u}, {9.0, 0.0});

	ClaimLedger ledger;
	ledger.propose(0u, shared, 9.0);
	ledger.propose(1u, shared, 11.0);

	const auto accepted = ledger.resolve(2u);
	ASSERT_EQ(accepted.size(), 2u);
	ASSERT_TRUE(accepted[0].has_value());
	EXPECT_FALSE(accepted[1].has_value());
	EXPECT_EQ(ledger.rejectedCount(), 1u);
}

TEST(ClaimLedgerUnit, OverlappingClusters_RejectedOnSharedPrimitive) {
	ClaimLedger ledger;
	ledger.propose(1u, makeClusterAt({5u, 6u, 7u}, {0.0, 0.0}), 4.0);
	ledger.propose(0u, makeClusterAt({7u, 8u}, {0.0, 0.0}), 2.0);
	ledger.propose(2u, makeClusterAt({9u}, {0.0, 0.0}), 1.0);

	const auto accepted = ledger.resolve(3u);
	EXPECT_TRUE(accepted[0].has_value());
	EXPECT_FALSE(accepted[1].has_value());
	EXPECT_TRUE(accepted[2].has_value());
}

TEST(ClaimLedgerUnit, EqualDistance_LowerTagIndexWins) {
	const Cluster shared = makeClusterAt({5u}, {0.0, 0.0});

	ClaimLedger ledger;
	ledger.propose(3u, shared, 5.0);
	ledger.propose(1u, shared, 5.0);

	const auto accepted = ledger.resolve(4u);
	EXPECT_TRUE(accepted[1].has_value());
	EXPECT_FALSE(accepted[3].has_value());
}

TEST(ClaimLedgerUnit, Reused_EachRoundStartsEmpty) {
	const Cluster shared = makeClusterAt({5u, 6u}, {0.0, 0.0});

	ClaimLedger ledger;
	ledger.propose(0u, shared, 3.0);
	ledger.propose(1u, shared, 4.0);
	ledger.resolve(2u);
	ASSERT_EQ(ledger.rejectedCount(), 1u);

	// Same primitives in a later round are free again.
	ledger.propose(1u, shared, 4.0);
	const auto accepted = ledger.resolve(2u);
	EXPECT_FALSE(accepted[0].has_value());
	ASSERT_TRUE(accepted[1].has_value());
	EXPECT_EQ(ledger.rejectedCount(), 0u);
}

TEST(ClaimLedgerUnit, AcceptedClaims_AreInjective) {
	ClaimLedger ledger;
	for (std::size_t tag = 0; tag < 6u; ++tag) {
		// Every pair of neighbouring proposals shares one primitive.
		ledger.propose(tag, makeClusterAt({tag, tag + 1u}, {0.0, 0.0}), static_cast<double>(tag % 3u));
	}

	std::set<EntityId> claimed;
	for (const auto& cluster: ledger.resolve(6u)) {
		if (!cluster.has_value()) {
			continue;
		}
		for (const EntityId id: cluster->ids()) {
			EXPECT_TRUE(claimed.insert(id).second) << "primitive " << id << " owned twice";
		}
	}
}

} // namespace gtest
} // namespace valvescan::matcher::core
