#include "matcher/core/ownershipResolver.hpp"

#include "matcher/core/extents.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>
#include <limits>

namespace valvescan::matcher::core {

bool ownsCluster(const Cluster& cluster, const cv::Point2d& origin, const std::vector<Tag>& allTags, double ambiguityTolerance) {
	if (allTags.empty()) {
		return false;
	}

	double minDist = std::numeric_limits<double>::max();
	for (const auto& tag: allTags) {
		minDist = std::min(minDist, distance(tag.position, cluster.centroid));
	}

	const double myDist = distance(origin, cluster.centroid);
	return std::abs(myDist - minDist) < ambiguityTolerance;
}

std::optional<OwnedCluster> selectOwnedCluster(const std::vector<Cluster>& clusters, const cv::Point2d& origin, const std::vector<Tag>& allTags,
                                               const OwnershipConfig& config) {
	std::optional<OwnedCluster> best;
	for (std::size_t i = 0; i < clusters.size(); ++i) {
		if (!ownsCluster(clusters[i], origin, allTags, config.ambiguityTolerance)) {
			continue;
		}

		const double myDist = distance(origin, clusters[i].centroid);
		if (!best.has_value() || myDist < best->distance) {
			best = OwnedCluster{i, myDist};
		}
	}
	return best;
}

void ClaimLedger::propose(std::size_t tagIndex, Cluster cluster, double distance) {
	m_proposals.push_back({tagIndex, std::move(cluster), distance});
}

std::vector<std::optional<Cluster>> ClaimLedger::resolve(std::size_t tagCount) {
	m_claimed.clear();
	m_rejected = 0u;

	std::stable_sort(m_proposals.begin(), m_proposals.end(), [](const Proposal& a, const Proposal& b) {
		if (a.distance != b.distance) {
			return a.distance < b.distance;
		}
		return a.tagIndex < b.tagIndex;
	});

	std::vector<std::optional<Cluster>> accepted(tagCount);
	for (auto& proposal: m_proposals) {
		if (proposal.tagIndex >= tagCount || accepted[proposal.tagIndex].has_value()) {
			continue;
		}

		const std::vector<EntityId> ids = proposal.cluster.ids();
		const bool conflict = std::any_of(ids.begin(), ids.end(), [this](EntityId id) { return m_claimed.count(id) != 0u; });
		if (conflict) {
			++m_rejected;
			std::cout << std::format("  Cluster near tag #{} already claimed by a closer tag.\n", proposal.tagIndex);
			continue;
		}

		m_claimed.insert(ids.begin(), ids.end());
		accepted[proposal.tagIndex] = std::move(proposal.cluster);
	}

	m_proposals.clear();
	return accepted;
}

} // namespace valvescan::matcher::core
