#include "matcher/core/clusterFinder.hpp"

#include "matcher/core/extents.hpp"
#include "matcher/core/tagFilter.hpp"

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <format>
#include <iostream>
#include <string_view>

namespace valvescan::matcher::core {

namespace {

//! Enable verbose clustering diagnostics via environment variable.
static bool clusterDebugEnabled() {
	const char* env = std::getenv("VALVESCAN_CLUSTER_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

} // namespace

std::vector<EntityId> Cluster::ids() const {
	std::vector<EntityId> out;
	out.reserve(members.size());
	for (const auto& member: members) {
		out.push_back(member.primitive.id);
	}
	return out;
}

CandidateSet collectCandidates(const std::vector<Primitive>& primitives, const cv::Point2d& tagPosition, const std::set<std::string>& allowedLayers,
                               const ClusterConfig& config) {
	CandidateSet result{};

	for (const auto& primitive: primitives) {
		if (primitive.kind == PrimitiveKind::Text) {
			continue; // Never pull other tags into a symbol.
		}
		if (allowedLayers.find(normaliseText(primitive.layer)) == allowedLayers.end()) {
			continue;
		}

		const std::optional<Extents> box = extentsOf(primitive);
		if (!box.has_value()) {
			++result.skipped;
			if (clusterDebugEnabled()) {
				std::cerr << std::format("[cluster-debug] skip id={} kind={} reason=invalid-extents\n", primitive.id, kindName(primitive.kind));
			}
			continue;
		}

		if (distance(center(*box), tagPosition) <= config.proximityRadius) {
			result.candidates.push_back({primitive, *box});
		}
	}

	return result;
}

Cluster makeCluster(std::vector<Candidate> members) {
	std::sort(members.begin(), members.end(), [](const Candidate& a, const Candidate& b) { return a.primitive.id < b.primitive.id; });

	Cluster cluster{};
	cv::Point2d sum{0.0, 0.0};
	for (const auto& member: members) {
		sum += center(member.extents);
		++cluster.composition[kindIndex(member.primitive.kind)];
	}
	if (!members.empty()) {
		cluster.centroid = sum / static_cast<double>(members.size());
	}
	cluster.members = std::move(members);
	return cluster;
}

std::vector<Cluster> buildClusters(const std::vector<Candidate>& candidates, double linkTolerance) {
	std::vector<Cluster> clusters;
	std::vector<bool> visited(candidates.size(), false);

	for (std::size_t start = 0; start < candidates.size(); ++start) {
		if (visited[start]) {
			continue;
		}

		// Breadth-first traversal over the implicit proximity graph.
		std::vector<Candidate> members;
		std::deque<std::size_t> queue{start};
		visited[start] = true;

		while (!queue.empty()) {
			const std::size_t current = queue.front();
			queue.pop_front();
			members.push_back(candidates[current]);

			for (std::size_t other = 0; other < candidates.size(); ++other) {
				if (visited[other]) {
					continue;
				}
				if (boxGap(candidates[current].extents, candidates[other].extents) <= linkTolerance) {
					visited[other] = true;
					queue.push_back(other);
				}
			}
		}

		clusters.push_back(makeCluster(std::move(members)));
	}

	std::sort(clusters.begin(), clusters.end(),
	          [](const Cluster& a, const Cluster& b) { return a.members.front().primitive.id < b.members.front().primitive.id; });

	if (clusterDebugEnabled()) {
		std::cerr << std::format("[cluster-debug] candidates={} clusters={} linkTolerance={:.2f}\n", candidates.size(), clusters.size(), linkTolerance);
	}
	return clusters;
}

} // namespace valvescan::matcher::core
