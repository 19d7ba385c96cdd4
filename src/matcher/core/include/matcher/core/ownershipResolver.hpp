#pragma once

#include "matcher/core/clusterFinder.hpp"
#include "matcher/core/matcherConfig.hpp"
#include "model/drawing.hpp"

#include <optional>
#include <set>
#include <vector>

namespace valvescan::matcher::core {

/*! Check if `origin` may claim the cluster.
 *  The nearest tag is searched over all tags, not only the tag whose search found the cluster, so a tag cannot steal the cluster of a neighbour.
 *  Distances within `ambiguityTolerance` of the nearest count as a tie.
 * \return False if `allTags` is empty.
 */
bool ownsCluster(const Cluster& cluster, const cv::Point2d& origin, const std::vector<Tag>& allTags, double ambiguityTolerance);

//! Cluster picked by a tag together with the distance used to rank competing claims.
struct OwnedCluster {
	std::size_t index{0u}; //!< Index into the cluster list passed to selectOwnedCluster().
	double distance{0.0};  //!< Origin tag to centroid.
};

//! Closest cluster the origin owns. Ties on distance keep the earlier cluster.
std::optional<OwnedCluster> selectOwnedCluster(const std::vector<Cluster>& clusters, const cv::Point2d& origin, const std::vector<Tag>& allTags,
                                               const OwnershipConfig& config);

/*! Pass-wide ownership bookkeeping.
 *  Each tag proposes at most one cluster. resolve() accepts proposals closest first and rejects any proposal sharing a primitive with an accepted one,
 *  so no cluster ever ends up with two owners.
 */
class ClaimLedger {
public:
	void propose(std::size_t tagIndex, Cluster cluster, double distance);

	/*! Resolve the proposals made since the last call. Returns the accepted cluster per tag index (std::nullopt for tags without an
	 *  accepted claim). Every call starts a new round: claims and the rejection count of earlier rounds are dropped.
	 */
	std::vector<std::optional<Cluster>> resolve(std::size_t tagCount);

	//! Rejected proposals of the last round.
	std::size_t rejectedCount() const { return m_rejected; }

private:
	struct Proposal {
		std::size_t tagIndex;
		Cluster cluster;
		double distance;
	};

	std::vector<Proposal> m_proposals{};
	std::set<EntityId> m_claimed{}; //!< Primitives of accepted claims.
	std::size_t m_rejected{0u};
};

} // namespace valvescan::matcher::core
