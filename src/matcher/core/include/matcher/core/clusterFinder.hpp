#pragma once

#include "matcher/core/matcherConfig.hpp"
#include "model/primitive.hpp"

#include <array>
#include <set>
#include <string>
#include <vector>

namespace valvescan::matcher::core {

//! Primitive with its bounding box resolved. Only primitives with a valid box become candidates.
struct Candidate {
	Primitive primitive;
	Extents extents;
};

//! Connected group of nearby primitives hypothesised to be one device symbol.
struct Cluster {
	std::vector<Candidate> members;                             //!< Sorted by primitive id.
	cv::Point2d centroid{};                                     //!< Mean of the member box centers.
	std::array<std::size_t, PRIMITIVE_KIND_COUNT> composition{}; //!< Member count per kind (index = kindIndex()).

	std::vector<EntityId> ids() const;
};

//! Candidate set around one tag.
struct CandidateSet {
	std::vector<Candidate> candidates;
	std::size_t skipped{0u}; //!< Primitives dropped for a missing or degenerate bounding box.
};

/*! Collect the primitives around a tag that may belong to its device symbol.
 * \param [in] primitives    All primitives of the drawing.
 * \param [in] tagPosition   Position of the tag the search is centered on.
 * \param [in] allowedLayers Trimmed, upper case layer names that may contain device geometry.
 * \param [in] config        Proximity radius is read from here.
 * \return     Non-text primitives on an allowed layer whose box center is within the proximity radius of the tag.
 */
CandidateSet collectCandidates(const std::vector<Primitive>& primitives, const cv::Point2d& tagPosition, const std::set<std::string>& allowedLayers,
                               const ClusterConfig& config);

/*! Partition candidates into connected components.
 *  Two candidates are connected if the gap between their boxes is at most `linkTolerance`.
 *  The partition does not depend on the input order. Members are sorted by id and clusters by their smallest id.
 * \param [in] candidates    Candidates with valid boxes.
 * \param [in] linkTolerance Max box gap for an edge.
 */
std::vector<Cluster> buildClusters(const std::vector<Candidate>& candidates, double linkTolerance);

//! Build a cluster from members. Sorts members and computes centroid and composition.
Cluster makeCluster(std::vector<Candidate> members);

} // namespace valvescan::matcher::core
