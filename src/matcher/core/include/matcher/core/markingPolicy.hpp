#pragma once

#include "matcher/core/matcherConfig.hpp"
#include "model/drawing.hpp"

#include <optional>
#include <vector>

namespace valvescan::matcher::core {

//! Outcome of the matching for one tag, as seen by the marking policy.
enum class TagOutcome {
	Resolved,  //!< Tag owns a cluster that matched a pattern.
	NoCluster, //!< Tag owns no cluster.
	Unmatched, //!< Tag owns a cluster but no pattern matched.
};

//! Marker state at a tag position.
enum class MarkState { Unmarked, Flagged };

//! Unresolved marker whose center lies within the location tolerance of the position, if any. Foreign markers are ignored.
std::optional<Marker> findMarker(const cv::Point2d& position, const std::vector<Marker>& markers, const MarkerConfig& config);

MarkState markState(const cv::Point2d& position, const std::vector<Marker>& markers, const MarkerConfig& config);

/*! Decide the marker mutation for one tag.
 *   - Unmarked + NoCluster/Unmatched -> Add a square marker centered on the tag.
 *   - Flagged  + Resolved            -> Remove the existing marker.
 *   - Otherwise                      -> No-op.
 * \param [in] position Tag position.
 * \param [in] outcome  Matching outcome of the tag.
 * \param [in] markers  Current markers (drawing markers plus those already added in this pass).
 * \param [in] config   Marker geometry and tolerance.
 */
std::optional<MarkerMutation> markerMutation(const cv::Point2d& position, TagOutcome outcome, const std::vector<Marker>& markers, const MarkerConfig& config);

/*! Apply a mutation to a working marker list so later decisions of the same pass see it.
 *  Added markers have no host id yet. They are given provisional ids above every existing id.
 */
void applyToWorkingSet(const MarkerMutation& mutation, std::vector<Marker>& markers);

} // namespace valvescan::matcher::core
