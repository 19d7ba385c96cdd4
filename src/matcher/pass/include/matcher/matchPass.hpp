#pragma once

#include "matcher/core/configLoader.hpp"
#include "matcher/core/debugVisualizer.hpp"
#include "matcher/core/markingPolicy.hpp"
#include "matcher/core/matcherConfig.hpp"
#include "model/drawing.hpp"
#include "model/matchRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace valvescan::matcher {

static constexpr const char* VALVE_TAG_KEY  = "VALVE_TAG";
static constexpr const char* VALVE_TYPE_KEY = "VALVE_TYPE";

//! Counters of one pass. Returned to the caller instead of living in shared state.
struct PassStats {
	std::size_t tagsAnalysed{0u};
	std::size_t recordsCreated{0u};
	std::size_t tagsFlagged{0u};
	std::size_t markersAdded{0u};
	std::size_t markersRemoved{0u};
	std::size_t primitivesSkipped{0u}; //!< Device layer primitives without a usable bounding box.
	std::size_t claimsRejected{0u};    //!< Clusters a tag lost to a closer tag.
};

//! Per-tag diagnostics.
struct TagReport {
	Tag tag;
	core::TagOutcome outcome{core::TagOutcome::NoCluster};
	std::size_t clusterSize{0u};
	std::optional<std::string> patternName;
};

//! Result of one matching pass. Nothing is applied to the drawing; `mutations` is the batch for the host.
struct MatchPassResult {
	bool success{false};
	std::vector<MatchRecord> records;
	std::vector<MarkerMutation> mutations;
	std::vector<TagReport> tags;
	PassStats stats{};
};

/*! Run one matching pass over an immutable drawing snapshot.
 *  Per tag: collect candidates, cluster, resolve ownership against all tags, classify the owned cluster, merge attributes and decide the
 *  marker mutation. Ownership is made injective over the whole pass before classification.
 * \param [in]     snapshot  Drawing snapshot. Not modified.
 * \param [in]     libraries Loaded pattern library, tag pattern, layers and attribute tables.
 * \param [in]     config    Tunables.
 * \param [in,out] debugger  Optional debug visualizer for stage renderings.
 */
MatchPassResult runMatchPass(const DrawingSnapshot& snapshot, const core::MatchLibraries& libraries, const core::MatcherConfig& config = core::MatcherConfig{},
                             core::DebugVisualizer* debugger = nullptr);

//! Load the libraries and run a pass. Configuration failure aborts before any mutation is produced (success = false).
MatchPassResult runMatchPass(const DrawingSnapshot& snapshot, const core::LibraryPaths& paths, const core::MatcherConfig& config = core::MatcherConfig{},
                             core::DebugVisualizer* debugger = nullptr);

} // namespace valvescan::matcher
