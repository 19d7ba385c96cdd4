#pragma once

#include "matcher/core/clusterFinder.hpp"
#include "matcher/core/matcherConfig.hpp"

#include <array>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace valvescan::matcher::core {

//! Allowed number of primitives of one kind.
struct CountRange {
	static constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

	std::size_t min{0u};
	std::size_t max{0u};

	bool contains(std::size_t count) const { return count >= min && count <= max; }
};

//! Named template of a device symbol.
struct Pattern {
	std::string name;
	std::array<std::optional<CountRange>, PRIMITIVE_KIND_COUNT> counts{}; //!< Unset kinds must be absent if `strict`, else are ignored.
	bool strict{true};

	std::optional<double> maxLineLength;   //!< Every line must be shorter.
	std::optional<double> minCircleRadius; //!< Every circle must be at least this large.
	std::optional<double> maxCircleRadius; //!< Every circle must be at most this large.
	bool closedPolylines{false};           //!< Every polyline must be closed.
};

//! Ordered pattern library. Must be ordered most specific first.
using PatternLibrary = std::vector<Pattern>;

//! Cluster members that take part in matching, grouped by kind.
struct Composition {
	std::array<std::vector<Primitive>, PRIMITIVE_KIND_COUNT> byKind{};

	std::size_t count(PrimitiveKind kind) const { return byKind[kindIndex(kind)].size(); }
};

/*! Apply the geometric pre-filters to a cluster.
 *  - Lines of `maxLineLength` or longer are dropped (process line segments caught by the search).
 *  - Polylines on the zone layer are dropped (zone boundaries are not device symbols).
 *  - Text is dropped.
 */
Composition composeCluster(const Cluster& cluster, const CompositionConfig& config);

bool satisfies(const Composition& composition, const Pattern& pattern);

//! First pattern of the library the composition satisfies. First match wins, no ranking.
std::optional<std::string> matchPattern(const Composition& composition, const PatternLibrary& patterns);

} // namespace valvescan::matcher::core
