#include "matcher/core/markingPolicy.hpp"

#include "matcher/core/extents.hpp"

#include <algorithm>

namespace valvescan::matcher::core {

std::optional<Marker> findMarker(const cv::Point2d& position, const std::vector<Marker>& markers, const MarkerConfig& config) {
	const auto it = std::find_if(markers.begin(), markers.end(), [&](const Marker& marker) {
		return marker.kind == MarkerKind::Unresolved && distance(marker.center, position) < config.locationTolerance;
	});
	if (it == markers.end()) {
		return std::nullopt;
	}
	return *it;
}

MarkState markState(const cv::Point2d& position, const std::vector<Marker>& markers, const MarkerConfig& config) {
	return findMarker(position, markers, config).has_value() ? MarkState::Flagged : MarkState::Unmarked;
}

std::optional<MarkerMutation> markerMutation(const cv::Point2d& position, TagOutcome outcome, const std::vector<Marker>& markers, const MarkerConfig& config) {
	const std::optional<Marker> existing = findMarker(position, markers, config);

	if (outcome == TagOutcome::Resolved) {
		if (!existing.has_value()) {
			return std::nullopt;
		}
		return MarkerMutation{MarkerMutation::Type::Remove, *existing};
	}

	if (existing.has_value()) {
		return std::nullopt; // Already flagged.
	}

	Marker marker{};
	marker.kind   = MarkerKind::Unresolved;
	marker.center = position;
	marker.size   = config.markerSize;
	return MarkerMutation{MarkerMutation::Type::Add, marker};
}

void applyToWorkingSet(const MarkerMutation& mutation, std::vector<Marker>& markers) {
	switch (mutation.type) {
	case MarkerMutation::Type::Add: {
		EntityId nextId = 1u;
		for (const auto& marker: markers) {
			nextId = std::max(nextId, marker.id + 1u);
		}
		Marker added = mutation.marker;
		added.id     = nextId;
		markers.push_back(added);
		break;
	}
	case MarkerMutation::Type::Remove:
		markers.erase(std::remove_if(markers.begin(), markers.end(), [&](const Marker& marker) { return marker.id == mutation.marker.id; }),
		              markers.end());
		break;
	}
}

} // namespace valvescan::matcher::core
