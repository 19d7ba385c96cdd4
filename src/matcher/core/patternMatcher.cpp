#include "matcher/core/patternMatcher.hpp"

#include "matcher/core/tagFilter.hpp"

#include <algorithm>

namespace valvescan::matcher::core {

namespace {

static bool countsSatisfied(const Composition& composition, const Pattern& pattern) {
	for (std::size_t kind = 0; kind < PRIMITIVE_KIND_COUNT; ++kind) {
		const std::size_t count = composition.byKind[kind].size();
		const auto& range       = pattern.counts[kind];
		if (range.has_value()) {
			if (!range->contains(count)) {
				return false;
			}
		} else if (pattern.strict && count != 0u) {
			return false;
		}
	}
	return true;
}

static bool predicatesSatisfied(const Composition& composition, const Pattern& pattern) {
	const auto& lines     = composition.byKind[kindIndex(PrimitiveKind::Line)];
	const auto& circles   = composition.byKind[kindIndex(PrimitiveKind::Circle)];
	const auto& polylines = composition.byKind[kindIndex(PrimitiveKind::Polyline)];

	if (pattern.maxLineLength.has_value()) {
		const double limit = *pattern.maxLineLength;
		if (!std::all_of(lines.begin(), lines.end(), [limit](const Primitive& line) { return lineLength(line) < limit; })) {
			return false;
		}
	}
	if (pattern.minCircleRadius.has_value()) {
		const double limit = *pattern.minCircleRadius;
		if (!std::all_of(circles.begin(), circles.end(), [limit](const Primitive& circle) { return circle.radius >= limit; })) {
			return false;
		}
	}
	if (pattern.maxCircleRadius.has_value()) {
		const double limit = *pattern.maxCircleRadius;
		if (!std::all_of(circles.begin(), circles.end(), [limit](const Primitive& circle) { return circle.radius <= limit; })) {
			return false;
		}
	}
	if (pattern.closedPolylines) {
		if (!std::all_of(polylines.begin(), polylines.end(), [](const Primitive& polyline) { return polyline.closed; })) {
			return false;
		}
	}
	return true;
}

} // namespace

Composition composeCluster(const Cluster& cluster, const CompositionConfig& config) {
	const std::string zoneLayer = normaliseText(config.zoneLayer);

	Composition composition{};
	for (const auto& member: cluster.members) {
		const Primitive& primitive = member.primitive;
		switch (primitive.kind) {
		case PrimitiveKind::Text:
			continue;
		case PrimitiveKind::Line:
			if (lineLength(primitive) >= config.maxLineLength) {
				continue;
			}
			break;
		case PrimitiveKind::Polyline:
			if (normaliseText(primitive.layer) == zoneLayer) {
				continue;
			}
			break;
		default:
			break;
		}
		composition.byKind[kindIndex(primitive.kind)].push_back(primitive);
	}
	return composition;
}

bool satisfies(const Composition& composition, const Pattern& pattern) {
	return countsSatisfied(composition, pattern) && predicatesSatisfied(composition, pattern);
}

std::optional<std::string> matchPattern(const Composition& composition, const PatternLibrary& patterns) {
	const bool empty = std::all_of(composition.byKind.begin(), composition.byKind.end(), [](const auto& members) { return members.empty(); });
	if (empty) {
		return std::nullopt; // Everything filtered out. Nothing left to recognise.
	}

	const auto it = std::find_if(patterns.begin(), patterns.end(), [&composition](const Pattern& pattern) { return satisfies(composition, pattern); });
	if (it == patterns.end()) {
		return std::nullopt;
	}
	return it->name;
}

} // namespace valvescan::matcher::core
