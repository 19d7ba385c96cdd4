#include "matcher/matchPass.hpp"

#include "matcher/core/attributes.hpp"
#include "matcher/core/clusterFinder.hpp"
#include "matcher/core/extents.hpp"
#include "matcher/core/ownershipResolver.hpp"
#include "matcher/core/patternMatcher.hpp"
#include "matcher/core/tagFilter.hpp"

#include <array>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string_view>

#include <opencv2/imgproc.hpp>

namespace valvescan::matcher {

namespace {

//! Enable verbose per-tag diagnostics via environment variable.
static bool matchDebugEnabled() {
	const char* env = std::getenv("VALVESCAN_MATCH_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static std::size_t countSkipped(const std::vector<Primitive>& primitives, const std::set<std::string>& allowedLayers) {
	std::size_t skipped = 0u;
	for (const auto& primitive: primitives) {
		if (primitive.kind != PrimitiveKind::Text && allowedLayers.count(core::normaliseText(primitive.layer)) != 0u && !core::extentsOf(primitive)) {
			++skipped;
		}
	}
	return skipped;
}

static std::string compositionSummary(const core::Composition& composition) {
	std::string out;
	for (std::size_t kind = 0; kind < PRIMITIVE_KIND_COUNT; ++kind) {
		if (composition.byKind[kind].empty()) {
			continue;
		}
		out += std::format("{}{}={}", out.empty() ? "" : " ", kindName(static_cast<PrimitiveKind>(kind)), composition.byKind[kind].size());
	}
	return out.empty() ? "empty" : out;
}

namespace debugging {

static const cv::Scalar GREY(170, 170, 170);
static const cv::Scalar ZONE(200, 140, 40);
static const cv::Scalar TAG(160, 30, 160);
static const cv::Scalar RED(0, 0, 220);
static const cv::Scalar GREEN(0, 160, 0);

static const std::array<cv::Scalar, 6> PALETTE = {
        cv::Scalar(230, 120, 0), cv::Scalar(0, 150, 230), cv::Scalar(40, 180, 40), cv::Scalar(180, 60, 200), cv::Scalar(0, 200, 200), cv::Scalar(120, 80, 30),
};

//! Drawing with zones and tags.
static cv::Mat drawTags(const core::DrawingCanvas& canvas, const DrawingSnapshot& snapshot, const std::vector<Tag>& tags) {
	cv::Mat image = canvas.blank();
	for (const auto& zone: snapshot.zones) {
		canvas.drawBox(image, zone.extents, ZONE, 2);
	}
	for (const auto& primitive: snapshot.primitives) {
		canvas.drawPrimitive(image, primitive, GREY);
	}
	for (const auto& tag: tags) {
		cv::circle(image, canvas.toPixel(tag.position), 3, TAG, cv::FILLED);
		canvas.drawLabel(image, tag.position, tag.text, TAG);
	}
	return image;
}

//! Every cluster found around any tag, one color per cluster.
static cv::Mat drawClusters(const core::DrawingCanvas& canvas, const DrawingSnapshot& snapshot, const std::vector<std::vector<core::Cluster>>& clustersPerTag,
                            const std::vector<Tag>& tags, double proximityRadius) {
	cv::Mat image = canvas.blank();
	for (const auto& primitive: snapshot.primitives) {
		canvas.drawPrimitive(image, primitive, GREY);
	}

	std::size_t color = 0u;
	for (std::size_t i = 0; i < clustersPerTag.size(); ++i) {
		canvas.drawCircle(image, tags[i].position, proximityRadius, TAG);
		for (const auto& cluster: clustersPerTag[i]) {
			const cv::Scalar& c = PALETTE[color++ % PALETTE.size()];
			for (const auto& member: cluster.members) {
				canvas.drawPrimitive(image, member.primitive, c);
			}
			cv::drawMarker(image, canvas.toPixel(cluster.centroid), c, cv::MARKER_CROSS, 8);
		}
	}
	return image;
}

//! Accepted ownership: tag to centroid link and cluster box.
static cv::Mat drawOwnership(const core::DrawingCanvas& canvas, const DrawingSnapshot& snapshot, const std::vector<Tag>& tags,
                             const std::vector<std::optional<core::Cluster>>& owned, const std::vector<TagReport>& reports) {
	cv::Mat image = canvas.blank();
	for (const auto& primitive: snapshot.primitives) {
		canvas.drawPrimitive(image, primitive, GREY);
	}
	for (std::size_t i = 0; i < tags.size(); ++i) {
		canvas.drawLabel(image, tags[i].position, tags[i].text, TAG);
		if (!owned[i].has_value()) {
			continue;
		}

		const cv::Scalar& c = reports[i].outcome == core::TagOutcome::Resolved ? GREEN : RED;
		for (const auto& member: owned[i]->members) {
			canvas.drawBox(image, member.extents, c);
		}
		cv::line(image, canvas.toPixel(tags[i].position), canvas.toPixel(owned[i]->centroid), c, 1, cv::LINE_AA);
		if (reports[i].patternName.has_value()) {
			canvas.drawLabel(image, owned[i]->centroid, *reports[i].patternName, c);
		}
	}
	return image;
}

static cv::Mat drawMarkers(const core::DrawingCanvas& canvas, const DrawingSnapshot& snapshot, const std::vector<Marker>& markers) {
	cv::Mat image = canvas.blank();
	for (const auto& primitive: snapshot.primitives) {
		canvas.drawPrimitive(image, primitive, GREY);
	}
	for (const auto& marker: markers) {
		canvas.drawMarker(image, marker, marker.kind == MarkerKind::Unresolved ? RED : GREY);
	}
	return image;
}

} // namespace debugging

} // namespace

MatchPassResult runMatchPass(const DrawingSnapshot& snapshot, const core::MatchLibraries& libraries, const core::MatcherConfig& config,
                             core::DebugVisualizer* debugger) {
	MatchPassResult result{};
	const bool verbose = matchDebugEnabled();

	const std::vector<Tag> tags = core::selectTags(snapshot.texts, snapshot.zones, libraries.tagPattern, config.marker.locationTolerance);
	std::cout << std::format("Found {} valve tag(s).\n", tags.size());

	result.stats.primitivesSkipped = countSkipped(snapshot.primitives, libraries.allowedLayers);
	if (result.stats.primitivesSkipped > 0u) {
		std::cout << std::format("Skipped {} primitive(s) without a usable bounding box.\n", result.stats.primitivesSkipped);
	}

	// 1) Every tag proposes the closest cluster it owns.
	core::ClaimLedger ledger;
	std::vector<std::vector<core::Cluster>> clustersPerTag(tags.size());
	for (std::size_t i = 0; i < tags.size(); ++i) {
		const core::CandidateSet candidates = core::collectCandidates(snapshot.primitives, tags[i].position, libraries.allowedLayers, config.cluster);
		clustersPerTag[i] = core::buildClusters(candidates.candidates, config.cluster.linkTolerance);

		const auto owned = core::selectOwnedCluster(clustersPerTag[i], tags[i].position, tags, config.ownership);
		if (verbose) {
			std::cout << std::format("[match-debug] tag={} candidates={} clusters={} owned={}\n", tags[i].text, candidates.candidates.size(),
			                         clustersPerTag[i].size(), owned.has_value() ? std::format("{:.2f}", owned->distance) : "none");
		}
		if (owned.has_value()) {
			ledger.propose(i, clustersPerTag[i][owned->index], owned->distance);
		}
	}

	// 2) No cluster may end up with two owners.
	const std::vector<std::optional<core::Cluster>> owned = ledger.resolve(tags.size());
	result.stats.claimsRejected = ledger.rejectedCount();

	// 3) Classify owned clusters, build records and update the markers.
	std::vector<Marker> markers = snapshot.markers;
	for (std::size_t i = 0; i < tags.size(); ++i) {
		const Tag& tag = tags[i];
		std::cout << "Analyzing tag: " << tag.text << '\n';
		++result.stats.tagsAnalysed;

		TagReport report{tag};
		if (!owned[i].has_value()) {
			std::cout << "  No owned cluster found for tag: " << tag.text << '\n';
			report.outcome = core::TagOutcome::NoCluster;
		} else {
			const core::Cluster& cluster = *owned[i];
			report.clusterSize           = cluster.members.size();
			std::cout << std::format("  Using cluster (entities: {})\n", cluster.members.size());

			const core::Composition composition = core::composeCluster(cluster, config.composition);
			report.patternName                  = core::matchPattern(composition, libraries.patterns);
			if (verbose) {
				std::cout << std::format("[match-debug] tag={} composition: {}\n", tag.text, compositionSummary(composition));
			}

			if (!report.patternName.has_value()) {
				std::cout << "  Unmatched valve at tag: " << tag.text << '\n';
				report.outcome = core::TagOutcome::Unmatched;
			} else {
				std::cout << "  Matched as: " << *report.patternName << '\n';
				report.outcome = core::TagOutcome::Resolved;

				const core::FacilityKey facility = core::zoneFacility(core::findZone(tag.position, snapshot.zones));

				MatchRecord record{};
				record.tagText     = tag.text;
				record.tagPosition = tag.position;
				record.patternName = *report.patternName;
				record.clusterIds  = cluster.ids();
				record.facility    = facility.facility;
				record.subFacility = facility.subFacility;
				record.attributes  = core::mergeAttributes(core::lookup(libraries.catalog, record.patternName), core::lookup(libraries.facilities, facility));
				record.attributes[VALVE_TAG_KEY]  = record.tagText;
				record.attributes[VALVE_TYPE_KEY] = record.patternName;

				result.records.push_back(std::move(record));
				++result.stats.recordsCreated;
			}
		}

		if (report.outcome != core::TagOutcome::Resolved) {
			++result.stats.tagsFlagged;
		}

		if (const auto mutation = core::markerMutation(tag.position, report.outcome, markers, config.marker)) {
			if (mutation->type == MarkerMutation::Type::Add) {
				++result.stats.markersAdded;
			} else {
				++result.stats.markersRemoved;
			}
			core::applyToWorkingSet(*mutation, markers);
			result.mutations.push_back(*mutation);
		}

		result.tags.push_back(std::move(report));
	}

	if (debugger) {
		const core::DrawingCanvas canvas(core::DrawingCanvas::worldOf(snapshot));
		debugger->beginStage("Valve Matching");
		debugger->add("Tags", debugging::drawTags(canvas, snapshot, tags));
		debugger->add("Clusters", debugging::drawClusters(canvas, snapshot, clustersPerTag, tags, config.cluster.proximityRadius));
		debugger->add("Ownership", debugging::drawOwnership(canvas, snapshot, tags, owned, result.tags));
		debugger->add("Markers", debugging::drawMarkers(canvas, snapshot, markers));
		debugger->endStage();
	}

	std::cout << std::format("Rebuilt {} valve block(s), flagged {} tag(s).\n", result.stats.recordsCreated, result.stats.tagsFlagged);
	result.success = true;
	return result;
}

MatchPassResult runMatchPass(const DrawingSnapshot& snapshot, const core::LibraryPaths& paths, const core::MatcherConfig& config,
                             core::DebugVisualizer* debugger) {
	const auto libraries = core::loadMatchLibraries(paths);
	if (!libraries.has_value()) {
		std::cerr << "Valve matching aborted: configuration could not be loaded.\n";
		return {};
	}
	return runMatchPass(snapshot, *libraries, config, debugger);
}

} // namespace valvescan::matcher
