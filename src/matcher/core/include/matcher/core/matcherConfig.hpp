#pragma once

#include <string>

namespace valvescan::matcher::core {

// The tolerances below are empirically tuned on customer drawings and need calibration per
// drawing standard. They are exposed here so the tuner and config files can override them.

//! Candidate collection and clustering parameters.
struct ClusterConfig {
	double proximityRadius{25.0}; //!< Max distance from tag to a primitive's center to be a candidate.
	double linkTolerance{2.0};    //!< Max box gap for two primitives to be connected.
};

//! Tag ownership parameters.
struct OwnershipConfig {
	double ambiguityTolerance{10.0}; //!< Origin tag owns a cluster if its distance is within this band of the nearest tag's.
};

//! Filters applied to a cluster before pattern matching.
struct CompositionConfig {
	double maxLineLength{30.0};        //!< Longer lines are process lines, not symbol strokes.
	std::string zoneLayer{"AREA_ZONE"}; //!< Polylines on this layer are zone boundaries.
};

//! Problem marker parameters.
struct MarkerConfig {
	double markerSize{7.0};        //!< Edge length of the square marker.
	double locationTolerance{1.0}; //!< Marker belongs to a tag if its center is closer than this.
};

//! Export step parameters.
struct ExportConfig {
	unsigned settleDelayMs{3000u}; //!< Wait between applying drawing mutations and exporting.
};

//! Full matcher configuration.
struct MatcherConfig {
	ClusterConfig cluster{};
	OwnershipConfig ownership{};
	CompositionConfig composition{};
	MarkerConfig marker{};
	ExportConfig exporting{};
};

} // namespace valvescan::matcher::core
