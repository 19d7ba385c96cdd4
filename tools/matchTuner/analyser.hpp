#pragma once

#include "matcher/core/configLoader.hpp"
#include "matcher/matchPass.hpp"
#include "model/drawing.hpp"

#include <opencv2/core/mat.hpp>

namespace valvescan::matcher {

//! Runs the matching pass with the DebugVisualizer attached and returns the stage mosaic.
class Analyser {
public:
	Analyser(DrawingSnapshot snapshot, core::MatchLibraries libraries);

	cv::Mat analyse(const core::MatcherConfig& config);

	const PassStats& lastStats() const { return m_lastStats; }

private:
	DrawingSnapshot m_snapshot;
	core::MatchLibraries m_libraries;
	PassStats m_lastStats{};
};

} // namespace valvescan::matcher
