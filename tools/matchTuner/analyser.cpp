#include "analyser.hpp"

#include "matcher/core/debugVisualizer.hpp"

#include <opencv2/imgproc.hpp>

#include <string>

namespace valvescan::matcher {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

Analyser::Analyser(DrawingSnapshot snapshot, core::MatchLibraries libraries) : m_snapshot(std::move(snapshot)), m_libraries(std::move(libraries)) {
}

cv::Mat Analyser::analyse(const core::MatcherConfig& config) {
	if (m_snapshot.primitives.empty() && m_snapshot.texts.empty()) {
		return buildInfoTile("Input Error", "Drawing snapshot is empty.");
	}

	core::DebugVisualizer debugger;
	debugger.setInteractive(false);

	const MatchPassResult result = runMatchPass(m_snapshot, m_libraries, config, &debugger);
	m_lastStats                  = result.stats;
	if (!result.success) {
		return buildInfoTile("Match Error", "Matching pass failed.");
	}

	const cv::Mat mosaic = debugger.buildMosaic();
	if (mosaic.empty()) {
		return buildInfoTile("No Debug Output", "Matching pass produced no visuals.");
	}
	return mosaic;
}

} // namespace valvescan::matcher
