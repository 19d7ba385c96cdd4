#include "matcher/core/debugVisualizer.hpp"

#include "matcher/core/extents.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace valvescan::matcher::core {

namespace {

static constexpr int TILE_SIZE     = 420;
static constexpr int LABEL_HEIGHT  = 26;
static constexpr int HEADER_WIDTH  = 180;
static constexpr int CANVAS_MARGIN = 20;

static const cv::Scalar BACKGROUND(24, 24, 24);
static const cv::Scalar FOREGROUND(235, 235, 235);

static void extend(Extents& world, const Extents& box) {
	world.min.x = std::min(world.min.x, box.min.x);
	world.min.y = std::min(world.min.y, box.min.y);
	world.max.x = std::max(world.max.x, box.max.x);
	world.max.y = std::max(world.max.y, box.max.y);
}

//! Scale an image into a square tile, keeping the aspect ratio.
static cv::Mat fitTile(const cv::Mat& image) {
	cv::Mat tile(TILE_SIZE, TILE_SIZE, CV_8UC3, BACKGROUND);
	if (image.empty()) {
		return tile;
	}

	cv::Mat bgr;
	if (image.channels() == 1) {
		cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
	} else if (image.channels() == 4) {
		cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
	} else {
		bgr = image;
	}

	const int avail    = TILE_SIZE - LABEL_HEIGHT;
	const double scale = std::min(static_cast<double>(TILE_SIZE) / bgr.cols, static_cast<double>(avail) / bgr.rows);
	const int w        = std::max(1, static_cast<int>(std::lround(bgr.cols * scale)));
	const int h        = std::max(1, static_cast<int>(std::lround(bgr.rows * scale)));

	cv::Mat resized;
	cv::resize(bgr, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
	resized.copyTo(tile(cv::Rect((TILE_SIZE - w) / 2, LABEL_HEIGHT + (avail - h) / 2, w, h)));
	return tile;
}

} // namespace

void DebugVisualizer::setInteractive(bool interactive, unsigned displayTimeMs) {
	m_interactive = interactive;
	m_displayTime = displayTimeMs;
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.push_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		assert(false); // Start a stage first.
		return;
	}

	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});

	if (m_interactive) {
		cv::imshow("Matcher Debug", img);
		cv::waitKey(static_cast<int>(m_displayTime));
		cv::destroyWindow("Matcher Debug");
	}
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	endStage();

	std::size_t maxSteps = 0u;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}
	if (maxSteps == 0u) {
		return {};
	}

	const int rows = static_cast<int>(m_stages.size());
	cv::Mat mosaic(rows * TILE_SIZE, HEADER_WIDTH + static_cast<int>(maxSteps) * TILE_SIZE, CV_8UC3, BACKGROUND);

	for (int r = 0; r < rows; ++r) {
		const auto& stage = m_stages[static_cast<std::size_t>(r)];
		const int y       = r * TILE_SIZE;

		cv::rectangle(mosaic, cv::Rect(0, y, HEADER_WIDTH, TILE_SIZE), cv::Scalar(0, 0, 0), cv::FILLED);
		cv::putText(mosaic, stage.name, cv::Point(8, y + TILE_SIZE / 2), cv::FONT_HERSHEY_SIMPLEX, 0.6, FOREGROUND, 1, cv::LINE_AA);

		for (std::size_t c = 0; c < stage.steps.size(); ++c) {
			const auto& step = stage.steps[c];
			const cv::Rect cell(HEADER_WIDTH + static_cast<int>(c) * TILE_SIZE, y, TILE_SIZE, TILE_SIZE);

			fitTile(step.image).copyTo(mosaic(cell));
			cv::putText(mosaic, step.name, cv::Point(cell.x + 6, y + 18), cv::FONT_HERSHEY_SIMPLEX, 0.5, FOREGROUND, 1, cv::LINE_AA);
			cv::rectangle(mosaic, cell, cv::Scalar(60, 60, 60), 1);
		}
	}
	return mosaic;
}

DrawingCanvas::DrawingCanvas(const Extents& world, int maxSidePx) : m_world(world) {
	const double width  = std::max(1e-6, world.max.x - world.min.x);
	const double height = std::max(1e-6, world.max.y - world.min.y);
	const int inner     = std::max(1, maxSidePx - 2 * CANVAS_MARGIN);

	m_scale = static_cast<double>(inner) / std::max(width, height);
	m_size  = cv::Size(static_cast<int>(std::lround(width * m_scale)) + 2 * CANVAS_MARGIN, static_cast<int>(std::lround(height * m_scale)) + 2 * CANVAS_MARGIN);
}

Extents DrawingCanvas::worldOf(const DrawingSnapshot& snapshot) {
	bool any = false;
	Extents world{{0.0, 0.0}, {1.0, 1.0}};
	const auto include = [&](const Extents& box) {
		if (!any) {
			world = box;
			any   = true;
		} else {
			extend(world, box);
		}
	};

	for (const auto& primitive: snapshot.primitives) {
		if (const auto box = extentsOf(primitive)) {
			include(*box);
		}
	}
	for (const auto& zone: snapshot.zones) {
		include(zone.extents);
	}
	for (const auto& text: snapshot.texts) {
		include({text.position, text.position});
	}
	return world;
}

cv::Mat DrawingCanvas::blank() const {
	return cv::Mat(m_size, CV_8UC3, cv::Scalar(255, 255, 255));
}

cv::Point DrawingCanvas::toPixel(const cv::Point2d& point) const {
	const double x = CANVAS_MARGIN + (point.x - m_world.min.x) * m_scale;
	const double y = m_size.height - CANVAS_MARGIN - (point.y - m_world.min.y) * m_scale;
	return {static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
}

void DrawingCanvas::drawPrimitive(cv::Mat& image, const Primitive& primitive, const cv::Scalar& color) const {
	switch (primitive.kind) {
	case PrimitiveKind::Circle:
		drawCircle(image, primitive.center, primitive.radius, color);
		return;
	case PrimitiveKind::Arc: {
		const int radius = std::max(1, static_cast<int>(std::lround(primitive.radius * m_scale)));
		// Image y is flipped, so counter-clockwise drawing angles become negative image angles.
		cv::ellipse(image, toPixel(primitive.center), cv::Size(radius, radius), 0.0, -primitive.startAngle, -primitive.endAngle, color, 1, cv::LINE_AA);
		return;
	}
	case PrimitiveKind::Line:
	case PrimitiveKind::Polyline:
	case PrimitiveKind::FilledShape:
	case PrimitiveKind::Hatch: {
		if (primitive.vertices.size() < 2u) {
			break;
		}
		std::vector<cv::Point> points;
		points.reserve(primitive.vertices.size());
		for (const auto& vertex: primitive.vertices) {
			points.push_back(toPixel(vertex));
		}
		if (primitive.kind == PrimitiveKind::FilledShape || primitive.kind == PrimitiveKind::Hatch) {
			cv::fillPoly(image, std::vector<std::vector<cv::Point>>{points}, color, cv::LINE_AA);
		} else {
			cv::polylines(image, points, primitive.closed, color, 1, cv::LINE_AA);
		}
		return;
	}
	case PrimitiveKind::Text:
		break;
	}

	// Fallback for host boxes without geometry.
	if (const auto box = extentsOf(primitive)) {
		drawBox(image, *box, color);
	}
}

void DrawingCanvas::drawBox(cv::Mat& image, const Extents& box, const cv::Scalar& color, int thickness) const {
	cv::rectangle(image, toPixel({box.min.x, box.max.y}), toPixel({box.max.x, box.min.y}), color, thickness, cv::LINE_AA);
}

void DrawingCanvas::drawCircle(cv::Mat& image, const cv::Point2d& center, double radius, const cv::Scalar& color, int thickness) const {
	const int pixels = std::max(1, static_cast<int>(std::lround(radius * m_scale)));
	cv::circle(image, toPixel(center), pixels, color, thickness, cv::LINE_AA);
}

void DrawingCanvas::drawLabel(cv::Mat& image, const cv::Point2d& anchor, const std::string& text, const cv::Scalar& color) const {
	cv::putText(image, text, toPixel(anchor) + cv::Point(4, -4), cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1, cv::LINE_AA);
}

void DrawingCanvas::drawMarker(cv::Mat& image, const Marker& marker, const cv::Scalar& color) const {
	const cv::Point2d half{marker.size / 2.0, marker.size / 2.0};
	drawBox(image, {marker.center - half, marker.center + half}, color, 2);
}

} // namespace valvescan::matcher::core
