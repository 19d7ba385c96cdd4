#include "matcher/core/extents.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace valvescan::matcher::core {

namespace {

static bool isFinite(const cv::Point2d& p) {
	return std::isfinite(p.x) && std::isfinite(p.y);
}

static std::optional<Extents> boundingBox(const std::vector<cv::Point2d>& points) {
	if (points.empty()) {
		return std::nullopt;
	}

	Extents box{points.front(), points.front()};
	for (const auto& p: points) {
		if (!isFinite(p)) {
			return std::nullopt;
		}
		box.min.x = std::min(box.min.x, p.x);
		box.min.y = std::min(box.min.y, p.y);
		box.max.x = std::max(box.max.x, p.x);
		box.max.y = std::max(box.max.y, p.y);
	}
	return box;
}

//! Normalise an angle in degrees to [0, 360).
static double normaliseDegrees(double angle) {
	const double wrapped = std::fmod(angle, 360.0);
	return wrapped < 0.0 ? wrapped + 360.0 : wrapped;
}

//! True if `angle` lies on the counter-clockwise sweep from `start` to `end`.
static bool onSweep(double angle, double start, double end) {
	const double sweep  = normaliseDegrees(end - start);
	const double offset = normaliseDegrees(angle - start);
	return sweep == 0.0 || offset <= sweep;
}

static std::optional<Extents> arcExtents(const Primitive& arc) {
	if (!isFinite(arc.center) || !std::isfinite(arc.radius) || arc.radius <= 0.0 || !std::isfinite(arc.startAngle) || !std::isfinite(arc.endAngle)) {
		return std::nullopt;
	}

	const auto pointAt = [&arc](double degrees) {
		const double rad = degrees * std::numbers::pi / 180.0;
		return cv::Point2d{arc.center.x + arc.radius * std::cos(rad), arc.center.y + arc.radius * std::sin(rad)};
	};

	std::vector<cv::Point2d> points{pointAt(arc.startAngle), pointAt(arc.endAngle)};
	static constexpr std::array<double, 4> AXIS_ANGLES = {0.0, 90.0, 180.0, 270.0};
	for (const double axis: AXIS_ANGLES) {
		if (onSweep(axis, arc.startAngle, arc.endAngle)) {
			points.push_back(pointAt(axis));
		}
	}
	return boundingBox(points);
}

} // namespace

bool isValidExtents(const Extents& extents) {
	return isFinite(extents.min) && isFinite(extents.max) && extents.min.x <= extents.max.x && extents.min.y <= extents.max.y;
}

std::optional<Extents> extentsOf(const Primitive& primitive) {
	if (primitive.extents.has_value()) {
		if (!isValidExtents(*primitive.extents)) {
			return std::nullopt;
		}
		return primitive.extents;
	}

	switch (primitive.kind) {
	case PrimitiveKind::Line:
		if (primitive.vertices.size() < 2u) {
			return std::nullopt;
		}
		return boundingBox(primitive.vertices);
	case PrimitiveKind::Circle:
		if (!isFinite(primitive.center) || !std::isfinite(primitive.radius) || primitive.radius <= 0.0) {
			return std::nullopt;
		}
		return Extents{primitive.center - cv::Point2d{primitive.radius, primitive.radius}, primitive.center + cv::Point2d{primitive.radius, primitive.radius}};
	case PrimitiveKind::Arc:
		return arcExtents(primitive);
	case PrimitiveKind::Polyline:
	case PrimitiveKind::FilledShape:
	case PrimitiveKind::Hatch:
	case PrimitiveKind::Text:
		return boundingBox(primitive.vertices);
	}
	return std::nullopt;
}

cv::Point2d center(const Extents& extents) {
	return {(extents.min.x + extents.max.x) / 2.0, (extents.min.y + extents.max.y) / 2.0};
}

double boxGap(const Extents& a, const Extents& b) {
	const double dx = std::max(0.0, std::max(a.min.x - b.max.x, b.min.x - a.max.x));
	const double dy = std::max(0.0, std::max(a.min.y - b.max.y, b.min.y - a.max.y));
	return std::sqrt(dx * dx + dy * dy);
}

bool contains(const Extents& extents, const cv::Point2d& point) {
	return point.x >= extents.min.x && point.x <= extents.max.x && point.y >= extents.min.y && point.y <= extents.max.y;
}

double distance(const cv::Point2d& a, const cv::Point2d& b) {
	return std::hypot(a.x - b.x, a.y - b.y);
}

} // namespace valvescan::matcher::core
