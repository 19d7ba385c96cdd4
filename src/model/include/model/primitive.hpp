#pragma once

#include <opencv2/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace valvescan {

using EntityId = std::uint64_t;

//! Kind of a geometric drawing entity.
enum class PrimitiveKind { Line, Circle, Arc, Polyline, FilledShape, Hatch, Text };

static constexpr std::size_t PRIMITIVE_KIND_COUNT = 7u;

//! Axis-aligned bounding box in drawing units.
struct Extents {
	cv::Point2d min;
	cv::Point2d max;
};

/*! Value copy of one host drawing entity for the duration of a matching pass.
 *  Only the fields relevant for the kind are populated:
 *   - Line:                      vertices = {start, end}
 *   - Circle:                    center, radius
 *   - Arc:                       center, radius, startAngle, endAngle (degrees, counter-clockwise)
 *   - Polyline/FilledShape/Hatch: vertices, closed
 *   - Text:                      vertices = {insertion point}
 */
struct Primitive {
	EntityId id{0u};
	PrimitiveKind kind{PrimitiveKind::Line};
	std::string layer;

	std::vector<cv::Point2d> vertices;
	cv::Point2d center{};
	double radius{0.0};
	double startAngle{0.0};
	double endAngle{0.0};
	bool closed{false};
	int colorIndex{0};

	std::optional<Extents> extents; //!< Host supplied box. Overrides the box derived from the geometry.
};

//! Length of a line primitive. 0 for every other kind.
double lineLength(const Primitive& primitive);

std::string_view kindName(PrimitiveKind kind);                   //!< Lower case name, e.g. "filledShape".
std::optional<PrimitiveKind> parseKind(std::string_view name); //!< Inverse of kindName(). Case-insensitive.

//! Index of a kind into per-kind arrays.
constexpr std::size_t kindIndex(PrimitiveKind kind) {
	return static_cast<std::size_t>(kind);
}

} // namespace valvescan
