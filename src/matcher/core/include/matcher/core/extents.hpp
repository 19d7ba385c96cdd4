#pragma once

#include "model/primitive.hpp"

#include <optional>

namespace valvescan::matcher::core {

/*! Bounding box of a primitive.
 *  Uses the host supplied box if present, otherwise derives it from the geometry.
 *  \return std::nullopt if the primitive has no usable geometry (missing vertices, non-finite coordinates, non-positive radius, inverted box).
 */
std::optional<Extents> extentsOf(const Primitive& primitive);

bool isValidExtents(const Extents& extents);

cv::Point2d center(const Extents& extents);

//! Smallest distance between two boxes. Per-axis gap clamped at zero, combined by Euclidean norm. 0 if the boxes overlap.
double boxGap(const Extents& a, const Extents& b);

//! Point inside the box. Boundary counts as inside.
bool contains(const Extents& extents, const cv::Point2d& point);

double distance(const cv::Point2d& a, const cv::Point2d& b);

} // namespace valvescan::matcher::core
