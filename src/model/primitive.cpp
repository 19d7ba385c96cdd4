#include "model/primitive.hpp"

#include <array>
#include <cctype>
#include <cmath>

namespace valvescan {

namespace {

static constexpr std::array<std::string_view, PRIMITIVE_KIND_COUNT> KIND_NAMES = {
        "line", "circle", "arc", "polyline", "filledShape", "hatch", "text",
};

static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
	if (a.size() != b.size()) {
		return false;
	}
	for (std::size_t i = 0; i < a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

} // namespace

double lineLength(const Primitive& primitive) {
	if (primitive.kind != PrimitiveKind::Line || primitive.vertices.size() < 2u) {
		return 0.0;
	}
	const cv::Point2d delta = primitive.vertices.back() - primitive.vertices.front();
	return std::hypot(delta.x, delta.y);
}

std::string_view kindName(PrimitiveKind kind) {
	return KIND_NAMES[kindIndex(kind)];
}

std::optional<PrimitiveKind> parseKind(std::string_view name) {
	for (std::size_t i = 0; i < KIND_NAMES.size(); ++i) {
		if (equalsIgnoreCase(name, KIND_NAMES[i])) {
			return static_cast<PrimitiveKind>(i);
		}
	}
	// Host vocabulary for filled shapes.
	if (equalsIgnoreCase(name, "solid")) {
		return PrimitiveKind::FilledShape;
	}
	return std::nullopt;
}

} // namespace valvescan
