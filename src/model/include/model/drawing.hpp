#pragma once

#include "model/primitive.hpp"

#include <map>
#include <string>
#include <vector>

namespace valvescan {

//! Text entity as found in the drawing. Becomes a Tag if it passes the tag filter.
struct TextEntity {
	EntityId id{0u};
	cv::Point2d position{};
	std::string value;
	std::string layer;
};

//! Device tag. Identity for ownership is the position, not the text.
struct Tag {
	EntityId id{0u};
	cv::Point2d position{};
	std::string text; //!< Trimmed and upper case.
};

//! Bounded drawing region carrying facility metadata.
struct Zone {
	EntityId id{0u};
	Extents extents{};
	std::map<std::string, std::string> metadata;
};

//! Who owns a marker. The matcher only ever touches its own markers.
enum class MarkerKind { Unresolved, Other };

//! Square annotation surfacing an unresolved tag to a reviewer.
struct Marker {
	EntityId id{0u};
	MarkerKind kind{MarkerKind::Unresolved};
	cv::Point2d center{};
	double size{0.0};
};

//! Mutation intent returned by a pass. The host applies the whole batch or nothing.
struct MarkerMutation {
	enum class Type { Add, Remove };

	Type type{Type::Add};
	Marker marker{}; //!< Add: marker to create (id assigned by the host). Remove: marker to erase.
};

//! Immutable read snapshot of a drawing.
struct DrawingSnapshot {
	std::vector<Primitive> primitives;
	std::vector<TextEntity> texts;
	std::vector<Zone> zones;
	std::vector<Marker> markers;
};

} // namespace valvescan
