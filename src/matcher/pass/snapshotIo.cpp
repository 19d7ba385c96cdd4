#include "matcher/snapshotIo.hpp"

#include "matcher/core/markingPolicy.hpp"

#include <algorithm>
#include <climits>
#include <format>
#include <iostream>
#include <limits>
#include <string>

#include <opencv2/core/persistence.hpp>

namespace valvescan::matcher {

namespace {

static constexpr const char* MARKER_KIND_UNRESOLVED = "unresolved";
static constexpr const char* MARKER_KIND_OTHER      = "other";

//! Flat list of numbers. Empty if the node is not a sequence.
static std::vector<double> readNumbers(const cv::FileNode& node) {
	std::vector<double> values;
	if (!node.isSeq()) {
		return values;
	}
	for (const cv::FileNode entry: node) {
		values.push_back(entry.real());
	}
	return values;
}

static cv::Point2d readPoint(const cv::FileNode& node) {
	const std::vector<double> values = readNumbers(node);
	if (values.size() < 2u) {
		return {};
	}
	return {values[0], values[1]};
}

static std::vector<cv::Point2d> readPoints(const cv::FileNode& node) {
	const std::vector<double> values = readNumbers(node);
	std::vector<cv::Point2d> points;
	points.reserve(values.size() / 2u);
	for (std::size_t i = 0; i + 1u < values.size(); i += 2u) {
		points.emplace_back(values[i], values[i + 1u]);
	}
	return points;
}

static std::optional<Extents> readExtents(const cv::FileNode& node) {
	const std::vector<double> values = readNumbers(node);
	if (values.size() != 4u) {
		return std::nullopt;
	}
	return Extents{{values[0], values[1]}, {values[2], values[3]}};
}

//! Ids are written as int when they fit, as string otherwise (FileStorage integers are 32 bit).
static std::optional<EntityId> readId(const cv::FileNode& node) {
	if (node.isInt()) {
		const int value = static_cast<int>(node);
		if (value < 0) {
			return std::nullopt;
		}
		return static_cast<EntityId>(value);
	}
	if (node.isString()) {
		const std::string text = node.string();
		if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
			return std::nullopt;
		}
		try {
			return static_cast<EntityId>(std::stoull(text));
		} catch (const std::out_of_range&) {
			return std::nullopt;
		}
	}
	return std::nullopt;
}

static std::string readString(const cv::FileNode& node) {
	return node.isString() ? node.string() : std::string{};
}

static double readDouble(const cv::FileNode& node, double fallback = 0.0) {
	return node.isInt() || node.isReal() ? node.real() : fallback;
}

static std::optional<Primitive> readPrimitive(const cv::FileNode& node) {
	if (!node.isMap()) {
		std::cerr << "Primitive entry is not a mapping.\n";
		return std::nullopt;
	}
	const auto id   = readId(node["id"]);
	const auto kind = parseKind(readString(node["kind"]));
	if (!id.has_value() || !kind.has_value()) {
		std::cerr << std::format("Primitive entry with invalid id or kind '{}'.\n", readString(node["kind"]));
		return std::nullopt;
	}

	Primitive primitive{};
	primitive.id         = *id;
	primitive.kind       = *kind;
	primitive.layer      = readString(node["layer"]);
	primitive.vertices   = readPoints(node["vertices"]);
	primitive.center     = readPoint(node["center"]);
	primitive.radius     = readDouble(node["radius"]);
	primitive.startAngle = readDouble(node["startAngle"]);
	primitive.endAngle   = readDouble(node["endAngle"]);
	primitive.closed     = node["closed"].isInt() && static_cast<int>(node["closed"]) != 0;
	primitive.colorIndex = node["color"].isInt() ? static_cast<int>(node["color"]) : 0;
	if (!node["extents"].empty()) {
		// A box that is present but unreadable is kept as invalid, so the primitive is skipped and counted.
		const double nan  = std::numeric_limits<double>::quiet_NaN();
		primitive.extents = readExtents(node["extents"]).value_or(Extents{{nan, nan}, {nan, nan}});
	}
	return primitive;
}

static std::optional<Zone> readZone(const cv::FileNode& node) {
	if (!node.isMap()) {
		return std::nullopt;
	}
	const auto id = readId(node["id"]);
	if (!id.has_value()) {
		return std::nullopt;
	}

	Zone zone{};
	zone.id = *id;
	if (const auto box = readExtents(node["extents"])) {
		zone.extents = *box;
	} else {
		// Bounding box surrogate of the boundary polygon.
		const std::vector<cv::Point2d> boundary = readPoints(node["vertices"]);
		if (boundary.empty()) {
			return std::nullopt;
		}
		zone.extents = {boundary.front(), boundary.front()};
		for (const auto& p: boundary) {
			zone.extents.min.x = std::min(zone.extents.min.x, p.x);
			zone.extents.min.y = std::min(zone.extents.min.y, p.y);
			zone.extents.max.x = std::max(zone.extents.max.x, p.x);
			zone.extents.max.y = std::max(zone.extents.max.y, p.y);
		}
	}

	const cv::FileNode metadata = node["metadata"];
	if (metadata.isMap()) {
		for (const cv::FileNode entry: metadata) {
			zone.metadata[entry.name()] = entry.isString() ? entry.string() : std::format("{}", entry.real());
		}
	}
	return zone;
}

static void writeId(cv::FileStorage& storage, EntityId id) {
	if (id <= static_cast<EntityId>(INT_MAX)) {
		storage << "id" << static_cast<int>(id);
	} else {
		storage << "id" << std::to_string(id);
	}
}

static void writePoint(cv::FileStorage& storage, const char* key, const cv::Point2d& point) {
	storage << key << "[:" << point.x << point.y << "]";
}

static void writeExtents(cv::FileStorage& storage, const Extents& box) {
	storage << "extents" << "[:" << box.min.x << box.min.y << box.max.x << box.max.y << "]";
}

static void writePrimitive(cv::FileStorage& storage, const Primitive& primitive) {
	storage << "{";
	writeId(storage, primitive.id);
	storage << "kind" << std::string(kindName(primitive.kind));
	storage << "layer" << primitive.layer;

	switch (primitive.kind) {
	case PrimitiveKind::Circle:
		writePoint(storage, "center", primitive.center);
		storage << "radius" << primitive.radius;
		break;
	case PrimitiveKind::Arc:
		writePoint(storage, "center", primitive.center);
		storage << "radius" << primitive.radius << "startAngle" << primitive.startAngle << "endAngle" << primitive.endAngle;
		break;
	default:
		storage << "vertices" << "[:";
		for (const auto& vertex: primitive.vertices) {
			storage << vertex.x << vertex.y;
		}
		storage << "]";
		storage << "closed" << static_cast<int>(primitive.closed);
		break;
	}

	storage << "color" << primitive.colorIndex;
	if (primitive.extents.has_value()) {
		writeExtents(storage, *primitive.extents);
	}
	storage << "}";
}

} // namespace

std::optional<DrawingSnapshot> readSnapshot(const std::filesystem::path& path) {
	cv::FileStorage storage;
	try {
		if (!storage.open(path.string(), cv::FileStorage::READ)) {
			std::cerr << "Failed to open drawing snapshot: " << path << '\n';
			return std::nullopt;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "Failed to parse drawing snapshot " << path << ": " << e.msg << '\n';
		return std::nullopt;
	}

	DrawingSnapshot snapshot{};

	for (const cv::FileNode node: storage["primitives"]) {
		auto primitive = readPrimitive(node);
		if (!primitive.has_value()) {
			return std::nullopt;
		}
		snapshot.primitives.push_back(std::move(*primitive));
	}

	for (const cv::FileNode node: storage["texts"]) {
		const auto id = node.isMap() ? readId(node["id"]) : std::nullopt;
		if (!id.has_value()) {
			std::cerr << "Text entry without valid id.\n";
			return std::nullopt;
		}
		snapshot.texts.push_back(TextEntity{*id, readPoint(node["position"]), readString(node["value"]), readString(node["layer"])});
	}

	for (const cv::FileNode node: storage["zones"]) {
		auto zone = readZone(node);
		if (!zone.has_value()) {
			std::cerr << "Zone entry without valid id or boundary.\n";
			return std::nullopt;
		}
		snapshot.zones.push_back(std::move(*zone));
	}

	for (const cv::FileNode node: storage["markers"]) {
		const auto id = node.isMap() ? readId(node["id"]) : std::nullopt;
		if (!id.has_value()) {
			std::cerr << "Marker entry without valid id.\n";
			return std::nullopt;
		}
		Marker marker{};
		marker.id     = *id;
		marker.kind   = readString(node["kind"]) == MARKER_KIND_UNRESOLVED ? MarkerKind::Unresolved : MarkerKind::Other;
		marker.center = readPoint(node["center"]);
		marker.size   = readDouble(node["size"]);
		snapshot.markers.push_back(marker);
	}

	return snapshot;
}

bool writeSnapshot(const DrawingSnapshot& snapshot, const std::filesystem::path& path) {
	try {
		cv::FileStorage storage(path.string(), cv::FileStorage::WRITE);
		if (!storage.isOpened()) {
			std::cerr << "Failed to open drawing snapshot for writing: " << path << '\n';
			return false;
		}

		storage << "primitives" << "[";
		for (const auto& primitive: snapshot.primitives) {
			writePrimitive(storage, primitive);
		}
		storage << "]";

		storage << "texts" << "[";
		for (const auto& text: snapshot.texts) {
			storage << "{";
			writeId(storage, text.id);
			writePoint(storage, "position", text.position);
			storage << "value" << text.value << "layer" << text.layer;
			storage << "}";
		}
		storage << "]";

		storage << "zones" << "[";
		for (const auto& zone: snapshot.zones) {
			storage << "{";
			writeId(storage, zone.id);
			writeExtents(storage, zone.extents);
			storage << "metadata" << "{";
			for (const auto& [key, value]: zone.metadata) {
				storage << key << value;
			}
			storage << "}";
			storage << "}";
		}
		storage << "]";

		storage << "markers" << "[";
		for (const auto& marker: snapshot.markers) {
			storage << "{";
			writeId(storage, marker.id);
			storage << "kind" << std::string(marker.kind == MarkerKind::Unresolved ? MARKER_KIND_UNRESOLVED : MARKER_KIND_OTHER);
			writePoint(storage, "center", marker.center);
			storage << "size" << marker.size;
			storage << "}";
		}
		storage << "]";
	} catch (const cv::Exception& e) {
		// Zone metadata keys must be valid FileStorage names.
		std::cerr << "Failed to write drawing snapshot " << path << ": " << e.msg << '\n';
		return false;
	}
	return true;
}

bool applyMutations(DrawingSnapshot& snapshot, const std::vector<MarkerMutation>& mutations) {
	std::vector<Marker> markers = snapshot.markers;

	for (const auto& mutation: mutations) {
		if (mutation.type == MarkerMutation::Type::Remove) {
			const auto it = std::find_if(markers.begin(), markers.end(), [&](const Marker& marker) { return marker.id == mutation.marker.id; });
			if (it == markers.end() || it->kind != MarkerKind::Unresolved) {
				std::cerr << std::format("Mutation batch rejected: marker #{} cannot be removed.\n", mutation.marker.id);
				return false;
			}
		}
		core::applyToWorkingSet(mutation, markers);
	}

	snapshot.markers = std::move(markers);
	return true;
}

} // namespace valvescan::matcher
