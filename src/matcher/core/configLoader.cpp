#include "matcher/core/configLoader.hpp"

#include "matcher/core/tagFilter.hpp"

#include <format>
#include <fstream>
#include <iostream>

#include <opencv2/core/persistence.hpp>

namespace valvescan::matcher::core {

namespace {

//! Open a FileStorage for reading. OpenCV throws on syntax errors, report them like a missing file.
static bool openStorage(const std::filesystem::path& path, cv::FileStorage& storage) {
	try {
		if (!storage.open(path.string(), cv::FileStorage::READ)) {
			std::cerr << "Failed to open config file: " << path << '\n';
			return false;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "Failed to parse config file " << path << ": " << e.msg << '\n';
		return false;
	}
	return true;
}

//! Scalar node as text. Unquoted numbers in YAML arrive as int/real nodes.
static std::string nodeToString(const cv::FileNode& node) {
	if (node.isString()) {
		return node.string();
	}
	if (node.isInt()) {
		return std::to_string(static_cast<int>(node));
	}
	if (node.isReal()) {
		return std::format("{}", node.real());
	}
	return {};
}

//! Child mapping of a node. Empty node if absent or not a mapping (FileNode::operator[] asserts on non-maps).
static cv::FileNode section(const cv::FileNode& parent, const char* name) {
	if (!parent.isMap()) {
		return {};
	}
	const cv::FileNode child = parent[name];
	return child.isMap() ? child : cv::FileNode{};
}

static bool isNumber(const cv::FileNode& node) {
	return node.isInt() || node.isReal();
}

static void readDouble(const cv::FileNode& node, double& value) {
	if (isNumber(node)) {
		value = node.real();
	}
}

static std::optional<double> readOptionalDouble(const cv::FileNode& node) {
	if (!isNumber(node)) {
		return std::nullopt;
	}
	return node.real();
}

static AttributeMap readAttributes(const cv::FileNode& node) {
	AttributeMap attributes;
	if (!node.isMap()) {
		return attributes;
	}
	for (const cv::FileNode entry: node) {
		attributes[entry.name()] = nodeToString(entry);
	}
	return attributes;
}

//! Parse a count node: exact integer or {min, max} with max -1 for unbounded.
static std::optional<CountRange> readCountRange(const cv::FileNode& node) {
	if (node.isInt()) {
		const int exact = static_cast<int>(node);
		if (exact < 0) {
			return std::nullopt;
		}
		return CountRange{static_cast<std::size_t>(exact), static_cast<std::size_t>(exact)};
	}
	if (!node.isMap()) {
		return std::nullopt;
	}

	const int min = node["min"].isInt() ? static_cast<int>(node["min"]) : 0;
	const int max = node["max"].isInt() ? static_cast<int>(node["max"]) : -1;
	if (min < 0 || (max >= 0 && max < min)) {
		return std::nullopt;
	}
	return CountRange{static_cast<std::size_t>(min), max < 0 ? CountRange::UNBOUNDED : static_cast<std::size_t>(max)};
}

static std::optional<Pattern> readPattern(const cv::FileNode& node, std::size_t index) {
	if (!node.isMap()) {
		std::cerr << std::format("Pattern #{} is not a mapping.\n", index);
		return std::nullopt;
	}

	Pattern pattern{};
	pattern.name = trim(nodeToString(node["name"]));
	if (pattern.name.empty()) {
		std::cerr << std::format("Pattern #{} has no name.\n", index);
		return std::nullopt;
	}

	if (node["strict"].isInt()) {
		pattern.strict = static_cast<int>(node["strict"]) != 0;
	}

	const cv::FileNode counts = node["counts"];
	if (!counts.empty() && counts.isMap()) {
		for (const cv::FileNode entry: counts) {
			const auto kind = parseKind(entry.name());
			if (!kind.has_value()) {
				std::cerr << std::format("Pattern '{}': unknown primitive kind '{}'.\n", pattern.name, entry.name());
				return std::nullopt;
			}
			const auto range = readCountRange(entry);
			if (!range.has_value()) {
				std::cerr << std::format("Pattern '{}': invalid count for '{}'.\n", pattern.name, entry.name());
				return std::nullopt;
			}
			pattern.counts[kindIndex(*kind)] = range;
		}
	}

	pattern.maxLineLength   = readOptionalDouble(node["maxLineLength"]);
	pattern.minCircleRadius = readOptionalDouble(node["minCircleRadius"]);
	pattern.maxCircleRadius = readOptionalDouble(node["maxCircleRadius"]);
	if (node["closedPolylines"].isInt()) {
		pattern.closedPolylines = static_cast<int>(node["closedPolylines"]) != 0;
	}
	return pattern;
}

//! First cell of a CSV/TSV row without surrounding quotes.
static std::string firstCell(const std::string& row) {
	const std::size_t end = row.find_first_of(",;\t");
	std::string cell      = trim(row.substr(0, end));
	if (cell.size() >= 2u && cell.front() == '"' && cell.back() == '"') {
		cell = trim(cell.substr(1, cell.size() - 2u));
	}
	return cell;
}

} // namespace

LibraryPaths libraryPathsIn(const std::filesystem::path& directory) {
	LibraryPaths paths{};
	paths.patterns     = directory / "patterns.yml";
	paths.tagPrefixes  = directory / "prefixes.csv";
	paths.deviceLayers = directory / "layers.csv";
	if (std::filesystem::exists(directory / "catalog.yml")) {
		paths.attributeCatalog = directory / "catalog.yml";
	}
	if (std::filesystem::exists(directory / "facilities.yml")) {
		paths.facilityTable = directory / "facilities.yml";
	}
	return paths;
}

std::optional<PatternLibrary> loadPatternLibrary(const std::filesystem::path& path) {
	cv::FileStorage storage;
	if (!openStorage(path, storage)) {
		return std::nullopt;
	}

	const cv::FileNode root = storage["patterns"];
	if (!root.isSeq()) {
		std::cerr << "Pattern library " << path << " has no 'patterns' sequence.\n";
		return std::nullopt;
	}

	PatternLibrary library;
	std::size_t index = 0u;
	for (const cv::FileNode node: root) {
		auto pattern = readPattern(node, index++);
		if (!pattern.has_value()) {
			return std::nullopt;
		}
		library.push_back(std::move(*pattern));
	}
	return library;
}

std::optional<std::vector<std::string>> loadTableColumn(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		std::cerr << "Failed to open table: " << path << '\n';
		return std::nullopt;
	}

	std::vector<std::string> values;
	std::string row;
	while (std::getline(file, row)) {
		if (values.empty() && row.rfind("\xEF\xBB\xBF", 0) == 0) {
			row.erase(0, 3); // UTF-8 BOM of spreadsheet exports.
		}
		const std::string cell = firstCell(row);
		if (cell.empty() || cell.front() == '#') {
			continue;
		}
		values.push_back(cell);
	}
	return values;
}

std::optional<AttributeCatalog> loadAttributeCatalog(const std::filesystem::path& path) {
	cv::FileStorage storage;
	if (!openStorage(path, storage)) {
		return std::nullopt;
	}

	const cv::FileNode root = storage["catalog"];
	if (!root.isSeq()) {
		std::cerr << "Attribute catalog " << path << " has no 'catalog' sequence.\n";
		return std::nullopt;
	}

	AttributeCatalog catalog;
	for (const cv::FileNode entry: root) {
		if (!entry.isMap()) {
			continue;
		}
		const std::string pattern = trim(nodeToString(entry["pattern"]));
		if (pattern.empty()) {
			std::cerr << "Attribute catalog entry without pattern name skipped.\n";
			continue;
		}
		catalog[pattern] = readAttributes(entry["attributes"]);
	}
	return catalog;
}

std::optional<FacilityTable> loadFacilityTable(const std::filesystem::path& path) {
	cv::FileStorage storage;
	if (!openStorage(path, storage)) {
		return std::nullopt;
	}

	const cv::FileNode root = storage["facilities"];
	if (!root.isSeq()) {
		std::cerr << "Facility table " << path << " has no 'facilities' sequence.\n";
		return std::nullopt;
	}

	FacilityTable table;
	for (const cv::FileNode entry: root) {
		if (!entry.isMap()) {
			continue;
		}
		FacilityKey key{};
		key.facility    = trim(nodeToString(entry["facility"]));
		key.subFacility = trim(nodeToString(entry["subFacility"]));
		if (key.facility.empty() || key.subFacility.empty()) {
			std::cerr << "Facility table entry without facility identifiers skipped.\n";
			continue;
		}
		table[key] = readAttributes(entry["attributes"]);
	}
	return table;
}

std::optional<MatcherConfig> loadMatcherConfig(const std::filesystem::path& path) {
	cv::FileStorage storage;
	if (!openStorage(path, storage)) {
		return std::nullopt;
	}

	MatcherConfig config{};
	const cv::FileNode root = storage.root();

	const cv::FileNode cluster = section(root, "cluster");
	readDouble(cluster["proximityRadius"], config.cluster.proximityRadius);
	readDouble(cluster["linkTolerance"], config.cluster.linkTolerance);

	readDouble(section(root, "ownership")["ambiguityTolerance"], config.ownership.ambiguityTolerance);

	const cv::FileNode composition = section(root, "composition");
	readDouble(composition["maxLineLength"], config.composition.maxLineLength);
	if (composition["zoneLayer"].isString()) {
		config.composition.zoneLayer = composition["zoneLayer"].string();
	}

	const cv::FileNode marker = section(root, "marker");
	readDouble(marker["markerSize"], config.marker.markerSize);
	readDouble(marker["locationTolerance"], config.marker.locationTolerance);

	const cv::FileNode exporting = section(root, "export");
	if (exporting["settleDelayMs"].isInt() && static_cast<int>(exporting["settleDelayMs"]) >= 0) {
		config.exporting.settleDelayMs = static_cast<unsigned>(static_cast<int>(exporting["settleDelayMs"]));
	}

	if (config.cluster.proximityRadius < 0.0 || config.cluster.linkTolerance < 0.0 || config.ownership.ambiguityTolerance < 0.0) {
		std::cerr << "Matcher config " << path << " has negative tolerances.\n";
		return std::nullopt;
	}
	if (config.marker.markerSize <= 0.0 || config.marker.locationTolerance <= 0.0) {
		std::cerr << "Matcher config " << path << " needs a positive marker size and location tolerance.\n";
		return std::nullopt;
	}
	return config;
}

std::optional<MatchLibraries> loadMatchLibraries(const LibraryPaths& paths) {
	MatchLibraries libraries{};

	auto patterns = loadPatternLibrary(paths.patterns);
	if (!patterns.has_value()) {
		std::cerr << "Failed to load valve patterns.\n";
		return std::nullopt;
	}
	libraries.patterns = std::move(*patterns);
	std::cout << std::format("Loaded {} valve pattern(s).\n", libraries.patterns.size());

	const auto prefixes = loadTableColumn(paths.tagPrefixes);
	if (!prefixes.has_value()) {
		std::cerr << "Failed to load tag prefixes.\n";
		return std::nullopt;
	}
	auto tagPattern = buildTagPattern(*prefixes);
	if (!tagPattern.has_value()) {
		std::cerr << "Tag prefix list " << paths.tagPrefixes << " contains no prefix.\n";
		return std::nullopt;
	}
	libraries.tagPattern = std::move(*tagPattern);
	std::cout << std::format("Loaded {} tag prefix(es).\n", prefixes->size());

	const auto layers = loadTableColumn(paths.deviceLayers);
	if (!layers.has_value()) {
		std::cerr << "Failed to load valve layers.\n";
		return std::nullopt;
	}
	for (const auto& layer: *layers) {
		const std::string normalised = normaliseText(layer);
		if (!normalised.empty()) {
			libraries.allowedLayers.insert(normalised);
		}
	}
	if (libraries.allowedLayers.empty()) {
		std::cerr << "Layer list " << paths.deviceLayers << " contains no layer.\n";
		return std::nullopt;
	}
	std::cout << std::format("Loaded {} valve layer(s).\n", libraries.allowedLayers.size());

	// Optional enrichment tables. Missing tables leave records with fewer attributes.
	if (!paths.attributeCatalog.empty()) {
		if (auto catalog = loadAttributeCatalog(paths.attributeCatalog)) {
			libraries.catalog = std::move(*catalog);
		}
	}
	if (!paths.facilityTable.empty()) {
		if (auto facilities = loadFacilityTable(paths.facilityTable)) {
			libraries.facilities = std::move(*facilities);
		}
	}

	return libraries;
}

} // namespace valvescan::matcher::core
