#pragma once

#include "matcher/core/attributes.hpp"
#include "matcher/core/matcherConfig.hpp"
#include "matcher/core/patternMatcher.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

// Configuration files are read with cv::FileStorage, so YAML (with the "%YAML:1.0" header), JSON and XML all work.
// Tabular lists (tag prefixes, device layers) are plain text or CSV exports of the customer's spreadsheets.
namespace valvescan::matcher::core {

//! Locations of the configuration a pass needs. Catalog and facility table are optional (empty path -> not used).
struct LibraryPaths {
	std::filesystem::path patterns;
	std::filesystem::path tagPrefixes;
	std::filesystem::path deviceLayers;
	std::filesystem::path attributeCatalog;
	std::filesystem::path facilityTable;
};

/*! Conventional file names inside a configuration directory:
 *  patterns.yml, prefixes.csv, layers.csv and, if present, catalog.yml and facilities.yml.
 */
LibraryPaths libraryPathsIn(const std::filesystem::path& directory);

//! Read-only configuration shared by every tag of a pass.
struct MatchLibraries {
	PatternLibrary patterns;
	std::regex tagPattern;
	std::set<std::string> allowedLayers; //!< Trimmed, upper case.
	AttributeCatalog catalog;
	FacilityTable facilities;
};

/*! Load the ordered pattern library.
 *  Expects a top-level `patterns` sequence. Each entry has a `name`, optional `strict` (default 1), optional `counts` map
 *  (kind name -> exact count or {min, max}; max -1 = unbounded) and optional predicates `maxLineLength`, `minCircleRadius`,
 *  `maxCircleRadius`, `closedPolylines`.
 * \return std::nullopt if the file cannot be read or an entry is malformed.
 */
std::optional<PatternLibrary> loadPatternLibrary(const std::filesystem::path& path);

//! First column of every non-empty, non-comment row of a text/CSV table. Cells are trimmed and unquoted.
std::optional<std::vector<std::string>> loadTableColumn(const std::filesystem::path& path);

//! Static attributes per pattern from a `catalog` sequence of {pattern, attributes}.
std::optional<AttributeCatalog> loadAttributeCatalog(const std::filesystem::path& path);

//! Attributes per facility from a `facilities` sequence of {facility, subFacility, attributes}.
std::optional<FacilityTable> loadFacilityTable(const std::filesystem::path& path);

//! Matcher tunables. Missing sections or keys keep their defaults.
std::optional<MatcherConfig> loadMatcherConfig(const std::filesystem::path& path);

//! Load everything a pass needs. Fails as a whole if patterns, prefixes or layers cannot be loaded.
std::optional<MatchLibraries> loadMatchLibraries(const LibraryPaths& paths);

} // namespace valvescan::matcher::core
