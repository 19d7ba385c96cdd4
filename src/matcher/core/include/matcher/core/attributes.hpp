#pragma once

#include "model/drawing.hpp"
#include "model/matchRecord.hpp"

#include <map>
#include <string>
#include <tuple>

namespace valvescan::matcher::core {

static constexpr const char* UNKNOWN_FACILITY = "UNKNOWN";
static constexpr const char* FACILITY_KEY     = "FACILITY";
static constexpr const char* SUB_FACILITY_KEY = "SUB_FACILITY";

//! Facility identifiers of a zone.
struct FacilityKey {
	std::string facility{UNKNOWN_FACILITY};
	std::string subFacility{UNKNOWN_FACILITY};

	bool operator<(const FacilityKey& other) const { return std::tie(facility, subFacility) < std::tie(other.facility, other.subFacility); }
};

//! Static attributes per pattern name.
using AttributeCatalog = std::map<std::string, AttributeMap>;

//! Attributes per facility.
using FacilityTable = std::map<FacilityKey, AttributeMap>;

//! Copy of `staticAttrs` overlaid with every key of `zoneAttrs`. Zone wins on collision.
AttributeMap mergeAttributes(const AttributeMap& staticAttrs, const AttributeMap& zoneAttrs);

//! Facility identifiers read from zone metadata. Missing zone or keys degrade to UNKNOWN.
FacilityKey zoneFacility(const Zone* zone);

//! First zone whose box contains the position, or nullptr.
const Zone* findZone(const cv::Point2d& position, const std::vector<Zone>& zones);

AttributeMap lookup(const AttributeCatalog& catalog, const std::string& patternName); //!< Empty map if the pattern has no entry.
AttributeMap lookup(const FacilityTable& table, const FacilityKey& key);              //!< Empty map if the facility has no entry.

} // namespace valvescan::matcher::core
