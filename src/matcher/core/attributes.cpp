#include "matcher/core/attributes.hpp"

#include "matcher/core/extents.hpp"
#include "matcher/core/tagFilter.hpp"

#include <algorithm>

namespace valvescan::matcher::core {

namespace {

static std::string metadataValue(const Zone& zone, const char* key) {
	const auto it = zone.metadata.find(key);
	if (it == zone.metadata.end()) {
		return UNKNOWN_FACILITY;
	}
	const std::string value = trim(it->second);
	return value.empty() ? std::string{UNKNOWN_FACILITY} : value;
}

} // namespace

AttributeMap mergeAttributes(const AttributeMap& staticAttrs, const AttributeMap& zoneAttrs) {
	AttributeMap merged = staticAttrs;
	for (const auto& [key, value]: zoneAttrs) {
		merged[key] = value;
	}
	return merged;
}

FacilityKey zoneFacility(const Zone* zone) {
	if (zone == nullptr) {
		return {};
	}
	return {metadataValue(*zone, FACILITY_KEY), metadataValue(*zone, SUB_FACILITY_KEY)};
}

const Zone* findZone(const cv::Point2d& position, const std::vector<Zone>& zones) {
	const auto it = std::find_if(zones.begin(), zones.end(), [&position](const Zone& zone) { return contains(zone.extents, position); });
	return it == zones.end() ? nullptr : &*it;
}

AttributeMap lookup(const AttributeCatalog& catalog, const std::string& patternName) {
	const auto it = catalog.find(patternName);
	return it == catalog.end() ? AttributeMap{} : it->second;
}

AttributeMap lookup(const FacilityTable& table, const FacilityKey& key) {
	const auto it = table.find(key);
	return it == table.end() ? AttributeMap{} : it->second;
}

} // namespace valvescan::matcher::core
