#pragma once

#include "model/primitive.hpp"

#include <map>
#include <string>
#include <vector>

namespace valvescan {

using AttributeMap = std::map<std::string, std::string>;

//! One recognized device.
struct MatchRecord {
	std::string tagText;
	cv::Point2d tagPosition{};
	std::string patternName;
	AttributeMap attributes;          //!< Static type attributes overlaid with zone attributes.
	std::vector<EntityId> clusterIds; //!< Primitives of the owning cluster, sorted.
	std::string facility;
	std::string subFacility;
};

} // namespace valvescan
