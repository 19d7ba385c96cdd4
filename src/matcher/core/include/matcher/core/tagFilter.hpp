#pragma once

#include "model/drawing.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace valvescan::matcher::core {

std::string trim(const std::string& value);

//! Trimmed and upper case. Used for tag texts and layer names.
std::string normaliseText(const std::string& value);

/*! Build the device tag pattern from the prefix list: a prefix followed by one or more digits, case-insensitive.
 * \return std::nullopt if the list has no usable prefix.
 */
std::optional<std::regex> buildTagPattern(const std::vector<std::string>& prefixes);

/*! Select the texts that are device tags.
 *  A text is a tag if its normalised value is not empty, matches `tagPattern` and its position lies inside a zone.
 *  A tag closer than `mergeTolerance` to an earlier tag is dropped, so every location yields at most one tag.
 */
std::vector<Tag> selectTags(const std::vector<TextEntity>& texts, const std::vector<Zone>& zones, const std::regex& tagPattern, double mergeTolerance);

} // namespace valvescan::matcher::core
