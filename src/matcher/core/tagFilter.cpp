#include "matcher/core/tagFilter.hpp"

#include "matcher/core/extents.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace valvescan::matcher::core {

namespace {

//! Characters with a meaning in ECMAScript regular expressions.
static constexpr std::string_view REGEX_SPECIAL = R"(\^$.|?*+()[]{}-/)";

static std::string escapeRegex(const std::string& text) {
	std::string out;
	out.reserve(text.size() * 2u);
	for (const char c: text) {
		if (REGEX_SPECIAL.find(c) != std::string_view::npos) {
			out.push_back('\\');
		}
		out.push_back(c);
	}
	return out;
}

} // namespace

std::string trim(const std::string& value) {
	const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
	const auto last  = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
	return first < last ? std::string(first, last) : std::string{};
}

std::string normaliseText(const std::string& value) {
	std::string out = trim(value);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return out;
}

std::optional<std::regex> buildTagPattern(const std::vector<std::string>& prefixes) {
	std::string alternatives;
	for (const auto& prefix: prefixes) {
		const std::string cleaned = trim(prefix);
		if (cleaned.empty()) {
			continue;
		}
		if (!alternatives.empty()) {
			alternatives.push_back('|');
		}
		alternatives += escapeRegex(cleaned);
	}

	if (alternatives.empty()) {
		return std::nullopt;
	}
	return std::regex("^(" + alternatives + R"()\d+$)", std::regex::ECMAScript | std::regex::icase);
}

std::vector<Tag> selectTags(const std::vector<TextEntity>& texts, const std::vector<Zone>& zones, const std::regex& tagPattern, double mergeTolerance) {
	std::vector<Tag> tags;
	for (const auto& text: texts) {
		const std::string value = normaliseText(text.value);
		if (value.empty()) {
			continue;
		}

		const bool insideZone = std::any_of(zones.begin(), zones.end(), [&text](const Zone& zone) { return contains(zone.extents, text.position); });
		if (!insideZone || !std::regex_match(value, tagPattern)) {
			continue;
		}

		// Stacked or duplicated labels name the same device location.
		const bool duplicate = std::any_of(tags.begin(), tags.end(), [&](const Tag& tag) { return distance(tag.position, text.position) < mergeTolerance; });
		if (duplicate) {
			continue;
		}

		tags.push_back({text.id, text.position, value});
	}
	return tags;
}

} // namespace valvescan::matcher::core
