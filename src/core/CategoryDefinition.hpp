#pragma once

#include <map>
#include <string>
#include <vector>

#include "util/StringUtils.hpp"

namespace relnotes {

/**
 * @brief A release-note section and the message prefixes that feed it
 *
 * Priority orders the sections (lower renders earlier) and must be unique
 * within one category table.
 */
struct CategoryDefinition {
    std::string name;
    std::string emoji;
    int priority{0};
    std::vector<std::string> prefixes;
};

/// Bot login -> synthetic prefix key, compared case-insensitively
using BotOverrideTable = std::map<std::string, std::string, StringUtils::CaseInsensitiveLess>;

/// Built-in table: Breaking Changes (1) through Dependencies (10)
std::vector<CategoryDefinition> defaultCategories();

/// Built-in bot overrides: renovate[bot], dependabot[bot], dependabot -> "dep"
BotOverrideTable defaultBotOverrides();

/// Emoji of the fallback "Other" section
constexpr const char* OTHER_EMOJI = "\xF0\x9F\x93\x8C";     // U+1F4CC
/// Emoji for sections that are in no category table
constexpr const char* UNKNOWN_EMOJI = "\xF0\x9F\x94\xB9";   // U+1F539

}
