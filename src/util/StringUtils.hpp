#pragma once

#include <string>
#include <vector>

namespace relnotes {

/**
 * @brief ASCII string helpers shared by the classifier and identity code
 *
 * Case folding only touches ASCII letters; UTF-8 continuation bytes pass
 * through unchanged, which keeps emoji and non-Latin names intact.
 */
namespace StringUtils {

char toLowerAscii(char c);
std::string toLower(const std::string& s);

/// Strip leading/trailing whitespace (space, tab, CR, LF, VT, FF)
std::string trim(const std::string& s);

/// Case-insensitive equality on ASCII letters
bool iequals(const std::string& a, const std::string& b);

/// True if @p s starts with @p prefix, ignoring ASCII case
bool istartsWith(const std::string& s, const std::string& prefix);

/// True if @p needle occurs anywhere in @p haystack, ignoring ASCII case
bool icontains(const std::string& haystack, const std::string& needle);

/**
 * @brief Split text into lines on "\r\n" and "\n"
 *
 * Empty lines are preserved; "a\n" yields {"a", ""}.
 */
std::vector<std::string> splitLines(const std::string& text);

/// First line of @p text (up to the first CR-LF or LF)
std::string firstLine(const std::string& text);

/// Strict weak ordering for case-insensitive std::set / std::map keys
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

} // namespace StringUtils

}
