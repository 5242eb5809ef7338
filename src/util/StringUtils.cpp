#include "util/StringUtils.hpp"

#include <algorithm>

namespace relnotes {

namespace StringUtils {

namespace {
    bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }
}

char toLowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), toLowerAscii);
    return out;
}

std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && isSpace(s[first])) ++first;
    size_t last = s.size();
    while (last > first && isSpace(s[last - 1])) --last;
    return s.substr(first, last - first);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i])) return false;
    }
    return true;
}

bool istartsWith(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return iequals(s.substr(0, prefix.size()), prefix);
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        size_t end = nl;
        if (end > start && text[end - 1] == '\r') --end;
        lines.push_back(text.substr(start, end - start));
        start = nl + 1;
    }
    return lines;
}

std::string firstLine(const std::string& text) {
    size_t nl = text.find('\n');
    if (nl == std::string::npos) return text;
    if (nl > 0 && text[nl - 1] == '\r') --nl;
    return text.substr(0, nl);
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return static_cast<unsigned char>(toLowerAscii(x)) < static_cast<unsigned char>(toLowerAscii(y));
        });
}

} // namespace StringUtils

}
