#include "core/AuthorIdentity.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

#include "core/Constants.hpp"

namespace relnotes {

namespace AuthorIdentityResolver {

namespace {
    bool isBlank(const std::string& s) {
        return StringUtils::trim(s).empty();
    }

    std::string primaryIdentity(const CommitObject& commit) {
        if (!commit.authorLogin.empty()) return commit.authorLogin;
        if (!commit.committerLogin.empty()) return commit.committerLogin;
        if (!isBlank(commit.authorName)) return commit.authorName;
        if (!isBlank(commit.committerName)) return commit.committerName;
        return Constants::UNKNOWN_AUTHOR;
    }
}

AuthorSet extractAuthors(const CommitObject& commit) {
    AuthorSet authors;
    authors.insert(normalize(primaryIdentity(commit)));

    const size_t markerLength = std::strlen(Constants::CO_AUTHOR_TRAILER);
    for (const auto& line : StringUtils::splitLines(commit.message)) {
        std::string trimmed = StringUtils::trim(line);
        if (StringUtils::istartsWith(trimmed, Constants::CO_AUTHOR_TRAILER)) {
            authors.insert(normalize(trimmed.substr(markerLength)));
        }
    }
    return authors;
}

std::string normalize(const std::string& raw) {
    std::string name = raw.substr(0, raw.find('<'));
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return std::isspace(c) != 0; }),
               name.end());
    return name.empty() ? Constants::UNKNOWN_AUTHOR : name;
}

bool isBot(const std::string& identity) {
    return StringUtils::icontains(identity, Constants::BOT_MARKER);
}

void addAll(AuthorSet& into, const AuthorSet& from) {
    into.insert(from.begin(), from.end());
}

AuthorSet difference(const AuthorSet& lhs, const AuthorSet& rhs) {
    AuthorSet out;
    std::set_difference(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                        std::inserter(out, out.end()), StringUtils::CaseInsensitiveLess{});
    return out;
}

} // namespace AuthorIdentityResolver

}
