#pragma once

#include <set>
#include <string>

#include "core/CommitObject.hpp"
#include "util/StringUtils.hpp"

namespace relnotes {

/// Normalized identities, ordered and compared case-insensitively
using AuthorSet = std::set<std::string, StringUtils::CaseInsensitiveLess>;

/**
 * @brief Extracts and normalizes the people (and bots) behind a commit
 *
 * Primary identity order: author login, committer login, author display
 * name, committer display name, then "unknown". Every message line that
 * starts with "Co-authored-by:" (any case, after trimming) adds the rest of
 * that line as another identity.
 */
namespace AuthorIdentityResolver {

AuthorSet extractAuthors(const CommitObject& commit);

/**
 * @brief Normalize a raw author string
 *
 * Drops everything from the first '<' (the email), removes all whitespace.
 * Returns "unknown" if nothing is left.
 *
 * Example: " John Doe <john@x.com> " -> "JohnDoe"
 */
std::string normalize(const std::string& raw);

/// True if the identity contains "[bot]", ignoring case
bool isBot(const std::string& identity);

/// Union of @p from into @p into
void addAll(AuthorSet& into, const AuthorSet& from);

/// Identities in @p lhs that are not in @p rhs
AuthorSet difference(const AuthorSet& lhs, const AuthorSet& rhs);

} // namespace AuthorIdentityResolver

}
