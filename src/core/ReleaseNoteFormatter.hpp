#pragma once

#include <string>

#include "core/AuthorIdentity.hpp"
#include "core/CommitClassifier.hpp"

namespace relnotes {

/**
 * @brief Renders grouped commits and contributor sets as Markdown
 *
 * Layout:
 *   ## <map> What's Changed
 *   ### <emoji> <Category>        (known categories by priority, then
 *    * owner/repo@sha <subject> @a   "Other", then any unknown names)
 *   <link> **Full Changelog**: <url>
 *   ### <hands> Contributions
 *   new contributors / thanks to all (bots excluded), then bots
 *
 * Empty sections are left out. Trailing whitespace is trimmed.
 */
class ReleaseNoteFormatter {
public:
    static std::string format(const std::string& owner,
                              const std::string& repo,
                              const std::string& changelogUrl,
                              const AuthorSet& allAuthors,
                              const AuthorSet& newAuthors,
                              const CategoryGrouping& grouped,
                              const CommitClassifier& classifier);

    /// " * owner/repo@sha subject @author1 @author2"
    static std::string formatCommitLine(const std::string& owner, const std::string& repo,
                                        const ClassifiedCommit& commit);
};

}
