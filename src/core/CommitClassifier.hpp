#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/AuthorIdentity.hpp"
#include "core/CategoryDefinition.hpp"
#include "core/CommitObject.hpp"
#include "core/PrefixCategoryIndex.hpp"
#include "util/StringUtils.hpp"

namespace relnotes {

/// A commit with its category and the identities credited for it
struct ClassifiedCommit {
    CommitObject commit;
    std::string category;
    int priority{0};
    AuthorSet authors;
};

/// All commits of one category, in the order they were grouped
struct CategorySection {
    std::string name;
    int priority{0};
    std::vector<ClassifiedCommit> commits;
};

/**
 * @brief Category name -> commits, enumerated in ascending priority
 *
 * Name lookups are case-insensitive. Sections are kept in the order they
 * were first added; CommitClassifier::group adds them by ascending priority.
 */
class CategoryGrouping {
public:
    void add(ClassifiedCommit commit);

    const std::vector<CategorySection>& sections() const { return sectionList; }

    /// Section by name or nullptr
    const CategorySection* find(const std::string& name) const;

    bool empty() const { return sectionList.empty(); }
    size_t commitCount() const;

private:
    std::vector<CategorySection> sectionList;
    std::map<std::string, size_t, StringUtils::CaseInsensitiveLess> byName;
};

/**
 * @brief Assigns commits to release-note categories
 *
 * Bot logins listed in the override table short-circuit: their synthetic key
 * is looked up in the prefix index instead of the message, so dependency bots
 * land in their category whatever the message says. Everything else is
 * classified by message prefix.
 */
class CommitClassifier {
public:
    CommitClassifier();
    CommitClassifier(std::vector<CategoryDefinition> categories, BotOverrideTable botOverrides);

    CategoryMatch classify(const CommitObject& commit) const;

    /// Classify every commit and group them by ascending category priority (stable)
    CategoryGrouping group(const std::vector<CommitObject>& commits) const;

    const PrefixCategoryIndex& index() const { return prefixIndex; }
    const std::vector<CategoryDefinition>& categories() const { return categoryList; }

    /// Known category names in ascending priority
    std::vector<std::string> categoryNamesByPriority() const;

    /// Emoji for a section heading; "Other" and unknown names get fixed fallbacks
    std::string emojiFor(const std::string& category) const;

    const std::string& otherCategoryName() const { return otherName; }

    bool isKnownCategory(const std::string& name) const;

private:
    std::vector<CategoryDefinition> categoryList;
    BotOverrideTable bots;
    std::string otherName;
    PrefixCategoryIndex prefixIndex;  // built from categoryList, declared after it
};

}
