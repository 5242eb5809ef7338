#include "core/CommitClassifier.hpp"

#include <algorithm>

#include "core/Constants.hpp"

namespace relnotes {

void CategoryGrouping::add(ClassifiedCommit commit) {
    auto it = byName.find(commit.category);
    if (it == byName.end()) {
        it = byName.emplace(commit.category, sectionList.size()).first;
        sectionList.push_back(CategorySection{commit.category, commit.priority, {}});
    }
    sectionList[it->second].commits.push_back(std::move(commit));
}

const CategorySection* CategoryGrouping::find(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) return nullptr;
    return &sectionList[it->second];
}

size_t CategoryGrouping::commitCount() const {
    size_t total = 0;
    for (const auto& section : sectionList) total += section.commits.size();
    return total;
}

CommitClassifier::CommitClassifier()
    : CommitClassifier(defaultCategories(), defaultBotOverrides()) {}

CommitClassifier::CommitClassifier(std::vector<CategoryDefinition> categories, BotOverrideTable botOverrides)
    : categoryList(std::move(categories)),
      bots(std::move(botOverrides)),
      otherName(Constants::OTHER_CATEGORY),
      prefixIndex(otherName, categoryList) {}

CategoryMatch CommitClassifier::classify(const CommitObject& commit) const {
    const std::string& login = commit.primaryLogin();
    if (!login.empty()) {
        auto it = bots.find(login);
        if (it != bots.end()) {
            return prefixIndex.lookup(it->second);
        }
    }
    return prefixIndex.lookup(commit.message);
}

CategoryGrouping CommitClassifier::group(const std::vector<CommitObject>& commits) const {
    std::vector<ClassifiedCommit> classified;
    classified.reserve(commits.size());
    for (const auto& commit : commits) {
        CategoryMatch match = classify(commit);
        classified.push_back(ClassifiedCommit{commit, match.name, match.priority,
                                              AuthorIdentityResolver::extractAuthors(commit)});
    }

    // Stable: equal priorities keep the provider's commit order
    std::stable_sort(classified.begin(), classified.end(),
                     [](const ClassifiedCommit& a, const ClassifiedCommit& b) { return a.priority < b.priority; });

    CategoryGrouping grouping;
    for (auto& c : classified) {
        grouping.add(std::move(c));
    }
    return grouping;
}

std::vector<std::string> CommitClassifier::categoryNamesByPriority() const {
    std::vector<CategoryDefinition> sorted(categoryList);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CategoryDefinition& a, const CategoryDefinition& b) { return a.priority < b.priority; });
    std::vector<std::string> names;
    names.reserve(sorted.size());
    for (const auto& def : sorted) names.push_back(def.name);
    return names;
}

std::string CommitClassifier::emojiFor(const std::string& category) const {
    for (const auto& def : categoryList) {
        if (StringUtils::iequals(def.name, category)) return def.emoji;
    }
    if (StringUtils::iequals(category, otherName)) return OTHER_EMOJI;
    return UNKNOWN_EMOJI;
}

bool CommitClassifier::isKnownCategory(const std::string& name) const {
    return std::any_of(categoryList.begin(), categoryList.end(),
                       [&](const CategoryDefinition& def) { return StringUtils::iequals(def.name, name); });
}

}
