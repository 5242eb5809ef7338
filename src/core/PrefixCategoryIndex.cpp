#include "core/PrefixCategoryIndex.hpp"

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace relnotes {

PrefixCategoryIndex::PrefixCategoryIndex(std::string otherCategoryName)
    : nodes(1), otherName(std::move(otherCategoryName)) {}

PrefixCategoryIndex::PrefixCategoryIndex(std::string otherCategoryName, const std::vector<CategoryDefinition>& categories)
    : PrefixCategoryIndex(std::move(otherCategoryName)) {
    for (const auto& def : categories) {
        insert(def.priority, def.name, def.prefixes);
    }
}

void PrefixCategoryIndex::insert(int priority, const std::string& category, const std::vector<std::string>& prefixes) {
    groupList.push_back(Group{priority, category, prefixes});
    for (const auto& prefix : prefixes) {
        insertPrefix(priority, prefix, category);
    }
}

void PrefixCategoryIndex::insertPrefix(int priority, const std::string& prefix, const std::string& category) {
    // An empty prefix would make the root terminal
    if (prefix.empty()) return;

    size_t current = 0;
    for (char raw : prefix) {
        char ch = StringUtils::toLowerAscii(raw);
        auto it = nodes[current].children.find(ch);
        if (it != nodes[current].children.end()) {
            current = it->second;
            continue;
        }
        // push_back may reallocate, so take the index before touching nodes[current] again
        size_t child = nodes.size();
        nodes.emplace_back();
        nodes[current].children.emplace(ch, child);
        current = child;
    }

    Node& leaf = nodes[current];
    leaf.terminal = true;
    leaf.priority = priority;
    leaf.category = category;
}

CategoryMatch PrefixCategoryIndex::lookup(const std::string& message) const {
    size_t current = 0;
    for (char raw : message) {
        const auto& children = nodes[current].children;
        auto it = children.find(StringUtils::toLowerAscii(raw));
        if (it == children.end()) {
            return otherCategory();
        }
        current = it->second;
        if (nodes[current].terminal) {
            return CategoryMatch{nodes[current].priority, nodes[current].category};
        }
    }
    return otherCategory();
}

CategoryMatch PrefixCategoryIndex::otherCategory() const {
    return CategoryMatch{Constants::MAX_PRIORITY, otherName};
}

}
