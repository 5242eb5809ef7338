#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/CategoryDefinition.hpp"

namespace relnotes {

/// (priority, category name) as returned by a lookup
struct CategoryMatch {
    int priority{0};
    std::string name;

    bool operator==(const CategoryMatch& other) const {
        return priority == other.priority && name == other.name;
    }
};

/**
 * @brief Prefix tree mapping lowercase message prefixes to categories
 *
 * Nodes live in one growable arena; each child edge is an index into that
 * arena keyed by the lowercase character. Node 0 is the root and is never
 * terminal.
 *
 * Lookup walks the message one character at a time and returns on the first
 * terminal node reached, so a message matches the shortest registered prefix
 * it starts with. Messages that leave the tree or end before a terminal node
 * fall back to ("Other", MAX_PRIORITY).
 *
 * When one registered prefix is a proper prefix of another, which category
 * wins is unspecified.
 */
class PrefixCategoryIndex {
public:
    /// A registered category group in insertion order
    struct Group {
        int priority{0};
        std::string category;
        std::vector<std::string> prefixes;
    };

    explicit PrefixCategoryIndex(std::string otherCategoryName = "Other");
    PrefixCategoryIndex(std::string otherCategoryName, const std::vector<CategoryDefinition>& categories);

    /// Register a category and insert every one of its prefixes
    void insert(int priority, const std::string& category, const std::vector<std::string>& prefixes);

    CategoryMatch lookup(const std::string& message) const;

    /// The fallback returned when nothing matches
    CategoryMatch otherCategory() const;

    /// Registered groups in insertion order
    const std::vector<Group>& groups() const { return groupList; }

    size_t size() const { return groupList.size(); }
    size_t nodeCount() const { return nodes.size(); }

private:
    struct Node {
        std::unordered_map<char, size_t> children;
        bool terminal{false};
        int priority{0};
        std::string category;
    };

    std::vector<Node> nodes;
    std::vector<Group> groupList;
    std::string otherName;

    void insertPrefix(int priority, const std::string& prefix, const std::string& category);
};

}
