#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace relnotes {

/**
 * @brief Reference lookup for an on-disk git repository
 *
 * Repository layout read here:
 *   .git/
 *     HEAD              - "ref: refs/heads/main" or a detached commit hash
 *     packed-refs       - "<hash> <refname>" lines, "^<hash>" peel lines
 *     refs/
 *       heads/<branch>  - Branch tip commit hash
 *       tags/<tag>      - Lightweight tag or annotated tag object hash
 *
 * Loose ref files take precedence over packed-refs entries.
 */
class Repository {
public:
    /// @param root Working tree root (the directory that contains .git)
    explicit Repository(const std::filesystem::path& root);

    /**
     * @brief Find repository root by searching upwards for .git
     * @param start Starting directory (usually current working directory)
     * @return Absolute path to repository root, or NotARepository
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    const std::filesystem::path& root() const { return rootPath; }

    /// Get .git directory path
    std::filesystem::path gitDir() const { return rootPath / ".git"; }

    /**
     * @brief Resolve a revision name to an object hash
     *
     * Accepts a full 40-char hash, "HEAD", a full ref ("refs/tags/v1"),
     * or a short name searched in refs/heads, refs/tags and refs/remotes.
     * The result may name an annotated tag object; peel it via ObjectStore.
     */
    Expected<std::string> resolveRef(const std::string& name) const;

    /**
     * @brief Branch named by a symbolic HEAD
     * @return Branch name, or NotFound when HEAD is detached
     */
    Expected<std::string> getCurrentBranch() const;

    /// (tag name, object hash) for every tag, loose and packed, sorted by name
    Expected<std::vector<std::pair<std::string, std::string>>> listTags() const;

private:
    std::filesystem::path rootPath;

    Expected<std::vector<std::pair<std::string, std::string>>> readPackedRefs() const;
    /// Loose ref value, following up to Constants::MAX_SYMREF_DEPTH "ref: " hops
    Expected<std::string> readRefFile(const std::string& refName, int depth = 0) const;
};

}
