#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/IHistoryProvider.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace relnotes {

/**
 * @brief History provider backed by a local .git directory
 *
 * Owner and repo arguments are ignored; they only matter for URLs.
 * Local commits carry no hosting logins, so identities come from the
 * author/committer display names.
 *
 * Ordering follows `git log`: newest committer timestamp first, each commit
 * once, ties broken by hash. The latest release is the tag whose commit has
 * the newest committer timestamp.
 */
class LocalHistoryProvider : public IHistoryProvider {
public:
    explicit LocalHistoryProvider(const std::filesystem::path& repoRoot);

    Expected<RepositoryInfo> getRepository(const std::string& owner, const std::string& repo) override;
    Expected<ReleaseLookup> getLatestRelease(const std::string& owner, const std::string& repo) override;
    Expected<std::vector<CommitObject>> compareRefs(const std::string& owner, const std::string& repo,
                                                    const std::string& base, const std::string& head) override;
    Expected<std::vector<CommitObject>> listCommits(const std::string& owner, const std::string& repo,
                                                    const std::string& ref, int page, int pageSize) override;

private:
    Repository repository;
    ObjectStore store;
    std::unordered_map<std::string, CommitObject> commitCache;
    std::unordered_map<std::string, std::vector<std::string>> historyCache;  // tip hash -> ordered hashes

    /// Resolve and peel a revision to a commit hash
    Expected<std::string> resolveCommit(const std::string& rev);
    const CommitObject& loadCommit(const std::string& hash);
    const std::vector<std::string>& orderedHistory(const std::string& tip);
    std::unordered_set<std::string> reachableFrom(const std::string& tip);
};

}
