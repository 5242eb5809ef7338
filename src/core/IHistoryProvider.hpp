#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/CommitObject.hpp"
#include "util/Expected.hpp"

namespace relnotes {

struct RepositoryInfo {
    std::string defaultBranch;
};

/**
 * @brief Result of a latest-release lookup
 *
 * "No release yet" is an expected answer, so it is a value rather than an
 * error: found == false means the whole history is the release window.
 */
struct ReleaseLookup {
    bool found{false};
    std::string tagName;

    static ReleaseLookup notFound() { return ReleaseLookup{}; }
    static ReleaseLookup of(std::string tag) { return ReleaseLookup{true, std::move(tag)}; }
};

/**
 * @brief Commit history capability consumed by the release aggregator
 *
 * Implementations report failures as Error values using the shared
 * taxonomy (RateLimited with rateLimitReset, ServerError, NetworkError,
 * Timeout, NotFound, Unauthorized, ...), which is what ResilientFetch
 * keys its retry decisions on.
 */
class IHistoryProvider {
public:
    virtual ~IHistoryProvider() = default;

    virtual Expected<RepositoryInfo> getRepository(const std::string& owner, const std::string& repo) = 0;

    virtual Expected<ReleaseLookup> getLatestRelease(const std::string& owner, const std::string& repo) = 0;

    /// Commits reachable from @p head but not from @p base, oldest first
    virtual Expected<std::vector<CommitObject>> compareRefs(const std::string& owner, const std::string& repo,
                                                            const std::string& base, const std::string& head) = 0;

    /**
     * @brief One page of the history reachable from @p ref, newest first
     * @param page 1-based page number
     * @return Empty vector once the history is exhausted
     */
    virtual Expected<std::vector<CommitObject>> listCommits(const std::string& owner, const std::string& repo,
                                                            const std::string& ref, int page, int pageSize) = 0;
};

}
