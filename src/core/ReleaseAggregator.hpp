#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/AuthorIdentity.hpp"
#include "core/CommitClassifier.hpp"
#include "core/CommitObject.hpp"
#include "core/IHistoryProvider.hpp"
#include "core/ResilientFetch.hpp"
#include "util/Expected.hpp"

namespace relnotes {

/// What the caller wants released; empty refs are resolved remotely
struct ReleaseRequest {
    std::string owner;
    std::string repo;
    std::optional<std::string> baseRef;
    std::optional<std::string> headRef;
    std::string version;        // heading/URL version; falls back to the head ref
};

/// base == nullopt means "entire reachable history" (no prior release)
struct ReleaseWindow {
    std::optional<std::string> baseRef;
    std::string headRef;
};

struct AggregationResult {
    ReleaseWindow window;
    std::vector<CommitObject> windowCommits;
    CategoryGrouping grouped;
    AuthorSet authorsInWindow;
    AuthorSet authorsBeforeWindow;
    AuthorSet newAuthors;
    bool historyTruncated{false};  // pagination cap hit, authorsBeforeWindow may be incomplete
};

/**
 * @brief Builds one release's categorized, attributed change list
 *
 * Steps, in order:
 *   1. base ref: explicit, else latest release tag, else none (whole history)
 *   2. head ref: explicit, else the repository's default branch
 *   3. window commits: compare(base, head), or all history from head
 *   4. authors in window
 *   5. authors before window: paged history from base (100 per page,
 *      at most 500 pages; hitting the cap only logs a warning)
 *   6. new authors = in window - before window
 *   7. classify and group window commits
 *
 * Every remote call goes through ResilientFetch. Any unrecovered failure
 * aborts the run; no partial result is returned.
 */
class ReleaseAggregator {
public:
    ReleaseAggregator(IHistoryProvider& provider, const CommitClassifier& classifier, ResilientFetch& fetch);

    Expected<AggregationResult> aggregate(const ReleaseRequest& request);

    /// aggregate() followed by ReleaseNoteFormatter::format()
    Expected<std::string> generate(const ReleaseRequest& request);

    Expected<std::optional<std::string>> resolveBaseRef(const ReleaseRequest& request);

    /// Authors of every commit reachable from @p ref, paging until empty or the cap
    Expected<AuthorSet> collectAuthorsReachableFrom(const std::string& owner, const std::string& repo,
                                                    const std::string& ref, bool& truncated);

    /// Compare URL with a base ref, commit-history URL without one
    static std::string changelogUrl(const std::string& owner, const std::string& repo,
                                    const std::optional<std::string>& baseRef, const std::string& version);

    void setMaxPages(int pages) { maxPages = pages; }
    void setPageSize(int size) { pageSize = size; }

private:
    IHistoryProvider& provider;
    const CommitClassifier& classifier;
    ResilientFetch& fetch;
    int maxPages;
    int pageSize;

    Expected<std::string> resolveHeadRef(const ReleaseRequest& request);
    Expected<std::vector<CommitObject>> fetchWindowCommits(const ReleaseRequest& request, const ReleaseWindow& window);

    /// Page through history from @p ref; the value is true if the page cap stopped the walk
    Expected<bool> walkHistory(const std::string& owner, const std::string& repo, const std::string& ref,
                               const std::function<void(std::vector<CommitObject>&)>& onPage);
};

}
