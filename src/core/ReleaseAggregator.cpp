#include "core/ReleaseAggregator.hpp"

#include <sstream>

#include "core/Constants.hpp"
#include "core/ReleaseNoteFormatter.hpp"
#include "util/Logger.hpp"

namespace relnotes {

ReleaseAggregator::ReleaseAggregator(IHistoryProvider& provider, const CommitClassifier& classifier, ResilientFetch& fetch)
    : provider(provider),
      classifier(classifier),
      fetch(fetch),
      maxPages(Constants::MAX_PAGINATION_PAGES),
      pageSize(Constants::HISTORY_PAGE_SIZE) {}

Expected<std::optional<std::string>> ReleaseAggregator::resolveBaseRef(const ReleaseRequest& request) {
    if (request.baseRef && !StringUtils::trim(*request.baseRef).empty()) {
        return std::optional<std::string>(*request.baseRef);
    }

    auto latest = fetch.execute("get latest release", [&] {
        return provider.getLatestRelease(request.owner, request.repo);
    });
    if (!latest) return latest.error();

    if (!latest.value().found) {
        Logger::instance().info("No existing releases found - using entire commit history");
        return std::optional<std::string>();
    }
    Logger::instance().info("Latest release: " + latest.value().tagName);
    return std::optional<std::string>(latest.value().tagName);
}

Expected<std::string> ReleaseAggregator::resolveHeadRef(const ReleaseRequest& request) {
    auto repoInfo = fetch.execute("get repository", [&] {
        return provider.getRepository(request.owner, request.repo);
    });
    if (!repoInfo) return repoInfo.error();

    if (request.headRef && !StringUtils::trim(*request.headRef).empty()) {
        return *request.headRef;
    }
    if (repoInfo.value().defaultBranch.empty()) {
        return Error{ErrorCode::NotFound, "repository " + request.owner + "/" + request.repo + " has no default branch"};
    }
    return repoInfo.value().defaultBranch;
}

Expected<bool> ReleaseAggregator::walkHistory(const std::string& owner, const std::string& repo, const std::string& ref,
                                              const std::function<void(std::vector<CommitObject>&)>& onPage) {
    int page = 1;
    for (; page <= maxPages; ++page) {
        auto commits = fetch.execute("list commits page " + std::to_string(page), [&] {
            return provider.listCommits(owner, repo, ref, page, pageSize);
        });
        if (!commits) return commits.error();
        if (commits.value().empty()) break;
        onPage(commits.value());
    }

    if (page > maxPages) {
        Logger::instance().warn("Reached max pagination limit (" + std::to_string(maxPages) +
                                ") when fetching history from " + ref);
        return true;
    }
    return false;
}

Expected<std::vector<CommitObject>> ReleaseAggregator::fetchWindowCommits(const ReleaseRequest& request,
                                                                          const ReleaseWindow& window) {
    if (window.baseRef) {
        return fetch.execute("compare " + *window.baseRef + "..." + window.headRef, [&] {
            return provider.compareRefs(request.owner, request.repo, *window.baseRef, window.headRef);
        });
    }

    std::vector<CommitObject> all;
    auto walked = walkHistory(request.owner, request.repo, window.headRef, [&](std::vector<CommitObject>& page) {
        for (auto& c : page) all.push_back(std::move(c));
    });
    if (!walked) return walked.error();
    return all;
}

Expected<AuthorSet> ReleaseAggregator::collectAuthorsReachableFrom(const std::string& owner, const std::string& repo,
                                                                   const std::string& ref, bool& truncated) {
    AuthorSet authors;
    auto walked = walkHistory(owner, repo, ref, [&](std::vector<CommitObject>& page) {
        for (const auto& c : page) {
            AuthorIdentityResolver::addAll(authors, AuthorIdentityResolver::extractAuthors(c));
        }
    });
    if (!walked) return walked.error();
    truncated = walked.value();
    return authors;
}

Expected<AggregationResult> ReleaseAggregator::aggregate(const ReleaseRequest& request) {
    AggregationResult result;

    auto base = resolveBaseRef(request);
    if (!base) return base.error();
    result.window.baseRef = base.value();

    auto head = resolveHeadRef(request);
    if (!head) return head.error();
    result.window.headRef = head.value();

    Logger::instance().info("Comparing " + result.window.baseRef.value_or("(all history)") + " -> " +
                            result.window.headRef);

    auto commits = fetchWindowCommits(request, result.window);
    if (!commits) return commits.error();
    result.windowCommits = std::move(commits.value());
    Logger::instance().info("Found " + std::to_string(result.windowCommits.size()) + " commits since last release");

    for (const auto& c : result.windowCommits) {
        AuthorIdentityResolver::addAll(result.authorsInWindow, AuthorIdentityResolver::extractAuthors(c));
    }

    // Nothing precedes "all of history"
    if (result.window.baseRef) {
        auto before = collectAuthorsReachableFrom(request.owner, request.repo, *result.window.baseRef,
                                                  result.historyTruncated);
        if (!before) return before.error();
        result.authorsBeforeWindow = std::move(before.value());
    }

    result.newAuthors = AuthorIdentityResolver::difference(result.authorsInWindow, result.authorsBeforeWindow);
    result.grouped = classifier.group(result.windowCommits);

    Logger::instance().debug(std::to_string(result.authorsInWindow.size()) + " authors in window, " +
                             std::to_string(result.newAuthors.size()) + " new");
    return result;
}

Expected<std::string> ReleaseAggregator::generate(const ReleaseRequest& request) {
    std::string version = request.version.empty() ? request.headRef.value_or("") : request.version;
    Logger::instance().info("Generating release notes for " + request.owner + "/" + request.repo +
                            (version.empty() ? std::string() : " version " + version));

    auto aggregated = aggregate(request);
    if (!aggregated) return aggregated.error();
    const AggregationResult& result = aggregated.value();

    if (version.empty()) version = result.window.headRef;
    std::string url = changelogUrl(request.owner, request.repo, result.window.baseRef, version);

    return ReleaseNoteFormatter::format(request.owner, request.repo, url, result.authorsInWindow,
                                        result.newAuthors, result.grouped, classifier);
}

std::string ReleaseAggregator::changelogUrl(const std::string& owner, const std::string& repo,
                                            const std::optional<std::string>& baseRef, const std::string& version) {
    std::ostringstream url;
    url << Constants::GITHUB_URL << "/" << owner << "/" << repo;
    if (baseRef && !baseRef->empty()) {
        url << "/compare/" << *baseRef << "..." << version;
    } else {
        url << "/commits/" << version;
    }
    return url.str();
}

}
