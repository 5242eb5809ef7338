#include "core/LocalHistoryProvider.hpp"

#include <algorithm>
#include <queue>
#include <utility>

#include "util/Logger.hpp"

namespace relnotes {

namespace {
    Error toError(const ObjectStoreError& e) {
        return Error{e.code(), e.what()};
    }

    struct NewestFirst {
        bool operator()(const std::pair<int64_t, std::string>& a, const std::pair<int64_t, std::string>& b) const {
            if (a.first != b.first) return a.first < b.first;
            return a.second > b.second;
        }
    };
}

LocalHistoryProvider::LocalHistoryProvider(const std::filesystem::path& repoRoot)
    : repository(repoRoot), store(repository.gitDir()) {}

const CommitObject& LocalHistoryProvider::loadCommit(const std::string& hash) {
    auto it = commitCache.find(hash);
    if (it != commitCache.end()) return it->second;
    return commitCache.emplace(hash, store.readCommit(hash)).first->second;
}

Expected<std::string> LocalHistoryProvider::resolveCommit(const std::string& rev) {
    auto resolved = repository.resolveRef(rev);
    if (!resolved) return resolved.error();
    try {
        std::string hash = store.peel(resolved.value());
        loadCommit(hash);
        return hash;
    } catch (const ObjectStoreError& e) {
        return toError(e);
    }
}

const std::vector<std::string>& LocalHistoryProvider::orderedHistory(const std::string& tip) {
    auto cached = historyCache.find(tip);
    if (cached != historyCache.end()) return cached->second;

    std::vector<std::string> order;
    std::unordered_set<std::string> seen{tip};
    std::priority_queue<std::pair<int64_t, std::string>, std::vector<std::pair<int64_t, std::string>>, NewestFirst> queue;
    queue.emplace(loadCommit(tip).committerTimestamp, tip);

    while (!queue.empty()) {
        std::string hash = queue.top().second;
        queue.pop();
        order.push_back(hash);
        const CommitObject& commit = loadCommit(hash);
        for (const auto& parent : commit.parentHashes) {
            if (seen.insert(parent).second) {
                queue.emplace(loadCommit(parent).committerTimestamp, parent);
            }
        }
    }
    return historyCache.emplace(tip, std::move(order)).first->second;
}

std::unordered_set<std::string> LocalHistoryProvider::reachableFrom(const std::string& tip) {
    const auto& order = orderedHistory(tip);
    return std::unordered_set<std::string>(order.begin(), order.end());
}

Expected<RepositoryInfo> LocalHistoryProvider::getRepository(const std::string&, const std::string&) {
    auto branch = repository.getCurrentBranch();
    if (branch) return RepositoryInfo{branch.value()};
    if (branch.error().code == ErrorCode::NotFound) {
        // Detached HEAD: the checked-out commit is the best default
        return RepositoryInfo{"HEAD"};
    }
    return branch.error();
}

Expected<ReleaseLookup> LocalHistoryProvider::getLatestRelease(const std::string&, const std::string&) {
    auto tags = repository.listTags();
    if (!tags) return tags.error();

    bool found = false;
    std::string bestTag;
    int64_t bestTime = 0;
    for (const auto& [name, objectHash] : tags.value()) {
        std::string commitHash;
        try {
            commitHash = store.peel(objectHash);
            int64_t when = loadCommit(commitHash).committerTimestamp;
            if (!found || when > bestTime || (when == bestTime && name > bestTag)) {
                found = true;
                bestTag = name;
                bestTime = when;
            }
        } catch (const ObjectStoreError& e) {
            // Tags on trees and blobs are not releases; missing or unreadable objects are errors
            if (e.code() != ErrorCode::CorruptObject) return toError(e);
            Logger::instance().debug("Skipping tag " + name + ": " + e.what());
        }
    }
    return found ? ReleaseLookup::of(bestTag) : ReleaseLookup::notFound();
}

Expected<std::vector<CommitObject>> LocalHistoryProvider::compareRefs(const std::string&, const std::string&,
                                                                      const std::string& base, const std::string& head) {
    auto baseHash = resolveCommit(base);
    if (!baseHash) return baseHash.error();
    auto headHash = resolveCommit(head);
    if (!headHash) return headHash.error();

    try {
        std::unordered_set<std::string> excluded = reachableFrom(baseHash.value());
        const auto& headOrder = orderedHistory(headHash.value());

        std::vector<CommitObject> commits;
        for (const auto& hash : headOrder) {
            if (!excluded.count(hash)) commits.push_back(loadCommit(hash));
        }
        // Compare views list the oldest change first
        std::reverse(commits.begin(), commits.end());
        return commits;
    } catch (const ObjectStoreError& e) {
        return toError(e);
    }
}

Expected<std::vector<CommitObject>> LocalHistoryProvider::listCommits(const std::string&, const std::string&,
                                                                      const std::string& ref, int page, int pageSize) {
    if (page < 1 || pageSize < 1) {
        return Error{ErrorCode::InvalidArgs, "page and page size must be positive"};
    }
    auto tip = resolveCommit(ref);
    if (!tip) return tip.error();

    try {
        const auto& order = orderedHistory(tip.value());
        size_t start = static_cast<size_t>(page - 1) * static_cast<size_t>(pageSize);
        std::vector<CommitObject> commits;
        for (size_t i = start; i < order.size() && i < start + static_cast<size_t>(pageSize); ++i) {
            commits.push_back(loadCommit(order[i]));
        }
        return commits;
    } catch (const ObjectStoreError& e) {
        return toError(e);
    }
}

}
