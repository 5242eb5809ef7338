#include "core/Repository.hpp"

#include <algorithm>
#include <fstream>
#include <map>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace relnotes {

namespace {
    bool isFullHash(const std::string& s) {
        if (s.size() != Constants::SHA1_HEX_LENGTH) return false;
        return std::all_of(s.begin(), s.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        });
    }

    const char* const TAGS_PREFIX = "refs/tags/";
}

Repository::Repository(const fs::path& root) : rootPath(root) {}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) return Error{ErrorCode::IoError, "Cannot resolve path " + start.string() + ": " + ec.message()};
    while (true) {
        fs::path gd = cur / ".git";
        if (fs::exists(gd, ec) && fs::is_directory(gd, ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a git repository: " + start.string()};
        }
        cur = cur.parent_path();
    }
}

Expected<std::string> Repository::readRefFile(const std::string& refName, int depth) const {
    if (depth > Constants::MAX_SYMREF_DEPTH) {
        return Error{ErrorCode::CorruptObject, "symbolic ref loop: " + refName};
    }
    fs::path refFile = gitDir() / refName;
    std::error_code ec;
    if (!fs::is_regular_file(refFile, ec)) {
        return Error{ErrorCode::NotFound, "No such ref: " + refName};
    }
    std::ifstream rf(refFile);
    if (!rf) {
        return Error{ErrorCode::IoError, "Failed to read ref file " + refName};
    }
    std::string content;
    std::getline(rf, content);
    if (rf.bad()) {
        return Error{ErrorCode::IoError, "Failed to read ref file " + refName};
    }
    content = StringUtils::trim(content);

    // Symbolic ref, e.g. refs/remotes/origin/HEAD
    if (content.rfind("ref: ", 0) == 0) {
        return readRefFile(StringUtils::trim(content.substr(5)), depth + 1);
    }
    return content;
}

Expected<std::vector<std::pair<std::string, std::string>>> Repository::readPackedRefs() const {
    std::vector<std::pair<std::string, std::string>> refs;
    fs::path packed = gitDir() / "packed-refs";
    std::error_code ec;
    if (!fs::exists(packed, ec)) return refs;

    std::ifstream in(packed);
    if (!in) return Error{ErrorCode::IoError, "Failed to read packed-refs"};
    std::string line;
    while (std::getline(in, line)) {
        line = StringUtils::trim(line);
        // '#' header and '^' peeled lines; peeling is done through the object store
        if (line.empty() || line[0] == '#' || line[0] == '^') continue;
        size_t space = line.find(' ');
        if (space == std::string::npos) continue;
        refs.emplace_back(line.substr(space + 1), line.substr(0, space));
    }
    if (in.bad()) return Error{ErrorCode::IoError, "Failed to read packed-refs"};
    return refs;
}

Expected<std::string> Repository::resolveRef(const std::string& name) const {
    std::string rev = StringUtils::trim(name);
    if (rev.empty()) return Error{ErrorCode::InvalidArgs, "Empty revision"};
    if (isFullHash(rev)) return StringUtils::toLower(rev);

    std::vector<std::string> candidates;
    if (rev == "HEAD" || rev.rfind("refs/", 0) == 0) {
        candidates.push_back(rev);
    } else {
        candidates.push_back("refs/heads/" + rev);
        candidates.push_back(TAGS_PREFIX + rev);
        candidates.push_back("refs/remotes/" + rev);
    }

    auto packed = readPackedRefs();
    if (!packed) return packed.error();

    for (const auto& candidate : candidates) {
        auto loose = readRefFile(candidate);
        if (loose) return loose.value();
        if (loose.error().code != ErrorCode::NotFound) return loose.error();

        for (const auto& [refName, hash] : packed.value()) {
            if (refName == candidate) return hash;
        }
    }
    return Error{ErrorCode::NotFound, "Unknown revision: " + rev};
}

Expected<std::string> Repository::getCurrentBranch() const {
    fs::path headPath = gitDir() / "HEAD";
    std::ifstream headFile(headPath);
    if (!headFile) {
        return Error{ErrorCode::IoError, "Failed to read HEAD file"};
    }
    std::string headContent;
    std::getline(headFile, headContent);
    headContent = StringUtils::trim(headContent);

    if (headContent.rfind("ref: refs/heads/", 0) == 0) {
        return headContent.substr(16);
    }
    return Error{ErrorCode::NotFound, "HEAD is detached"};
}

Expected<std::vector<std::pair<std::string, std::string>>> Repository::listTags() const {
    std::map<std::string, std::string> tags;

    auto packed = readPackedRefs();
    if (!packed) return packed.error();
    const std::string prefix = TAGS_PREFIX;
    for (const auto& [refName, hash] : packed.value()) {
        if (refName.rfind(prefix, 0) == 0) tags[refName.substr(prefix.size())] = hash;
    }

    fs::path tagsDir = gitDir() / "refs" / "tags";
    std::error_code ec;
    if (fs::is_directory(tagsDir, ec)) {
        for (auto it = fs::recursive_directory_iterator(tagsDir, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            std::string tagName = fs::relative(it->path(), tagsDir).generic_string();
            auto hash = readRefFile(prefix + tagName);
            if (!hash) return hash.error();
            tags[tagName] = hash.value();
        }
        if (ec) return Error{ErrorCode::IoError, "Failed to read tags directory: " + ec.message()};
    }

    return std::vector<std::pair<std::string, std::string>>(tags.begin(), tags.end());
}

}
