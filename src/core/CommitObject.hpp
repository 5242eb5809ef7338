#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "util/StringUtils.hpp"

namespace relnotes {

/**
 * @brief A commit as delivered by a history provider
 *
 * Remote providers fill the login fields (the hosting account that authored
 * or committed the change); local providers only know display names and
 * emails, so the logins stay empty there.
 */
struct CommitObject {
    std::string hash;              // Commit SHA (hex)
    std::vector<std::string> parentHashes;  // 0 for root, 1+ for merges
    std::string authorLogin;       // Hosting account login, empty if unknown
    std::string committerLogin;
    std::string authorName;        // Display name from the commit header
    std::string authorEmail;
    int64_t authorTimestamp{0};    // Unix timestamp
    std::string committerName;
    std::string committerEmail;
    int64_t committerTimestamp{0};
    std::string message;           // Full commit message

    /// First line of the message, split on CR-LF or LF
    std::string shortMessage() const {
        return StringUtils::firstLine(message);
    }

    /// First 7 characters of the hash
    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }

    /// Author login, else committer login, else empty
    const std::string& primaryLogin() const {
        return !authorLogin.empty() ? authorLogin : committerLogin;
    }
};

}
