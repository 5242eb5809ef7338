#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "util/Expected.hpp"

namespace relnotes {

/// Thrown by ObjectStore; the code says whether the object was missing or malformed
class ObjectStoreError : public std::runtime_error {
public:
    ObjectStoreError(ErrorCode code, const std::string& what) : std::runtime_error(what), errorCode(code) {}
    ErrorCode code() const { return errorCode; }

private:
    ErrorCode errorCode;
};

class PackFile;

/// Decoded object: type and body, from a loose file or a pack
struct RawObject {
    std::string type;   // "commit", "tag", "tree", "blob"
    std::string body;
};

/**
 * @brief Read-only access to a git repository's objects
 *
 * Storage Layout (Git standard):
 *   .git/objects/<first-2-chars>/<remaining-38-chars>
 *   Example: hash "abc123..." -> .git/objects/ab/c123...
 *   .git/objects/pack/pack-<id>.{idx,pack}
 *
 * Each loose file is zlib-deflated "<type> <size>\0<content>". Loose objects
 * are looked up first, then every pack in .git/objects/pack (see PackFile).
 * Packs are opened on first use.
 */
class ObjectStore {
public:
    /// @param gitDir Path to the .git directory
    explicit ObjectStore(const std::filesystem::path& gitDir);
    ~ObjectStore();

    /// Returns path to .git/objects
    std::filesystem::path objectsDir() const;

    /// Get path for object: .git/objects/<aa>/<bbbb...>
    std::filesystem::path getObjectPath(const std::string& hash) const;

    /// True when the object exists loose or in a pack; throws ObjectStoreError if a pack index is unreadable
    bool hasObject(const std::string& hash) const;

    /**
     * @brief Read, inflate and split an object into type and body
     * @throws ObjectStoreError NotFound, IoError or CorruptObject
     */
    RawObject readObject(const std::string& hash) const;

    /**
     * @brief Read and parse a commit object
     *
     * Git commit format:
     *   tree <hash>
     *   parent <hash>            (0..n)
     *   author Name <email> <timestamp> <timezone>
     *   committer Name <email> <timestamp> <timezone>
     *   <other headers, possibly continued on lines starting with a space>
     *
     *   <commit message>
     */
    CommitObject readCommit(const std::string& hash) const;

    /**
     * @brief Follow annotated tags until a non-tag object
     * @return Hash of the first non-tag object (the commit for release tags)
     */
    std::string peel(const std::string& hash) const;

    /// Parse a commit body (without the loose-object header)
    static CommitObject parseCommit(const std::string& hash, const std::string& body);

private:
    std::filesystem::path gitDir;
    mutable std::vector<std::unique_ptr<PackFile>> packs;
    mutable bool packsLoaded{false};

    RawObject readLoose(const std::string& hash) const;
    RawObject readPacked(const PackFile& pack, uint64_t offset, const std::string& hash) const;
    const std::vector<std::unique_ptr<PackFile>>& loadPacks() const;
    /// Pack holding @p hash, or nullptr; @p offset receives the entry offset
    const PackFile* findPacked(const std::string& hash, uint64_t& offset) const;
};

}
