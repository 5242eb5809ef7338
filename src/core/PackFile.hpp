#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"

namespace relnotes {

/// Object type codes stored in pack entry headers
enum class PackObjectType {
    Commit = 1,
    Tree = 2,
    Blob = 3,
    Tag = 4,
    OfsDelta = 6,
    RefDelta = 7
};

/// One inflated pack entry. Delta entries carry the delta and name their base.
struct PackEntry {
    PackObjectType type{PackObjectType::Blob};
    std::string data;
    uint64_t baseOffset{0};   // OfsDelta: absolute offset of the base entry
    std::string baseHash;     // RefDelta: hex id of the base object
};

/**
 * @brief Read-only access to one packfile and its version 2 index
 *
 * Storage Layout (Git standard):
 *   .git/objects/pack/pack-<id>.idx
 *     "\377tOc", version 2, fan-out[256], sorted ids[N] (20 bytes each),
 *     crc32[N], offset32[N], offset64[M], pack checksum, index checksum
 *   .git/objects/pack/pack-<id>.pack
 *     "PACK", version, count, entries, checksum
 *
 * Each entry is a variable-length type/size header followed by zlib data.
 * OFS_DELTA entries also carry a negative offset to their base and
 * REF_DELTA entries the 20-byte id of theirs. Checksums are not verified.
 */
class PackFile {
public:
    /**
     * @param indexPath Path to a pack-*.idx file; the .pack sits beside it
     * @throws ObjectStoreError IoError or CorruptObject
     */
    explicit PackFile(const std::filesystem::path& indexPath);

    const std::filesystem::path& packPath() const { return pack; }
    size_t objectCount() const { return offsets.size(); }

    /// Look up an object id; on success @p offset is its entry offset in the pack
    bool find(const std::string& hash, uint64_t& offset) const;

    /**
     * @brief Read and inflate the entry at @p offset
     * @throws ObjectStoreError IoError or CorruptObject
     */
    PackEntry readEntry(uint64_t offset) const;

    /// "commit", "tree", "blob" or "tag"; empty for delta types
    static std::string typeName(PackObjectType type);

    /**
     * @brief Rebuild an object from its base and a git delta
     *
     * Delta format: base size and result size as little-endian base-128
     * varints, then copy (high bit set) and insert (1..127) instructions.
     * @throws ObjectStoreError CorruptObject on a malformed delta
     */
    static std::string applyDelta(const std::string& base, const std::string& delta);

private:
    std::filesystem::path pack;
    std::string ids;                  // N * 20 raw bytes, sorted
    std::vector<uint64_t> offsets;    // parallel to ids
    std::vector<uint32_t> fanout;     // 256 cumulative counts
    mutable std::ifstream packStream;

    void loadIndex(const std::filesystem::path& indexPath);
};

}
