#include "core/ObjectStore.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

#include "core/Constants.hpp"
#include "core/PackFile.hpp"
#include "util/StringUtils.hpp"

#include <zlib.h>

namespace fs = std::filesystem;

namespace relnotes {

namespace {
    /**
     * @brief Decompress zlib data
     */
    std::string zlibDecompress(const std::vector<uint8_t>& compressed, const std::string& hash) {
        z_stream stream{};
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;

        if (inflateInit(&stream) != Z_OK) {
            throw ObjectStoreError(ErrorCode::InternalError, "zlib inflateInit failed");
        }

        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_in = const_cast<Bytef*>(compressed.data());

        std::string decompressed;
        std::vector<uint8_t> buffer(4096);

        int ret;
        do {
            stream.avail_out = static_cast<uInt>(buffer.size());
            stream.next_out = buffer.data();

            ret = inflate(&stream, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                inflateEnd(&stream);
                throw ObjectStoreError(ErrorCode::CorruptObject, "zlib inflate failed for object " + hash);
            }

            size_t have = buffer.size() - stream.avail_out;
            decompressed.append(reinterpret_cast<char*>(buffer.data()), have);

            // Truncated stream: no progress and no end marker
            if (ret == Z_OK && have == 0 && stream.avail_in == 0) {
                inflateEnd(&stream);
                throw ObjectStoreError(ErrorCode::CorruptObject, "truncated object " + hash);
            }
        } while (ret != Z_STREAM_END);

        inflateEnd(&stream);
        return decompressed;
    }

    /**
     * @brief Parse "Name <email> timestamp timezone" from an author/committer header
     */
    void parseSignature(const std::string& sig, std::string& name, std::string& email, int64_t& timestamp) {
        size_t emailStart = sig.find('<');
        size_t emailEnd = sig.find('>', emailStart == std::string::npos ? 0 : emailStart);
        if (emailStart == std::string::npos || emailEnd == std::string::npos) {
            name = StringUtils::trim(sig);
            return;
        }
        name = StringUtils::trim(sig.substr(0, emailStart));
        email = sig.substr(emailStart + 1, emailEnd - emailStart - 1);

        std::istringstream rest(sig.substr(emailEnd + 1));
        rest >> timestamp;
        if (rest.fail()) timestamp = 0;
    }

    std::string headerHash(const std::string& value, const std::string& commitHash, const char* field) {
        std::string hashPart = StringUtils::trim(value);
        if (hashPart.length() < Constants::SHA1_HEX_LENGTH) {
            throw ObjectStoreError(ErrorCode::CorruptObject,
                                   std::string("Invalid ") + field + " hash length in commit: " + commitHash);
        }
        return hashPart.substr(0, Constants::SHA1_HEX_LENGTH);
    }
}

ObjectStore::ObjectStore(const fs::path& gitDir) : gitDir(gitDir) {}

ObjectStore::~ObjectStore() = default;

fs::path ObjectStore::objectsDir() const {
    return gitDir / "objects";
}

fs::path ObjectStore::getObjectPath(const std::string& hash) const {
    if (hash.length() < Constants::OBJECT_DIR_LENGTH + 1) {
        throw ObjectStoreError(ErrorCode::InvalidArgs, "Invalid hash length: " + hash);
    }
    std::string dir = hash.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string file = hash.substr(Constants::OBJECT_DIR_LENGTH);
    return objectsDir() / dir / file;
}

bool ObjectStore::hasObject(const std::string& hash) const {
    if (hash.length() < Constants::OBJECT_DIR_LENGTH + 1) return false;
    std::error_code ec;
    if (fs::is_regular_file(getObjectPath(hash), ec)) return true;
    uint64_t offset = 0;
    return findPacked(hash, offset) != nullptr;
}

const std::vector<std::unique_ptr<PackFile>>& ObjectStore::loadPacks() const {
    if (packsLoaded) return packs;

    fs::path packDir = objectsDir() / "pack";
    std::error_code ec;
    std::vector<fs::path> indexes;
    if (fs::is_directory(packDir, ec)) {
        for (auto it = fs::directory_iterator(packDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& p = it->path();
            if (p.extension() == ".idx" && p.filename().string().rfind("pack-", 0) == 0) indexes.push_back(p);
        }
        if (ec) throw ObjectStoreError(ErrorCode::IoError, "Failed to list " + packDir.string() + ": " + ec.message());
    }
    std::sort(indexes.begin(), indexes.end());

    std::vector<std::unique_ptr<PackFile>> opened;
    for (const auto& idx : indexes) {
        opened.push_back(std::make_unique<PackFile>(idx));
    }
    packs = std::move(opened);
    packsLoaded = true;
    return packs;
}

const PackFile* ObjectStore::findPacked(const std::string& hash, uint64_t& offset) const {
    for (const auto& pack : loadPacks()) {
        if (pack->find(hash, offset)) return pack.get();
    }
    return nullptr;
}

RawObject ObjectStore::readObject(const std::string& hash) const {
    fs::path objPath = getObjectPath(hash);
    std::error_code ec;
    if (fs::exists(objPath, ec)) return readLoose(hash);

    uint64_t offset = 0;
    if (const PackFile* pack = findPacked(hash, offset)) {
        return readPacked(*pack, offset, hash);
    }
    throw ObjectStoreError(ErrorCode::NotFound, "Object not found: " + hash);
}

RawObject ObjectStore::readPacked(const PackFile& pack, uint64_t offset, const std::string& hash) const {
    // Walk the delta chain down to a whole object, then apply deltas back up
    std::vector<std::string> deltas;
    RawObject obj;
    PackEntry entry = pack.readEntry(offset);
    while (true) {
        if (deltas.size() > Constants::MAX_DELTA_CHAIN) {
            throw ObjectStoreError(ErrorCode::CorruptObject, "Delta chain too deep: " + hash);
        }
        if (entry.type == PackObjectType::OfsDelta) {
            deltas.push_back(std::move(entry.data));
            entry = pack.readEntry(entry.baseOffset);
        } else if (entry.type == PackObjectType::RefDelta) {
            deltas.push_back(std::move(entry.data));
            uint64_t baseOffset = 0;
            if (pack.find(entry.baseHash, baseOffset)) {
                entry = pack.readEntry(baseOffset);
            } else {
                // Thin packs may delta against an object stored elsewhere
                obj = readObject(entry.baseHash);
                break;
            }
        } else {
            obj.type = PackFile::typeName(entry.type);
            obj.body = std::move(entry.data);
            break;
        }
    }

    for (auto it = deltas.rbegin(); it != deltas.rend(); ++it) {
        obj.body = PackFile::applyDelta(obj.body, *it);
    }
    return obj;
}

RawObject ObjectStore::readLoose(const std::string& hash) const {
    fs::path objPath = getObjectPath(hash);

    std::ifstream in(objPath, std::ios::binary);
    if (!in) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to open object file for reading: " + hash);
    }
    std::vector<uint8_t> compressed((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ObjectStoreError(ErrorCode::IoError, "Error reading object file: " + hash);
    }
    if (compressed.empty()) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Object file is empty: " + hash);
    }

    std::string fullObject = zlibDecompress(compressed, hash);

    size_t headerEnd = fullObject.find('\0');
    if (headerEnd == std::string::npos) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid object format: " + hash);
    }
    std::string header = fullObject.substr(0, headerEnd);
    size_t space = header.find(' ');
    if (space == std::string::npos) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Invalid object header: " + hash);
    }

    RawObject obj;
    obj.type = header.substr(0, space);
    obj.body = fullObject.substr(headerEnd + 1);

    std::string sizeField = header.substr(space + 1);
    if (sizeField != std::to_string(obj.body.size())) {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Object size mismatch: " + hash);
    }
    return obj;
}

CommitObject ObjectStore::readCommit(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != "commit") {
        throw ObjectStoreError(ErrorCode::CorruptObject, "Not a commit object: " + hash + " (" + obj.type + ")");
    }
    return parseCommit(hash, obj.body);
}

std::string ObjectStore::peel(const std::string& hash) const {
    std::string current = hash;
    // Tag chains longer than this are certainly cyclic or corrupt
    for (int depth = 0; depth < 16; ++depth) {
        RawObject obj = readObject(current);
        if (obj.type != "tag") return current;
        if (obj.body.rfind("object ", 0) != 0) {
            throw ObjectStoreError(ErrorCode::CorruptObject, "Tag without object header: " + current);
        }
        size_t eol = obj.body.find('\n');
        current = StringUtils::trim(obj.body.substr(7, eol == std::string::npos ? std::string::npos : eol - 7));
    }
    throw ObjectStoreError(ErrorCode::CorruptObject, "Tag chain too deep: " + hash);
}

CommitObject ObjectStore::parseCommit(const std::string& hash, const std::string& body) {
    CommitObject commit;
    commit.hash = hash;

    // Headers end at the first blank line; everything after is the message
    size_t split = body.find("\n\n");
    std::string headers = split == std::string::npos ? body : body.substr(0, split);
    commit.message = split == std::string::npos ? std::string() : body.substr(split + 2);

    std::istringstream iss(headers);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty() || line[0] == ' ') {
            // Continuation of a multi-line header such as gpgsig
            continue;
        }
        if (line.rfind("parent ", 0) == 0) {
            commit.parentHashes.push_back(headerHash(line.substr(7), hash, "parent"));
        } else if (line.rfind("author ", 0) == 0) {
            parseSignature(line.substr(7), commit.authorName, commit.authorEmail, commit.authorTimestamp);
        } else if (line.rfind("committer ", 0) == 0) {
            parseSignature(line.substr(10), commit.committerName, commit.committerEmail, commit.committerTimestamp);
        } else if (line.rfind("tree ", 0) == 0) {
            headerHash(line.substr(5), hash, "tree");
        }
    }

    return commit;
}

}
