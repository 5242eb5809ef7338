#include "test_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

namespace fs = std::filesystem;

namespace relnotes::test::utils {

namespace {
    std::string zlibCompress(const std::string& data) {
        uLongf bound = compressBound(static_cast<uLong>(data.size()));
        std::string out(bound, '\0');
        int rc = compress(reinterpret_cast<Bytef*>(&out[0]), &bound,
                          reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()));
        if (rc != Z_OK) throw std::runtime_error("zlib compress failed");
        out.resize(bound);
        return out;
    }

    void writeText(const fs::path& path, const std::string& content, std::ios::openmode mode = std::ios::trunc) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | mode);
        out << content;
    }

    std::string be32(uint32_t v) {
        std::string out(4, '\0');
        out[0] = static_cast<char>((v >> 24) & 0xff);
        out[1] = static_cast<char>((v >> 16) & 0xff);
        out[2] = static_cast<char>((v >> 8) & 0xff);
        out[3] = static_cast<char>(v & 0xff);
        return out;
    }

    std::string rawId(const std::string& hex) {
        std::string raw;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            raw += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
        }
        return raw;
    }

    /// Pack entry header: type in bits 4-6, size in 4 + 7n bits
    std::string entryHeader(int type, uint64_t size) {
        std::string out;
        auto c = static_cast<unsigned char>((type << 4) | (size & 0x0f));
        size >>= 4;
        while (size) {
            out += static_cast<char>(c | 0x80);
            c = static_cast<unsigned char>(size & 0x7f);
            size >>= 7;
        }
        out += static_cast<char>(c);
        return out;
    }

    /// OFS_DELTA distance, encoded the way git writes it
    std::string ofsDistance(uint64_t distance) {
        unsigned char buf[16];
        size_t pos = sizeof(buf) - 1;
        buf[pos] = static_cast<unsigned char>(distance & 0x7f);
        while (distance >>= 7) {
            buf[--pos] = static_cast<unsigned char>(0x80 | (--distance & 0x7f));
        }
        return std::string(reinterpret_cast<char*>(buf) + pos, sizeof(buf) - pos);
    }

    std::string deltaVarint(uint64_t v) {
        std::string out;
        do {
            auto c = static_cast<unsigned char>(v & 0x7f);
            v >>= 7;
            if (v) c |= 0x80;
            out += static_cast<char>(c);
        } while (v);
        return out;
    }

    /// Delta that copies the common prefix and suffix of base and inserts the rest
    std::string makeDelta(const std::string& base, const std::string& target) {
        std::string delta = deltaVarint(base.size()) + deltaVarint(target.size());

        size_t prefix = 0;
        while (prefix < base.size() && prefix < target.size() && prefix < 0xffff && base[prefix] == target[prefix]) {
            ++prefix;
        }
        size_t suffix = 0;
        size_t room = std::min(base.size(), target.size()) - prefix;
        while (suffix < room && suffix < 0xffff &&
               base[base.size() - 1 - suffix] == target[target.size() - 1 - suffix]) {
            ++suffix;
        }

        if (prefix > 0) {
            delta += static_cast<char>(0x80 | 0x30);
            delta += static_cast<char>(prefix & 0xff);
            delta += static_cast<char>((prefix >> 8) & 0xff);
        }
        for (size_t pos = prefix; pos < target.size() - suffix; pos += 127) {
            size_t n = std::min<size_t>(127, target.size() - suffix - pos);
            delta += static_cast<char>(n);
            delta += target.substr(pos, n);
        }
        if (suffix > 0) {
            uint32_t offset = static_cast<uint32_t>(base.size() - suffix);
            delta += static_cast<char>(0x80 | 0x0f | 0x30);
            for (int i = 0; i < 4; ++i) delta += static_cast<char>((offset >> (8 * i)) & 0xff);
            delta += static_cast<char>(suffix & 0xff);
            delta += static_cast<char>((suffix >> 8) & 0xff);
        }
        return delta;
    }

    int packTypeCode(const std::string& type) {
        if (type == "commit") return 1;
        if (type == "tree") return 2;
        if (type == "blob") return 3;
        if (type == "tag") return 4;
        throw std::runtime_error("unknown object type " + type);
    }
}

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "relnotes_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    if (fs::exists(dir)) {
        fs::remove_all(dir);
    }
}

fs::path createFile(const fs::path& baseDir, const std::string& filename, const std::string& content) {
    fs::path filePath = baseDir / filename;
    writeText(filePath, content);
    return filePath;
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

CommitObject makeCommit(const std::string& sha, const std::string& message,
                        const std::string& authorLogin, const std::string& authorName) {
    CommitObject c;
    c.hash = sha;
    c.message = message;
    c.authorLogin = authorLogin;
    c.authorName = authorName;
    return c;
}

// ---------------------------------------------------------------------------
// GitFixture

GitFixture::GitFixture(const fs::path& root) : rootPath(root) {
    fs::create_directories(gitDir() / "objects");
    fs::create_directories(gitDir() / "refs" / "heads");
    fs::create_directories(gitDir() / "refs" / "tags");
    setHeadBranch("main");
}

std::string GitFixture::nextHash() {
    char buf[41];
    std::snprintf(buf, sizeof(buf), "%040x", nextId++);
    return std::string(buf);
}

void GitFixture::writeObject(const std::string& hash, const std::string& type, const std::string& body) {
    written.push_back(StoredObject{hash, type, body});
    std::string full = type + " " + std::to_string(body.size());
    full += '\0';
    full += body;
    writeRawObjectFile(hash, zlibCompress(full));
}

void GitFixture::writeRawObjectFile(const std::string& hash, const std::string& bytes) {
    writeText(gitDir() / "objects" / hash.substr(0, 2) / hash.substr(2), bytes);
}

std::string GitFixture::commit(const std::string& message, const std::vector<std::string>& parents,
                               int64_t timestamp, const std::string& authorName, const std::string& authorEmail) {
    std::ostringstream body;
    body << "tree " << std::string(40, '0') << "\n";
    for (const auto& p : parents) body << "parent " << p << "\n";
    body << "author " << authorName << " <" << authorEmail << "> " << timestamp << " +0000\n";
    body << "committer " << authorName << " <" << authorEmail << "> " << timestamp << " +0000\n";
    body << "\n" << message;

    std::string hash = nextHash();
    writeObject(hash, "commit", body.str());
    return hash;
}

std::string GitFixture::annotatedTag(const std::string& name, const std::string& target, int64_t timestamp) {
    std::ostringstream body;
    body << "object " << target << "\n";
    body << "type commit\n";
    body << "tag " << name << "\n";
    body << "tagger Release Bot <bot@example.com> " << timestamp << " +0000\n";
    body << "\nRelease " << name << "\n";

    std::string hash = nextHash();
    writeObject(hash, "tag", body.str());
    return hash;
}

void GitFixture::setRef(const std::string& refName, const std::string& hash) {
    writeText(gitDir() / "refs" / refName, hash + "\n");
}

void GitFixture::addPackedRef(const std::string& refName, const std::string& hash) {
    fs::path packed = gitDir() / "packed-refs";
    if (!fs::exists(packed)) {
        writeText(packed, "# pack-refs with: peeled fully-peeled sorted \n");
    }
    writeText(packed, hash + " " + refName + "\n", std::ios::app);
}

void GitFixture::setHeadBranch(const std::string& branch) {
    writeText(gitDir() / "HEAD", "ref: refs/heads/" + branch + "\n");
}

fs::path GitFixture::repack(const std::map<std::string, std::string>& ofsDeltas,
                           const std::map<std::string, std::string>& refDeltas,
                           const std::set<std::string>& keepLoose) {
    auto bodyOf = [this](const std::string& hash) -> const std::string& {
        for (const auto& obj : written) {
            if (obj.hash == hash) return obj.body;
        }
        throw std::runtime_error("repack: unknown delta base " + hash);
    };

    std::vector<const StoredObject*> packed;
    for (const auto& obj : written) {
        if (!keepLoose.count(obj.hash)) packed.push_back(&obj);
    }

    std::string pack = "PACK" + be32(2) + be32(static_cast<uint32_t>(packed.size()));
    std::map<std::string, uint64_t> offsets;  // raw id -> entry offset, sorted for the index
    std::map<std::string, uint64_t> offsetByHash;
    for (const StoredObject* obj : packed) {
        uint64_t offset = pack.size();
        auto ofs = ofsDeltas.find(obj->hash);
        auto ref = refDeltas.find(obj->hash);
        if (ofs != ofsDeltas.end()) {
            auto base = offsetByHash.find(ofs->second);
            if (base == offsetByHash.end()) throw std::runtime_error("repack: OFS_DELTA base not packed yet");
            std::string delta = makeDelta(bodyOf(ofs->second), obj->body);
            pack += entryHeader(6, delta.size()) + ofsDistance(offset - base->second) + zlibCompress(delta);
        } else if (ref != refDeltas.end()) {
            std::string delta = makeDelta(bodyOf(ref->second), obj->body);
            pack += entryHeader(7, delta.size()) + rawId(ref->second) + zlibCompress(delta);
        } else {
            pack += entryHeader(packTypeCode(obj->type), obj->body.size()) + zlibCompress(obj->body);
        }
        offsets[rawId(obj->hash)] = offset;
        offsetByHash[obj->hash] = offset;
        fs::remove(gitDir() / "objects" / obj->hash.substr(0, 2) / obj->hash.substr(2));
    }
    pack += std::string(20, '\0');

    std::string idx = "\377tOc" + be32(2);
    for (int b = 0; b < 256; ++b) {
        uint32_t count = 0;
        for (const auto& entry : offsets) {
            if (static_cast<unsigned char>(entry.first[0]) <= b) ++count;
        }
        idx += be32(count);
    }
    for (const auto& entry : offsets) idx += entry.first;
    for (size_t i = 0; i < offsets.size(); ++i) idx += be32(0);  // crc32, not verified by readers here
    for (const auto& entry : offsets) idx += be32(static_cast<uint32_t>(entry.second));
    idx += std::string(40, '\0');

    char name[64];
    std::snprintf(name, sizeof(name), "pack-%040x", ++packCount);
    fs::path packDir = gitDir() / "objects" / "pack";
    writeText(packDir / (std::string(name) + ".idx"), idx);
    writeText(packDir / (std::string(name) + ".pack"), pack);
    return packDir / (std::string(name) + ".pack");
}

// ---------------------------------------------------------------------------
// FakeHistoryProvider

bool FakeHistoryProvider::popFailure(const std::string& operation, Error& out) {
    ++calls[operation];
    auto it = failures.find(operation);
    if (it == failures.end() || it->second.empty()) return false;
    out = it->second.front();
    it->second.pop_front();
    return true;
}

Expected<RepositoryInfo> FakeHistoryProvider::getRepository(const std::string&, const std::string&) {
    Error err;
    if (popFailure("getRepository", err)) return err;
    return RepositoryInfo{defaultBranch};
}

Expected<ReleaseLookup> FakeHistoryProvider::getLatestRelease(const std::string&, const std::string&) {
    Error err;
    if (popFailure("getLatestRelease", err)) return err;
    return latestRelease;
}

Expected<std::vector<CommitObject>> FakeHistoryProvider::compareRefs(const std::string&, const std::string&,
                                                                     const std::string& base, const std::string& head) {
    Error err;
    if (popFailure("compareRefs", err)) return err;
    compareCalls.emplace_back(base, head);
    return compareResult;
}

Expected<std::vector<CommitObject>> FakeHistoryProvider::listCommits(const std::string&, const std::string&,
                                                                     const std::string& ref, int page, int pageSize) {
    Error err;
    if (popFailure("listCommits", err)) return err;
    listedRefs.push_back(ref);

    auto it = historyByRef.find(ref);
    if (it == historyByRef.end()) {
        return Error{ErrorCode::NotFound, "No commit found for SHA: " + ref};
    }
    const auto& all = it->second;
    size_t start = static_cast<size_t>(page - 1) * static_cast<size_t>(pageSize);
    std::vector<CommitObject> slice;
    for (size_t i = start; i < all.size() && i < start + static_cast<size_t>(pageSize); ++i) {
        slice.push_back(all[i]);
    }
    return slice;
}

} // namespace relnotes::test::utils
