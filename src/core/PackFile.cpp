#include "core/PackFile.hpp"

#include <cstring>
#include <iterator>

#include <zlib.h>

namespace fs = std::filesystem;

namespace relnotes {

namespace {
    constexpr size_t RAW_ID_LENGTH = 20;
    constexpr size_t FANOUT_ENTRIES = 256;
    constexpr uint32_t LARGE_OFFSET_FLAG = 0x80000000u;

    ObjectStoreError corrupt(const fs::path& file, const std::string& what) {
        return ObjectStoreError(ErrorCode::CorruptObject, what + ": " + file.filename().string());
    }

    uint32_t readBE32(const std::string& buf, size_t pos) {
        const auto* p = reinterpret_cast<const unsigned char*>(buf.data() + pos);
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }

    uint64_t readBE64(const std::string& buf, size_t pos) {
        return (uint64_t(readBE32(buf, pos)) << 32) | readBE32(buf, pos + 4);
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    /// 40 hex chars to 20 raw bytes; false on malformed input
    bool hexToRaw(const std::string& hex, std::string& raw) {
        if (hex.size() != RAW_ID_LENGTH * 2) return false;
        raw.assign(RAW_ID_LENGTH, '\0');
        for (size_t i = 0; i < RAW_ID_LENGTH; ++i) {
            int hi = hexValue(hex[2 * i]);
            int lo = hexValue(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) return false;
            raw[i] = static_cast<char>((hi << 4) | lo);
        }
        return true;
    }

    std::string rawToHex(const char* raw) {
        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(RAW_ID_LENGTH * 2);
        for (size_t i = 0; i < RAW_ID_LENGTH; ++i) {
            auto byte = static_cast<unsigned char>(raw[i]);
            hex += digits[byte >> 4];
            hex += digits[byte & 0x0f];
        }
        return hex;
    }
}

PackFile::PackFile(const fs::path& indexPath) {
    loadIndex(indexPath);

    pack = indexPath;
    pack.replace_extension(".pack");
    packStream.open(pack, std::ios::binary);
    if (!packStream) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to open packfile: " + pack.string());
    }

    char header[12];
    packStream.read(header, sizeof(header));
    std::string head(header, static_cast<size_t>(packStream.gcount()));
    if (head.size() != sizeof(header) || head.compare(0, 4, "PACK") != 0) {
        throw corrupt(pack, "Invalid packfile header");
    }
    uint32_t version = readBE32(head, 4);
    if (version != 2 && version != 3) {
        throw corrupt(pack, "Unsupported packfile version " + std::to_string(version));
    }
    if (readBE32(head, 8) != offsets.size()) {
        throw corrupt(pack, "Packfile object count does not match its index");
    }
}

void PackFile::loadIndex(const fs::path& indexPath) {
    std::ifstream in(indexPath, std::ios::binary);
    if (!in) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to open pack index: " + indexPath.string());
    }
    std::string idx((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ObjectStoreError(ErrorCode::IoError, "Error reading pack index: " + indexPath.string());
    }

    const size_t fanoutStart = 8;
    const size_t idsStart = fanoutStart + FANOUT_ENTRIES * 4;
    if (idx.size() < idsStart || idx.compare(0, 4, "\377tOc") != 0) {
        throw corrupt(indexPath, "Not a version 2 pack index");
    }
    if (readBE32(idx, 4) != 2) {
        throw corrupt(indexPath, "Unsupported pack index version " + std::to_string(readBE32(idx, 4)));
    }

    fanout.resize(FANOUT_ENTRIES);
    for (size_t i = 0; i < FANOUT_ENTRIES; ++i) {
        fanout[i] = readBE32(idx, fanoutStart + i * 4);
        if (i > 0 && fanout[i] < fanout[i - 1]) throw corrupt(indexPath, "Pack index fan-out is not sorted");
    }

    const size_t count = fanout.back();
    const size_t crcStart = idsStart + count * RAW_ID_LENGTH;
    const size_t offsetStart = crcStart + count * 4;
    const size_t largeStart = offsetStart + count * 4;
    // Both trailing checksums follow the offset tables
    if (idx.size() < largeStart + 2 * RAW_ID_LENGTH) {
        throw corrupt(indexPath, "Truncated pack index");
    }
    const size_t largeCount = (idx.size() - largeStart - 2 * RAW_ID_LENGTH) / 8;

    ids = idx.substr(idsStart, count * RAW_ID_LENGTH);
    offsets.resize(count);
    for (size_t i = 0; i < count; ++i) {
        uint32_t small = readBE32(idx, offsetStart + i * 4);
        if (small & LARGE_OFFSET_FLAG) {
            size_t slot = small & ~LARGE_OFFSET_FLAG;
            if (slot >= largeCount) throw corrupt(indexPath, "Pack index large offset out of range");
            offsets[i] = readBE64(idx, largeStart + slot * 8);
        } else {
            offsets[i] = small;
        }
    }
}

bool PackFile::find(const std::string& hash, uint64_t& offset) const {
    std::string raw;
    if (!hexToRaw(hash, raw)) return false;

    auto first = static_cast<unsigned char>(raw[0]);
    size_t lo = first == 0 ? 0 : fanout[first - 1];
    size_t hi = fanout[first];
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        int cmp = std::memcmp(ids.data() + mid * RAW_ID_LENGTH, raw.data(), RAW_ID_LENGTH);
        if (cmp == 0) {
            offset = offsets[mid];
            return true;
        }
        if (cmp < 0) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return false;
}

PackEntry PackFile::readEntry(uint64_t offset) const {
    packStream.clear();
    packStream.seekg(static_cast<std::streamoff>(offset));
    if (!packStream) {
        throw ObjectStoreError(ErrorCode::IoError, "Failed to seek in packfile: " + pack.string());
    }

    auto nextByte = [this]() {
        char c;
        if (!packStream.get(c)) throw corrupt(pack, "Truncated pack entry");
        return static_cast<unsigned char>(c);
    };

    // Type and inflated size: 3 type bits and 4 size bits, then 7 size bits per byte
    unsigned char c = nextByte();
    int typeCode = (c >> 4) & 0x07;
    uint64_t size = c & 0x0f;
    int shift = 4;
    while (c & 0x80) {
        if (shift > 57) throw corrupt(pack, "Pack entry size overflow");
        c = nextByte();
        size |= uint64_t(c & 0x7f) << shift;
        shift += 7;
    }

    PackEntry entry;
    switch (typeCode) {
        case 1: case 2: case 3: case 4: case 6: case 7:
            entry.type = static_cast<PackObjectType>(typeCode);
            break;
        default:
            throw corrupt(pack, "Unknown pack entry type " + std::to_string(typeCode));
    }

    if (entry.type == PackObjectType::OfsDelta) {
        c = nextByte();
        uint64_t distance = c & 0x7f;
        while (c & 0x80) {
            if (distance > (UINT64_MAX >> 8)) throw corrupt(pack, "Delta base offset overflow");
            c = nextByte();
            distance = ((distance + 1) << 7) | (c & 0x7f);
        }
        if (distance == 0 || distance > offset) throw corrupt(pack, "Delta base offset out of range");
        entry.baseOffset = offset - distance;
    } else if (entry.type == PackObjectType::RefDelta) {
        char base[RAW_ID_LENGTH];
        packStream.read(base, sizeof(base));
        if (packStream.gcount() != static_cast<std::streamsize>(sizeof(base))) {
            throw corrupt(pack, "Truncated delta base id");
        }
        entry.baseHash = rawToHex(base);
    }

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    if (inflateInit(&stream) != Z_OK) {
        throw ObjectStoreError(ErrorCode::InternalError, "zlib inflateInit failed");
    }

    std::vector<char> input(8192);
    std::vector<uint8_t> buffer(8192);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (stream.avail_in == 0) {
            packStream.read(input.data(), static_cast<std::streamsize>(input.size()));
            std::streamsize got = packStream.gcount();
            if (got <= 0) {
                inflateEnd(&stream);
                throw corrupt(pack, "Truncated zlib data in pack entry");
            }
            stream.next_in = reinterpret_cast<Bytef*>(input.data());
            stream.avail_in = static_cast<uInt>(got);
        }

        stream.avail_out = static_cast<uInt>(buffer.size());
        stream.next_out = buffer.data();
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw corrupt(pack, "zlib inflate failed for pack entry");
        }
        entry.data.append(reinterpret_cast<char*>(buffer.data()), buffer.size() - stream.avail_out);
    }
    inflateEnd(&stream);

    if (entry.data.size() != size) {
        throw corrupt(pack, "Pack entry size mismatch at offset " + std::to_string(offset));
    }
    return entry;
}

std::string PackFile::typeName(PackObjectType type) {
    switch (type) {
        case PackObjectType::Commit: return "commit";
        case PackObjectType::Tree: return "tree";
        case PackObjectType::Blob: return "blob";
        case PackObjectType::Tag: return "tag";
        default: return "";
    }
}

std::string PackFile::applyDelta(const std::string& base, const std::string& delta) {
    size_t pos = 0;
    auto fail = [](const std::string& what) { return ObjectStoreError(ErrorCode::CorruptObject, "Invalid delta: " + what); };
    auto byteAt = [&]() {
        if (pos >= delta.size()) throw fail("unexpected end");
        return static_cast<unsigned char>(delta[pos++]);
    };
    auto varint = [&]() {
        uint64_t value = 0;
        int shift = 0;
        unsigned char c;
        do {
            if (shift > 63) throw fail("size overflow");
            c = byteAt();
            value |= uint64_t(c & 0x7f) << shift;
            shift += 7;
        } while (c & 0x80);
        return value;
    };

    uint64_t baseSize = varint();
    uint64_t resultSize = varint();
    if (baseSize != base.size()) throw fail("base size mismatch");

    std::string out;
    out.reserve(static_cast<size_t>(resultSize));
    while (pos < delta.size()) {
        unsigned char cmd = byteAt();
        if (cmd & 0x80) {
            uint64_t copyOffset = 0;
            uint64_t copySize = 0;
            for (int i = 0; i < 4; ++i) {
                if (cmd & (1 << i)) copyOffset |= uint64_t(byteAt()) << (8 * i);
            }
            for (int i = 0; i < 3; ++i) {
                if (cmd & (0x10 << i)) copySize |= uint64_t(byteAt()) << (8 * i);
            }
            if (copySize == 0) copySize = 0x10000;
            if (copyOffset + copySize > base.size()) throw fail("copy outside base");
            out.append(base, static_cast<size_t>(copyOffset), static_cast<size_t>(copySize));
        } else if (cmd != 0) {
            if (pos + cmd > delta.size()) throw fail("insert past end");
            out.append(delta, pos, cmd);
            pos += cmd;
        } else {
            throw fail("reserved opcode 0");
        }
    }

    if (out.size() != resultSize) throw fail("result size mismatch");
    return out;
}

}
