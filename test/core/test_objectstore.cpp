#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "test_utils.hpp"
#include "core/ObjectStore.hpp"
#include "core/PackFile.hpp"
#include "core/CommitObject.hpp"

namespace fs = std::filesystem;

using namespace relnotes;
using namespace relnotes::test::utils;

class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        fixture = std::make_unique<GitFixture>(tempDir);
    }

    void TearDown() override {
        fixture.reset();
        removeDir(tempDir);
    }

    ErrorCode readError(const ObjectStore& store, const std::string& hash) {
        try {
            store.readObject(hash);
        } catch (const ObjectStoreError& e) {
            return e.code();
        }
        return ErrorCode::None;
    }

    fs::path tempDir;
    std::unique_ptr<GitFixture> fixture;
};

// Test: Object path uses the 2-char fan-out directory
TEST_F(ObjectStoreTest, ObjectPathLayout) {
    ObjectStore store(fixture->gitDir());
    std::string hash = "abcdef0123456789abcdef0123456789abcdef01";
    fs::path objPath = store.getObjectPath(hash);

    EXPECT_EQ(objPath.parent_path().filename().string(), "ab");
    EXPECT_EQ(objPath.filename().string(), hash.substr(2));
    EXPECT_EQ(objPath.parent_path().parent_path(), store.objectsDir());
}

// Test: Read and inflate a loose commit
TEST_F(ObjectStoreTest, ReadCommit) {
    std::string root = fixture->commit("initial commit\n", {}, 1000, "Alice Smith", "alice@example.com");
    std::string child = fixture->commit("feat: second\n\nbody line\n", {root}, 2000, "Bob", "bob@example.com");

    ObjectStore store(fixture->gitDir());
    EXPECT_TRUE(store.hasObject(child));

    CommitObject commit = store.readCommit(child);
    EXPECT_EQ(commit.hash, child);
    ASSERT_EQ(commit.parentHashes.size(), 1u);
    EXPECT_EQ(commit.parentHashes[0], root);
    EXPECT_EQ(commit.authorName, "Bob");
    EXPECT_EQ(commit.authorEmail, "bob@example.com");
    EXPECT_EQ(commit.authorTimestamp, 2000);
    EXPECT_EQ(commit.committerTimestamp, 2000);
    EXPECT_EQ(commit.message, "feat: second\n\nbody line\n");
    EXPECT_EQ(commit.shortMessage(), "feat: second");
    EXPECT_TRUE(commit.authorLogin.empty());

    CommitObject first = store.readCommit(root);
    EXPECT_TRUE(first.parentHashes.empty());
    EXPECT_EQ(first.authorName, "Alice Smith");
}

// Test: Raw object type and body
TEST_F(ObjectStoreTest, ReadRawObject) {
    std::string hash(40, 'b');
    fixture->writeObject(hash, "blob", "hello world");

    ObjectStore store(fixture->gitDir());
    RawObject obj = store.readObject(hash);
    EXPECT_EQ(obj.type, "blob");
    EXPECT_EQ(obj.body, "hello world");
}

// Test: Missing, corrupt and mis-sized objects are reported with distinct codes
TEST_F(ObjectStoreTest, ReadErrors) {
    ObjectStore store(fixture->gitDir());
    EXPECT_FALSE(store.hasObject(std::string(40, 'e')));
    EXPECT_EQ(readError(store, std::string(40, 'e')), ErrorCode::NotFound);

    std::string garbage(40, 'c');
    fixture->writeRawObjectFile(garbage, "definitely not zlib");
    EXPECT_EQ(readError(store, garbage), ErrorCode::CorruptObject);

    std::string empty(40, 'd');
    fixture->writeRawObjectFile(empty, "");
    EXPECT_EQ(readError(store, empty), ErrorCode::CorruptObject);

    EXPECT_THROW(store.getObjectPath("a"), ObjectStoreError);
}

// Test: Reading a blob as a commit fails
TEST_F(ObjectStoreTest, ReadCommitWrongType) {
    std::string hash(40, 'f');
    fixture->writeObject(hash, "blob", "data");
    ObjectStore store(fixture->gitDir());
    try {
        store.readCommit(hash);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }
}

// Test: Annotated tags peel to their commit, commits peel to themselves
TEST_F(ObjectStoreTest, PeelAnnotatedTag) {
    std::string commit = fixture->commit("release\n", {}, 100);
    std::string tag = fixture->annotatedTag("v1.0.0", commit, 200);

    ObjectStore store(fixture->gitDir());
    EXPECT_EQ(store.peel(tag), commit);
    EXPECT_EQ(store.peel(commit), commit);
}

// Test: Multi-line headers such as gpgsig are skipped
TEST(ObjectStoreParseTest, SkipsContinuationLines) {
    std::string parent(40, '1');
    std::string body =
        "tree " + std::string(40, '0') + "\n"
        "parent " + parent + "\n"
        "author Jane Doe <jane@x.com> 1700000000 +0100\n"
        "committer GitHub <noreply@github.com> 1700000100 +0000\n"
        "gpgsig -----BEGIN PGP SIGNATURE-----\n"
        " \n"
        " wsBcBAABCAAQBQJl\n"
        " -----END PGP SIGNATURE-----\n"
        "\n"
        "fix: handle CRLF\r\n\r\nCo-authored-by: Bob <bob@x.com>";

    CommitObject c = ObjectStore::parseCommit("h", body);
    EXPECT_EQ(c.parentHashes, (std::vector<std::string>{parent}));
    EXPECT_EQ(c.authorName, "Jane Doe");
    EXPECT_EQ(c.committerName, "GitHub");
    EXPECT_EQ(c.committerTimestamp, 1700000100);
    EXPECT_EQ(c.shortMessage(), "fix: handle CRLF");
}

// Test: A commit without a message parses with an empty one
TEST(ObjectStoreParseTest, NoMessage) {
    std::string body = "tree " + std::string(40, '0') + "\nauthor A <a@x> 1 +0000\ncommitter A <a@x> 1 +0000\n";
    CommitObject c = ObjectStore::parseCommit("h", body);
    EXPECT_EQ(c.message, "");
    EXPECT_EQ(c.authorName, "A");
}

// Test: A short parent hash is a corrupt commit
TEST(ObjectStoreParseTest, ShortParentHash) {
    std::string body = "tree " + std::string(40, '0') + "\nparent abc\n\nmsg";
    EXPECT_THROW(ObjectStore::parseCommit("h", body), ObjectStoreError);
}

// Test: Objects moved into a pack read the same as loose ones
TEST_F(ObjectStoreTest, ReadPackedObjects) {
    std::string root = fixture->commit("initial commit\n", {}, 1000, "Alice Smith", "alice@example.com");
    std::string blob(40, 'b');
    fixture->writeObject(blob, "blob", "hello world");

    fixture->repack();
    EXPECT_FALSE(fs::exists(fixture->gitDir() / "objects" / root.substr(0, 2) / root.substr(2)));

    ObjectStore store(fixture->gitDir());
    EXPECT_TRUE(store.hasObject(root));
    EXPECT_TRUE(store.hasObject(blob));
    EXPECT_FALSE(store.hasObject(std::string(40, 'e')));
    EXPECT_EQ(readError(store, std::string(40, 'e')), ErrorCode::NotFound);

    CommitObject commit = store.readCommit(root);
    EXPECT_EQ(commit.authorName, "Alice Smith");
    EXPECT_EQ(commit.message, "initial commit\n");

    RawObject obj = store.readObject(blob);
    EXPECT_EQ(obj.type, "blob");
    EXPECT_EQ(obj.body, "hello world");
}

// Test: OFS_DELTA and REF_DELTA chains resolve to the full object
TEST_F(ObjectStoreTest, ReadPackedDeltaChain) {
    std::string c1 = fixture->commit("feat: first change with a long enough message\n", {}, 1000);
    std::string c2 = fixture->commit("feat: second change with a long enough message\n", {c1}, 2000);
    std::string c3 = fixture->commit("fix: third change with a long enough message\n", {c2}, 3000, "Bob", "bob@example.com");
    std::string tag = fixture->annotatedTag("v1.0.0", c3, 3100);

    // c3 -> c2 (REF) -> c1 (OFS) -> whole
    fixture->repack({{c2, c1}}, {{c3, c2}});

    ObjectStore store(fixture->gitDir());
    CommitObject second = store.readCommit(c2);
    EXPECT_EQ(second.parentHashes, (std::vector<std::string>{c1}));
    EXPECT_EQ(second.message, "feat: second change with a long enough message\n");

    CommitObject third = store.readCommit(c3);
    EXPECT_EQ(third.parentHashes, (std::vector<std::string>{c2}));
    EXPECT_EQ(third.authorName, "Bob");
    EXPECT_EQ(third.committerTimestamp, 3000);
    EXPECT_EQ(third.shortMessage(), "fix: third change with a long enough message");

    EXPECT_EQ(store.peel(tag), c3);
}

// Test: A REF_DELTA base may live outside the pack
TEST_F(ObjectStoreTest, ReadPackedDeltaWithLooseBase) {
    std::string c1 = fixture->commit("docs: describe the install steps\n", {}, 1000);
    std::string c2 = fixture->commit("docs: describe the upgrade steps\n", {c1}, 2000);
    fixture->repack({}, {{c2, c1}}, {c1});

    ObjectStore store(fixture->gitDir());
    EXPECT_EQ(store.readCommit(c2).message, "docs: describe the upgrade steps\n");
}

// Test: An unreadable pack index is a corrupt object store
TEST_F(ObjectStoreTest, CorruptPackIndex) {
    createFile(fixture->gitDir() / "objects" / "pack", "pack-" + std::string(40, '9') + ".idx", "not an index");
    ObjectStore store(fixture->gitDir());
    EXPECT_EQ(readError(store, std::string(40, 'e')), ErrorCode::CorruptObject);
}

// Test: Delta copy and insert instructions
TEST(PackFileDeltaTest, ApplyCopyAndInsert) {
    std::string base = "hello brave world";
    // sizes 17 -> 15; copy "hello " (offset 0, size 6); insert "new"; copy " world" (offset 11, size 6)
    std::string delta;
    delta += static_cast<char>(17);
    delta += static_cast<char>(15);
    delta += static_cast<char>(0x90);
    delta += static_cast<char>(6);
    delta += static_cast<char>(3);
    delta += "new";
    delta += static_cast<char>(0x91);
    delta += static_cast<char>(11);
    delta += static_cast<char>(6);

    EXPECT_EQ(PackFile::applyDelta(base, delta), "hello new world");
}

// Test: Malformed deltas are corrupt objects
TEST(PackFileDeltaTest, RejectsMalformedDelta) {
    std::string base = "abc";

    std::string wrongBase;
    wrongBase += static_cast<char>(4);
    wrongBase += static_cast<char>(1);
    wrongBase += static_cast<char>(1);
    wrongBase += "x";
    EXPECT_THROW(PackFile::applyDelta(base, wrongBase), ObjectStoreError);

    std::string reserved;
    reserved += static_cast<char>(3);
    reserved += static_cast<char>(1);
    reserved += '\0';
    EXPECT_THROW(PackFile::applyDelta(base, reserved), ObjectStoreError);

    std::string outside;
    outside += static_cast<char>(3);
    outside += static_cast<char>(4);
    outside += static_cast<char>(0x90);
    outside += static_cast<char>(4);
    EXPECT_THROW(PackFile::applyDelta(base, outside), ObjectStoreError);
}
