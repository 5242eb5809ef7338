#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "test_utils.hpp"
#include "cli/commands/GenerateCommand.hpp"
#include "core/CommitClassifier.hpp"
#include "core/LocalHistoryProvider.hpp"
#include "core/ReleaseAggregator.hpp"
#include "core/ResilientFetch.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace relnotes;
using namespace relnotes::test::utils;

/**
 * End-to-end release note generation over an on-disk repository:
 *
 *   v1.0.0:  initial (Alice), feat: parser (Bob)
 *   since:   fix: crash (Alice, co-authored by Erin),
 *            feat: export (Carol), chore(deps): bump zlib (Dependabot [bot]),
 *            Merge pull request (Bob)
 */
class ReleaseWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        git = std::make_unique<GitFixture>(tempDir);

        c1 = git->commit("initial commit\n", {}, 1000, "Alice", "alice@example.com");
        c2 = git->commit("feat: parser\n", {c1}, 2000, "Bob", "bob@example.com");
        git->setRef("tags/v1.0.0", git->annotatedTag("v1.0.0", c2, 2100));

        c3 = git->commit("fix: crash on empty input\n\nCo-authored-by: Erin Park <erin@example.com>\n",
                                     {c2}, 3000, "Alice", "alice@example.com");
        c4 = git->commit("feat: export to JSON\n", {c3}, 4000, "Carol", "carol@example.com");
        c5 = git->commit("chore(deps): bump zlib\n", {c4}, 5000, "dependabot[bot]",
                                     "49699333+dependabot[bot]@users.noreply.github.com");
        m = git->commit("Merge pull request #7 from acme/export\n", {c5}, 6000, "Bob", "bob@example.com");
        git->setRef("heads/main", m);
    }

    void TearDown() override {
        git.reset();
        removeDir(tempDir);
        Logger::instance().setLevel(LogLevel::Error);
    }

    fs::path tempDir;
    std::unique_ptr<GitFixture> git;
    std::string c1, c2, c3, c4, c5, m;
};

// Test: Aggregation over a real .git directory
TEST_F(ReleaseWorkflowTest, AggregateLocalHistory) {
    LocalHistoryProvider provider(tempDir);
    CommitClassifier classifier;
    ResilientFetch fetch;
    ReleaseAggregator aggregator(provider, classifier, fetch);

    ReleaseRequest request;
    request.owner = "acme";
    request.repo = "rocket";
    auto result = aggregator.aggregate(request);
    ASSERT_TRUE(result) << result.error().message;
    const AggregationResult& r = result.value();

    EXPECT_EQ(*r.window.baseRef, "v1.0.0");
    EXPECT_EQ(r.window.headRef, "main");
    EXPECT_EQ(r.windowCommits.size(), 4u);
    EXPECT_EQ(r.authorsBeforeWindow, (AuthorSet{"Alice", "Bob"}));
    EXPECT_EQ(r.newAuthors, (AuthorSet{"Carol", "dependabot[bot]", "ErinPark"}));

    // Local commits have no logins, so the bot lands by message prefix
    ASSERT_NE(r.grouped.find("General Changes"), nullptr);
    ASSERT_NE(r.grouped.find("Other"), nullptr);
    EXPECT_EQ(r.grouped.sections().front().name, "Features");
}

// Test: The generate command renders the whole document from disk
TEST_F(ReleaseWorkflowTest, GenerateFromRepository) {
    fs::path subDir = tempDir / "docs";
    fs::create_directories(subDir);
    fs::path outFile = tempDir / "dist" / "RELEASE.md";
    GenerateCommand cmd;
    AppContext ctx;

    testing::internal::CaptureStdout();
    auto res = cmd.execute(ctx, {"--owner", "acme", "--repo", "rocket", "--repo-path", subDir.string(),
                                 "--release-version", "v1.1.0", "--output-file", outFile.string(), "--quiet"});
    std::string stdoutText = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(res) << res.error().message;

    std::string expected =
        "## \xF0\x9F\x97\xBA\xEF\xB8\x8F What's Changed\n"
        "\n"
        "### \xE2\x9C\xA8 Features\n"
        " * acme/rocket@" + c4 + " feat: export to JSON @Carol\n"
        "\n"
        "### \xF0\x9F\x90\x9B Fixes\n"
        " * acme/rocket@" + c3 + " fix: crash on empty input @Alice @ErinPark\n"
        "\n"
        "### \xF0\x9F\xA7\xB9 General Changes\n"
        " * acme/rocket@" + c5 + " chore(deps): bump zlib @dependabot[bot]\n"
        "\n"
        "### \xF0\x9F\x93\x8C Other\n"
        " * acme/rocket@" + m + " Merge pull request #7 from acme/export @Bob\n"
        "\n"
        "\xF0\x9F\x94\x97 **Full Changelog**: https://github.com/acme/rocket/compare/v1.0.0...v1.1.0\n"
        "\n"
        "### \xF0\x9F\x99\x8C Contributions\n"
        "\xF0\x9F\x8C\xB1 New contributors since the last release: @Carol, @ErinPark\n"
        "\xF0\x9F\x92\x96 Thanks to all the contributors: @Alice, @Bob, @Carol, @ErinPark\n"
        "\n"
        "\xF0\x9F\xA4\x96 Automated services that contributed: @dependabot[bot]";

    EXPECT_EQ(stdoutText, expected + "\n");
    EXPECT_EQ(readFile(outFile), expected);
}

// Test: First release covers the whole history and everyone is new
TEST_F(ReleaseWorkflowTest, FirstReleaseWithoutTags) {
    fs::remove(git->gitDir() / "refs" / "tags" / "v1.0.0");

    LocalHistoryProvider provider(tempDir);
    CommitClassifier classifier;
    ResilientFetch fetch;
    ReleaseAggregator aggregator(provider, classifier, fetch);

    ReleaseRequest request;
    request.owner = "acme";
    request.repo = "rocket";
    auto notes = aggregator.generate(request);
    ASSERT_TRUE(notes) << notes.error().message;

    EXPECT_NE(notes.value().find("https://github.com/acme/rocket/commits/main"), std::string::npos);
    EXPECT_NE(notes.value().find("New contributors since the last release: @Alice, @Bob, @Carol, @ErinPark"),
              std::string::npos);
    EXPECT_NE(notes.value().find("feat: parser"), std::string::npos);
}

// Test: Explicit base ref narrows the window
TEST_F(ReleaseWorkflowTest, ExplicitBaseRef) {
    LocalHistoryProvider provider(tempDir);
    CommitClassifier classifier;
    ResilientFetch fetch;
    ReleaseAggregator aggregator(provider, classifier, fetch);

    ReleaseRequest request;
    request.owner = "acme";
    request.repo = "rocket";
    request.baseRef = c5;
    auto result = aggregator.aggregate(request);
    ASSERT_TRUE(result) << result.error().message;

    ASSERT_EQ(result.value().windowCommits.size(), 1u);
    EXPECT_EQ(result.value().windowCommits[0].hash, m);
    EXPECT_TRUE(result.value().newAuthors.empty());
}
