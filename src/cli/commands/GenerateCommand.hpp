#pragma once

#include <functional>
#include <optional>
#include <string>

#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

namespace relnotes {

/// Settings for one `relnotes generate` run, after CLI and environment merging
struct GenerateOptions {
    std::string owner;
    std::string repo;
    std::optional<std::string> baseRef;
    std::optional<std::string> headRef;
    std::optional<std::string> version;
    std::optional<std::string> outputFile;
    bool githubOutput{false};
    std::string outputName{"changelog"};
    std::string githubOutputPath;   // from GITHUB_OUTPUT
    std::string repoPath{"."};
    std::optional<LogLevel> logLevel;
};

class GenerateCommand : public ICommand {
public:
    /// Returns the variable's value, or empty when unset
    using EnvLookup = std::function<std::string(const char* name)>;

    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "generate"; }
    const char* description() const override { return "Generate release notes for a commit range"; }
    const char* helpNameLine() const override { return "generate -  Generate categorized release notes"; }
    const char* helpSynopsis() const override {
        return "relnotes generate [--owner <o>] [--repo <r>] [--base-ref <ref>] [--head-ref <ref>]\n"
               "                  [--release-version <v>] [--output-file <path>] [--github-output]\n"
               "                  [--output-name <name>] [--repo-path <dir>] [--verbose | --quiet]";
    }
    const char* helpDescription() const override {
        return "Compare the latest release (or --base-ref) with the default branch (or --head-ref),\n"
               "group the commits by message prefix and list new and returning contributors.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--owner <o>", "Repository owner (defaults to GITHUB_REPOSITORY)."},
            {"--repo <r>", "Repository name (defaults to GITHUB_REPOSITORY)."},
            {"--base-ref <ref>", "Ref to compare from (defaults to the latest release tag)."},
            {"--head-ref <ref>", "Ref to compare to (defaults to the default branch)."},
            {"--release-version <v>", "Version used in the changelog link (defaults to the head ref)."},
            {"--output-file <path>", "Also write the release notes to a file."},
            {"--github-output", "Also append the release notes to GITHUB_OUTPUT."},
            {"--output-name <name>", "Variable name for GITHUB_OUTPUT (default: changelog)."},
            {"--repo-path <dir>", "Local repository to read history from (default: .)."},
            {"--verbose", "Log debug details."},
            {"--quiet", "Only log warnings and errors."},
        };
    }

    /// Merge CLI flags with GITHUB_REPOSITORY / GITHUB_OUTPUT
    static Expected<GenerateOptions> parseOptions(const std::vector<std::string>& args, const EnvLookup& env);
    static Expected<GenerateOptions> parseOptions(const std::vector<std::string>& args);
};

}
