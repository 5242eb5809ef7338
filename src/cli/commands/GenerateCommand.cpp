#include "cli/commands/GenerateCommand.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

#include "cli/OutputWriter.hpp"
#include "core/CommitClassifier.hpp"
#include "core/Constants.hpp"
#include "core/LocalHistoryProvider.hpp"
#include "core/ReleaseAggregator.hpp"
#include "core/Repository.hpp"
#include "core/ResilientFetch.hpp"

namespace relnotes {

namespace {
    std::string systemEnv(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }

    Expected<std::unique_ptr<IHistoryProvider>> makeProvider(const AppContext& ctx, const std::string& repoPath) {
        if (ctx.providerFactory) {
            auto provider = ctx.providerFactory(repoPath);
            if (!provider) return Error{ErrorCode::InternalError, "history provider factory returned nothing"};
            return provider;
        }
        auto rootRes = Repository::discoverRoot(repoPath);
        if (!rootRes) return rootRes.error();
        return std::unique_ptr<IHistoryProvider>(std::make_unique<LocalHistoryProvider>(rootRes.value()));
    }
}

Expected<GenerateOptions> GenerateCommand::parseOptions(const std::vector<std::string>& args) {
    return parseOptions(args, systemEnv);
}

/**
 * @brief Parse `generate` flags
 *
 * Every value flag takes the next argument. GITHUB_REPOSITORY ("owner/name")
 * fills in owner and repo when the flags are absent.
 */
Expected<GenerateOptions> GenerateCommand::parseOptions(const std::vector<std::string>& args, const EnvLookup& env) {
    GenerateOptions opts;
    opts.outputName = Constants::DEFAULT_OUTPUT_NAME;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto takeValue = [&](std::string& into) -> Expected<void> {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "generate: option " + arg + " requires a value"};
            }
            into = args[++i];
            return {};
        };
        auto takeOptional = [&](std::optional<std::string>& into) -> Expected<void> {
            std::string value;
            auto res = takeValue(value);
            if (!res) return res;
            into = value;
            return {};
        };

        Expected<void> res;
        if (arg == "--owner") {
            res = takeValue(opts.owner);
        } else if (arg == "--repo") {
            res = takeValue(opts.repo);
        } else if (arg == "--base-ref") {
            res = takeOptional(opts.baseRef);
        } else if (arg == "--head-ref") {
            res = takeOptional(opts.headRef);
        } else if (arg == "--release-version") {
            res = takeOptional(opts.version);
        } else if (arg == "--output-file") {
            res = takeOptional(opts.outputFile);
        } else if (arg == "--output-name") {
            res = takeValue(opts.outputName);
        } else if (arg == "--repo-path") {
            res = takeValue(opts.repoPath);
        } else if (arg == "--github-output") {
            opts.githubOutput = true;
        } else if (arg == "--verbose") {
            opts.logLevel = LogLevel::Debug;
        } else if (arg == "--quiet") {
            opts.logLevel = LogLevel::Warn;
        } else {
            return Error{ErrorCode::InvalidArgs, "generate: unknown option " + arg};
        }
        if (!res) return res.error();
    }

    std::string repository = env("GITHUB_REPOSITORY");
    size_t slash = repository.find('/');
    if (slash != std::string::npos) {
        if (opts.owner.empty()) opts.owner = repository.substr(0, slash);
        if (opts.repo.empty()) opts.repo = repository.substr(slash + 1);
    }
    opts.githubOutputPath = env("GITHUB_OUTPUT");

    if (opts.owner.empty() || opts.repo.empty()) {
        return Error{ErrorCode::InvalidArgs,
                     "Repository owner and name are required. Use --owner/--repo or set GITHUB_REPOSITORY."};
    }
    if (opts.outputName.empty()) {
        return Error{ErrorCode::InvalidArgs, "generate: --output-name must not be empty"};
    }
    return opts;
}

/**
 * @brief Execute 'relnotes generate'
 *
 * Resolves the release window through the history provider, renders the
 * notes, prints them to stdout and then feeds the optional file and
 * GITHUB_OUTPUT sinks.
 */
Expected<void> GenerateCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseOptions(args);
    if (!optsRes) return optsRes.error();
    const GenerateOptions& opts = optsRes.value();

    if (opts.logLevel) Logger::instance().setLevel(*opts.logLevel);

    auto providerRes = makeProvider(ctx, opts.repoPath);
    if (!providerRes) return providerRes.error();
    IHistoryProvider& provider = *providerRes.value();

    ResilientFetch fetch(RetryPolicy{}, ctx.retrySleeper);
    CommitClassifier classifier;
    ReleaseAggregator aggregator(provider, classifier, fetch);

    ReleaseRequest request;
    request.owner = opts.owner;
    request.repo = opts.repo;
    request.baseRef = opts.baseRef;
    request.headRef = opts.headRef;
    request.version = opts.version.value_or("");

    auto notes = aggregator.generate(request);
    if (!notes) return notes.error();
    Logger::instance().info("Release notes generated (" + std::to_string(notes.value().size()) + " characters)");

    OutputWriter::writeToStream(notes.value(), std::cout);

    if (opts.outputFile) {
        auto written = OutputWriter::writeToFile(notes.value(), *opts.outputFile);
        if (!written) return written;
    }
    if (opts.githubOutput) {
        auto written = OutputWriter::writeToGitHubOutput(notes.value(), opts.outputName, opts.githubOutputPath);
        if (!written) return written;
    }
    return {};
}

}
