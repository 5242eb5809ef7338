#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include "util/Expected.hpp"

namespace relnotes {

/**
 * @brief Sinks for the rendered release notes
 *
 * GitHub Actions output uses the multi-line form:
 *   <name><<<delimiter>
 *   <notes>
 *   <delimiter>
 * with a random "ghadelimiter_<32 hex>" delimiter.
 */
namespace OutputWriter {

void writeToStream(const std::string& releaseNotes, std::ostream& out);

/// Write (truncate) @p outputFile, creating parent directories
Expected<void> writeToFile(const std::string& releaseNotes, const std::filesystem::path& outputFile);

/**
 * @brief Append to the file named by GITHUB_OUTPUT
 * @param outputPath Value of GITHUB_OUTPUT; empty logs a warning and skips
 */
Expected<void> writeToGitHubOutput(const std::string& releaseNotes, const std::string& outputName,
                                   const std::string& outputPath);

/// "ghadelimiter_" followed by 32 random hex digits
std::string makeDelimiter();

} // namespace OutputWriter

}
