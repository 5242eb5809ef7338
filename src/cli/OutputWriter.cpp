#include "cli/OutputWriter.hpp"

#include <fstream>
#include <random>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace relnotes {

namespace OutputWriter {

void writeToStream(const std::string& releaseNotes, std::ostream& out) {
    out << releaseNotes << "\n";
    out.flush();
}

Expected<void> writeToFile(const std::string& releaseNotes, const fs::path& outputFile) {
    std::error_code ec;
    if (outputFile.has_parent_path()) {
        fs::create_directories(outputFile.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create directory for " + outputFile.string() + ": " + ec.message()};
        }
    }

    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open output file: " + outputFile.string()};
    }
    out << releaseNotes;
    out.flush();
    if (!out.good()) {
        return Error{ErrorCode::IoError, "Failed to write output file: " + outputFile.string()};
    }
    Logger::instance().info("Release notes written to " + outputFile.string());
    return {};
}

Expected<void> writeToGitHubOutput(const std::string& releaseNotes, const std::string& outputName,
                                   const std::string& outputPath) {
    if (outputPath.empty()) {
        Logger::instance().warn("GITHUB_OUTPUT environment variable is not set, skipping GitHub output");
        return {};
    }

    std::string delimiter = makeDelimiter();
    std::ofstream out(outputPath, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open GITHUB_OUTPUT file: " + outputPath};
    }
    out << outputName << "<<" << delimiter << "\n" << releaseNotes << "\n" << delimiter << "\n";
    out.flush();
    if (!out.good()) {
        return Error{ErrorCode::IoError, "Failed to append to GITHUB_OUTPUT file: " + outputPath};
    }
    Logger::instance().info("Release notes written to GITHUB_OUTPUT as '" + outputName + "'");
    return {};
}

std::string makeDelimiter() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string delimiter = "ghadelimiter_";
    for (int i = 0; i < 32; ++i) {
        delimiter += "0123456789abcdef"[dis(gen)];
    }
    return delimiter;
}

} // namespace OutputWriter

}
