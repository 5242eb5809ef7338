#pragma once

#include <chrono>
#include <climits>
#include <cstddef>

/**
 * @brief Release-note constants used throughout the codebase
 *
 * Centralizes magic numbers to improve maintainability and readability.
 */
namespace relnotes {

namespace Constants {
    // Git object layout
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 produces 40-char hex strings
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // First 2 chars of hash form directory name
    constexpr size_t MAX_DELTA_CHAIN = 4096;      // Longest pack delta chain followed
    constexpr int MAX_SYMREF_DEPTH = 5;           // Hops allowed when following "ref: " files

    // Classification
    constexpr int MAX_PRIORITY = INT_MAX;         // Priority of the fallback category
    constexpr const char* OTHER_CATEGORY = "Other";

    // Author identities
    constexpr const char* UNKNOWN_AUTHOR = "unknown";
    constexpr const char* BOT_MARKER = "[bot]";
    constexpr const char* CO_AUTHOR_TRAILER = "Co-authored-by:";

    // History pagination
    constexpr int HISTORY_PAGE_SIZE = 100;
    constexpr int MAX_PAGINATION_PAGES = 500;

    // Retry policy
    constexpr int MAX_RETRIES = 3;                // 4 attempts in total
    constexpr std::chrono::milliseconds RETRY_BASE_DELAY{2000};
    constexpr std::chrono::milliseconds RATE_LIMIT_PADDING{1000};
    constexpr double RETRY_JITTER_RATIO = 0.2;

    // Output
    constexpr const char* DEFAULT_OUTPUT_NAME = "changelog";
    constexpr const char* GITHUB_URL = "https://github.com";
}
}
