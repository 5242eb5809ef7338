#include "core/CategoryDefinition.hpp"

namespace relnotes {

std::vector<CategoryDefinition> defaultCategories() {
    return {
        {"Breaking Changes", "\xF0\x9F\x92\xA5", 1, {"break"}},
        {"Features", "\xE2\x9C\xA8", 2, {"feat"}},
        {"Refactoring", "\xE2\x99\xBB\xEF\xB8\x8F", 3, {"refactor"}},
        {"Fixes", "\xF0\x9F\x90\x9B", 4, {"fix", "bug"}},
        {"Performance", "\xE2\x9A\xA1", 5, {"perf"}},
        {"General Changes", "\xF0\x9F\xA7\xB9", 6, {"housekeeping", "chore", "update"}},
        {"Tests", "\xE2\x9C\x85", 7, {"test"}},
        {"Documentation", "\xF0\x9F\x93\x9D", 8, {"doc"}},
        {"Style Changes", "\xF0\x9F\x92\x85", 9, {"style"}},
        {"Dependencies", "\xF0\x9F\x93\xA6", 10, {"dep"}},
    };
}

BotOverrideTable defaultBotOverrides() {
    return {
        {"renovate[bot]", "dep"},
        {"dependabot[bot]", "dep"},
        {"dependabot", "dep"},
    };
}

}
