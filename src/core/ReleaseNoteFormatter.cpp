#include "core/ReleaseNoteFormatter.hpp"

#include <sstream>
#include <vector>

namespace relnotes {

namespace {
    const char* const WHATS_CHANGED = "## \xF0\x9F\x97\xBA\xEF\xB8\x8F What's Changed";   // U+1F5FA U+FE0F
    const char* const FULL_CHANGELOG = "\xF0\x9F\x94\x97 **Full Changelog**: ";        // U+1F517
    const char* const CONTRIBUTIONS = "### \xF0\x9F\x99\x8C Contributions";            // U+1F64C
    const char* const NEW_CONTRIBUTORS = "\xF0\x9F\x8C\xB1 New contributors since the last release: ";  // U+1F331
    const char* const THANKS = "\xF0\x9F\x92\x96 Thanks to all the contributors: ";    // U+1F496
    const char* const BOTS = "\xF0\x9F\xA4\x96 Automated services that contributed: "; // U+1F916

    std::string joinHandles(const std::vector<std::string>& names, const char* sep) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += sep;
            out += "@" + names[i];
        }
        return out;
    }

    void formatSection(std::ostringstream& out, const CategorySection& section, const std::string& owner,
                       const std::string& repo, const CommitClassifier& classifier) {
        out << "### " << classifier.emojiFor(section.name) << " " << section.name << "\n";
        for (const auto& c : section.commits) {
            out << ReleaseNoteFormatter::formatCommitLine(owner, repo, c) << "\n";
        }
        out << "\n";
    }

    std::string trimEnd(std::string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
            s.pop_back();
        }
        return s;
    }
}

std::string ReleaseNoteFormatter::formatCommitLine(const std::string& owner, const std::string& repo,
                                                   const ClassifiedCommit& commit) {
    std::vector<std::string> authors(commit.authors.begin(), commit.authors.end());
    std::string sha = commit.commit.hash.empty() ? "unknown" : commit.commit.hash;

    std::ostringstream line;
    line << " * " << owner << "/" << repo << "@" << sha << " " << commit.commit.shortMessage()
         << " " << joinHandles(authors, " ");
    return line.str();
}

std::string ReleaseNoteFormatter::format(const std::string& owner,
                                         const std::string& repo,
                                         const std::string& changelogUrl,
                                         const AuthorSet& allAuthors,
                                         const AuthorSet& newAuthors,
                                         const CategoryGrouping& grouped,
                                         const CommitClassifier& classifier) {
    std::ostringstream out;
    out << WHATS_CHANGED << "\n\n";

    for (const auto& name : classifier.categoryNamesByPriority()) {
        const CategorySection* section = grouped.find(name);
        if (section && !section->commits.empty()) {
            formatSection(out, *section, owner, repo, classifier);
        }
    }

    const std::string& other = classifier.otherCategoryName();
    const CategorySection* otherSection = grouped.find(other);
    if (otherSection && !otherSection->commits.empty()) {
        formatSection(out, *otherSection, owner, repo, classifier);
    }

    // Names missing from the category table still render, after everything else
    for (const auto& section : grouped.sections()) {
        if (classifier.isKnownCategory(section.name) || StringUtils::iequals(section.name, other)) continue;
        if (section.commits.empty()) continue;
        formatSection(out, section, owner, repo, classifier);
    }

    out << FULL_CHANGELOG << changelogUrl << "\n\n";

    std::vector<std::string> bots;
    std::vector<std::string> humans;
    for (const auto& author : allAuthors) {
        (AuthorIdentityResolver::isBot(author) ? bots : humans).push_back(author);
    }
    std::vector<std::string> newHumans;
    for (const auto& author : newAuthors) {
        if (!AuthorIdentityResolver::isBot(author)) newHumans.push_back(author);
    }

    out << CONTRIBUTIONS << "\n";
    if (!newHumans.empty()) {
        out << NEW_CONTRIBUTORS << joinHandles(newHumans, ", ") << "\n";
    }
    if (!humans.empty()) {
        out << THANKS << joinHandles(humans, ", ") << "\n";
    }
    if (!bots.empty()) {
        out << "\n" << BOTS << joinHandles(bots, ", ") << "\n";
    }

    return trimEnd(out.str());
}

}
