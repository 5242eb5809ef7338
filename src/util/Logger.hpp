#pragma once

#include <string>

namespace relnotes {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// Plain "[level] msg" lines, or GitHub Actions workflow commands
enum class LogStyle { Plain, GitHubActions };

/**
 * @brief Process-wide leveled logger
 *
 * Every level writes to stderr so stdout carries only the rendered
 * release notes. Initial level comes from RELNOTES_LOG; the style switches
 * to workflow commands ("::warning::...") when GITHUB_ACTIONS is "true", so
 * warnings and errors show up as annotations on the run.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void setStyle(LogStyle style) { currentStyle = style; }
    LogStyle style() const { return currentStyle; }
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse "debug|info|warn|warning|error" (any case) or "3|2|1|0"; Info otherwise
    static LogLevel parseLevel(const std::string& value);

    /// Escape '%', CR and LF for a workflow command payload
    static std::string escapeWorkflowData(const std::string& msg);

private:
    Logger();
    LogLevel currentLevel;
    LogStyle currentStyle;

    void write(LogLevel level, const std::string& msg) const;
};

}
