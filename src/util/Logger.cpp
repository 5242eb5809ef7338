#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

#include "util/StringUtils.hpp"

namespace relnotes {

namespace {
    std::string envOrEmpty(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }

    const char* plainTag(LogLevel level) {
        switch (level) {
            case LogLevel::Error: return "[error] ";
            case LogLevel::Warn: return "[warn ] ";
            case LogLevel::Info: return "[info ] ";
            case LogLevel::Debug: return "[debug] ";
        }
        return "";
    }
}

LogLevel Logger::parseLevel(const std::string& value) {
    std::string v = StringUtils::toLower(StringUtils::trim(value));
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

std::string Logger::escapeWorkflowData(const std::string& msg) {
    std::string out;
    out.reserve(msg.size());
    for (char c : msg) {
        switch (c) {
            case '%': out += "%25"; break;
            case '\r': out += "%0D"; break;
            case '\n': out += "%0A"; break;
            default: out += c;
        }
    }
    return out;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
    : currentLevel(parseLevel(envOrEmpty("RELNOTES_LOG"))),
      currentStyle(StringUtils::iequals(envOrEmpty("GITHUB_ACTIONS"), "true") ? LogStyle::GitHubActions
                                                                             : LogStyle::Plain) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::write(LogLevel level, const std::string& msg) const {
    if (currentLevel < level) return;
    if (currentStyle == LogStyle::Plain) {
        std::cerr << plainTag(level) << msg << "\n";
        return;
    }
    // Info has no workflow command; it is printed as is
    switch (level) {
        case LogLevel::Error: std::cerr << "::error::" << escapeWorkflowData(msg) << "\n"; break;
        case LogLevel::Warn: std::cerr << "::warning::" << escapeWorkflowData(msg) << "\n"; break;
        case LogLevel::Debug: std::cerr << "::debug::" << escapeWorkflowData(msg) << "\n"; break;
        case LogLevel::Info: std::cerr << msg << "\n"; break;
    }
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, msg); }

}
