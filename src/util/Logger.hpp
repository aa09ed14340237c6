#pragma once

#include <string>

namespace havc {

enum class LogLevel { Critical = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

/**
 * @brief Process-wide leveled logger
 *
 * Level is read once from HAVC_LOG (critical|error|warn|info|debug or 0-4).
 * Every level goes to stderr; stdout carries command output only, such
 * as file content from `havc show`.
 * Critical is always emitted regardless of the configured level.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void critical(const std::string& msg) const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    static LogLevel parseLevel(const std::string& value, LogLevel fallback);

private:
    Logger();
    LogLevel currentLevel;
};

}
