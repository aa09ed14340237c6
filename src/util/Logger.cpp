#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace havc {

LogLevel Logger::parseLevel(const std::string& v, LogLevel fallback) {
    if (v == "debug" || v == "4") return LogLevel::Debug;
    if (v == "info" || v == "3") return LogLevel::Info;
    if (v == "warn" || v == "2") return LogLevel::Warn;
    if (v == "error" || v == "1") return LogLevel::Error;
    if (v == "critical" || v == "0") return LogLevel::Critical;
    return fallback;
}

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("HAVC_LOG");
    if (!env) return LogLevel::Info;
    return Logger::parseLevel(env, LogLevel::Info);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::critical(const std::string& msg) const { std::cerr << "[CRITICAL] " << msg << "\n"; }
void Logger::error(const std::string& msg) const { if (currentLevel >= LogLevel::Error) std::cerr << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (currentLevel >= LogLevel::Warn) std::cerr << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (currentLevel >= LogLevel::Info) std::cerr << "[info ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (currentLevel >= LogLevel::Debug) std::cerr << "[debug] " << msg << "\n"; }

}
