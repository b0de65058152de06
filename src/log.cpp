#include "log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace cutlist {

namespace {

std::atomic<int> currentLevel{static_cast<int>(LogLevel::Info)};
std::mutex outputMutex;

} // namespace

void setLogLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(currentLevel.load());
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LogLevel::Debug;
    } else if (text == "info") {
        level = LogLevel::Info;
    } else if (text == "warn" || text == "warning") {
        level = LogLevel::Warn;
    } else if (text == "error") {
        level = LogLevel::Error;
    } else if (text == "off" || text == "none") {
        level = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

void configureLogLevelFromEnv() {
    const char* value = std::getenv("CUTLIST_LOG_LEVEL");
    if (value == nullptr) {
        return;
    }
    LogLevel level = logLevel();
    if (parseLogLevel(value, level)) {
        setLogLevel(level);
    } else {
        logWarn("Ignoring unknown CUTLIST_LOG_LEVEL '", value, "'");
    }
}

void logLine(LogLevel level, const std::string& message) {
    if (level < logLevel() || level == LogLevel::Off) {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << "[Cutlist] ";
    switch (level) {
        case LogLevel::Warn: std::cerr << "WARNING: "; break;
        case LogLevel::Error: std::cerr << "ERROR: "; break;
        default: break;
    }
    std::cerr << message << std::endl;
}

} // namespace cutlist
