/**
 * Diagnostic logging to stderr.
 *
 * stdout carries the JSON result of the CLI, so every diagnostic line goes
 * to std::cerr with a "[Cutlist]" prefix. Lines below the current level are
 * dropped before the message is formatted.
 */

#ifndef CUTLIST_LOG_HPP
#define CUTLIST_LOG_HPP

#include <sstream>
#include <string>
#include <utility>

namespace cutlist {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

/**
 * Parse "debug", "info", "warn", "error" or "off". Returns false and leaves
 * level untouched for anything else.
 */
bool parseLogLevel(const std::string& text, LogLevel& level);

/**
 * Apply CUTLIST_LOG_LEVEL from the environment, if set and valid.
 */
void configureLogLevelFromEnv();

void logLine(LogLevel level, const std::string& message);

namespace detail {

template <class... Args>
void logFormatted(LogLevel level, Args&&... args) {
    if (level < logLevel()) {
        return;
    }
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    logLine(level, out.str());
}

} // namespace detail

template <class... Args>
void logDebug(Args&&... args) { detail::logFormatted(LogLevel::Debug, std::forward<Args>(args)...); }

template <class... Args>
void logInfo(Args&&... args) { detail::logFormatted(LogLevel::Info, std::forward<Args>(args)...); }

template <class... Args>
void logWarn(Args&&... args) { detail::logFormatted(LogLevel::Warn, std::forward<Args>(args)...); }

template <class... Args>
void logError(Args&&... args) { detail::logFormatted(LogLevel::Error, std::forward<Args>(args)...); }

} // namespace cutlist

#endif // CUTLIST_LOG_HPP
