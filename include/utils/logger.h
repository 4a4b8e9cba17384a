#pragma once
/**
 * @file logger.h
 * @brief Diagnostic stream for the watch loop
 *
 * One line per event: "HH:MM:SS.mmm [LEVEL] message". A supervising process
 * may tail this stream for display; it is not a stable format.
 */

#include <iosfwd>
#include <string>

namespace log_watchdog {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/**
 * @brief Parse a level name ("debug", "info", "warn"/"warning", "error")
 * @return Parsed level, INFO for unknown names
 */
LogLevel parseLogLevel(const std::string& name);

/// Tag printed between the timestamp and the message, e.g. "[WARN]"
const char* logLevelTag(LogLevel level);

/**
 * @brief Redirect log output (nullptr restores std::cout)
 *
 * The stream must outlive all logging calls made while it is installed.
 */
void setLogStream(std::ostream* stream);

void log(LogLevel level, const std::string& message);

void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

} // namespace log_watchdog
