/**
 * @file logger.cpp
 * @brief Diagnostic stream implementation
 */

#include "utils/logger.h"
#include "utils/string_utils.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace log_watchdog {

namespace {

LogLevel g_minLogLevel = LogLevel::INFO;
std::ostream* g_stream = nullptr;

std::string wallClockStamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

void setLogLevel(LogLevel level) { g_minLogLevel = level; }

LogLevel getLogLevel() { return g_minLogLevel; }

LogLevel parseLogLevel(const std::string& name) {
    const std::string s = toLower(trim(name));
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn" || s == "warning") return LogLevel::WARNING;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "[DEBUG]";
        case LogLevel::INFO:    return "[INFO]";
        case LogLevel::WARNING: return "[WARN]";
        case LogLevel::ERROR:   return "[ERROR]";
    }
    return "[INFO]";
}

void setLogStream(std::ostream* stream) { g_stream = stream; }

void log(LogLevel level, const std::string& message) {
    if (level < g_minLogLevel) return;

    std::ostream& out = g_stream ? *g_stream : std::cout;
    // flushed per line; the reader may be another process
    out << wallClockStamp() << ' ' << logLevelTag(level) << ' ' << message << std::endl;
}

void logDebug(const std::string& message) { log(LogLevel::DEBUG, message); }
void logInfo(const std::string& message) { log(LogLevel::INFO, message); }
void logWarning(const std::string& message) { log(LogLevel::WARNING, message); }
void logError(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace log_watchdog
