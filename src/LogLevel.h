/**
 * @file LogLevel.h
 * @brief Centralized log level system for cuetrack
 *
 * Provides 4 log levels (ERROR, WARN, INFO, DEBUG) with runtime filtering
 * via g_logLevel. Lines are written whole under a single mutex so that the
 * playback threads, the sink thread and the main thread never interleave.
 *
 * Usage:
 *   LOG_ERROR("something failed: " << reason);
 *   LOG_WARN("buffer low: " << pct << "%");
 *   LOG_INFO("Playback started");
 *   LOG_DEBUG("[Component] detailed message");
 */

#ifndef CUETRACK_LOGLEVEL_H
#define CUETRACK_LOGLEVEL_H

#include <iostream>
#include <mutex>
#include <sstream>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;
extern std::mutex g_logMutex;

#define CUETRACK_LOG_LINE(stream, prefix, x) do { \
    std::ostringstream _line; _line << prefix << x; \
    std::lock_guard<std::mutex> _lock(g_logMutex); \
    stream << _line.str() << std::endl; \
} while(0)

#define LOG_ERROR(x) do { \
    if (g_logLevel >= LogLevel::ERROR) { CUETRACK_LOG_LINE(std::cerr, "[ERROR] ", x); } \
} while(0)
#define LOG_WARN(x) do { \
    if (g_logLevel >= LogLevel::WARN) { CUETRACK_LOG_LINE(std::cerr, "[WARN] ", x); } \
} while(0)
#define LOG_INFO(x) do { \
    if (g_logLevel >= LogLevel::INFO) { CUETRACK_LOG_LINE(std::cerr, "", x); } \
} while(0)
#define LOG_DEBUG(x) do { \
    if (g_logLevel >= LogLevel::DEBUG) { CUETRACK_LOG_LINE(std::cerr, "", x); } \
} while(0)

#endif // CUETRACK_LOGLEVEL_H
