/**
 * @file Debug.h
 * @brief Debug logging utilities with timestamps
 */

#pragma once

#include "ThreadSafeLog.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace FileBeam {

// Serializes writes to std::cerr from concurrent stream handlers
inline std::mutex g_logMutex;

// LOG_DEBUG output is suppressed unless enabled
inline std::atomic<bool> g_debugLogging{false};

/**
 * @brief Enable or disable LOG_DEBUG output
 */
inline void setDebugLogging(bool enabled) {
    g_debugLogging.store(enabled);
}

/**
 * @brief Enable LOG_DEBUG when FILEBEAM_DEBUG is set to a non-empty, non-"0" value
 */
inline void initDebugLoggingFromEnv() {
    const char* value = std::getenv("FILEBEAM_DEBUG");
    if (value && *value && std::string(value) != "0") {
        setDebugLogging(true);
    }
}

inline bool isDebugLogging() {
    return g_debugLogging.load();
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

}  // namespace FileBeam

/**
 * @brief Thread-safe logging macros with timestamp
 *
 * Each line goes to std::cerr under g_logMutex and is mirrored to the
 * ThreadSafeLog file when one has been configured.
 */
#define FILEBEAM_LOG_LINE(level, msg) \
    do { \
        std::ostringstream filebeamLogOss_; \
        filebeamLogOss_ << "[" << level << "] " << msg; \
        { \
            std::lock_guard<std::mutex> filebeamLogLock_(FileBeam::g_logMutex); \
            std::cerr << FileBeam::getTimestamp() << " " << filebeamLogOss_.str() << std::endl; \
        } \
        FileBeam::ThreadSafeLog::log(filebeamLogOss_.str()); \
    } while(0)

#define LOG_INFO(msg) FILEBEAM_LOG_LINE("INFO", msg)

#define LOG_WARNING(msg) FILEBEAM_LOG_LINE("WARNING", msg)

#define LOG_ERROR(msg) FILEBEAM_LOG_LINE("ERROR", msg)

#define LOG_DEBUG(msg) \
    do { \
        if (FileBeam::isDebugLogging()) { \
            FILEBEAM_LOG_LINE("DEBUG", msg); \
        } \
    } while(0)
