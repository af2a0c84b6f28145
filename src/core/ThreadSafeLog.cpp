/**
 * @file ThreadSafeLog.cpp
 * @brief Optional log file shared by every handler thread
 */

#include "filebeam/ThreadSafeLog.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace FileBeam {

std::mutex ThreadSafeLog::s_mutex;
std::ofstream ThreadSafeLog::s_file;

bool ThreadSafeLog::open(const std::filesystem::path& logPath, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_file.is_open()) {
        s_file.close();
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Failed to create log directory " + logPath.parent_path().string() +
                       ": " + ec.message();
            return false;
        }
    }

    s_file.clear();
    s_file.open(logPath, std::ios::out | std::ios::app);
    if (!s_file.is_open()) {
        errorMsg = "Failed to open log file: " + logPath.string();
        return false;
    }

    return true;
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_file.is_open()) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    gmtime_r(&nowT, &tmBuf);

    s_file << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << "Z"
           << " [" << std::this_thread::get_id() << "] " << message << '\n';
    s_file.flush();

    if (!s_file) {
        // Disk full or file removed; stop mirroring instead of failing every line
        s_file.close();
    }
}

void ThreadSafeLog::close() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.close();
    }
}

bool ThreadSafeLog::isEnabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_file.is_open();
}

} // namespace FileBeam
