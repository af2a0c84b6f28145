/**
 * @file ThreadSafeLog.h
 * @brief Optional log file shared by every handler thread
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace FileBeam {

/**
 * @brief Append-only mirror of the LOG_* output
 *
 * Every LOG_* line is also passed to log(); nothing is written until
 * open() succeeds. Lines from concurrent stream handlers never interleave.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Open (append) the log file, replacing any previous one
     * @param logPath Path to the log file; parent directories are created
     * @param errorMsg Output error message on failure
     * @return true if the file is open for appending
     */
    static bool open(const std::filesystem::path& logPath, std::string& errorMsg);

    /**
     * @brief Append "<timestamp> [tid] <message>" if a file is open
     */
    static void log(const std::string& message);

    static void close();

    static bool isEnabled();

private:
    static std::mutex s_mutex;
    static std::ofstream s_file;
};

} // namespace FileBeam
