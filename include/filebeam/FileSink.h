/**
 * @file FileSink.h
 * @brief Destination for a received file body
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

namespace FileBeam {

/**
 * @brief Write-only destination owned by a single transfer session
 *
 * create() truncates any existing file at the same path (last writer wins).
 * Nothing is deleted on failure; partially written output is left in place.
 */
class FileSink {
public:
    virtual ~FileSink() = default;
    virtual bool create(const std::filesystem::path& path, std::string& errorMsg) = 0;
    virtual bool writeAll(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool close(std::string& errorMsg) = 0;
};

/**
 * @brief FileSink backed by a binary std::ofstream
 */
class DiskFileSink final : public FileSink {
public:
    DiskFileSink() = default;
    ~DiskFileSink() override;

    bool create(const std::filesystem::path& path, std::string& errorMsg) override;
    bool writeAll(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool close(std::string& errorMsg) override;

private:
    std::ofstream m_file;
    std::filesystem::path m_path;
};

using SinkFactory = std::function<std::unique_ptr<FileSink>()>;

/**
 * @brief Factory producing a fresh DiskFileSink per session
 */
SinkFactory diskSinkFactory();

}  // namespace FileBeam
