/**
 * @file FileSink.cpp
 * @brief Destination for a received file body
 */

#include "filebeam/FileSink.h"

namespace FileBeam {

DiskFileSink::~DiskFileSink() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

bool DiskFileSink::create(const std::filesystem::path& path, std::string& errorMsg) {
    m_file.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!m_file) {
        errorMsg = "Failed to create output file: " + path.string();
        return false;
    }
    m_path = path;
    return true;
}

bool DiskFileSink::writeAll(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_file.is_open()) {
        errorMsg = "Output file is not open";
        return false;
    }
    if (!data || size == 0) {
        return true;
    }

    m_file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!m_file) {
        errorMsg = "Failed to write to output file: " + m_path.string();
        return false;
    }
    return true;
}

bool DiskFileSink::close(std::string& errorMsg) {
    if (!m_file.is_open()) {
        return true;
    }

    m_file.flush();
    const bool flushed = static_cast<bool>(m_file);
    m_file.close();
    if (!flushed || m_file.fail()) {
        errorMsg = "Failed to flush output file: " + m_path.string();
        return false;
    }
    return true;
}

SinkFactory diskSinkFactory() {
    return [] { return std::make_unique<DiskFileSink>(); };
}

}  // namespace FileBeam
