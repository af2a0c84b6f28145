/**
 * @file test_util.h
 * @brief Shared helpers for FileBeam tests
 */

#pragma once

#include "filebeam/FileSink.h"
#include "filebeam/TransferHeader.h"
#include "filebeam/TransportStream.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace FileBeam {
namespace test {

// Unique scratch directory removed on destruction
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string testName = info ? info->name() : "unknown";
        m_path = std::filesystem::temp_directory_path() /
                 ("filebeam_" + tag + "_" + testName + "_" + std::to_string(counter++));
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/**
 * @brief In-memory stream that replays scripted deliveries
 *
 * Each queued chunk is returned by one receiveChunk() call. When the script
 * runs out the stream reports its terminal status.
 */
class ScriptedStream final : public TransportStream {
public:
    void deliver(const std::vector<uint8_t>& bytes) { m_chunks.push_back(bytes); }

    void deliverByteByByte(const std::vector<uint8_t>& bytes) {
        for (uint8_t b : bytes) {
            m_chunks.push_back({b});
        }
    }

    void endWith(ChunkStatus status, const std::string& errorMsg = std::string()) {
        m_terminal = status;
        m_terminalError = errorMsg;
    }

    ChunkStatus receiveChunk(uint8_t* buffer, size_t capacity,
                             size_t& received, std::string& errorMsg) override {
        received = 0;
        if (m_chunks.empty()) {
            errorMsg = m_terminalError;
            return m_terminal;
        }
        auto& front = m_chunks.front();
        const size_t n = std::min(capacity, front.size());
        std::copy(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(n), buffer);
        front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(n));
        if (front.empty()) {
            m_chunks.pop_front();
        }
        received = n;
        return ChunkStatus::DATA;
    }

    bool sendChunk(const uint8_t* data, size_t size, std::string& errorMsg) override {
        (void)errorMsg;
        sent.insert(sent.end(), data, data + size);
        return true;
    }

    bool close(std::string& errorMsg) override {
        (void)errorMsg;
        closed = true;
        return true;
    }

    std::vector<uint8_t> sent;
    bool closed = false;

private:
    std::deque<std::vector<uint8_t>> m_chunks;
    ChunkStatus m_terminal = ChunkStatus::END_OF_STREAM;
    std::string m_terminalError;
};

// Sink that fails after accepting a fixed number of bytes
class FailingSink final : public FileSink {
public:
    explicit FailingSink(size_t acceptBytes) : m_remaining(acceptBytes) {}

    bool create(const std::filesystem::path& path, std::string& errorMsg) override {
        (void)path;
        (void)errorMsg;
        return true;
    }

    bool writeAll(const uint8_t* data, size_t size, std::string& errorMsg) override {
        (void)data;
        if (size > m_remaining) {
            errorMsg = "disk full";
            return false;
        }
        m_remaining -= size;
        return true;
    }

    bool close(std::string& errorMsg) override {
        (void)errorMsg;
        return true;
    }

private:
    size_t m_remaining;
};

inline std::vector<uint8_t> wireBytes(const std::string& name, uint64_t declaredSize,
                                      const std::string& body) {
    std::vector<uint8_t> out;
    std::string error;
    EXPECT_TRUE(encodeFileHeader(name, declaredSize, out, error)) << error;
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

}  // namespace test
}  // namespace FileBeam
