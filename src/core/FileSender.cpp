/**
 * @file FileSender.cpp
 * @brief Sender side of a transfer: header once, then the raw file body
 */

#include "filebeam/FileSender.h"
#include "filebeam/Debug.h"
#include "filebeam/SessionId.h"
#include "filebeam/TransferHeader.h"
#include "filebeam/TransportStream.h"
#include <filesystem>
#include <fstream>
#include <vector>

namespace FileBeam {

FileSender::FileSender(const std::string& filePath)
    : m_filePath(filePath)
    , m_fileSize(0)
    , m_bytesSent(0)
    , m_initialized(false)
    , m_lastErrorKind(TransferErrorKind::NONE)
{
}

bool FileSender::initialize(std::string& errorMsg) {
    if (m_initialized) {
        return true;
    }

    std::error_code ec;
    const std::filesystem::path path(m_filePath);

    if (!std::filesystem::is_regular_file(path, ec)) {
        errorMsg = "Not a regular file: " + m_filePath;
        m_lastErrorKind = TransferErrorKind::SOURCE;
        return false;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        errorMsg = "Failed to read file size of " + m_filePath + ": " + ec.message();
        m_lastErrorKind = TransferErrorKind::SOURCE;
        return false;
    }

    const std::string name = path.filename().string();
    if (name.empty() || name == "." || name == "..") {
        errorMsg = "File path has no file name component: " + m_filePath;
        m_lastErrorKind = TransferErrorKind::SOURCE;
        return false;
    }

    m_fileName = name;
    m_fileSize = static_cast<uint64_t>(size);
    m_initialized = true;
    return true;
}

bool FileSender::sendFile(TransportStream& stream,
                          std::string& errorMsg,
                          SessionProgressCallback progress) {
    m_bytesSent = 0;
    m_lastErrorKind = TransferErrorKind::NONE;

    if (!initialize(errorMsg)) {
        return false;
    }

    std::vector<uint8_t> header;
    if (!encodeFileHeader(m_fileName, m_fileSize, header, errorMsg)) {
        m_lastErrorKind = TransferErrorKind::ENCODING;
        return false;
    }

    if (!stream.sendChunk(header.data(), header.size(), errorMsg)) {
        errorMsg = "Failed to send header: " + errorMsg;
        m_lastErrorKind = TransferErrorKind::TRANSPORT;
        return false;
    }

    LOG_DEBUG("Sent header for '" << m_fileName << "' (" << m_fileSize << " bytes declared)");

    ThrottledProgress throttled(SessionId::generateWithPrefix("send_"), std::move(progress));
    if (!sendFileData(stream, errorMsg, throttled)) {
        return false;
    }

    if (!stream.close(errorMsg)) {
        errorMsg = "Failed to close stream: " + errorMsg;
        m_lastErrorKind = TransferErrorKind::TRANSPORT;
        return false;
    }

    return true;
}

bool FileSender::sendFileData(TransportStream& stream, std::string& errorMsg,
                              ThrottledProgress& progress) {
    std::ifstream file(m_filePath, std::ios::binary);
    if (!file) {
        errorMsg = "Failed to open file for reading: " + m_filePath;
        m_lastErrorKind = TransferErrorKind::SOURCE;
        return false;
    }

    std::vector<uint8_t> buffer(BUFFER_SIZE);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytesRead = file.gcount();

        if (bytesRead <= 0) {
            break;  // EOF or error
        }

        if (!stream.sendChunk(buffer.data(), static_cast<size_t>(bytesRead), errorMsg)) {
            errorMsg = "Failed to send file chunk: " + errorMsg;
            m_lastErrorKind = TransferErrorKind::TRANSPORT;
            return false;
        }

        m_bytesSent += static_cast<uint64_t>(bytesRead);
        progress(m_bytesSent, m_fileSize);
    }

    if (file.bad()) {
        errorMsg = "Error reading file: " + m_filePath;
        m_lastErrorKind = TransferErrorKind::SOURCE;
        return false;
    }

    progress(m_bytesSent, m_fileSize, true);

    // A concurrent writer shows up as an integrity mismatch on the receiver
    if (m_bytesSent != m_fileSize) {
        LOG_WARNING("File " << m_filePath << " changed while sending: declared "
                    << m_fileSize << " bytes, sent " << m_bytesSent);
    }

    return true;
}

}  // namespace FileBeam
