/**
 * @file FileSender.h
 * @brief Sender side of a transfer: header once, then the raw file body
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"
#include "TransferSession.h"
#include <cstdint>
#include <string>

namespace FileBeam {

class TransportStream;

//=============================================================================
// FileSender Class
//=============================================================================

/**
 * @class FileSender
 * @brief Streams one file onto a transport stream
 *
 * 1. Validates the file is a readable regular file and records its size
 * 2. Encodes the header (an over-long name aborts before anything is sent)
 * 3. Sends the header, then the file in BUFFER_SIZE chunks
 * 4. Closes the stream so the receiver observes end of stream
 *
 * Empty files are allowed: only the header is sent.
 *
 * Usage:
 * @code
 * FileSender sender("/path/to/report.pdf");
 * std::string error;
 * if (sender.sendFile(stream, error)) {
 *     std::cout << "Sent " << sender.getBytesSent() << " bytes\n";
 * }
 * @endcode
 */
class FileSender {
public:
    /**
     * @brief Constructor
     * @param filePath Path to the file to send
     *
     * Does not open the file yet. Call sendFile() to initiate transfer.
     */
    explicit FileSender(const std::string& filePath);

    // Prevent copying
    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    /**
     * @brief Send the file over a connected stream and close it
     * @param stream Open transport stream
     * @param errorMsg Output error message if transfer fails
     * @param progress Optional progress callback (throttled)
     * @return true if every byte was sent and the stream was closed
     */
    bool sendFile(TransportStream& stream,
                  std::string& errorMsg,
                  SessionProgressCallback progress = nullptr);

    /**
     * @brief Validate the file and compute the header name and size
     *
     * Called by sendFile(); may be called earlier to fail fast before
     * connecting.
     */
    bool initialize(std::string& errorMsg);


    /**
     * @brief Name sent in the header (last path component)
     */
    const std::string& getFileName() const { return m_fileName; }

    uint64_t getFileSize() const { return m_fileSize; }
    uint64_t getBytesSent() const { return m_bytesSent; }

    /**
     * @brief Classification of the last failure (NONE after success)
     */
    TransferErrorKind getLastErrorKind() const { return m_lastErrorKind; }

private:
    bool sendFileData(TransportStream& stream, std::string& errorMsg,
                      ThrottledProgress& progress);

    std::string m_filePath;
    std::string m_fileName;
    uint64_t m_fileSize;
    uint64_t m_bytesSent;
    bool m_initialized;
    TransferErrorKind m_lastErrorKind;
};

}  // namespace FileBeam
