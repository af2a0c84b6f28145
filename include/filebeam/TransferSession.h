/**
 * @file TransferSession.h
 * @brief Body reception bookkeeping for one decoded transfer
 */

#pragma once

#include "config.h"
#include "FileName.h"
#include "FileSink.h"
#include "TransferHeader.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace FileBeam {

//=============================================================================
// Session Status
//=============================================================================

/**
 * @brief Status of a transfer session
 */
enum class SessionStatus : uint8_t {
    IDLE,         ///< Header decoded, sink not yet created
    TRANSFERRING, ///< Writing body bytes
    COMPLETED,    ///< Stream ended cleanly and the sink was closed
    FAILED        ///< Sink or transport failure
};

/**
 * @brief Convert SessionStatus to string
 */
inline std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:         return "Idle";
        case SessionStatus::TRANSFERRING: return "Transferring";
        case SessionStatus::COMPLETED:    return "Completed";
        case SessionStatus::FAILED:       return "Failed";
        default:                          return "Unknown";
    }
}

//=============================================================================
// Transfer Report
//=============================================================================

/**
 * @brief Outcome of a finished body stream
 *
 * A size mismatch is not an error: the file is kept and the discrepancy is
 * surfaced to the caller as a warning.
 */
struct TransferReport {
    std::string sessionId;
    std::string fileName;                   ///< Name as declared in the header
    std::filesystem::path destinationPath;  ///< Sanitized local destination
    uint64_t declaredSize = 0;
    uint64_t bytesWritten = 0;

    bool sizeMatches() const { return declaredSize == bytesWritten; }
};

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Progress callback function type
 *
 * @param sessionId Unique session identifier
 * @param bytesTransferred Total bytes transferred so far
 * @param totalBytes Declared file size
 * @param percentage Transfer percentage (0-100, may exceed 100 when the
 *                   sender under-declared the size)
 */
using SessionProgressCallback = std::function<void(const std::string& sessionId,
                                                   uint64_t bytesTransferred,
                                                   uint64_t totalBytes,
                                                   double percentage)>;

//=============================================================================
// Helper Classes
//=============================================================================

/**
 * @class ThrottledProgress
 * @brief Wraps a progress callback with throttling
 *
 * Callbacks are only invoked if at least PROGRESS_THROTTLE_MS have elapsed
 * since the last callback. The first call always goes through, and
 * force=true bypasses the throttle (used for the final update).
 */
class ThrottledProgress {
public:
    ThrottledProgress(const std::string& sessionId,
                      SessionProgressCallback callback);

    void operator()(uint64_t bytesTransferred,
                    uint64_t totalBytes,
                    bool force = false);

private:
    std::string m_sessionId;
    SessionProgressCallback m_callback;
    std::chrono::steady_clock::time_point m_lastUpdate;
    bool m_hasUpdated;
    std::mutex m_mutex;
};

/**
 * @brief Percentage of totalBytes covered by bytesTransferred (100 for empty files)
 */
double progressPercentage(uint64_t bytesTransferred, uint64_t totalBytes);

//=============================================================================
// TransferSession Class
//=============================================================================

/**
 * @class TransferSession
 * @brief Ties one accepted stream to one destination sink
 *
 * Created once the header is decoded. Owns the sink exclusively and counts
 * every body byte written to it; finalize() compares that count against the
 * declared size. One session per stream, no state shared with other sessions.
 *
 * Usage:
 * @code
 * TransferSession session(header, outputDir);
 * std::string error;
 * if (!session.open(diskSinkFactory(), error)) { ... }
 * session.writeBody(data, size, error);
 * TransferReport report;
 * session.finalize(report, error);
 * @endcode
 */
class TransferSession {
public:
    /**
     * @brief Constructor
     * @param header Decoded header (name is sanitized here, not trusted)
     * @param outputDir Directory the destination file is created in
     * @param progressCb Optional progress callback (throttled)
     */
    TransferSession(const FileHeader& header,
                    const std::filesystem::path& outputDir,
                    SessionProgressCallback progressCb = nullptr);

    ~TransferSession();

    // Prevent copying
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * @brief Create the destination through a fresh sink
     * @param factory Sink factory (must produce a non-null sink)
     * @param errorMsg Output error message
     * @return true if the destination was created
     */
    bool open(const SinkFactory& factory, std::string& errorMsg);

    /**
     * @brief Write body bytes and advance bytesWritten
     */
    bool writeBody(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Close the sink and produce the report
     * @param report Filled in even when the sizes disagree
     * @param errorMsg Output error message if the sink fails to close
     * @return false only if closing the sink failed
     */
    bool finalize(TransferReport& report, std::string& errorMsg);

    /**
     * @brief Close the sink after a stream failure, keeping partial output
     */
    void abort(const std::string& reason);

    const std::string& getSessionId() const { return m_sessionId; }
    const FileHeader& getHeader() const { return m_header; }
    const std::filesystem::path& getDestinationPath() const { return m_destinationPath; }
    uint64_t getBytesWritten() const { return m_bytesWritten; }
    SessionStatus getStatus() const { return m_status; }

    /// True when the peer's name had to be rewritten to stay inside the output directory
    bool nameWasSanitized() const { return !isSafeFileName(m_header.fileName); }

private:
    std::string m_sessionId;
    FileHeader m_header;
    std::filesystem::path m_destinationPath;
    std::unique_ptr<FileSink> m_sink;
    uint64_t m_bytesWritten;
    SessionStatus m_status;
    ThrottledProgress m_progress;
};

}  // namespace FileBeam
