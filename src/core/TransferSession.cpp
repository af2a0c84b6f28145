/**
 * @file TransferSession.cpp
 * @brief Body reception bookkeeping for one decoded transfer
 */

#include "filebeam/TransferSession.h"
#include "filebeam/Debug.h"
#include "filebeam/FileName.h"
#include "filebeam/SessionId.h"

namespace FileBeam {

//=============================================================================
// Helper: ThrottledProgress Implementation
//=============================================================================

double progressPercentage(uint64_t bytesTransferred, uint64_t totalBytes) {
    if (totalBytes == 0) {
        return 100.0;
    }
    return (static_cast<double>(bytesTransferred) / static_cast<double>(totalBytes)) * 100.0;
}

ThrottledProgress::ThrottledProgress(const std::string& sessionId,
                                     SessionProgressCallback callback)
    : m_sessionId(sessionId)
    , m_callback(std::move(callback))
    , m_lastUpdate()
    , m_hasUpdated(false)
{
}

void ThrottledProgress::operator()(uint64_t bytesTransferred,
                                   uint64_t totalBytes,
                                   bool force) {
    if (!m_callback) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - m_lastUpdate).count();

    if (force || !m_hasUpdated || elapsed >= PROGRESS_THROTTLE_MS) {
        m_callback(m_sessionId, bytesTransferred, totalBytes,
                   progressPercentage(bytesTransferred, totalBytes));
        m_lastUpdate = now;
        m_hasUpdated = true;
    }
}

//=============================================================================
// TransferSession
//=============================================================================

TransferSession::TransferSession(const FileHeader& header,
                                 const std::filesystem::path& outputDir,
                                 SessionProgressCallback progressCb)
    : m_sessionId(SessionId::generateWithPrefix("xfer_"))
    , m_header(header)
    , m_destinationPath(outputDir / sanitizeFileName(header.fileName))
    , m_sink()
    , m_bytesWritten(0)
    , m_status(SessionStatus::IDLE)
    , m_progress(m_sessionId, std::move(progressCb))
{
}

TransferSession::~TransferSession() {
    if (m_sink) {
        std::string closeError;
        if (!m_sink->close(closeError)) {
            LOG_WARNING(m_sessionId << ": " << closeError);
        }
    }
}

bool TransferSession::open(const SinkFactory& factory, std::string& errorMsg) {
    if (m_status != SessionStatus::IDLE) {
        errorMsg = "Session already opened";
        return false;
    }

    m_sink = factory ? factory() : nullptr;
    if (!m_sink) {
        errorMsg = "No file sink available";
        m_status = SessionStatus::FAILED;
        return false;
    }

    if (!m_sink->create(m_destinationPath, errorMsg)) {
        m_sink.reset();
        m_status = SessionStatus::FAILED;
        return false;
    }

    if (nameWasSanitized()) {
        LOG_DEBUG(m_sessionId << ": peer name '" << m_header.fileName << "' stored as '"
                  << m_destinationPath.filename().string() << "'");
    }
    LOG_DEBUG(m_sessionId << ": receiving '" << m_header.fileName << "' ("
              << m_header.fileSize << " bytes declared) into "
              << m_destinationPath.string());

    m_status = SessionStatus::TRANSFERRING;
    return true;
}

bool TransferSession::writeBody(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (m_status != SessionStatus::TRANSFERRING || !m_sink) {
        errorMsg = "Session is not accepting body bytes (" +
                   sessionStatusToString(m_status) + ")";
        return false;
    }

    if (!m_sink->writeAll(data, size, errorMsg)) {
        m_status = SessionStatus::FAILED;
        return false;
    }

    m_bytesWritten += size;
    m_progress(m_bytesWritten, m_header.fileSize);
    return true;
}

bool TransferSession::finalize(TransferReport& report, std::string& errorMsg) {
    report.sessionId = m_sessionId;
    report.fileName = m_header.fileName;
    report.destinationPath = m_destinationPath;
    report.declaredSize = m_header.fileSize;
    report.bytesWritten = m_bytesWritten;

    if (m_status != SessionStatus::TRANSFERRING || !m_sink) {
        errorMsg = "Cannot finalize session in state " + sessionStatusToString(m_status);
        return false;
    }

    const bool closed = m_sink->close(errorMsg);
    m_sink.reset();
    if (!closed) {
        m_status = SessionStatus::FAILED;
        return false;
    }

    m_progress(m_bytesWritten, m_header.fileSize, true);
    m_status = SessionStatus::COMPLETED;
    return true;
}

void TransferSession::abort(const std::string& reason) {
    if (m_sink) {
        std::string closeError;
        if (!m_sink->close(closeError)) {
            LOG_WARNING(m_sessionId << ": " << closeError);
        }
        m_sink.reset();
    }
    m_status = SessionStatus::FAILED;
    LOG_DEBUG(m_sessionId << ": aborted after " << m_bytesWritten
              << " bytes: " << reason);
}

}  // namespace FileBeam
