/**
 * @file StreamReceiver.cpp
 * @brief Two-phase receive loop for a single accepted stream
 */

#include "filebeam/StreamReceiver.h"
#include "filebeam/Debug.h"
#include <vector>

namespace FileBeam {

StreamReceiver::StreamReceiver(std::shared_ptr<const std::filesystem::path> outputDir,
                               SinkFactory sinkFactory,
                               SessionProgressCallback progressCb)
    : m_outputDir(std::move(outputDir))
    , m_sinkFactory(std::move(sinkFactory))
    , m_progressCallback(std::move(progressCb))
    , m_reassembler(
          [this](const FileHeader& header, std::string& errorMsg) {
              return handleHeader(header, errorMsg);
          },
          [this](const uint8_t* data, size_t size, std::string& errorMsg) {
              return handleBody(data, size, errorMsg);
          })
    , m_finished(false)
{
}

//=============================================================================
// Receive loop
//=============================================================================

ReceiveResult StreamReceiver::receive(TransportStream& stream) {
    std::vector<uint8_t> buffer(BUFFER_SIZE);

    while (!m_finished) {
        size_t received = 0;
        std::string errorMsg;
        const ChunkStatus status = stream.receiveChunk(buffer.data(), buffer.size(),
                                                       received, errorMsg);
        switch (status) {
            case ChunkStatus::DATA:
                if (!onChunk(buffer.data(), received)) {
                    return m_result;
                }
                break;
            case ChunkStatus::END_OF_STREAM:
                return onEndOfStream();
            case ChunkStatus::FAILED:
            default:
                return onTransportError(errorMsg);
        }
    }

    return m_result;
}

//=============================================================================
// Events
//=============================================================================

bool StreamReceiver::onChunk(const uint8_t* data, size_t size) {
    if (m_finished) {
        return false;
    }

    std::string errorMsg;
    if (!m_reassembler.push(data, size, errorMsg)) {
        // handleHeader/handleBody already classified the failure
        if (!m_finished) {
            fail(TransferErrorKind::SINK, errorMsg);
        }
        return false;
    }
    return true;
}

ReceiveResult StreamReceiver::onEndOfStream() {
    if (m_finished) {
        return m_result;
    }

    std::string errorMsg;
    if (!m_reassembler.finish(errorMsg)) {
        fail(TransferErrorKind::PROTOCOL_VIOLATION, errorMsg);
        return m_result;
    }

    TransferReport report;
    if (!m_session->finalize(report, errorMsg)) {
        m_result.report = report;
        fail(TransferErrorKind::SINK, errorMsg);
        return m_result;
    }

    m_result.report = report;
    m_result.completed = true;
    m_finished = true;

    if (!report.sizeMatches()) {
        m_result.error = TransferErrorKind::INTEGRITY_MISMATCH;
        m_result.errorMessage = "expected " + std::to_string(report.declaredSize) +
                                " bytes for '" + report.fileName + "' but wrote " +
                                std::to_string(report.bytesWritten);
    }

    return m_result;
}

ReceiveResult StreamReceiver::onTransportError(const std::string& errorMsg) {
    if (!m_finished) {
        fail(TransferErrorKind::TRANSPORT,
             errorMsg.empty() ? std::string("Stream read failed") : errorMsg);
    }
    return m_result;
}

//=============================================================================
// Reassembler handlers
//=============================================================================

bool StreamReceiver::handleHeader(const FileHeader& header, std::string& errorMsg) {
    if (!m_outputDir) {
        errorMsg = "Output directory not configured";
        fail(TransferErrorKind::SINK, errorMsg);
        return false;
    }

    auto session = std::make_unique<TransferSession>(header, *m_outputDir, m_progressCallback);
    if (!session->open(m_sinkFactory, errorMsg)) {
        fail(TransferErrorKind::SINK, errorMsg);
        return false;
    }

    m_session = std::move(session);
    m_result.sessionCreated = true;
    return true;
}

bool StreamReceiver::handleBody(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_session->writeBody(data, size, errorMsg)) {
        fail(TransferErrorKind::SINK, errorMsg);
        return false;
    }
    return true;
}

void StreamReceiver::fail(TransferErrorKind kind, const std::string& message) {
    m_result.completed = false;
    m_result.error = kind;
    m_result.errorMessage = message;
    m_finished = true;

    if (m_session) {
        m_result.report.sessionId = m_session->getSessionId();
        m_result.report.fileName = m_session->getHeader().fileName;
        m_result.report.destinationPath = m_session->getDestinationPath();
        m_result.report.declaredSize = m_session->getHeader().fileSize;
        m_result.report.bytesWritten = m_session->getBytesWritten();
        m_session->abort(message);
    }
}

std::string describeReceiveError(const ReceiveResult& result) {
    if (result.error == TransferErrorKind::NONE) {
        return {};
    }
    return std::string("[") + errorCodeFor(result.error) + "] " +
           errorKindToString(result.error) + ": " + result.errorMessage;
}

std::string formatReceiveSummary(const ReceiveResult& result) {
    if (!result.completed) {
        return {};
    }
    if (result.hasIntegrityMismatch()) {
        return "warning: " + result.errorMessage;
    }
    if (result.error != TransferErrorKind::NONE) {
        return {};
    }
    return "received '" + result.report.fileName + "' (" +
           std::to_string(result.report.bytesWritten) + " bytes) at " +
           result.report.destinationPath.string();
}

}  // namespace FileBeam
