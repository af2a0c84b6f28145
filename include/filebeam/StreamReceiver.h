/**
 * @file StreamReceiver.h
 * @brief Two-phase receive loop for a single accepted stream
 */

#pragma once

#include "ErrorCodes.h"
#include "FileSink.h"
#include "ReceiveReassembler.h"
#include "TransferSession.h"
#include "TransportStream.h"
#include <filesystem>
#include <memory>
#include <string>

namespace FileBeam {

/**
 * @brief Outcome of receiving one stream
 *
 * completed is true when the stream ended cleanly after a header and the
 * destination was closed. In that case error is either NONE or
 * INTEGRITY_MISMATCH (non-fatal, file retained). Every other error kind
 * means the transfer did not complete.
 */
struct ReceiveResult {
    bool completed = false;
    TransferErrorKind error = TransferErrorKind::NONE;
    std::string errorMessage;
    bool sessionCreated = false;  ///< A header was decoded and a session opened
    TransferReport report;        ///< Valid when sessionCreated

    bool hasIntegrityMismatch() const {
        return error == TransferErrorKind::INTEGRITY_MISMATCH;
    }
};

/**
 * @class StreamReceiver
 * @brief Drives one stream through header phase and body phase
 *
 * Pulls deliveries from the transport, feeds them to a ReceiveReassembler,
 * opens a TransferSession once the header decodes and finalizes it at end
 * of stream. Errors stay local to the stream being received.
 *
 * One instance per stream. The output directory is shared read-only between
 * every concurrent receiver and never mutated after startup.
 *
 * The event methods (onChunk/onEndOfStream/onTransportError) can also be
 * called directly when deliveries come from somewhere other than a
 * TransportStream.
 */
class StreamReceiver {
public:
    StreamReceiver(std::shared_ptr<const std::filesystem::path> outputDir,
                   SinkFactory sinkFactory = diskSinkFactory(),
                   SessionProgressCallback progressCb = nullptr);

    // Prevent copying
    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    /**
     * @brief Receive a whole stream
     *
     * Returns at end of stream, on a transport failure, or as soon as the
     * header or body cannot be written.
     */
    ReceiveResult receive(TransportStream& stream);

    /**
     * @brief Feed one delivery
     * @return false if the stream must be abandoned (see result())
     */
    bool onChunk(const uint8_t* data, size_t size);

    ReceiveResult onEndOfStream();
    ReceiveResult onTransportError(const std::string& errorMsg);

    ReassemblyState state() const { return m_reassembler.state(); }
    const TransferSession* session() const { return m_session.get(); }

    /**
     * @brief Result so far (final once a terminal event was handled)
     */
    const ReceiveResult& result() const { return m_result; }

private:
    bool handleHeader(const FileHeader& header, std::string& errorMsg);
    bool handleBody(const uint8_t* data, size_t size, std::string& errorMsg);
    void fail(TransferErrorKind kind, const std::string& message);

    std::shared_ptr<const std::filesystem::path> m_outputDir;
    SinkFactory m_sinkFactory;
    SessionProgressCallback m_progressCallback;
    ReceiveReassembler m_reassembler;
    std::unique_ptr<TransferSession> m_session;
    ReceiveResult m_result;
    bool m_finished;
};

/**
 * @brief Format "[CODE] Kind: message" for a failed or mismatched result
 */
std::string describeReceiveError(const ReceiveResult& result);

/**
 * @brief One-line report for a finished transfer
 *
 * An exact-size transfer gives "received '<name>' (<n> bytes) at <path>",
 * a size mismatch gives "warning: <mismatch message>". Failed transfers
 * give an empty string.
 */
std::string formatReceiveSummary(const ReceiveResult& result);

}  // namespace FileBeam
