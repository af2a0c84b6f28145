/**
 * @file ReceiveReassembler.h
 * @brief Header/body split over arbitrarily chunked transport deliveries
 */

#pragma once

#include "TransferHeader.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace FileBeam {

/**
 * @brief Phase of one stream's receive loop
 */
enum class ReassemblyState : uint8_t {
    AWAITING_HEADER,  ///< Buffering until a complete header decodes
    STREAMING_BODY    ///< Every delivered byte belongs to the body
};

inline std::string reassemblyStateToString(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::AWAITING_HEADER: return "AwaitingHeader";
        case ReassemblyState::STREAMING_BODY:  return "StreamingBody";
        default:                               return "Unknown";
    }
}

/**
 * @brief Called once when the header has been decoded
 *
 * Returning false aborts the stream; errorMsg is propagated out of push().
 */
using HeaderHandler = std::function<bool(const FileHeader& header, std::string& errorMsg)>;

/**
 * @brief Called with body bytes in arrival order (never with size 0)
 */
using BodyHandler = std::function<bool(const uint8_t* data, size_t size, std::string& errorMsg)>;

/**
 * @class ReceiveReassembler
 * @brief Two-state machine separating the header from the body
 *
 * While AWAITING_HEADER, deliveries are appended to an internal buffer and
 * the header decode probe is re-run. Once it succeeds the header handler is
 * called, any trailing bytes after the header are forwarded as the first
 * body chunk, and the buffer is released. From then on deliveries go to the
 * body handler verbatim without copying.
 *
 * Relies on in-order, duplicate-free delivery from the transport; no
 * resequencing is performed. Owned by exactly one stream handler.
 */
class ReceiveReassembler {
public:
    ReceiveReassembler(HeaderHandler onHeader, BodyHandler onBody);

    // Prevent copying
    ReceiveReassembler(const ReceiveReassembler&) = delete;
    ReceiveReassembler& operator=(const ReceiveReassembler&) = delete;

    /**
     * @brief Feed one transport delivery
     * @param data Delivered bytes (may be null when size is 0)
     * @param size Number of delivered bytes
     * @param errorMsg Output error message from a failing handler
     * @return false if a handler rejected the header or body bytes
     */
    bool push(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Signal clean end of stream
     * @param errorMsg Output error message on protocol violation
     * @return false if the stream ended before a complete header arrived
     */
    bool finish(std::string& errorMsg);

    ReassemblyState state() const { return m_state; }

    /**
     * @brief Bytes held while awaiting the header (0 once streaming)
     */
    size_t bufferedBytes() const { return m_buffer.size(); }

    /**
     * @brief Total bytes forwarded to the body handler
     */
    uint64_t bodyBytesForwarded() const { return m_bodyBytes; }

    bool hasHeader() const { return m_state == ReassemblyState::STREAMING_BODY; }

    /**
     * @brief Decoded header (valid only when hasHeader())
     */
    const FileHeader& header() const { return m_header; }

private:
    bool forwardBody(const uint8_t* data, size_t size, std::string& errorMsg);

    HeaderHandler m_onHeader;
    BodyHandler m_onBody;
    ReassemblyState m_state;
    std::vector<uint8_t> m_buffer;   ///< Receive buffer (header phase only)
    FileHeader m_header;
    uint64_t m_bodyBytes;
};

}  // namespace FileBeam
