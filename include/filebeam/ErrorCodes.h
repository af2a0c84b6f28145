/**
 * @file ErrorCodes.h
 * @brief Transfer error kinds and stable, user-visible error codes.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

#include <cstdint>
#include <string>

namespace FileBeam {

/**
 * @brief Failure classes of a single transfer
 *
 * Every kind is local to one stream. None of them terminates the listener
 * or affects other concurrent streams.
 */
enum class TransferErrorKind : uint8_t {
    NONE = 0,
    ENCODING,            ///< File name exceeds the u16 length field; header not sent
    PROTOCOL_VIOLATION,  ///< Stream ended before a complete header arrived
    TRANSPORT,           ///< Underlying read/write/handshake failure
    SINK,                ///< Destination file could not be created or written
    SOURCE,              ///< Sender could not read the file to send
    INTEGRITY_MISMATCH   ///< Declared size differs from bytes written (non-fatal)
};

namespace ErrorCodes {

inline constexpr const char* ENCODING_NAME_TOO_LONG = "FB-ENC-1000";
inline constexpr const char* PROTOCOL_INCOMPLETE_HEADER = "FB-PROTO-2000";
inline constexpr const char* TRANSPORT_FAILURE = "FB-TRANSPORT-3000";
inline constexpr const char* SINK_FAILURE = "FB-SINK-4000";
inline constexpr const char* SOURCE_UNREADABLE = "FB-SOURCE-4100";
inline constexpr const char* INTEGRITY_SIZE_MISMATCH = "FB-INTEGRITY-5000";

}  // namespace ErrorCodes

/**
 * @brief Stable code for an error kind (empty for NONE)
 */
inline const char* errorCodeFor(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::ENCODING:           return ErrorCodes::ENCODING_NAME_TOO_LONG;
        case TransferErrorKind::PROTOCOL_VIOLATION: return ErrorCodes::PROTOCOL_INCOMPLETE_HEADER;
        case TransferErrorKind::TRANSPORT:          return ErrorCodes::TRANSPORT_FAILURE;
        case TransferErrorKind::SINK:               return ErrorCodes::SINK_FAILURE;
        case TransferErrorKind::SOURCE:             return ErrorCodes::SOURCE_UNREADABLE;
        case TransferErrorKind::INTEGRITY_MISMATCH: return ErrorCodes::INTEGRITY_SIZE_MISMATCH;
        case TransferErrorKind::NONE:
        default:                                    return "";
    }
}

/**
 * @brief Convert TransferErrorKind to string
 */
inline std::string errorKindToString(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::NONE:               return "None";
        case TransferErrorKind::ENCODING:           return "EncodingError";
        case TransferErrorKind::PROTOCOL_VIOLATION: return "ProtocolViolation";
        case TransferErrorKind::TRANSPORT:          return "TransportError";
        case TransferErrorKind::SINK:               return "SinkError";
        case TransferErrorKind::SOURCE:             return "SourceError";
        case TransferErrorKind::INTEGRITY_MISMATCH: return "IntegrityMismatch";
        default:                                    return "Unknown";
    }
}

}  // namespace FileBeam
