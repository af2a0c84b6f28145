/**
 * @file config.h
 * @brief Configuration constants for FileBeam
 *
 * This file contains the compile-time configuration constants used throughout
 * FileBeam: the wire header layout, buffer sizes, default endpoints and paths,
 * connection limits, and TLS/SSL configuration.
 *
 * @note Changes to the wire constants break compatibility with existing peers.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @namespace FileBeam
 * @brief FileBeam namespace containing all public APIs
 */
namespace FileBeam {

//=========================================================================
// Wire Protocol
//=========================================================================

/** @defgroup WireProtocol Wire Protocol Configuration
 * @brief Layout of the file header that precedes every transfer body
 *
 * Header Layout (10 + name_len bytes):
 * - Offset 0-1:  Name length (u16, little-endian)
 * - Offset 2-9:  File size (u64, little-endian)
 * - Offset 10-:  File name (name_len bytes, UTF-8)
 * @{
 */

/**
 * @brief Fixed prefix size: name length (u16) + file size (u64)
 */
constexpr size_t HEADER_PREFIX_LEN = 2 + 8;

/**
 * @brief Largest file name (in bytes) that fits the u16 length field
 */
constexpr size_t MAX_FILE_NAME_BYTES = 65535;

/**
 * @brief Local file name used when a received name has no usable component
 */
constexpr const char* FALLBACK_FILE_NAME = "received_file";

/** @} */ // end of WireProtocol

//=========================================================================
// Buffer Sizes
//=========================================================================

/**
 * @brief File transfer chunk size
 *
 * The sender reads and forwards the file body in 64 KB chunks; the
 * receiver pulls at most this many bytes per transport delivery.
 */
constexpr size_t BUFFER_SIZE = 64 * 1024;  // 64 KB

//=========================================================================
// Endpoints and Paths
//=========================================================================

/** @defgroup Defaults Default Endpoints and Paths
 * @{
 */

constexpr uint16_t DEFAULT_PORT = 4433;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0:4433";
constexpr const char* DEFAULT_SERVER_ADDRESS = "127.0.0.1:4433";

/**
 * @brief Expected server name for TLS validation on the client side
 */
constexpr const char* DEFAULT_SERVER_NAME = "localhost";

constexpr const char* DEFAULT_CERT_PATH = "certs/server-cert.pem";
constexpr const char* DEFAULT_KEY_PATH = "certs/server-key.pem";
constexpr const char* DEFAULT_OUTPUT_DIR = "received";

/**
 * @brief Subject alternative names written into a generated certificate
 */
constexpr std::array<const char*, 2> DEFAULT_SUBJECT_ALT_NAMES = {
    "localhost", "127.0.0.1"
};

/** @} */ // end of Defaults

//=========================================================================
// Connection Handling
//=========================================================================

/** @defgroup Connections Connection Handling
 * @{
 */

/**
 * @brief Maximum concurrent connection handler threads
 *
 * TransferServer spawns a dedicated handler thread per accepted TCP
 * connection. Connections above this limit are closed immediately.
 */
constexpr size_t MAX_CONCURRENT_CONNECTIONS = 64;

/**
 * @brief Idle timeout applied to connected sockets
 *
 * A receive that sees no data for this long fails the stream with a
 * transport error.
 */
constexpr uint32_t IDLE_TIMEOUT_MS = 30000;  // 30 seconds

/**
 * @brief Poll interval of the non-blocking accept loop
 */
constexpr uint32_t ACCEPT_POLL_INTERVAL_MS = 100;

constexpr int LISTEN_BACKLOG = 128;

/**
 * @brief Progress update throttle interval
 */
constexpr uint32_t PROGRESS_THROTTLE_MS = 250;

/** @} */ // end of Connections

//=========================================================================
// TLS/SSL Configuration
//=========================================================================

/** @defgroup TLS TLS/SSL Configuration
 * @brief Transport Layer Security settings
 *
 * TLS 1.3 only. TLS 1.2 and below are rejected by version policy.
 * @{
 */

constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:"
    "TLS_CHACHA20_POLY1305_SHA256:"
    "TLS_AES_128_GCM_SHA256";

/**
 * @brief Supported key exchange groups (ECDHE)
 */
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

/**
 * @brief Self-signed certificate validity period
 */
constexpr int CERT_VALIDITY_DAYS = 365;

/**
 * @brief RSA key size of generated certificates
 */
constexpr int CERT_RSA_BITS = 2048;

/**
 * @brief Maximum TLS record payload (16 KB)
 */
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/** @} */ // end of TLS

}  // namespace FileBeam
