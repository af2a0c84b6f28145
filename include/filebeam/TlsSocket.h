/**
 * @file TlsSocket.h
 * @brief TLS 1.3 wrapper over a connected POSIX socket
 */

#pragma once

#include "TransportStream.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct ssl_st;
typedef struct ssl_st SSL;

namespace FileBeam {

/**
 * @brief Side of the TLS handshake
 */
enum class TlsRole : uint8_t {
    SERVER,
    CLIENT
};

/**
 * @brief Process-wide OpenSSL setup (idempotent, thread-safe)
 *
 * Also ignores SIGPIPE so a write to a closed peer fails with EPIPE instead
 * of terminating the process.
 */
void initOpenSsl();

/**
 * @class TlsContext
 * @brief Shared SSL_CTX configured once and used by every connection
 *
 * Server contexts carry the certificate and key and do not request a client
 * certificate. Client contexts trust exactly the certificates in the CA file
 * and require the server to present a certificate that verifies against it.
 */
class TlsContext {
public:
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    static std::shared_ptr<TlsContext> createServer(const std::string& certPath,
                                                    const std::string& keyPath,
                                                    std::string& errorMsg);

    static std::shared_ptr<TlsContext> createClient(const std::string& caCertPath,
                                                    std::string& errorMsg);

    TlsRole role() const { return m_role; }
    SSL_CTX* native() const { return m_ctx; }

private:
    TlsContext(SSL_CTX* ctx, TlsRole role) : m_ctx(ctx), m_role(role) {}

    static SSL_CTX* createBaseContext(TlsRole role, std::string& errorMsg);

    SSL_CTX* m_ctx;
    TlsRole m_role;
};

/**
 * @class TlsSocket
 * @brief Owns a connected socket and the TLS session running over it
 *
 * Thread Safety: one thread reads/writes at a time; abort() may be called
 * from any thread to unblock a pending read.
 */
class TlsSocket {
public:
    /**
     * @brief Take ownership of a connected socket
     * @param fd Connected socket (closed in the destructor)
     * @param context Shared context deciding the handshake role
     */
    TlsSocket(int fd, std::shared_ptr<TlsContext> context);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Perform the TLS handshake
     * @param serverName Client role: expected DNS name or IP address of the
     *                   server (also sent as SNI for DNS names). Ignored
     *                   for the server role.
     * @param errorMsg Output error message
     */
    bool handshake(const std::string& serverName, std::string& errorMsg);

    /**
     * @brief Write all bytes (split into TLS records)
     */
    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Read up to capacity bytes
     *
     * close_notify from the peer is END_OF_STREAM; an EOF without
     * close_notify, a reset, or an idle timeout is FAILED.
     */
    ChunkStatus recv(uint8_t* buffer, size_t capacity, size_t& received, std::string& errorMsg);

    /**
     * @brief Send close_notify and wait for the peer's close_notify
     * @return false if the peer did not confirm the close
     */
    bool closeSend(std::string& errorMsg);

    /**
     * @brief Best-effort close_notify (no wait)
     */
    void shutdown();

    /**
     * @brief Shut the socket down at the TCP level (unblocks readers)
     */
    void abort();

    bool isConnected() const { return m_connected; }
    int fd() const { return m_fd; }

    /**
     * @brief SHA-256 fingerprint of the peer certificate (64 uppercase hex)
     */
    std::string getPeerFingerprint(std::string& errorMsg);

    static std::string getLastError();
    static std::string getErrorDescription(int sslErrorCode);

private:
    std::string describeFailure(int ret, int savedErrno);

    int m_fd;
    std::shared_ptr<TlsContext> m_context;
    SSL* m_ssl;
    bool m_connected;
    bool m_shutdownSent;
    std::mutex m_abortMutex;
    bool m_aborted;
};

}  // namespace FileBeam
