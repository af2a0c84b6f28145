/**
 * @file TlsSocket.cpp
 * @brief TLS 1.3 wrapper over a connected POSIX socket
 */

#include "filebeam/TlsSocket.h"
#include "filebeam/CertificateManager.h"
#include "filebeam/SocketUtils.h"
#include "filebeam/config.h"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>

namespace FileBeam {

//=============================================================================
// OpenSSL Initialization (Static)
//=============================================================================

void initOpenSsl() {
    static std::once_flag once;
    std::call_once(once, [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        std::signal(SIGPIPE, SIG_IGN);
    });
}

//=============================================================================
// TlsContext
//=============================================================================

TlsContext::~TlsContext() {
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

SSL_CTX* TlsContext::createBaseContext(TlsRole role, std::string& errorMsg) {
    initOpenSsl();

    SSL_CTX* ctx = SSL_CTX_new(role == TlsRole::SERVER ? TLS_server_method()
                                                       : TLS_client_method());
    if (!ctx) {
        errorMsg = "Failed to create SSL context: " + TlsSocket::getLastError();
        return nullptr;
    }

    // TLS 1.3 only (no legacy protocol negotiation).
    if (SSL_CTX_set_min_proto_version(ctx, TLS1_3_VERSION) != 1 ||
        SSL_CTX_set_max_proto_version(ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to restrict protocol to TLS 1.3: " + TlsSocket::getLastError();
        SSL_CTX_free(ctx);
        return nullptr;
    }

    if (SSL_CTX_set_ciphersuites(ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + TlsSocket::getLastError();
        SSL_CTX_free(ctx);
        return nullptr;
    }

    if (SSL_CTX_set1_groups_list(ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + TlsSocket::getLastError();
        SSL_CTX_free(ctx);
        return nullptr;
    }

    SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(ctx, SSL_MODE_AUTO_RETRY);

    return ctx;
}

std::shared_ptr<TlsContext> TlsContext::createServer(const std::string& certPath,
                                                     const std::string& keyPath,
                                                     std::string& errorMsg) {
    SSL_CTX* ctx = createBaseContext(TlsRole::SERVER, errorMsg);
    if (!ctx) {
        return nullptr;
    }

    // No client certificates; the server identity is what clients pin.
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);

    // Session tickets would be unread data on the client socket at close
    SSL_CTX_set_num_tickets(ctx, 0);

    if (!CertificateManager::loadCertificate(ctx, certPath, keyPath, errorMsg)) {
        SSL_CTX_free(ctx);
        return nullptr;
    }

    return std::shared_ptr<TlsContext>(new TlsContext(ctx, TlsRole::SERVER));
}

std::shared_ptr<TlsContext> TlsContext::createClient(const std::string& caCertPath,
                                                     std::string& errorMsg) {
    SSL_CTX* ctx = createBaseContext(TlsRole::CLIENT, errorMsg);
    if (!ctx) {
        return nullptr;
    }

    if (SSL_CTX_load_verify_locations(ctx, caCertPath.c_str(), nullptr) != 1) {
        errorMsg = "Failed to load CA certificate " + caCertPath + ": " + TlsSocket::getLastError();
        SSL_CTX_free(ctx);
        return nullptr;
    }

    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);

    return std::shared_ptr<TlsContext>(new TlsContext(ctx, TlsRole::CLIENT));
}

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int fd, std::shared_ptr<TlsContext> context)
    : m_fd(fd)
    , m_context(std::move(context))
    , m_ssl(nullptr)
    , m_connected(false)
    , m_shutdownSent(false)
    , m_aborted(false)
{
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    closeSocket(m_fd);
    m_fd = INVALID_SOCKET_FD;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(const std::string& serverName, std::string& errorMsg) {
    if (!m_context || !m_context->native()) {
        errorMsg = "TLS context not initialized";
        return false;
    }
    if (m_fd < 0) {
        errorMsg = "Invalid socket";
        return false;
    }

    m_ssl = SSL_new(m_context->native());
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    if (SSL_set_fd(m_ssl, m_fd) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    const bool isClient = m_context->role() == TlsRole::CLIENT;
    if (isClient) {
        if (serverName.empty()) {
            errorMsg = "Server name required for certificate verification";
            return false;
        }

        if (CertificateManager::isIpAddress(serverName)) {
            // SNI carries host names only; IPs are matched against IP SANs
            if (X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(m_ssl), serverName.c_str()) != 1) {
                errorMsg = "Invalid server IP address: " + serverName;
                return false;
            }
        } else {
            if (SSL_set_tlsext_host_name(m_ssl, serverName.c_str()) != 1) {
                errorMsg = "Failed to set SNI: " + getLastError();
                return false;
            }
            if (SSL_set1_host(m_ssl, serverName.c_str()) != 1) {
                errorMsg = "Failed to set expected host name: " + getLastError();
                return false;
            }
        }
    }

    errno = 0;
    const int result = isClient ? SSL_connect(m_ssl) : SSL_accept(m_ssl);
    if (result != 1) {
        const int savedErrno = errno;
        errorMsg = "TLS handshake failed (" + describeFailure(result, savedErrno) + ")";
        if (isClient) {
            const long verify = SSL_get_verify_result(m_ssl);
            if (verify != X509_V_OK) {
                errorMsg += ": certificate verification failed: ";
                errorMsg += X509_verify_cert_error_string(verify);
            }
        }
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    if (!data || size == 0) {
        return true;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);

        errno = 0;
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));
        if (sent <= 0) {
            const int savedErrno = errno;
            const int err = SSL_get_error(m_ssl, sent);
            if (err == SSL_ERROR_WANT_WRITE && savedErrno == EINTR) {
                continue;
            }
            errorMsg = "TLS write failed (" + describeFailure(sent, savedErrno) + ")";
            m_connected = false;
            return false;
        }

        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

ChunkStatus TlsSocket::recv(uint8_t* buffer, size_t capacity, size_t& received,
                            std::string& errorMsg) {
    received = 0;
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return ChunkStatus::FAILED;
    }

    if (!buffer || capacity == 0) {
        errorMsg = "Receive buffer is empty";
        return ChunkStatus::FAILED;
    }

    const int toRead = static_cast<int>(std::min<size_t>(capacity, INT_MAX));
    while (true) {
        errno = 0;
        const int n = SSL_read(m_ssl, buffer, toRead);
        if (n > 0) {
            received = static_cast<size_t>(n);
            return ChunkStatus::DATA;
        }

        const int savedErrno = errno;
        const int err = SSL_get_error(m_ssl, n);

        if (err == SSL_ERROR_ZERO_RETURN) {
            return ChunkStatus::END_OF_STREAM;
        }

        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            if (savedErrno == EINTR) {
                continue;
            }
            if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK) {
                errorMsg = "Idle timeout: peer sent nothing within the receive timeout";
                m_connected = false;
                return ChunkStatus::FAILED;
            }
        }

        errorMsg = "TLS read failed (" + describeFailure(n, savedErrno) + ")";
        m_connected = false;
        return ChunkStatus::FAILED;
    }
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

bool TlsSocket::closeSend(std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    errno = 0;
    const int ret = SSL_shutdown(m_ssl);
    m_shutdownSent = true;
    if (ret < 0) {
        errorMsg = "Failed to send close_notify (" + describeFailure(ret, errno) + ")";
        m_connected = false;
        return false;
    }
    if (ret == 1) {
        m_connected = false;
        return true;
    }

    // Peer answers with its own close_notify once it has consumed the stream
    uint8_t scratch[256];
    while (true) {
        errno = 0;
        const int n = SSL_read(m_ssl, scratch, sizeof(scratch));
        if (n > 0) {
            continue;
        }
        const int savedErrno = errno;
        const int err = SSL_get_error(m_ssl, n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            m_connected = false;
            return true;
        }
        if ((err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) && savedErrno == EINTR) {
            continue;
        }
        errorMsg = "Peer did not confirm stream close (" + describeFailure(n, savedErrno) + ")";
        m_connected = false;
        return false;
    }
}

void TlsSocket::shutdown() {
    if (m_ssl && m_connected && !m_shutdownSent) {
        // Best effort: the peer may already be gone
        if (SSL_shutdown(m_ssl) < 0) {
            ERR_clear_error();
        }
        m_shutdownSent = true;
    }
    m_connected = false;
}

void TlsSocket::abort() {
    std::lock_guard<std::mutex> lock(m_abortMutex);
    if (!m_aborted && m_fd >= 0) {
        ::shutdown(m_fd, SHUT_RDWR);
        m_aborted = true;
    }
}

//=============================================================================
// TlsSocket: Certificate Information
//=============================================================================

std::string TlsSocket::getPeerFingerprint(std::string& errorMsg) {
    if (!m_ssl) {
        errorMsg = "TLS not connected";
        return "";
    }

    X509* cert = SSL_get_peer_certificate(m_ssl);
    if (!cert) {
        errorMsg = "No peer certificate";
        return "";
    }

    std::string fingerprint = CertificateManager::fingerprintOf(cert, errorMsg);
    X509_free(cert);
    return fingerprint;
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::describeFailure(int ret, int savedErrno) {
    const int sslErrorCode = SSL_get_error(m_ssl, ret);
    std::string details;

    // Prefer OpenSSL's error queue when present.
    const unsigned long opensslErr = ERR_get_error();
    if (opensslErr != 0) {
        char buf[256];
        ERR_error_string_n(opensslErr, buf, sizeof(buf));
        details = buf;
        ERR_clear_error();
    } else if (sslErrorCode == SSL_ERROR_SYSCALL) {
        details = savedErrno != 0
            ? describeErrno(savedErrno)
            : std::string("peer closed the connection without close_notify");
    } else if (savedErrno != 0) {
        details = describeErrno(savedErrno);
    }

    if (details.empty()) {
        return getErrorDescription(sslErrorCode);
    }
    return getErrorDescription(sslErrorCode) + ": " + details;
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

}  // namespace FileBeam
