/**
 * @file TransferServer.cpp
 * @brief Multi-threaded TLS file transfer server
 */

#include "filebeam/TransferServer.h"
#include "filebeam/Debug.h"
#include "filebeam/SocketUtils.h"
#include "filebeam/TlsSocket.h"
#include "filebeam/TransportStream.h"
#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace FileBeam {

//=============================================================================
// Constructor / Destructor
//=============================================================================

TransferServer::TransferServer(std::shared_ptr<TlsContext> tlsContext,
                               std::shared_ptr<const std::filesystem::path> outputDir)
    : m_tlsContext(std::move(tlsContext))
    , m_outputDir(std::move(outputDir))
    , m_sinkFactory(diskSinkFactory())
    , m_transferCallback(nullptr)
    , m_maxConnections(MAX_CONCURRENT_CONNECTIONS)
    , m_idleTimeoutMs(IDLE_TIMEOUT_MS)
    , m_listenSocket(INVALID_SOCKET_FD)
    , m_boundPort(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_activeConnectionCount(0)
{
    if (!m_outputDir) {
        m_outputDir = std::make_shared<const std::filesystem::path>(DEFAULT_OUTPUT_DIR);
    }
}

TransferServer::~TransferServer() {
    if (m_running.load()) {
        stop();
    }
}

//=============================================================================
// TransferServer: start()
//=============================================================================

bool TransferServer::start(const std::string& listenAddress, std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Server already running";
        return false;
    }

    if (!m_tlsContext) {
        errorMsg = "TLS context not configured";
        return false;
    }

    SocketAddress address;
    if (!parseSocketAddress(listenAddress, address, errorMsg)) {
        return false;
    }

    m_listenSocket = createListenSocket(address, errorMsg);
    if (m_listenSocket == INVALID_SOCKET_FD) {
        return false;
    }
    m_boundPort.store(getLocalPort(m_listenSocket));

    m_stopRequested.store(false);
    m_running.store(true);

    m_listenerThread = std::thread(&TransferServer::listenerThreadFunc, this);

    LOG_DEBUG("TransferServer listening on port " << m_boundPort.load()
              << ", output " << m_outputDir->string());
    return true;
}

//=============================================================================
// TransferServer: stop()
//=============================================================================

void TransferServer::stop() {
    if (!m_running.load()) {
        return;
    }

    LOG_DEBUG("TransferServer::stop start");

    m_stopRequested.store(true);

    // Listener polls the flag between non-blocking accepts
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }

    closeSocket(m_listenSocket);
    m_listenSocket = INVALID_SOCKET_FD;
    m_boundPort.store(0);

    // Unblock handlers waiting in a handshake or stream read
    {
        std::vector<std::shared_ptr<TlsSocket>> toAbort;
        {
            std::lock_guard<std::mutex> lock(m_activeConnectionsMutex);
            toAbort.assign(m_activeConnections.begin(), m_activeConnections.end());
        }
        for (const auto& tls : toAbort) {
            tls->abort();
        }
    }

    // Wait for all detached connection handler threads to exit.
    {
        std::unique_lock<std::mutex> lock(m_activeConnectionsCvMutex);
        m_activeConnectionsCv.wait(lock, [this]() {
            return m_activeConnectionCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_running.store(false);
    LOG_DEBUG("TransferServer::stop end");
}

//=============================================================================
// TransferServer: listenerThreadFunc()
//=============================================================================

void TransferServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        int clientSocket = ::accept(m_listenSocket, nullptr, nullptr);

        if (clientSocket < 0) {
            const int error = errno;

            if (m_stopRequested.load()) {
                break;
            }

            if (error != EAGAIN && error != EWOULDBLOCK && error != EINTR) {
                LOG_WARNING("accept() failed: " << describeErrno(error));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_INTERVAL_MS));
            continue;
        }

        // Accepted sockets may inherit O_NONBLOCK from the listener on some platforms
        if (!setBlocking(clientSocket, true) ||
            !setSocketRecvTimeout(clientSocket, m_idleTimeoutMs)) {
            LOG_WARNING("Failed to configure accepted socket: " << describeErrno(errno));
            closeSocket(clientSocket);
            continue;
        }

        const std::string remoteAddress = getPeerAddress(clientSocket);

        // Cap concurrent connection handler threads before spawning.
        size_t prev = m_activeConnectionCount.load(std::memory_order_relaxed);
        bool admitted = false;
        while (prev < m_maxConnections) {
            if (m_activeConnectionCount.compare_exchange_weak(
                    prev,
                    prev + 1,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed)) {
                admitted = true;
                break;
            }
        }
        if (!admitted) {
            LOG_WARNING("Rejecting connection from " << remoteAddress << ": "
                        << m_maxConnections << " connections already active");
            closeSocket(clientSocket);
            continue;
        }

        auto tls = std::make_shared<TlsSocket>(clientSocket, m_tlsContext);
        {
            std::lock_guard<std::mutex> lock(m_activeConnectionsMutex);
            m_activeConnections.insert(tls);
        }

        std::thread connectionThread([this, tls, remoteAddress]() {
            try {
                handleConnection(tls, remoteAddress);
            } catch (const std::exception& e) {
                LOG_ERROR("Connection handler for " << remoteAddress
                          << " failed with exception: " << e.what());
            }
            releaseConnection(tls);
        });
        connectionThread.detach();
    }
}

void TransferServer::releaseConnection(const std::shared_ptr<TlsSocket>& tls) {
    {
        std::lock_guard<std::mutex> lock(m_activeConnectionsMutex);
        m_activeConnections.erase(tls);
    }

    {
        std::lock_guard<std::mutex> lock(m_activeConnectionsCvMutex);
        m_activeConnectionCount.fetch_sub(1, std::memory_order_acq_rel);
        // notify under the lock: stop() may destroy the server once it wakes
        m_activeConnectionsCv.notify_all();
    }
}

//=============================================================================
// TransferServer: handleConnection()
//=============================================================================

void TransferServer::handleConnection(const std::shared_ptr<TlsSocket>& tls,
                                      const std::string& remoteAddress) {
    std::string tlsError;
    if (!tls->handshake(std::string(), tlsError)) {
        LOG_WARNING("TLS handshake with " << remoteAddress << " failed: " << tlsError);
        return;
    }

    LOG_INFO("Accepted connection from " << remoteAddress);

    TlsConnection connection(tls, remoteAddress);
    std::vector<std::thread> streamThreads;

    while (!m_stopRequested.load()) {
        std::string streamError;
        std::unique_ptr<TransportStream> stream = connection.acceptStream(streamError);
        if (!stream) {
            if (!streamError.empty()) {
                LOG_WARNING("Connection " << remoteAddress << " ended: " << streamError);
            }
            break;
        }

        streamThreads.emplace_back([this, remoteAddress, s = std::move(stream)]() {
            try {
                handleStream(*s, remoteAddress);
            } catch (const std::exception& e) {
                LOG_ERROR("Stream handler for " << remoteAddress
                          << " failed with exception: " << e.what());
            }
        });
    }

    for (auto& thread : streamThreads) {
        thread.join();
    }

    // close_notify back to the sender confirms the stream was fully consumed
    connection.close();
    LOG_DEBUG("Connection from " << remoteAddress << " closed");
}

//=============================================================================
// TransferServer: handleStream()
//=============================================================================

void TransferServer::handleStream(TransportStream& stream, const std::string& remoteAddress) {
    StreamReceiver receiver(m_outputDir, m_sinkFactory);
    const ReceiveResult result = receiver.receive(stream);

    if (result.completed && result.error == TransferErrorKind::NONE) {
        LOG_DEBUG(result.report.sessionId << ": received '" << result.report.fileName
                  << "' (" << result.report.bytesWritten << " bytes) from " << remoteAddress);
    } else if (result.hasIntegrityMismatch()) {
        if (m_transferCallback) {
            // the callback owner reports the mismatch
            LOG_DEBUG(result.report.sessionId << ": " << describeReceiveError(result));
        } else {
            LOG_WARNING(result.report.sessionId << ": " << describeReceiveError(result));
        }
    } else {
        LOG_ERROR("Stream from " << remoteAddress << " failed: " << describeReceiveError(result));
    }

    if (m_transferCallback) {
        m_transferCallback(remoteAddress, result);
    }
}

}  // namespace FileBeam
