/**
 * @file TransferServer.h
 * @brief Multi-threaded TLS file transfer server
 */

#pragma once

#include "config.h"
#include "FileSink.h"
#include "StreamReceiver.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace FileBeam {

class TlsContext;
class TlsSocket;

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Called once per stream when it finishes (any outcome)
 *
 * Invoked on the stream's handler thread; concurrent streams may call it
 * concurrently.
 *
 * @param remoteAddress "ip:port" of the sending peer
 * @param result Outcome of the stream
 */
using TransferCallback = std::function<void(const std::string& remoteAddress,
                                            const ReceiveResult& result)>;

//=============================================================================
// TransferServer Class
//=============================================================================

/**
 * @class TransferServer
 * @brief Accepts TLS connections and receives one file per stream
 *
 * Architecture:
 * - Single listener thread polling a non-blocking listen socket
 * - One handler thread per accepted connection (TLS handshake, stream accept)
 * - One nested thread per accepted stream running a StreamReceiver
 * - Connection limit enforcement (MAX_CONCURRENT_CONNECTIONS by default);
 *   connections over the limit are closed immediately
 *
 * Stream handlers share nothing but the read-only output directory. A
 * failing stream never affects other streams or the listener.
 *
 * Thread Safety:
 * - getActiveConnectionCount() and getBoundPort() are thread-safe
 * - configuration setters, start() and stop() must be called from one thread
 *
 * Usage:
 * @code
 * auto tls = TlsContext::createServer(cert, key, error);
 * auto outputDir = std::make_shared<const std::filesystem::path>("received");
 * TransferServer server(tls, outputDir);
 * server.setTransferCallback([](const std::string& peer, const ReceiveResult& r) { ... });
 * if (server.start("0.0.0.0:4433", error)) {
 *     // ...
 *     server.stop();
 * }
 * @endcode
 */
class TransferServer {
public:
    TransferServer(std::shared_ptr<TlsContext> tlsContext,
                   std::shared_ptr<const std::filesystem::path> outputDir);

    /**
     * @brief Destructor
     *
     * Stops the server if running.
     */
    ~TransferServer();

    // Prevent copying
    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Prevent moving (server has unique resources)
    TransferServer(TransferServer&&) = delete;
    TransferServer& operator=(TransferServer&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Bind, listen and launch the listener thread
     * @param listenAddress Numeric "ip:port" (port 0 picks a free port)
     * @param errorMsg Output error message
     * @return true if the server is accepting connections
     */
    bool start(const std::string& listenAddress, std::string& errorMsg);

    /**
     * @brief Stop the transfer server
     *
     * Stops accepting, shuts down every active connection socket so stream
     * handlers return at their next read, and waits for all handler threads.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Query Methods
    //=========================================================================

    /**
     * @brief Port actually bound (useful when started on port 0)
     */
    uint16_t getBoundPort() const { return m_boundPort.load(); }

    size_t getActiveConnectionCount() const {
        return m_activeConnectionCount.load(std::memory_order_acquire);
    }

    //=========================================================================
    // Configuration Methods (call before start())
    //=========================================================================

    void setTransferCallback(TransferCallback callback) {
        m_transferCallback = std::move(callback);
    }

    void setMaxConnections(size_t maxConnections) { m_maxConnections = maxConnections; }

    void setIdleTimeoutMs(uint32_t timeoutMs) { m_idleTimeoutMs = timeoutMs; }

    void setSinkFactory(SinkFactory factory) { m_sinkFactory = std::move(factory); }


private:
    void listenerThreadFunc();
    void handleConnection(const std::shared_ptr<TlsSocket>& tls, const std::string& remoteAddress);
    void handleStream(TransportStream& stream, const std::string& remoteAddress);
    void releaseConnection(const std::shared_ptr<TlsSocket>& tls);

    std::shared_ptr<TlsContext> m_tlsContext;
    std::shared_ptr<const std::filesystem::path> m_outputDir;
    SinkFactory m_sinkFactory;
    TransferCallback m_transferCallback;
    size_t m_maxConnections;
    uint32_t m_idleTimeoutMs;

    int m_listenSocket;
    std::atomic<uint16_t> m_boundPort;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::thread m_listenerThread;

    // Connection handler threads are detached; stop() waits on this count
    std::atomic<size_t> m_activeConnectionCount;
    std::mutex m_activeConnectionsMutex;
    std::set<std::shared_ptr<TlsSocket>> m_activeConnections;
    std::mutex m_activeConnectionsCvMutex;
    std::condition_variable m_activeConnectionsCv;
};

}  // namespace FileBeam
