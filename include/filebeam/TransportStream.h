/**
 * @file TransportStream.h
 * @brief Transport abstraction consumed by the transfer protocol
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace FileBeam {

class TlsSocket;

/**
 * @brief Outcome of a single receiveChunk() call
 */
enum class ChunkStatus : uint8_t {
    DATA,           ///< One or more bytes were delivered
    END_OF_STREAM,  ///< Peer finished sending cleanly
    FAILED          ///< Read failed, timed out, or the peer closed abruptly
};

/**
 * @brief One ordered, reliable, bidirectional byte stream.
 *
 * Deliveries arrive in order without duplicates but with arbitrary chunk
 * boundaries. The transfer protocol never assumes a header arrives in a
 * single delivery.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;

    /**
     * @brief Block until data, a clean end, or an error
     * @param buffer Destination for delivered bytes
     * @param capacity Size of buffer (must be > 0)
     * @param received Number of bytes delivered when DATA is returned
     * @param errorMsg Output error message when FAILED is returned
     */
    virtual ChunkStatus receiveChunk(uint8_t* buffer, size_t capacity,
                                     size_t& received, std::string& errorMsg) = 0;
    virtual bool sendChunk(const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Finish the sending side so the peer observes END_OF_STREAM
     */
    virtual bool close(std::string& errorMsg) = 0;
};

/**
 * @brief A secured connection carrying one or more streams.
 */
class TransportConnection {
public:
    virtual ~TransportConnection() = default;

    /**
     * @brief Wait for the next peer-initiated stream
     * @return The stream, or nullptr once the connection carries no more
     *         streams (errorMsg is set only if that was due to a failure)
     */
    virtual std::unique_ptr<TransportStream> acceptStream(std::string& errorMsg) = 0;

    /**
     * @brief Open a locally-initiated stream
     */
    virtual std::unique_ptr<TransportStream> openStream(std::string& errorMsg) = 0;

    /**
     * @brief Close the connection once its streams are finished with
     */
    virtual void close() = 0;

    /**
     * @brief Unblock pending stream reads and writes (callable from any thread)
     *
     * Streams observe FAILED at their next suspension point.
     */
    virtual void abort() = 0;

    virtual std::string remoteAddress() const = 0;
};

/**
 * @brief Stream view over a TLS session (one stream per TLS connection)
 */
class TlsTransportStream final : public TransportStream {
public:
    explicit TlsTransportStream(std::shared_ptr<TlsSocket> tls) : m_tls(std::move(tls)) {}

    ChunkStatus receiveChunk(uint8_t* buffer, size_t capacity,
                             size_t& received, std::string& errorMsg) override;
    bool sendChunk(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool close(std::string& errorMsg) override;

private:
    std::shared_ptr<TlsSocket> m_tls;
};

/**
 * @brief TransportConnection over a completed TLS 1.3 handshake
 *
 * Each TLS connection carries exactly one bidirectional stream: the first
 * acceptStream()/openStream() call hands it out, later calls return nullptr.
 */
class TlsConnection final : public TransportConnection {
public:
    TlsConnection(std::shared_ptr<TlsSocket> tls, std::string remoteAddress);
    ~TlsConnection() override;

    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

    std::unique_ptr<TransportStream> acceptStream(std::string& errorMsg) override;
    std::unique_ptr<TransportStream> openStream(std::string& errorMsg) override;
    void close() override;
    void abort() override;
    std::string remoteAddress() const override { return m_remoteAddress; }

private:
    std::unique_ptr<TransportStream> takeStream(std::string& errorMsg);

    std::shared_ptr<TlsSocket> m_tls;
    std::string m_remoteAddress;
    bool m_streamTaken;
};

}  // namespace FileBeam
