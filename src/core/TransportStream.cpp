/**
 * @file TransportStream.cpp
 * @brief TLS-backed TransportStream and TransportConnection
 */

#include "filebeam/TransportStream.h"
#include "filebeam/TlsSocket.h"

namespace FileBeam {

//=============================================================================
// TlsTransportStream
//=============================================================================

ChunkStatus TlsTransportStream::receiveChunk(uint8_t* buffer, size_t capacity,
                                             size_t& received, std::string& errorMsg) {
    return m_tls->recv(buffer, capacity, received, errorMsg);
}

bool TlsTransportStream::sendChunk(const uint8_t* data, size_t size, std::string& errorMsg) {
    return m_tls->sendExact(data, size, errorMsg);
}

bool TlsTransportStream::close(std::string& errorMsg) {
    return m_tls->closeSend(errorMsg);
}

//=============================================================================
// TlsConnection
//=============================================================================

TlsConnection::TlsConnection(std::shared_ptr<TlsSocket> tls, std::string remoteAddress)
    : m_tls(std::move(tls))
    , m_remoteAddress(std::move(remoteAddress))
    , m_streamTaken(false)
{
}

TlsConnection::~TlsConnection() {
    close();
}

std::unique_ptr<TransportStream> TlsConnection::takeStream(std::string& errorMsg) {
    if (m_streamTaken) {
        return nullptr;
    }
    if (!m_tls || !m_tls->isConnected()) {
        errorMsg = "TLS not connected";
        return nullptr;
    }
    m_streamTaken = true;
    return std::make_unique<TlsTransportStream>(m_tls);
}

std::unique_ptr<TransportStream> TlsConnection::acceptStream(std::string& errorMsg) {
    return takeStream(errorMsg);
}

std::unique_ptr<TransportStream> TlsConnection::openStream(std::string& errorMsg) {
    if (m_streamTaken) {
        errorMsg = "TLS connection already carries its stream";
        return nullptr;
    }
    return takeStream(errorMsg);
}

void TlsConnection::close() {
    if (m_tls) {
        m_tls->shutdown();
    }
}

void TlsConnection::abort() {
    if (m_tls) {
        m_tls->abort();
    }
}

}  // namespace FileBeam
