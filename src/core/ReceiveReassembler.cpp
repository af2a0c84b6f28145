/**
 * @file ReceiveReassembler.cpp
 * @brief Header/body split over arbitrarily chunked transport deliveries
 */

#include "filebeam/ReceiveReassembler.h"
#include "filebeam/Debug.h"
#include <utility>

namespace FileBeam {

ReceiveReassembler::ReceiveReassembler(HeaderHandler onHeader, BodyHandler onBody)
    : m_onHeader(std::move(onHeader))
    , m_onBody(std::move(onBody))
    , m_state(ReassemblyState::AWAITING_HEADER)
    , m_bodyBytes(0)
{
}

bool ReceiveReassembler::push(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!data || size == 0) {
        return true;
    }

    if (m_state == ReassemblyState::STREAMING_BODY) {
        return forwardBody(data, size, errorMsg);
    }

    m_buffer.insert(m_buffer.end(), data, data + size);

    auto decoded = tryDecodeFileHeader(m_buffer);
    if (!decoded) {
        return true;  // Need more deliveries
    }

    if (decoded->nameWasLossy) {
        LOG_DEBUG("Header name is not valid UTF-8, decoded as '" << decoded->header.fileName << "'");
    }
    m_header = std::move(decoded->header);
    m_state = ReassemblyState::STREAMING_BODY;

    // Release the receive buffer before handing anything on; the residual
    // body bytes are moved out first so they are forwarded exactly once.
    std::vector<uint8_t> residual(m_buffer.begin() + static_cast<std::ptrdiff_t>(decoded->consumed),
                                  m_buffer.end());
    m_buffer.clear();
    m_buffer.shrink_to_fit();

    if (m_onHeader && !m_onHeader(m_header, errorMsg)) {
        return false;
    }

    if (!residual.empty()) {
        return forwardBody(residual.data(), residual.size(), errorMsg);
    }
    return true;
}

bool ReceiveReassembler::finish(std::string& errorMsg) {
    if (m_state == ReassemblyState::AWAITING_HEADER) {
        errorMsg = "Connection closed before header received (" +
                   std::to_string(m_buffer.size()) + " bytes buffered)";
        return false;
    }
    return true;
}

bool ReceiveReassembler::forwardBody(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (m_onBody && !m_onBody(data, size, errorMsg)) {
        return false;
    }
    m_bodyBytes += size;
    return true;
}

}  // namespace FileBeam
