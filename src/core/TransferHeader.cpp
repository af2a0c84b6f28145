/**
 * @file TransferHeader.cpp
 * @brief Length-prefixed file header encoding and decode probe
 */

#include "filebeam/TransferHeader.h"
#include "filebeam/Utf8.h"
#include <iomanip>
#include <sstream>

namespace FileBeam {

namespace {

void appendLe16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void appendLe64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

uint16_t readLe16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

uint64_t readLe64(const uint8_t* p) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

}  // namespace

//=============================================================================
// Encoding
//=============================================================================

bool encodeFileHeader(const std::string& fileName,
                      uint64_t fileSize,
                      std::vector<uint8_t>& out,
                      std::string& errorMsg) {
    if (fileName.size() > MAX_FILE_NAME_BYTES) {
        errorMsg = "File name too long: " + std::to_string(fileName.size()) +
                   " bytes (max " + std::to_string(MAX_FILE_NAME_BYTES) + ")";
        return false;
    }

    std::vector<uint8_t> header;
    header.reserve(encodedHeaderSize(fileName));
    appendLe16(header, static_cast<uint16_t>(fileName.size()));
    appendLe64(header, fileSize);
    header.insert(header.end(), fileName.begin(), fileName.end());

    out = std::move(header);
    return true;
}

//=============================================================================
// Decode probe
//=============================================================================

std::optional<DecodedHeader> tryDecodeFileHeader(const uint8_t* data, size_t size) {
    if (!data || size < HEADER_PREFIX_LEN) {
        return std::nullopt;
    }

    const size_t nameLen = readLe16(data);
    const uint64_t fileSize = readLe64(data + 2);

    if (size < HEADER_PREFIX_LEN + nameLen) {
        return std::nullopt;
    }

    DecodedHeader decoded;
    decoded.header.fileName = decodeUtf8Lossy(data + HEADER_PREFIX_LEN, nameLen);
    decoded.nameWasLossy = !isValidUtf8(data + HEADER_PREFIX_LEN, nameLen);
    decoded.header.fileSize = fileSize;
    decoded.consumed = HEADER_PREFIX_LEN + nameLen;
    return decoded;
}

std::string formatByteCount(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace FileBeam
