/**
 * @file TransferHeader.h
 * @brief Length-prefixed file header that precedes every transfer body
 */

#pragma once

#include "config.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace FileBeam {

/**
 * @brief Metadata sent once per transfer
 *
 * Wire layout (all integers little-endian):
 * @code
 * [name_len: u16][file_size: u64][name_bytes: name_len bytes]
 * @endcode
 *
 * Everything after the header is the raw file body, terminated only by the
 * end of the stream. The declared fileSize is not trusted until the body
 * has been written and counted.
 */
struct FileHeader {
    std::string fileName;   ///< UTF-8 name (lossily decoded on receive)
    uint64_t fileSize = 0;  ///< Byte count declared by the sender

    bool operator==(const FileHeader& other) const {
        return fileName == other.fileName && fileSize == other.fileSize;
    }
    bool operator!=(const FileHeader& other) const { return !(*this == other); }
};

/**
 * @brief Result of a successful decode probe
 */
struct DecodedHeader {
    FileHeader header;
    size_t consumed = 0;  ///< Header bytes at the front of the probed buffer
    bool nameWasLossy = false;  ///< Name bytes were not valid UTF-8
};

/**
 * @brief Encoded size of a header carrying the given name
 */
inline size_t encodedHeaderSize(const std::string& fileName) {
    return HEADER_PREFIX_LEN + fileName.size();
}

/**
 * @brief Serialize a file header for transmission
 * @param fileName Name to send (at most MAX_FILE_NAME_BYTES bytes)
 * @param fileSize Declared body size
 * @param out Receives exactly 10 + fileName.size() bytes on success
 * @param errorMsg Output error message if the name is too long
 * @return true on success; false leaves out untouched
 */
bool encodeFileHeader(const std::string& fileName,
                      uint64_t fileSize,
                      std::vector<uint8_t>& out,
                      std::string& errorMsg);

/**
 * @brief Probe a buffer for a complete header
 * @param data Start of the received bytes (may be null when size is 0)
 * @param size Number of bytes available
 * @return The header and the number of bytes it occupies, or std::nullopt
 *         when fewer than 10 + name_len bytes are present
 *
 * Never mutates its input and may be called again as more bytes arrive.
 * Bytes beyond the returned consumed count belong to the body. Invalid UTF-8
 * in the name is replaced with U+FFFD rather than rejected.
 */
std::optional<DecodedHeader> tryDecodeFileHeader(const uint8_t* data, size_t size);

inline std::optional<DecodedHeader> tryDecodeFileHeader(const std::vector<uint8_t>& buffer) {
    return tryDecodeFileHeader(buffer.data(), buffer.size());
}

/**
 * @brief Get file size as human-readable string
 * @return String like "1.50 MB" or "512 bytes"
 */
std::string formatByteCount(uint64_t bytes);

}  // namespace FileBeam
