/**
 * @file SessionId.h
 * @brief Random identifiers for transfer sessions
 */

#pragma once

#include <openssl/rand.h>
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace FileBeam {

/**
 * @class SessionId
 * @brief Generates short random IDs used to correlate log lines of one stream
 *
 * Thread Safety: RAND_bytes is thread-safe in OpenSSL 1.1.0+.
 */
class SessionId {
public:
    /**
     * @brief Generate a prefixed ID (e.g., "xfer_1a2b-3c4d-5e6f-7a8b")
     * @param prefix String prefix to prepend
     * @return Prefixed ID string, or just the prefix if no entropy is available
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 8> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return prefix;
        }

        std::ostringstream oss;
        oss << prefix << std::hex << std::setfill('0');

        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 2 || i == 4 || i == 6) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }

        return oss.str();
    }

private:
    SessionId() = delete;
};

}  // namespace FileBeam
