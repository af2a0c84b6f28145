#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace FileBeam {

// Decodes bytes as UTF-8, replacing every invalid sequence with U+FFFD.
// Each maximal invalid subpart yields exactly one replacement character, so
// valid input is returned byte-identical and invalid input never fails.
std::string decodeUtf8Lossy(const uint8_t* data, size_t size);

inline std::string decodeUtf8Lossy(const std::string& bytes) {
    return decodeUtf8Lossy(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

// Returns true if the bytes form well-formed UTF-8.
bool isValidUtf8(const uint8_t* data, size_t size);

}  // namespace FileBeam
