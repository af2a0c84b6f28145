#include "filebeam/Utf8.h"

namespace FileBeam {
namespace {

constexpr const char kReplacementChar[] = "\xEF\xBF\xBD";

// Length of the valid sequence starting at data[pos], or 0 if invalid.
// On an invalid sequence, *invalidLen receives the length of the maximal
// subpart to replace (always >= 1).
static size_t validSequenceLength(const uint8_t* data, size_t size, size_t pos,
                                  size_t* invalidLen) {
    const uint8_t lead = data[pos];
    if (lead < 0x80) {
        return 1;
    }

    size_t continuation = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        continuation = 1;
    } else if (lead == 0xE0) {
        continuation = 2;
        lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        continuation = 2;
    } else if (lead == 0xED) {
        continuation = 2;
        hi = 0x9F;  // excludes UTF-16 surrogates
    } else if (lead == 0xF0) {
        continuation = 3;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        continuation = 3;
    } else if (lead == 0xF4) {
        continuation = 3;
        hi = 0x8F;  // caps at U+10FFFF
    } else {
        *invalidLen = 1;
        return 0;
    }

    size_t next = pos + 1;
    for (size_t i = 0; i < continuation; ++i, ++next) {
        if (next >= size || data[next] < lo || data[next] > hi) {
            *invalidLen = next - pos;
            return 0;
        }
        // Only the first continuation byte has a narrowed range.
        lo = 0x80;
        hi = 0xBF;
    }

    return continuation + 1;
}

}  // namespace

std::string decodeUtf8Lossy(const uint8_t* data, size_t size) {
    std::string out;
    if (!data || size == 0) {
        return out;
    }
    out.reserve(size);

    size_t pos = 0;
    while (pos < size) {
        size_t invalidLen = 0;
        const size_t len = validSequenceLength(data, size, pos, &invalidLen);
        if (len > 0) {
            out.append(reinterpret_cast<const char*>(data + pos), len);
            pos += len;
        } else {
            out.append(kReplacementChar);
            pos += invalidLen;
        }
    }

    return out;
}

bool isValidUtf8(const uint8_t* data, size_t size) {
    size_t pos = 0;
    while (pos < size) {
        size_t invalidLen = 0;
        const size_t len = validSequenceLength(data, size, pos, &invalidLen);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

}  // namespace FileBeam
