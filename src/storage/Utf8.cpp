#include "storage/Utf8.hpp"
#include <cstddef>
#include <cstdint>

const char* const kReplacementChar = "\xEF\xBF\xBD";

namespace {

inline bool isContinuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at `pos`, or the number of
// bytes forming the maximal invalid prefix (negated) when it is ill-formed.
// Follows the Unicode "maximal subpart" rule so a torn multi-byte character
// costs exactly one replacement.
int sequenceLength(const std::string& in, size_t pos) {
    const uint8_t lead = static_cast<uint8_t>(in[pos]);
    if (lead < 0x80) {
        return 1;
    }

    int need = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        need = 2;
    } else if (lead == 0xED) {
        need = 2; hi = 0x9F; // surrogates
    } else if (lead == 0xF0) {
        need = 3; lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 3;
    } else if (lead == 0xF4) {
        need = 3; hi = 0x8F;
    } else {
        return -1; // 0x80..0xC1, 0xF5..0xFF never start a sequence
    }

    for (int i = 1; i <= need; ++i) {
        if (pos + i >= in.size()) {
            return -i;
        }
        const uint8_t b = static_cast<uint8_t>(in[pos + i]);
        if (i == 1 ? (b < lo || b > hi) : !isContinuation(b)) {
            return -i;
        }
    }
    return need + 1;
}

} // namespace

std::string decodeLossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        int len = sequenceLength(bytes, pos);
        if (len > 0) {
            out.append(bytes, pos, static_cast<size_t>(len));
            pos += static_cast<size_t>(len);
        } else {
            out.append(kReplacementChar);
            pos += static_cast<size_t>(-len);
        }
    }
    return out;
}

bool isValidUtf8(const std::string& bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        int len = sequenceLength(bytes, pos);
        if (len < 0) {
            return false;
        }
        pos += static_cast<size_t>(len);
    }
    return true;
}
