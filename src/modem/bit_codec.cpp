#include "orbiter/modem.hpp"

namespace orbiter {

namespace {

// U+FFFD REPLACEMENT CHARACTER
constexpr char REPLACEMENT[] = "\xEF\xBF\xBD";

bool isContinuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

// Length of the valid sequence starting at data[i], or the length of the
// maximal invalid prefix (negated) that must be replaced by one U+FFFD
int utf8SequenceLength(ByteSpan data, size_t i) {
    uint8_t lead = data[i];
    if (lead < 0x80) return 1;

    int need;
    uint8_t lo = 0x80, hi = 0xBF;  // Allowed range for the first continuation byte
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        if (lead == 0xE0) lo = 0xA0;         // Overlong
        else if (lead == 0xED) hi = 0x9F;    // Surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        if (lead == 0xF0) lo = 0x90;         // Overlong
        else if (lead == 0xF4) hi = 0x8F;    // Above U+10FFFF
    } else {
        return -1;
    }

    for (int k = 1; k <= need; k++) {
        if (i + k >= data.size()) return -k;
        uint8_t b = data[i + k];
        if (k == 1) {
            if (b < lo || b > hi) return -1;
        } else if (!isContinuation(b)) {
            return -k;
        }
    }
    return need + 1;
}

} // namespace

Bits bytesToBits(ByteSpan bytes) {
    Bits bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t byte : bytes) {
        for (int b = 7; b >= 0; --b) {
            bits.push_back((byte >> b) & 1);
        }
    }
    return bits;
}

Bytes bitsToBytes(BitSpan bits) {
    Bytes bytes((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); i++) {
        if (bits[i] & 1) {
            bytes[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    return bytes;
}

Bits textToBits(const std::string& text) {
    Bytes bytes(text.begin(), text.end());
    return bytesToBits(bytes);
}

std::string sanitizeUtf8(ByteSpan bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        int len = utf8SequenceLength(bytes, i);
        if (len > 0) {
            out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
            i += len;
        } else {
            out += REPLACEMENT;
            i += static_cast<size_t>(-len);
        }
    }
    return out;
}

std::string bitsToText(BitSpan bits) {
    Bytes bytes = bitsToBytes(bits);
    return sanitizeUtf8(bytes);
}

Symbols bitsToSymbols(BitSpan bits) {
    Symbols symbols(bits.size());
    for (size_t i = 0; i < bits.size(); i++) {
        symbols[i] = 2.0f * static_cast<float>(bits[i] & 1) - 1.0f;
    }
    return symbols;
}

Bits symbolsToBits(SampleSpan symbols) {
    Bits bits(symbols.size());
    for (size_t i = 0; i < symbols.size(); i++) {
        bits[i] = symbols[i] > 0.0f ? 1 : 0;
    }
    return bits;
}

} // namespace orbiter
