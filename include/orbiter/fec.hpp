#pragma once

#include "types.hpp"
#include <array>
#include <optional>

namespace orbiter {

// Hamming(7,4) codeword layout: [p1, p2, d1, p3, d2, d3, d4]
using Nibble = std::array<uint8_t, 4>;
using Codeword = std::array<uint8_t, 7>;

struct HammingDecodeResult {
    Nibble data{};
    bool corrected = false;   // A bit was flipped before extracting data
    int position = 0;         // 1-indexed flipped position, 0 = none
};

struct HammingBytesResult {
    Bytes data;
    size_t errors_corrected = 0;
    size_t total_codewords = 0;
};

/**
 * Hamming(7,4) codec
 *
 * Corrects exactly one bit error per 7-bit codeword via syndrome decoding.
 * Two or more errors in the same codeword produce a nonzero syndrome that
 * points at the wrong position: decode still "corrects" and returns wrong
 * data. The code has no way to tell the two cases apart.
 *
 * Wrong-length input returns std::nullopt (InvalidLength).
 */
class Hamming74 {
public:
    static constexpr size_t DATA_BITS = 4;
    static constexpr size_t CODE_BITS = 7;
    static constexpr size_t BITS_PER_BYTE = 2 * CODE_BITS;  // Two nibbles per byte

    static Codeword encode(const Nibble& data);
    static std::optional<Codeword> encode(BitSpan data);

    static HammingDecodeResult decode(const Codeword& codeword);
    static std::optional<HammingDecodeResult> decode(BitSpan codeword);

    // High nibble then low nibble, 14 bits per byte
    static Bits encodeBytes(ByteSpan data);

    // Pads a trailing partial group with zeros to a multiple of 14 bits
    static HammingBytesResult decodeBytes(BitSpan bits);

    // Encoded size in bits for a byte count
    static size_t encodedBits(size_t num_bytes) { return num_bytes * BITS_PER_BYTE; }
};

// Even parity: appends one bit so the total count of ones is even
Bits addParityBit(BitSpan bits);

// True if the count of ones (parity bit included) is even
bool checkParityBit(BitSpan bits_with_parity);

} // namespace orbiter
