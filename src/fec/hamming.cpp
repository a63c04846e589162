#include "orbiter/fec.hpp"
#include "orbiter/logging.hpp"

namespace orbiter {

Codeword Hamming74::encode(const Nibble& data) {
    uint8_t d1 = data[0] & 1;
    uint8_t d2 = data[1] & 1;
    uint8_t d3 = data[2] & 1;
    uint8_t d4 = data[3] & 1;

    uint8_t p1 = d1 ^ d2 ^ d4;
    uint8_t p2 = d1 ^ d3 ^ d4;
    uint8_t p3 = d2 ^ d3 ^ d4;

    return {p1, p2, d1, p3, d2, d3, d4};
}

std::optional<Codeword> Hamming74::encode(BitSpan data) {
    if (data.size() != DATA_BITS) {
        LOG_FEC(WARN, "encode: expected %zu bits, got %zu", DATA_BITS, data.size());
        return std::nullopt;
    }
    return encode(Nibble{data[0], data[1], data[2], data[3]});
}

HammingDecodeResult Hamming74::decode(const Codeword& codeword) {
    Codeword c;
    for (size_t i = 0; i < CODE_BITS; i++) c[i] = codeword[i] & 1;

    // Syndrome bits: received parity vs parity recomputed from received data
    uint8_t s1 = c[0] ^ c[2] ^ c[4] ^ c[6];
    uint8_t s2 = c[1] ^ c[2] ^ c[5] ^ c[6];
    uint8_t s3 = c[3] ^ c[4] ^ c[5] ^ c[6];
    int syndrome = 4 * s3 + 2 * s2 + s1;

    HammingDecodeResult result;
    if (syndrome != 0) {
        c[syndrome - 1] ^= 1;
        result.corrected = true;
        result.position = syndrome;
        LOG_FEC(TRACE, "Corrected bit at position %d", syndrome);
    }

    result.data = {c[2], c[4], c[5], c[6]};
    return result;
}

std::optional<HammingDecodeResult> Hamming74::decode(BitSpan codeword) {
    if (codeword.size() != CODE_BITS) {
        LOG_FEC(WARN, "decode: expected %zu bits, got %zu", CODE_BITS, codeword.size());
        return std::nullopt;
    }
    Codeword c;
    for (size_t i = 0; i < CODE_BITS; i++) c[i] = codeword[i];
    return decode(c);
}

Bits Hamming74::encodeBytes(ByteSpan data) {
    Bits out;
    out.reserve(encodedBits(data.size()));

    for (uint8_t byte : data) {
        Nibble high = {
            static_cast<uint8_t>((byte >> 7) & 1), static_cast<uint8_t>((byte >> 6) & 1),
            static_cast<uint8_t>((byte >> 5) & 1), static_cast<uint8_t>((byte >> 4) & 1)};
        Nibble low = {
            static_cast<uint8_t>((byte >> 3) & 1), static_cast<uint8_t>((byte >> 2) & 1),
            static_cast<uint8_t>((byte >> 1) & 1), static_cast<uint8_t>(byte & 1)};

        Codeword ch = encode(high);
        Codeword cl = encode(low);
        out.insert(out.end(), ch.begin(), ch.end());
        out.insert(out.end(), cl.begin(), cl.end());
    }

    LOG_FEC(DEBUG, "Encoded %zu bytes -> %zu bits", data.size(), out.size());
    return out;
}

HammingBytesResult Hamming74::decodeBytes(BitSpan bits) {
    HammingBytesResult result;

    size_t num_bytes = (bits.size() + BITS_PER_BYTE - 1) / BITS_PER_BYTE;
    result.data.reserve(num_bytes);

    for (size_t b = 0; b < num_bytes; b++) {
        uint8_t byte = 0;
        for (size_t half = 0; half < 2; half++) {
            Codeword c{};
            size_t base = b * BITS_PER_BYTE + half * CODE_BITS;
            for (size_t i = 0; i < CODE_BITS; i++) {
                c[i] = (base + i < bits.size()) ? bits[base + i] : 0;
            }

            HammingDecodeResult r = decode(c);
            if (r.corrected) result.errors_corrected++;
            result.total_codewords++;

            uint8_t nibble = static_cast<uint8_t>(
                (r.data[0] << 3) | (r.data[1] << 2) | (r.data[2] << 1) | r.data[3]);
            byte |= (half == 0) ? static_cast<uint8_t>(nibble << 4) : nibble;
        }
        result.data.push_back(byte);
    }

    LOG_FEC(DEBUG, "Decoded %zu codewords, %zu corrected",
            result.total_codewords, result.errors_corrected);
    return result;
}

Bits addParityBit(BitSpan bits) {
    Bits out(bits.begin(), bits.end());
    uint8_t parity = 0;
    for (uint8_t b : bits) parity ^= (b & 1);
    out.push_back(parity);
    return out;
}

bool checkParityBit(BitSpan bits_with_parity) {
    uint8_t parity = 0;
    for (uint8_t b : bits_with_parity) parity ^= (b & 1);
    return parity == 0;
}

} // namespace orbiter
