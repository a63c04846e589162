#pragma once

#include "types.hpp"
#include <string>

namespace orbiter {

// ============================================================================
// Bit / symbol codec
// ============================================================================

// UTF-8 bytes of text, 8 bits per byte MSB-first
Bits textToBits(const std::string& text);

// Inverse of textToBits. A trailing partial byte is zero-padded; invalid
// UTF-8 sequences decode to U+FFFD.
std::string bitsToText(BitSpan bits);

Bits bytesToBits(ByteSpan bytes);

// Zero-pads a trailing partial byte
Bytes bitsToBytes(BitSpan bits);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitizeUtf8(ByteSpan bytes);

// BPSK mapping: symbol = 2*bit - 1
Symbols bitsToSymbols(BitSpan bits);

// Sign decision at 0, ties go to bit 0
Bits symbolsToBits(SampleSpan symbols);

// ============================================================================
// Waveform
// ============================================================================

struct Waveform {
    Samples samples;
    float sample_rate_hz = 10000.0f;
    float carrier_freq_hz = 1000.0f;

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    // Derived from the two rates
    size_t samplesPerSymbol() const;

    float timeAt(size_t n) const { return static_cast<float>(n) / sample_rate_hz; }

    // t[n] = n / sample_rate
    Samples timeAxis() const;
};

/**
 * BPSK Modem
 *
 * Puts one symbol per bit onto a sine carrier and recovers it by coherent
 * mixing and integrate-and-dump.
 *
 * The receiver regenerates the exact transmit carrier, so carrier and
 * symbol timing are assumed locked. Errors come only from noise flipping
 * the sign of the integrated symbol.
 */
class BpskModem {
public:
    // Throws std::invalid_argument for non-positive rates
    BpskModem(float carrier_freq_hz, float sample_rate_hz);

    // max(100, floor(fs/fc) * 10)
    static size_t samplesPerSymbol(float carrier_freq_hz, float sample_rate_hz);

    // Output length = symbols.size() * samplesPerSymbol()
    Waveform modulate(SampleSpan symbols) const;

    // Mix with the regenerated carrier, sum each symbol segment, decide on sign.
    // Segment length is signal.size() / symbol_count.
    Symbols demodulate(SampleSpan signal, size_t symbol_count) const;

    // Same, but returns the integrated sums before the decision
    std::vector<float> integrate(SampleSpan signal, size_t symbol_count) const;

    float carrierFreq() const { return carrier_freq_hz_; }
    float sampleRate() const { return sample_rate_hz_; }
    size_t samplesPerSymbol() const { return samples_per_symbol_; }

private:
    float carrier_freq_hz_;
    float sample_rate_hz_;
    size_t samples_per_symbol_;
};

} // namespace orbiter
