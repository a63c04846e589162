#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace orbiter {

// Core types
using Sample = float;                          // Waveform sample
using Samples = std::vector<Sample>;           // Waveform buffer
using Symbols = std::vector<Sample>;           // BPSK symbols (+1/-1)
using Bits = std::vector<uint8_t>;             // One bit per element, MSB-first per byte
using Bytes = std::vector<uint8_t>;            // Byte stream

// Spans for zero-copy operations
using SampleSpan = std::span<const Sample>;
using BitSpan = std::span<const uint8_t>;
using ByteSpan = std::span<const uint8_t>;
using MutableSampleSpan = std::span<Sample>;

// Weather conditions along the slant path
enum class Weather : uint8_t {
    CLEAR = 0,
    CLOUDY = 1,
    RAIN = 2,
};

inline const char* weatherToString(Weather w) {
    switch (w) {
        case Weather::CLEAR:  return "clear";
        case Weather::CLOUDY: return "cloudy";
        case Weather::RAIN:   return "rain";
        default:              return "clear";
    }
}

// Unknown names map to CLEAR
inline Weather parseWeather(const std::string& name) {
    if (name == "cloudy") return Weather::CLOUDY;
    if (name == "rain") return Weather::RAIN;
    return Weather::CLEAR;
}

// Channel configuration consumed by the channel model per call
struct ChannelConfig {
    float distance_km = 1000.0f;       // Satellite to ground station slant range
    float snr_db = 15.0f;              // Target per-sample SNR at the receiver
    float carrier_freq_hz = 1000.0f;   // Carrier frequency
    float sample_rate_hz = 10000.0f;   // Waveform sample rate
    float elevation_deg = 90.0f;       // Elevation above the horizon
    Weather weather = Weather::CLEAR;

    // Reference distance for range loss (no loss at or below this)
    float reference_distance_km = 1.0f;
};

} // namespace orbiter
