#pragma once

#include "orbiter/types.hpp"
#include "fades.hpp"
#include <random>

namespace orbiter {
namespace sim {

// ============================================================================
// Range loss (free-space spreading)
// ============================================================================

// Power ratio (ref/d)^2. Distance <= 0 is clamped to the reference.
float rangeAttenuationFactor(float distance_km, float reference_km = 1.0f);

// 20*log10(d/ref)
float rangeLossDb(float distance_km, float reference_km = 1.0f);

// Scales amplitude by sqrt(rangeAttenuationFactor) so power drops by the factor
Samples applyRangeLoss(SampleSpan signal, float distance_km, float reference_km = 1.0f);

// ============================================================================
// Atmospheric loss
// ============================================================================

// Zenith loss for the weather: clear 0.5, cloudy 1.5, rain 4.0 dB
float weatherBaseLossDb(Weather weather);

// Base loss times 1/sin(elevation), elevation clamped to [5, 90] degrees
float atmosphericLossDb(float elevation_deg, Weather weather);

Samples applyAtmosphericLoss(SampleSpan signal, float elevation_deg, Weather weather);

// ============================================================================
// Fading
// ============================================================================

// Sample n is at t = n / sample_rate
Samples applyFades(SampleSpan signal, float sample_rate_hz, const FadeList& fades);

// ============================================================================
// AWGN
// ============================================================================

struct NoisyWaveform {
    Samples signal;   // Input plus noise
    Samples noise;    // The noise that was added
};

// noise_power = mean(signal^2) / 10^(snr_db/10). Zero noise power (infinite
// SNR or a silent input) returns the signal unchanged with a zero noise vector.
NoisyWaveform addAwgn(SampleSpan signal, float snr_db, std::mt19937& rng);

/**
 * Downlink channel
 *
 * Satellite to ground propagation in a fixed order:
 *   range loss -> atmospheric loss -> fading -> AWGN
 *
 * The noise source is seeded per channel so that a run is reproducible.
 * Stages hold no state between calls apart from the generator.
 */
class DownlinkChannel {
public:
    struct Output {
        Samples signal;              // Received waveform
        Samples noise;               // Noise added by the AWGN stage
        Samples attenuated;          // Waveform entering the AWGN stage
        float range_loss_db = 0.0f;
        float atmospheric_loss_db = 0.0f;
        float achieved_snr_db = 0.0f;   // attenuated vs noise
    };

    explicit DownlinkChannel(const ChannelConfig& config, uint32_t seed = 42)
        : config_(config)
        , rng_(seed)
    {}

    Output propagate(SampleSpan tx, const FadeList& fades = {});

    const ChannelConfig& getConfig() const { return config_; }
    void setSNR(float snr_db) { config_.snr_db = snr_db; }
    void reseed(uint32_t seed) { rng_.seed(seed); }

private:
    ChannelConfig config_;
    std::mt19937 rng_;
};

} // namespace sim
} // namespace orbiter
