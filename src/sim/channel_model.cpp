#include "channel_model.hpp"
#include "orbiter/dsp.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <cmath>

namespace orbiter {
namespace sim {

namespace {

constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;

Samples scaled(SampleSpan signal, float gain) {
    Samples out(signal.size());
    for (size_t i = 0; i < signal.size(); i++) {
        out[i] = signal[i] * gain;
    }
    return out;
}

float clampDistance(float distance_km, float reference_km) {
    return distance_km <= 0.0f ? reference_km : distance_km;
}

} // namespace

float rangeAttenuationFactor(float distance_km, float reference_km) {
    float d = clampDistance(distance_km, reference_km);
    float ratio = reference_km / d;
    return ratio * ratio;
}

float rangeLossDb(float distance_km, float reference_km) {
    float d = clampDistance(distance_km, reference_km);
    return 20.0f * std::log10(d / reference_km);
}

Samples applyRangeLoss(SampleSpan signal, float distance_km, float reference_km) {
    float gain = std::sqrt(rangeAttenuationFactor(distance_km, reference_km));
    return scaled(signal, gain);
}

float weatherBaseLossDb(Weather weather) {
    switch (weather) {
        case Weather::CLEAR:  return 0.5f;
        case Weather::CLOUDY: return 1.5f;
        case Weather::RAIN:   return 4.0f;
        default:              return 0.5f;
    }
}

float atmosphericLossDb(float elevation_deg, Weather weather) {
    float elev = std::clamp(elevation_deg, 5.0f, 90.0f);
    return weatherBaseLossDb(weather) / std::sin(elev * DEG_TO_RAD);
}

Samples applyAtmosphericLoss(SampleSpan signal, float elevation_deg, Weather weather) {
    float loss_db = atmosphericLossDb(elevation_deg, weather);
    return scaled(signal, std::pow(10.0f, -loss_db / 20.0f));
}

Samples applyFades(SampleSpan signal, float sample_rate_hz, const FadeList& fades) {
    Samples out(signal.begin(), signal.end());
    if (fades.empty()) return out;

    for (size_t n = 0; n < out.size(); n++) {
        float t = static_cast<float>(n) / sample_rate_hz;
        out[n] *= fadeFactorAt(fades, t);
    }
    return out;
}

NoisyWaveform addAwgn(SampleSpan signal, float snr_db, std::mt19937& rng) {
    NoisyWaveform result;
    result.signal.assign(signal.begin(), signal.end());
    result.noise.assign(signal.size(), 0.0f);
    if (signal.empty()) return result;

    float p_signal = signalPower(signal);
    float p_noise = p_signal / dbToLinear(snr_db);
    if (!(p_noise > 0.0f) || !std::isfinite(p_noise)) {
        return result;
    }

    std::normal_distribution<float> gaussian(0.0f, std::sqrt(p_noise));
    for (size_t i = 0; i < signal.size(); i++) {
        result.noise[i] = gaussian(rng);
        result.signal[i] += result.noise[i];
    }
    return result;
}

DownlinkChannel::Output DownlinkChannel::propagate(SampleSpan tx, const FadeList& fades) {
    Output out;

    out.range_loss_db = rangeLossDb(config_.distance_km, config_.reference_distance_km);
    out.atmospheric_loss_db = atmosphericLossDb(config_.elevation_deg, config_.weather);

    Samples stage = applyRangeLoss(tx, config_.distance_km, config_.reference_distance_km);
    stage = applyAtmosphericLoss(stage, config_.elevation_deg, config_.weather);
    if (!fades.empty()) {
        stage = applyFades(stage, config_.sample_rate_hz, fades);
    }

    NoisyWaveform noisy = addAwgn(stage, config_.snr_db, rng_);
    out.achieved_snr_db = measureSnrDb(stage, noisy.noise);
    out.signal = std::move(noisy.signal);
    out.noise = std::move(noisy.noise);
    out.attenuated = std::move(stage);

    LOG_CHAN(DEBUG, "Range loss %.1f dB, atmosphere %.2f dB (%s, %.0f deg), %zu fades",
             out.range_loss_db, out.atmospheric_loss_db, weatherToString(config_.weather),
             config_.elevation_deg, fades.size());
    LOG_CHAN(DEBUG, "AWGN target %.1f dB, achieved %.2f dB", config_.snr_db, out.achieved_snr_db);
    return out;
}

} // namespace sim
} // namespace orbiter
