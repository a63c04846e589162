#define _USE_MATH_DEFINES  // For M_PI on MSVC
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#include "orbiter/dsp.hpp"

#include <algorithm>
#include <limits>

namespace orbiter {

float dbToLinear(float db) {
    return std::pow(10.0f, db / 10.0f);
}

float linearToDb(float linear) {
    if (linear <= 0.0f) {
        return -std::numeric_limits<float>::infinity();
    }
    return 10.0f * std::log10(linear);
}

float signalPower(SampleSpan signal) {
    if (signal.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : signal) {
        sum += static_cast<double>(s) * s;
    }
    return static_cast<float>(sum / signal.size());
}

float measureSnrDb(SampleSpan signal, SampleSpan noise) {
    float p_noise = signalPower(noise);
    if (p_noise <= 0.0f) {
        return std::numeric_limits<float>::infinity();
    }
    return linearToDb(signalPower(signal) / p_noise);
}

size_t countBitErrors(BitSpan sent, BitSpan received) {
    size_t n = std::min(sent.size(), received.size());
    size_t errors = 0;
    for (size_t i = 0; i < n; i++) {
        if ((sent[i] & 1) != (received[i] & 1)) errors++;
    }
    return errors;
}

float calculateBer(BitSpan sent, BitSpan received) {
    size_t n = std::min(sent.size(), received.size());
    if (n == 0) return 0.0f;
    return static_cast<float>(countBitErrors(sent, received)) / static_cast<float>(n);
}

Samples generateSine(float freq_hz, float amplitude, float duration_sec, float sample_rate_hz) {
    if (duration_sec <= 0.0f || sample_rate_hz <= 0.0f) return {};

    size_t n = static_cast<size_t>(duration_sec * sample_rate_hz);
    Samples out(n);
    const double omega = 2.0 * M_PI * freq_hz / sample_rate_hz;
    for (size_t i = 0; i < n; i++) {
        out[i] = amplitude * static_cast<float>(std::sin(omega * i));
    }
    return out;
}

Samples timeAxis(size_t num_samples, float sample_rate_hz) {
    Samples t(num_samples);
    for (size_t i = 0; i < num_samples; i++) {
        t[i] = static_cast<float>(i) / sample_rate_hz;
    }
    return t;
}

} // namespace orbiter
