#pragma once

#include "types.hpp"

namespace orbiter {

// Power ratio conversions
float dbToLinear(float db);
float linearToDb(float linear);  // -inf for linear <= 0

// Mean of squared samples, 0 for an empty signal
float signalPower(SampleSpan signal);

// 10*log10(P_signal / P_noise), +inf when the noise power is 0
float measureSnrDb(SampleSpan signal, SampleSpan noise);

// Bit comparison over the common prefix of both sequences
size_t countBitErrors(BitSpan sent, BitSpan received);
float calculateBer(BitSpan sent, BitSpan received);  // 0 for empty input

// amplitude * sin(2*pi*f*t), t = n / sample_rate
Samples generateSine(float freq_hz, float amplitude, float duration_sec, float sample_rate_hz);

// t[n] = n / sample_rate
Samples timeAxis(size_t num_samples, float sample_rate_hz);

} // namespace orbiter
