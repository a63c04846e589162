#define _USE_MATH_DEFINES  // For M_PI on MSVC
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#include "orbiter/modem.hpp"
#include "orbiter/dsp.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace orbiter {

size_t Waveform::samplesPerSymbol() const {
    return BpskModem::samplesPerSymbol(carrier_freq_hz, sample_rate_hz);
}

Samples Waveform::timeAxis() const {
    return orbiter::timeAxis(samples.size(), sample_rate_hz);
}

BpskModem::BpskModem(float carrier_freq_hz, float sample_rate_hz)
    : carrier_freq_hz_(carrier_freq_hz)
    , sample_rate_hz_(sample_rate_hz)
{
    if (!(carrier_freq_hz > 0.0f)) {
        throw std::invalid_argument("Carrier frequency must be positive");
    }
    if (!(sample_rate_hz > 0.0f)) {
        throw std::invalid_argument("Sample rate must be positive");
    }
    samples_per_symbol_ = samplesPerSymbol(carrier_freq_hz, sample_rate_hz);
}

// Fixed oversampling: at least 100 samples, otherwise 10 carrier cycles' worth
size_t BpskModem::samplesPerSymbol(float carrier_freq_hz, float sample_rate_hz) {
    if (!(carrier_freq_hz > 0.0f) || !(sample_rate_hz > 0.0f)) return 100;
    size_t per_cycle = static_cast<size_t>(std::floor(sample_rate_hz / carrier_freq_hz));
    return std::max<size_t>(100, per_cycle * 10);
}

Waveform BpskModem::modulate(SampleSpan symbols) const {
    Waveform wf;
    wf.sample_rate_hz = sample_rate_hz_;
    wf.carrier_freq_hz = carrier_freq_hz_;
    wf.samples.resize(symbols.size() * samples_per_symbol_);

    const double omega = 2.0 * M_PI * carrier_freq_hz_ / sample_rate_hz_;

    size_t n = 0;
    for (float symbol : symbols) {
        for (size_t k = 0; k < samples_per_symbol_; k++, n++) {
            wf.samples[n] = symbol * static_cast<float>(std::sin(omega * n));
        }
    }

    LOG_MODEM(DEBUG, "Modulated %zu symbols -> %zu samples (%zu samples/symbol)",
              symbols.size(), wf.samples.size(), samples_per_symbol_);
    return wf;
}

std::vector<float> BpskModem::integrate(SampleSpan signal, size_t symbol_count) const {
    std::vector<float> sums(symbol_count, 0.0f);
    if (symbol_count == 0) return sums;

    size_t sps = signal.size() / symbol_count;
    if (sps < 1) sps = 1;

    const double omega = 2.0 * M_PI * carrier_freq_hz_ / sample_rate_hz_;

    for (size_t i = 0; i < symbol_count; i++) {
        size_t start = i * sps;
        // Last symbol absorbs any remainder
        size_t end = (i + 1 == symbol_count) ? signal.size() : std::min(start + sps, signal.size());

        double acc = 0.0;
        for (size_t n = start; n < end; n++) {
            acc += static_cast<double>(signal[n]) * std::sin(omega * n);
        }
        sums[i] = static_cast<float>(acc);
    }
    return sums;
}

Symbols BpskModem::demodulate(SampleSpan signal, size_t symbol_count) const {
    std::vector<float> sums = integrate(signal, symbol_count);

    Symbols symbols(symbol_count);
    for (size_t i = 0; i < symbol_count; i++) {
        symbols[i] = sums[i] > 0.0f ? 1.0f : -1.0f;
    }

    LOG_MODEM(DEBUG, "Demodulated %zu samples -> %zu symbols", signal.size(), symbol_count);
    return symbols;
}

} // namespace orbiter
