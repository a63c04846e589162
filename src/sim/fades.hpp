#pragma once

#include "orbiter/types.hpp"
#include <random>
#include <vector>

namespace orbiter {
namespace sim {

/**
 * Fade event
 *
 * A time-bounded multiplicative attenuation of the downlink (cloud bank,
 * antenna mispointing, obstruction). attenuation = 1.0 is no fade,
 * 0.0 is a total dropout. Active on [start_time, start_time + duration).
 */
struct FadeEvent {
    float start_time = 0.0f;    // Seconds from start of the waveform
    float duration = 1.0f;      // Seconds
    float attenuation = 1.0f;   // Amplitude factor while active

    FadeEvent() = default;

    // Throws std::invalid_argument for start_time < 0, duration <= 0,
    // or attenuation outside [0, 1]
    FadeEvent(float start_time, float duration, float attenuation);

    float endTime() const { return start_time + duration; }
    bool isActiveAt(float t) const { return t >= start_time && t < endTime(); }
};

using FadeList = std::vector<FadeEvent>;

// Product of the attenuation of every fade active at t (1.0 when none)
float fadeFactorAt(const FadeList& fades, float t);

// One factor per time point
Samples createFadeMask(SampleSpan time_axis, const FadeList& fades);

enum class FadeSeverity : uint8_t {
    SHALLOW = 0,   // 50-80% of the signal remains
    DEEP = 1,      // 5-30%
    MIXED = 2,     // 10-90%
};

const char* fadeSeverityToString(FadeSeverity s);
FadeSeverity parseFadeSeverity(const std::string& name);  // Unknown -> MIXED

// Start uniform in [0, duration), length uniform in [0.1, 2.0] s,
// attenuation from the severity range. Sorted by start time.
FadeList generateRandomFades(float duration_sec, size_t count,
                             FadeSeverity severity, std::mt19937& rng);

struct FadeImpact {
    size_t total_fades = 0;
    float total_fade_time_sec = 0.0f;
    float fade_percentage = 0.0f;      // Sum of durations over total duration
    float worst_attenuation = 1.0f;
    float average_attenuation = 1.0f;
};

// Empty impact for a non-positive duration
FadeImpact estimateFadeImpact(const FadeList& fades, float total_duration_sec);

} // namespace sim
} // namespace orbiter
