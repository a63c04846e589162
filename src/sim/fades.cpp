#include "fades.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace orbiter {
namespace sim {

FadeEvent::FadeEvent(float start_time_, float duration_, float attenuation_)
    : start_time(start_time_)
    , duration(duration_)
    , attenuation(attenuation_)
{
    if (!(start_time >= 0.0f)) {
        throw std::invalid_argument("Fade start time must be >= 0");
    }
    if (!(duration > 0.0f)) {
        throw std::invalid_argument("Fade duration must be positive");
    }
    if (!(attenuation >= 0.0f && attenuation <= 1.0f)) {
        throw std::invalid_argument("Fade attenuation must be in [0, 1]");
    }
}

float fadeFactorAt(const FadeList& fades, float t) {
    float factor = 1.0f;
    for (const auto& fade : fades) {
        if (fade.isActiveAt(t)) {
            factor *= fade.attenuation;
        }
    }
    return factor;
}

Samples createFadeMask(SampleSpan time_axis, const FadeList& fades) {
    Samples mask(time_axis.size());
    for (size_t i = 0; i < time_axis.size(); i++) {
        mask[i] = fadeFactorAt(fades, time_axis[i]);
    }
    return mask;
}

const char* fadeSeverityToString(FadeSeverity s) {
    switch (s) {
        case FadeSeverity::SHALLOW: return "shallow";
        case FadeSeverity::DEEP:    return "deep";
        case FadeSeverity::MIXED:   return "mixed";
        default:                    return "mixed";
    }
}

FadeSeverity parseFadeSeverity(const std::string& name) {
    if (name == "shallow") return FadeSeverity::SHALLOW;
    if (name == "deep") return FadeSeverity::DEEP;
    return FadeSeverity::MIXED;
}

FadeList generateRandomFades(float duration_sec, size_t count,
                             FadeSeverity severity, std::mt19937& rng) {
    float min_atten = 0.1f, max_atten = 0.9f;
    switch (severity) {
        case FadeSeverity::SHALLOW: min_atten = 0.5f;  max_atten = 0.8f; break;
        case FadeSeverity::DEEP:    min_atten = 0.05f; max_atten = 0.3f; break;
        case FadeSeverity::MIXED:   break;
    }

    FadeList fades;
    if (duration_sec <= 0.0f) return fades;
    fades.reserve(count);

    std::uniform_real_distribution<float> start_dist(0.0f, duration_sec);
    std::uniform_real_distribution<float> len_dist(0.1f, 2.0f);
    std::uniform_real_distribution<float> atten_dist(min_atten, max_atten);

    for (size_t i = 0; i < count; i++) {
        float start = start_dist(rng);
        float len = len_dist(rng);
        float atten = atten_dist(rng);
        fades.emplace_back(start, len, atten);
    }

    std::sort(fades.begin(), fades.end(),
              [](const FadeEvent& a, const FadeEvent& b) { return a.start_time < b.start_time; });

    LOG_CHAN(DEBUG, "Generated %zu %s fades over %.2f s",
             fades.size(), fadeSeverityToString(severity), duration_sec);
    return fades;
}

FadeImpact estimateFadeImpact(const FadeList& fades, float total_duration_sec) {
    FadeImpact impact;
    if (total_duration_sec <= 0.0f) return impact;

    impact.total_fades = fades.size();
    float atten_sum = 0.0f;
    for (const auto& fade : fades) {
        impact.total_fade_time_sec += fade.duration;
        impact.worst_attenuation = std::min(impact.worst_attenuation, fade.attenuation);
        atten_sum += fade.attenuation;
    }
    impact.fade_percentage = impact.total_fade_time_sec / total_duration_sec * 100.0f;
    if (!fades.empty()) {
        impact.average_attenuation = atten_sum / static_cast<float>(fades.size());
    }
    return impact;
}

} // namespace sim
} // namespace orbiter
