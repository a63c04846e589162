#pragma once

#include <string>
#include <vector>

namespace orbiter {
namespace pipeline {

struct Anomaly {
    std::string description;
    double time_sec = 0.0;      // Seconds since the start of the transmission
};

// Per-transmission anomaly accumulator. Built inside one pipeline run and
// moved into its result.
struct AnomalyLog {
    std::vector<Anomaly> entries;

    void add(std::string description, double time_sec) {
        entries.push_back({std::move(description), time_sec});
    }

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

} // namespace pipeline
} // namespace orbiter
