#pragma once

#include "downlink_pipeline.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace orbiter {
namespace pipeline {

/**
 * Satellite pass geometry
 *
 * Simplified rise/culminate/set: elevation follows an inverted parabola over
 * the pass, 0 at AOS and LOS, max_elevation_deg at mid-pass.
 */
struct SatellitePass {
    float duration_sec = 600.0f;
    float max_elevation_deg = 80.0f;

    // t / duration, clamped to [0, 1]
    float progressNormalized(float t_sec) const;

    // 1 - 4(p - 0.5)^2, in [0, 1]
    float normalizedElevation(float t_sec) const;

    float elevationAt(float t_sec) const { return max_elevation_deg * normalizedElevation(t_sec); }
};

struct PassConfig {
    float duration_sec = 600.0f;
    float max_elevation_deg = 80.0f;
    float min_snr_db = 5.0f;          // At the horizon
    float max_snr_db = 20.0f;         // At culmination
    float min_distance_km = 1000.0f;  // At culmination
    float max_distance_km = 2000.0f;  // At the horizon
    size_t num_transmissions = 10;

    // Transmission times, evenly spaced over [0, duration] (mid-pass for N = 1)
    std::vector<float> transmissionTimes() const;

    float snrAt(float normalized_elevation) const {
        return min_snr_db + (max_snr_db - min_snr_db) * normalized_elevation;
    }
    float distanceAt(float normalized_elevation) const {
        return max_distance_km - (max_distance_km - min_distance_km) * normalized_elevation;
    }
};

struct PassTransmission {
    size_t index = 0;
    float time_sec = 0.0f;
    float elevation_deg = 0.0f;
    float distance_km = 0.0f;
    float snr_target_db = 0.0f;
    TransmissionResult result;
};

struct PassResult {
    PassConfig config;
    std::vector<PassTransmission> transmissions;

    float avg_ber = 0.0f;
    float avg_snr_db = 0.0f;
    size_t packets_corrupted = 0;
    bool cancelled = false;        // Stopped before all transmissions ran
    double elapsed_sec = 0.0;
    std::string archive_id;

    size_t successful() const { return transmissions.size() - packets_corrupted; }
};

using PassCallback = std::function<void(const PassTransmission&)>;

/**
 * Run a satellite pass: one independent transmission per scheduled time,
 * with elevation, distance and target SNR taken from the pass geometry.
 * Transmission i uses seed base.seed + i.
 *
 * `on_transmission` is called after each transmission completes. Setting
 * `cancel` stops scheduling further transmissions; completed ones are kept
 * and the result is marked cancelled. With a sink and base.save_to_archive
 * set, a pass summary (not each transmission) is archived.
 */
PassResult simulatePass(const std::string& message,
                        const PassConfig& pass,
                        const TransmissionConfig& base,
                        const PassCallback& on_transmission = nullptr,
                        const std::atomic<bool>* cancel = nullptr,
                        MissionSink* sink = nullptr);

// transmission_num,time_sec,elevation_deg,distance_km,snr_db,ber,packet_valid,message_match,bit_errors
bool exportPassCsv(const PassResult& result, const std::string& path);

struct SweepPoint {
    float snr_db = 0.0f;             // Target
    float achieved_snr_db = 0.0f;
    float ber = 0.0f;
    float residual_ber = 0.0f;
    bool packet_valid = false;
};

// One transmission per SNR value, spread over worker threads
// (0 = hardware concurrency). Results are in input order.
std::vector<SweepPoint> sweepSnr(const std::string& message,
                                 const std::vector<float>& snr_values,
                                 const TransmissionConfig& base,
                                 size_t num_threads = 0);

} // namespace pipeline
} // namespace orbiter
