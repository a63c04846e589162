#include "satellite_pass.hpp"
#include "config/paths.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <fstream>
#include <mutex>
#include <thread>

namespace orbiter {
namespace pipeline {

float SatellitePass::progressNormalized(float t_sec) const {
    if (duration_sec <= 0.0f) return 0.5f;
    return std::clamp(t_sec / duration_sec, 0.0f, 1.0f);
}

float SatellitePass::normalizedElevation(float t_sec) const {
    float p = progressNormalized(t_sec);
    return std::max(0.0f, 1.0f - 4.0f * (p - 0.5f) * (p - 0.5f));
}

std::vector<float> PassConfig::transmissionTimes() const {
    std::vector<float> times(num_transmissions);
    if (num_transmissions == 1) {
        times[0] = duration_sec / 2.0f;
        return times;
    }
    for (size_t i = 0; i < num_transmissions; i++) {
        times[i] = duration_sec * static_cast<float>(i) / static_cast<float>(num_transmissions - 1);
    }
    return times;
}

PassResult simulatePass(const std::string& message,
                        const PassConfig& pass,
                        const TransmissionConfig& base,
                        const PassCallback& on_transmission,
                        const std::atomic<bool>* cancel,
                        MissionSink* sink) {
    auto start = std::chrono::steady_clock::now();

    PassResult result;
    result.config = pass;

    SatellitePass geometry{pass.duration_sec, pass.max_elevation_deg};
    std::vector<float> times = pass.transmissionTimes();

    LOG_PASS(INFO, "Pass: %.0f s, max elevation %.0f deg, %zu transmissions",
             pass.duration_sec, pass.max_elevation_deg, times.size());

    double ber_sum = 0.0;
    double snr_sum = 0.0;

    for (size_t i = 0; i < times.size(); i++) {
        if (cancel && cancel->load()) {
            result.cancelled = true;
            LOG_PASS(INFO, "Pass cancelled after %zu of %zu transmissions", i, times.size());
            break;
        }

        float e = geometry.normalizedElevation(times[i]);

        PassTransmission tx;
        tx.index = i;
        tx.time_sec = times[i];
        tx.elevation_deg = geometry.elevationAt(times[i]);
        tx.distance_km = pass.distanceAt(e);
        tx.snr_target_db = pass.snrAt(e);

        TransmissionConfig cfg = base;
        cfg.channel.elevation_deg = tx.elevation_deg;
        cfg.channel.distance_km = tx.distance_km;
        cfg.channel.snr_db = tx.snr_target_db;
        cfg.seed = base.seed + static_cast<uint32_t>(i);
        cfg.save_to_archive = false;

        LOG_PASS(DEBUG, "Transmission %zu/%zu: t=%.1f s, elev %.1f deg, %.0f km, SNR %.1f dB",
                 i + 1, times.size(), tx.time_sec, tx.elevation_deg, tx.distance_km, tx.snr_target_db);

        tx.result = simulateTransmission(message, cfg);

        ber_sum += tx.result.ber;
        snr_sum += tx.result.snr_actual_db;
        if (!tx.result.packet_valid) result.packets_corrupted++;

        result.transmissions.push_back(std::move(tx));
        if (on_transmission) {
            on_transmission(result.transmissions.back());
        }
    }

    size_t n = result.transmissions.size();
    if (n > 0) {
        result.avg_ber = static_cast<float>(ber_sum / n);
        result.avg_snr_db = static_cast<float>(snr_sum / n);
    }
    result.elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    LOG_PASS(INFO, "Pass complete: %zu/%zu packets OK, avg BER %.6f, avg SNR %.1f dB",
             result.successful(), n, result.avg_ber, result.avg_snr_db);

    if (base.save_to_archive && sink) {
        MissionRecord rec;
        rec.message_sent = "Satellite Pass: " + std::to_string(n) + " transmissions";
        rec.message_received = std::to_string(result.successful()) + " successful";
        rec.ber = result.avg_ber;
        rec.snr_db = result.avg_snr_db;
        rec.packets_total = static_cast<int>(n);
        rec.packets_corrupted = static_cast<int>(result.packets_corrupted);
        rec.metadata = {
            {"pass_duration_sec", std::to_string(static_cast<int>(pass.duration_sec))},
            {"max_elevation_deg", std::to_string(static_cast<int>(pass.max_elevation_deg))},
            {"use_fec", base.use_fec ? "1" : "0"},
            {"cancelled", result.cancelled ? "1" : "0"},
        };
        result.archive_id = sink->save(rec);
    }

    return result;
}

bool exportPassCsv(const PassResult& result, const std::string& path) {
    config::ensureParentDirectory(path);

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("PASS", "Cannot write pass CSV %s", path.c_str());
        return false;
    }

    file << "transmission_num,time_sec,elevation_deg,distance_km,snr_db,ber,packet_valid,message_match,bit_errors\n";

    char line[256];
    for (const auto& tx : result.transmissions) {
        snprintf(line, sizeof(line), "%zu,%.2f,%.2f,%.1f,%.2f,%.6f,%d,%d,%zu\n",
                 tx.index + 1, tx.time_sec, tx.elevation_deg, tx.distance_km,
                 tx.result.snr_actual_db, tx.result.ber,
                 tx.result.packet_valid ? 1 : 0, tx.result.perfect_match ? 1 : 0,
                 tx.result.total_bit_errors);
        file << line;
    }

    return file.good();
}

std::vector<SweepPoint> sweepSnr(const std::string& message,
                                 const std::vector<float>& snr_values,
                                 const TransmissionConfig& base,
                                 size_t num_threads) {
    std::vector<SweepPoint> points(snr_values.size());
    if (snr_values.empty()) return points;

    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    num_threads = std::min(num_threads, snr_values.size());

    // Workers claim indices from a shared counter and write only their own slots.
    // The first exception from any worker is rethrown after all have joined.
    std::atomic<size_t> next{0};
    std::exception_ptr error;
    std::mutex error_mutex;

    auto worker = [&]() {
        for (size_t i = next++; i < snr_values.size(); i = next++) {
            TransmissionConfig cfg = base;
            cfg.channel.snr_db = snr_values[i];
            cfg.seed = base.seed + static_cast<uint32_t>(i);
            cfg.keep_waveforms = false;
            cfg.save_to_archive = false;
            if (!cfg.packet_id) cfg.packet_id = static_cast<uint32_t>(i);
            if (!cfg.timestamp) cfg.timestamp = 0.0f;

            try {
                TransmissionResult r = simulateTransmission(message, cfg);
                points[i] = {snr_values[i], r.snr_actual_db, r.ber, r.residual_ber, r.packet_valid};
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!error) error = std::current_exception();
                return;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (size_t t = 0; t < num_threads; t++) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }
    if (error) {
        std::rethrow_exception(error);
    }

    LOG_PASS(DEBUG, "SNR sweep: %zu points on %zu threads", points.size(), num_threads);
    return points;
}

} // namespace pipeline
} // namespace orbiter
