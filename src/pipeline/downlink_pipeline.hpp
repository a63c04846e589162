#pragma once

#include "orbiter/types.hpp"
#include "sim/fades.hpp"
#include "protocol/packet.hpp"
#include "anomaly_log.hpp"
#include "mission_archive.hpp"
#include <optional>
#include <string>

namespace orbiter {
namespace pipeline {

// Anomaly thresholds
constexpr float HIGH_BER_THRESHOLD = 0.1f;
constexpr float LOW_SNR_THRESHOLD_DB = 5.0f;

struct TransmissionConfig {
    ChannelConfig channel;
    bool use_fec = true;
    sim::FadeList fades;

    uint32_t seed = 42;                    // AWGN generator seed
    std::optional<uint32_t> packet_id;     // Default: derived from the clock
    std::optional<float> timestamp;        // Default: current time

    bool keep_waveforms = false;           // Copy tx/rx waveforms into the result
    bool save_to_archive = false;          // Persist through the sink, if one is given
};

struct TransmissionResult {
    std::string message_sent;
    std::string message_received;
    bool perfect_match = false;

    // Channel bits (FEC-encoded when enabled) before and after the channel
    Bits transmitted_bits;
    Bits received_bits;

    Bytes packet_sent;
    Bytes packet_received;

    // Channel quality, measured before FEC decode
    float ber = 0.0f;
    size_t total_bit_errors = 0;

    // After FEC decode (equal to the channel figures without FEC)
    float residual_ber = 0.0f;
    size_t residual_bit_errors = 0;
    size_t fec_corrections = 0;

    float snr_target_db = 0.0f;
    float snr_actual_db = 0.0f;
    float range_loss_db = 0.0f;
    float atmo_loss_db = 0.0f;

    bool packet_valid = false;
    protocol::ParseStatus parse_status = protocol::ParseStatus::OK;
    bool packet_truncated = false;
    int packets_total = 1;
    int packets_corrupted = 0;

    std::vector<Anomaly> anomalies;
    double elapsed_sec = 0.0;

    TransmissionConfig config;

    // Only filled with keep_waveforms
    Samples tx_signal;
    Samples rx_signal;
    Samples time_axis;

    std::string archive_id;                // Set when persisted

    bool hasAnomaly(const std::string& prefix) const;
};

/**
 * Single downlink transmission
 *
 * Init -> Packetize -> [FEC encode] -> Modulate -> RangeLoss -> AtmosphericLoss
 *      -> [Fade] -> AWGN -> Demodulate -> [FEC decode] -> Depacketize
 *      -> Validate -> Metrics -> [Persist]
 *
 * A CRC failure does not stop the run: the payload is still decoded for
 * diagnostics and the failure is recorded as an anomaly. Output depends only
 * on the message, the config and its seed (plus packet id/timestamp when
 * those default to the clock).
 */
TransmissionResult simulateTransmission(const std::string& message,
                                        const TransmissionConfig& config,
                                        MissionSink* sink = nullptr);

// Flat record for a persistence sink
MissionRecord toMissionRecord(const TransmissionResult& result);

} // namespace pipeline
} // namespace orbiter
