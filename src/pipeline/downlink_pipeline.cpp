#include "downlink_pipeline.hpp"
#include "sim/channel_model.hpp"
#include "orbiter/modem.hpp"
#include "orbiter/fec.hpp"
#include "orbiter/dsp.hpp"
#include "orbiter/logging.hpp"

#include <chrono>
#include <cstdio>

namespace orbiter {
namespace pipeline {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

uint32_t clockPacketId() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<uint32_t>(ms % 65536);
}

std::string formatFloat(const char* fmt, double v) {
    char buf[64];
    snprintf(buf, sizeof(buf), fmt, v);
    return buf;
}

} // namespace

bool TransmissionResult::hasAnomaly(const std::string& prefix) const {
    for (const auto& a : anomalies) {
        if (a.description.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

TransmissionResult simulateTransmission(const std::string& message,
                                        const TransmissionConfig& config,
                                        MissionSink* sink) {
    auto start = Clock::now();
    const ChannelConfig& ch = config.channel;

    TransmissionResult result;
    result.message_sent = message;
    result.config = config;
    result.snr_target_db = ch.snr_db;

    AnomalyLog anomalies;

    LOG_LINK(INFO, "Transmission: %zu bytes, %.0f km, target SNR %.1f dB, FEC %s",
             message.size(), ch.distance_km, ch.snr_db, config.use_fec ? "on" : "off");

    // Packetize
    uint32_t packet_id = config.packet_id ? *config.packet_id : clockPacketId();
    result.packet_sent = protocol::createPacket(message, packet_id, config.timestamp);
    Bits packet_bits = bytesToBits(result.packet_sent);
    LOG_LINK(DEBUG, "Packet #%u: %zu bytes, %zu bits",
             packet_id & 0xFFFF, result.packet_sent.size(), packet_bits.size());

    // FEC encode
    if (config.use_fec) {
        result.transmitted_bits = Hamming74::encodeBytes(result.packet_sent);
        LOG_LINK(DEBUG, "FEC: %zu -> %zu bits", packet_bits.size(), result.transmitted_bits.size());
    } else {
        result.transmitted_bits = packet_bits;
    }

    // Modulate
    BpskModem modem(ch.carrier_freq_hz, ch.sample_rate_hz);
    Symbols symbols = bitsToSymbols(result.transmitted_bits);
    Waveform tx = modem.modulate(symbols);

    // Channel
    sim::DownlinkChannel channel(ch, config.seed);
    sim::DownlinkChannel::Output rx = channel.propagate(tx.samples, config.fades);
    result.range_loss_db = rx.range_loss_db;
    result.atmo_loss_db = rx.atmospheric_loss_db;
    result.snr_actual_db = rx.achieved_snr_db;

    // Demodulate
    Symbols rx_symbols = modem.demodulate(rx.signal, symbols.size());
    result.received_bits = symbolsToBits(rx_symbols);

    result.total_bit_errors = countBitErrors(result.transmitted_bits, result.received_bits);
    result.ber = calculateBer(result.transmitted_bits, result.received_bits);

    // FEC decode
    if (config.use_fec) {
        HammingBytesResult decoded = Hamming74::decodeBytes(result.received_bits);
        result.packet_received = std::move(decoded.data);
        result.fec_corrections = decoded.errors_corrected;
        LOG_LINK(DEBUG, "FEC corrected %zu of %zu codewords",
                 decoded.errors_corrected, decoded.total_codewords);
    } else {
        result.packet_received = bitsToBytes(result.received_bits);
    }

    Bits decoded_bits = bytesToBits(result.packet_received);
    result.residual_bit_errors = countBitErrors(packet_bits, decoded_bits);
    result.residual_ber = calculateBer(packet_bits, decoded_bits);

    // Depacketize + validate
    protocol::ParseResult parsed = protocol::parsePacket(result.packet_received);
    result.parse_status = parsed.status;
    result.packet_truncated = parsed.packet.truncated;
    result.packet_valid = parsed.ok() && !parsed.packet.truncated && parsed.packet.crc_valid;

    if (parsed.ok()) {
        result.message_received = parsed.packet.payloadAsText();
    } else {
        result.message_received = "[UNRECOVERABLE]";
    }

    if (!result.packet_valid) {
        result.packets_corrupted = 1;
        anomalies.add("CRC validation failed", secondsSince(start));
        LOG_LINK(WARN, "CRC validation failed (%s)", protocol::parseStatusToString(parsed.status));
    }

    // Metrics
    if (result.ber > HIGH_BER_THRESHOLD) {
        anomalies.add("High BER: " + formatFloat("%.3f", result.ber), secondsSince(start));
        LOG_LINK(WARN, "High BER: %.3f", result.ber);
    }
    if (result.snr_actual_db < LOW_SNR_THRESHOLD_DB) {
        anomalies.add("Low SNR: " + formatFloat("%.1f", result.snr_actual_db) + " dB", secondsSince(start));
        LOG_LINK(WARN, "Low SNR: %.1f dB", result.snr_actual_db);
    }

    result.perfect_match = (result.message_received == message);
    result.anomalies = std::move(anomalies.entries);

    if (config.keep_waveforms) {
        result.time_axis = tx.timeAxis();
        result.tx_signal = std::move(tx.samples);
        result.rx_signal = std::move(rx.signal);
    }

    result.elapsed_sec = secondsSince(start);

    // Persist
    if (config.save_to_archive && sink) {
        result.archive_id = sink->save(toMissionRecord(result));
    }

    LOG_LINK(INFO, "BER %.6f (%zu/%zu), SNR %.1f dB, packet %s, match %s",
             result.ber, result.total_bit_errors, result.transmitted_bits.size(),
             result.snr_actual_db, result.packet_valid ? "valid" : "corrupted",
             result.perfect_match ? "yes" : "no");
    return result;
}

MissionRecord toMissionRecord(const TransmissionResult& result) {
    const TransmissionConfig& cfg = result.config;

    MissionRecord rec;
    rec.message_sent = result.message_sent;
    rec.message_received = result.message_received;
    rec.ber = result.ber;
    rec.snr_db = result.snr_actual_db;
    rec.packets_total = result.packets_total;
    rec.packets_corrupted = result.packets_corrupted;
    rec.metadata = {
        {"distance_km", formatFloat("%.1f", cfg.channel.distance_km)},
        {"snr_db", formatFloat("%.1f", cfg.channel.snr_db)},
        {"actual_snr_db", formatFloat("%.2f", result.snr_actual_db)},
        {"carrier_freq_hz", formatFloat("%.1f", cfg.channel.carrier_freq_hz)},
        {"use_fec", cfg.use_fec ? "1" : "0"},
        {"elapsed_time_sec", formatFloat("%.4f", result.elapsed_sec)},
        {"range_loss_db", formatFloat("%.2f", result.range_loss_db)},
        {"atmo_loss_db", formatFloat("%.2f", result.atmo_loss_db)},
    };
    return rec;
}

} // namespace pipeline
} // namespace orbiter
