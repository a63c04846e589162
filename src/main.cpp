#include "orbiter/modem.hpp"
#include "orbiter/fec.hpp"
#include "orbiter/logging.hpp"
#include "protocol/packet.hpp"
#include "pipeline/downlink_pipeline.hpp"
#include "pipeline/satellite_pass.hpp"
#include "pipeline/mission_archive.hpp"
#include "config/mission_config.hpp"

#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace orbiter;

// Signal handling: Ctrl-C stops a pass after the current transmission
static std::atomic<bool> g_cancel{false};

void signalHandler(int) {
    g_cancel = true;
}

void printUsage(const char* prog) {
    std::cerr << "Orbiter - Satellite downlink simulator\n\n";
    std::cerr << "Usage: " << prog << " [options] <command> [message]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  send <msg>      Run one transmission through the downlink\n";
    std::cerr << "  pass <msg>      Simulate a satellite pass (repeated transmissions)\n";
    std::cerr << "  sweep <msg>     BER versus SNR table\n";
    std::cerr << "  inspect <msg>   Show the packet that would be sent\n";
    std::cerr << "  info            Show the link budget for the current settings\n";
    std::cerr << "  archive [list|stats|show <id>|clear]\n";
    std::cerr << "                  Browse the mission archive (default: list)\n";
    std::cerr << "\nLink options:\n";
    std::cerr << "  -d <km>         Distance (default: 1000)\n";
    std::cerr << "  -n <dB>         Target SNR (default: 15)\n";
    std::cerr << "  -c <Hz>         Carrier frequency (default: 1000)\n";
    std::cerr << "  -r <Hz>         Sample rate (default: 10000)\n";
    std::cerr << "  -e <deg>        Elevation (default: 90)\n";
    std::cerr << "  -W <weather>    clear, cloudy, rain (default: clear)\n";
    std::cerr << "  -F              Enable Hamming(7,4) FEC (default)\n";
    std::cerr << "  -N              Disable FEC\n";
    std::cerr << "  -f <s,d,a>      Add fade: start sec, duration sec, attenuation 0..1\n";
    std::cerr << "  -s <seed>       Noise seed (default: 42)\n";
    std::cerr << "\nMission options:\n";
    std::cerr << "  -S <scenario>   perfect_conditions, typical_leo, challenging, deep_space\n";
    std::cerr << "  -C <file>       Load mission INI file\n";
    std::cerr << "  -a <file>       Append results to CSV mission archive\n";
    std::cerr << "  -o <file>       Write pass timeline CSV\n";
    std::cerr << "  -t <count>      Pass transmissions (default: 10)\n";
    std::cerr << "  -T <sec>        Pass duration (default: 600)\n";
    std::cerr << "  -p              Pace pass transmissions in real time\n";
    std::cerr << "  -v              Verbose (repeat for more)\n";
    std::cerr << "\nArchive options:\n";
    std::cerr << "  -l <count>      Records to list (default: 20, 0 = all)\n";
    std::cerr << "  -m <dB>         Only missions with SNR at least this\n";
    std::cerr << "  -b <ber>        Only missions with BER at most this\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " send \"Hello from orbit\" -d 800 -n 10\n";
    std::cerr << "  " << prog << " pass \"Telemetry\" -S typical_leo -o pass.csv\n";
    std::cerr << "  " << prog << " send \"Hi\" -N -n 3 -f 0.2,0.3,0.1\n";
    std::cerr << "  " << prog << " archive list -m 10 -b 0.01\n";
    std::cerr << "\n";
}

// Command-line overrides, applied on top of scenario/config file
struct Overrides {
    std::optional<float> distance_km;
    std::optional<float> snr_db;
    std::optional<float> carrier_freq_hz;
    std::optional<float> sample_rate_hz;
    std::optional<float> elevation_deg;
    std::optional<Weather> weather;
    std::optional<bool> use_fec;
    std::optional<uint32_t> seed;
    std::optional<size_t> num_transmissions;
    std::optional<float> pass_duration_sec;
    sim::FadeList fades;
};

void applyOverrides(const Overrides& o, config::MissionConfig& mission) {
    ChannelConfig& ch = mission.link.channel;
    if (o.distance_km) ch.distance_km = *o.distance_km;
    if (o.snr_db) ch.snr_db = *o.snr_db;
    if (o.carrier_freq_hz) ch.carrier_freq_hz = *o.carrier_freq_hz;
    if (o.sample_rate_hz) ch.sample_rate_hz = *o.sample_rate_hz;
    if (o.elevation_deg) ch.elevation_deg = *o.elevation_deg;
    if (o.weather) ch.weather = *o.weather;
    if (o.use_fec) mission.link.use_fec = *o.use_fec;
    if (o.seed) mission.link.seed = *o.seed;
    if (o.num_transmissions) mission.pass.num_transmissions = *o.num_transmissions;
    if (o.pass_duration_sec) mission.pass.duration_sec = *o.pass_duration_sec;
    if (!o.fades.empty()) mission.link.fades = o.fades;
}

bool parseFadeArg(const char* s, sim::FadeEvent& out) {
    float start, duration, atten;
    if (sscanf(s, "%f,%f,%f", &start, &duration, &atten) != 3) {
        std::cerr << "Error: fade must be start,duration,attenuation: " << s << "\n";
        return false;
    }
    try {
        out = sim::FadeEvent(start, duration, atten);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid fade " << s << ": " << e.what() << "\n";
        return false;
    }
    return true;
}

void printResult(const pipeline::TransmissionResult& r) {
    std::cout << "Sent:       \"" << r.message_sent << "\"\n";
    std::cout << "Received:   \"" << r.message_received << "\"\n";
    std::cout << "Match:      " << (r.perfect_match ? "yes" : "no") << "\n";
    std::cout << "Packet:     " << (r.packet_valid ? "valid" : "CORRUPTED")
              << " (" << protocol::parseStatusToString(r.parse_status)
              << (r.packet_truncated ? ", truncated" : "") << ")\n";

    char line[160];
    snprintf(line, sizeof(line), "BER:        %.6f (%zu/%zu channel bits)\n",
             r.ber, r.total_bit_errors, r.transmitted_bits.size());
    std::cout << line;
    if (r.config.use_fec) {
        snprintf(line, sizeof(line), "After FEC:  %.6f (%zu bit errors, %zu codewords corrected)\n",
                 r.residual_ber, r.residual_bit_errors, r.fec_corrections);
        std::cout << line;
    }
    snprintf(line, sizeof(line), "SNR:        %.1f dB target, %.2f dB achieved\n",
             r.snr_target_db, r.snr_actual_db);
    std::cout << line;
    snprintf(line, sizeof(line), "Losses:     range %.1f dB, atmosphere %.2f dB\n",
             r.range_loss_db, r.atmo_loss_db);
    std::cout << line;
    snprintf(line, sizeof(line), "Time:       %.3f s\n", r.elapsed_sec);
    std::cout << line;

    if (!r.anomalies.empty()) {
        std::cout << "Anomalies:\n";
        for (const auto& a : r.anomalies) {
            std::cout << "  - " << a.description << "\n";
        }
    }
    if (!r.archive_id.empty()) {
        std::cout << "Archived as mission #" << r.archive_id << "\n";
    }
}

int runSend(const char* message, const config::MissionConfig& mission, pipeline::MissionSink* sink) {
    if (!message) {
        std::cerr << "Error: send requires a message\n";
        return 1;
    }
    pipeline::TransmissionResult r = pipeline::simulateTransmission(message, mission.link, sink);
    printResult(r);

    if (r.packet_sent != r.packet_received) {
        std::cout << "\nPacket damage:\n";
        std::cout << protocol::formatDiffReport(r.packet_sent, r.packet_received);
        protocol::PacketComparison c = protocol::comparePackets(r.packet_sent, r.packet_received);
        std::cout << "Fields:     preamble " << (c.preamble_match ? "ok" : "DIFF")
                  << ", header " << (c.header_match ? "ok" : "DIFF")
                  << ", payload " << (c.payload_match ? "ok" : "DIFF")
                  << ", crc " << (c.crc_match ? "ok" : "DIFF") << "\n";
    }
    return r.packet_valid ? 0 : 2;
}

int runPass(const char* message, const config::MissionConfig& mission,
            pipeline::MissionSink* sink, const char* output_file, bool realtime) {
    if (!message) {
        std::cerr << "Error: pass requires a message\n";
        return 1;
    }

    const pipeline::PassConfig& pass = mission.pass;
    size_t n = pass.num_transmissions;
    float interval = n > 0 ? pass.duration_sec / static_cast<float>(n) : 0.0f;

    std::cout << "  #    t(s)   elev    km    SNR(dB)   BER        packet\n";
    auto on_tx = [&](const pipeline::PassTransmission& tx) {
        char line[160];
        snprintf(line, sizeof(line), "%3zu %7.1f %6.1f %6.0f %7.2f   %.6f   %s\n",
                 tx.index + 1, tx.time_sec, tx.elevation_deg, tx.distance_km,
                 tx.result.snr_actual_db, tx.result.ber,
                 tx.result.packet_valid ? "OK" : "CORRUPTED");
        std::cout << line << std::flush;

        if (realtime && tx.index + 1 < n && !g_cancel) {
            std::this_thread::sleep_for(std::chrono::duration<float>(interval));
        }
    };

    pipeline::PassResult result = pipeline::simulatePass(message, pass, mission.link, on_tx, &g_cancel, sink);

    char summary[200];
    snprintf(summary, sizeof(summary),
             "\nPass: %zu/%zu packets OK, avg BER %.6f, avg SNR %.1f dB%s\n",
             result.successful(), result.transmissions.size(),
             result.avg_ber, result.avg_snr_db, result.cancelled ? " (cancelled)" : "");
    std::cout << summary;

    if (!result.archive_id.empty()) {
        std::cout << "Archived as mission #" << result.archive_id << "\n";
    }

    if (output_file) {
        if (!pipeline::exportPassCsv(result, output_file)) {
            std::cerr << "Error: Cannot write " << output_file << "\n";
            return 1;
        }
        std::cout << "Timeline written to " << output_file << "\n";
    }
    return 0;
}

int runSweep(const char* message, const config::MissionConfig& mission) {
    if (!message) {
        std::cerr << "Error: sweep requires a message\n";
        return 1;
    }

    std::vector<float> snrs;
    for (int snr = -25; snr <= 20; snr += 5) {
        snrs.push_back(static_cast<float>(snr));
    }

    auto points = pipeline::sweepSnr(message, snrs, mission.link);

    std::cout << "Target(dB)  Achieved(dB)  BER        After FEC  Packet\n";
    for (const auto& p : points) {
        char line[128];
        snprintf(line, sizeof(line), "%9.1f  %12.2f  %.6f   %.6f   %s\n",
                 p.snr_db, p.achieved_snr_db, p.ber, p.residual_ber,
                 p.packet_valid ? "OK" : "CORRUPTED");
        std::cout << line;
    }
    return 0;
}

int runInspect(const char* message, const config::MissionConfig& mission) {
    if (!message) {
        std::cerr << "Error: inspect requires a message\n";
        return 1;
    }

    Bytes packet = protocol::createPacket(message, 0);
    std::cout << protocol::packetToString(packet) << "\n\n";
    std::cout << protocol::hexdump(packet) << "\n";

    char line[160];
    snprintf(line, sizeof(line), "Payload %zu bytes, packet %zu bytes, overhead %.1f%%\n",
             packet.size() - protocol::PacketLayout::OVERHEAD, packet.size(),
             protocol::calculateOverhead(packet.size() - protocol::PacketLayout::OVERHEAD));
    std::cout << line;

    size_t bits = packet.size() * 8;
    if (mission.link.use_fec) {
        bits = Hamming74::encodedBits(packet.size());
    }
    size_t sps = BpskModem::samplesPerSymbol(mission.link.channel.carrier_freq_hz,
                                             mission.link.channel.sample_rate_hz);
    snprintf(line, sizeof(line), "On air: %zu bits%s, %zu samples (%.2f s)\n",
             bits, mission.link.use_fec ? " (Hamming 7,4)" : "", bits * sps,
             static_cast<float>(bits * sps) / mission.link.channel.sample_rate_hz);
    std::cout << line;
    return 0;
}

// Options for the archive command
struct ArchiveArgs {
    const char* action = nullptr;   // list, stats, show, clear
    const char* id = nullptr;
    pipeline::ArchiveQuery query;
};

void printMission(const pipeline::ArchivedMission& m) {
    const pipeline::MissionRecord& r = m.record;
    std::cout << "Mission #" << m.id << " (" << m.timestamp << ")\n";
    std::cout << "  Sent:      \"" << r.message_sent << "\"\n";
    std::cout << "  Received:  \"" << r.message_received << "\"\n";

    char line[160];
    snprintf(line, sizeof(line), "  BER:       %.6f\n  SNR:       %.2f dB\n  Packets:   %d/%d corrupted\n",
             r.ber, r.snr_db, r.packets_corrupted, r.packets_total);
    std::cout << line;
    for (const auto& [key, value] : r.metadata) {
        std::cout << "  " << key << " = " << value << "\n";
    }
}

int runArchive(const ArchiveArgs& args, pipeline::CsvMissionArchive& archive) {
    const char* action = args.action ? args.action : "list";

    if (strcmp(action, "list") == 0) {
        auto missions = archive.query(args.query);
        if (missions.empty()) {
            std::cout << "No missions in " << archive.path() << "\n";
            return 0;
        }
        std::cout << "  id  timestamp              BER        SNR(dB)  packets  message\n";
        for (const auto& m : missions) {
            char line[160];
            snprintf(line, sizeof(line), "%4s  %-20s  %.6f  %7.2f  %3d/%-3d  ",
                     m.id.c_str(), m.timestamp.c_str(), m.record.ber, m.record.snr_db,
                     m.record.packets_corrupted, m.record.packets_total);
            std::cout << line << m.record.message_sent << "\n";
        }
        return 0;
    } else if (strcmp(action, "stats") == 0) {
        pipeline::ArchiveStatistics st = archive.statistics();
        char line[200];
        snprintf(line, sizeof(line),
                 "Missions:          %zu\n"
                 "Average BER:       %.6f\n"
                 "Average SNR:       %.2f dB\n"
                 "Packets:           %ld (%ld corrupted)\n"
                 "Packet error rate: %.2f%%\n",
                 st.total_missions, st.average_ber, st.average_snr_db,
                 st.total_packets, st.total_corrupted, st.packet_error_rate * 100.0f);
        std::cout << line;
        return 0;
    } else if (strcmp(action, "show") == 0) {
        if (!args.id) {
            std::cerr << "Error: archive show requires an id\n";
            return 1;
        }
        auto m = archive.get(args.id);
        if (!m) {
            std::cerr << "Mission #" << args.id << " not found in " << archive.path() << "\n";
            return 1;
        }
        printMission(*m);
        return 0;
    } else if (strcmp(action, "clear") == 0) {
        size_t removed = archive.clear();
        std::cout << "Removed " << removed << " missions from " << archive.path() << "\n";
        return 0;
    }

    std::cerr << "Unknown archive action: " << action << "\n";
    return 1;
}

void printInfo(const config::MissionConfig& mission) {
    const ChannelConfig& ch = mission.link.channel;
    std::cout << "=== Orbiter downlink (" << mission.name << ") ===\n\n";

    char line[160];
    snprintf(line, sizeof(line), "  Distance:        %.0f km\n", ch.distance_km);  std::cout << line;
    snprintf(line, sizeof(line), "  Elevation:       %.0f deg\n", ch.elevation_deg); std::cout << line;
    snprintf(line, sizeof(line), "  Weather:         %s\n", weatherToString(ch.weather)); std::cout << line;
    snprintf(line, sizeof(line), "  Target SNR:      %.1f dB\n", ch.snr_db); std::cout << line;
    snprintf(line, sizeof(line), "  Carrier:         %.0f Hz\n", ch.carrier_freq_hz); std::cout << line;
    snprintf(line, sizeof(line), "  Sample rate:     %.0f Hz\n", ch.sample_rate_hz); std::cout << line;
    snprintf(line, sizeof(line), "  Samples/symbol:  %zu\n",
             BpskModem::samplesPerSymbol(ch.carrier_freq_hz, ch.sample_rate_hz)); std::cout << line;
    snprintf(line, sizeof(line), "  FEC:             %s\n", mission.link.use_fec ? "Hamming(7,4)" : "off"); std::cout << line;
    snprintf(line, sizeof(line), "  Fades:           %zu\n", mission.link.fades.size()); std::cout << line;

    std::cout << "\nScenarios:";
    for (const auto& name : config::presets::names()) {
        std::cout << " " << name;
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);

    const char* command = nullptr;
    const char* message = nullptr;
    const char* extra = nullptr;
    const char* scenario = nullptr;
    const char* config_file = nullptr;
    const char* archive_file = nullptr;
    const char* output_file = nullptr;
    bool realtime = false;
    int verbosity = 0;
    Overrides o;
    ArchiveArgs archive_args;
    archive_args.query.limit = 20;

    // Options can appear before or after the command
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            o.distance_km = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            o.snr_db = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            o.carrier_freq_hz = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            o.sample_rate_hz = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-e") == 0 && i + 1 < argc) {
            o.elevation_deg = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-W") == 0 && i + 1 < argc) {
            o.weather = parseWeather(argv[++i]);
        } else if (strcmp(argv[i], "-F") == 0) {
            o.use_fec = true;
        } else if (strcmp(argv[i], "-N") == 0) {
            o.use_fec = false;
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            sim::FadeEvent fade;
            if (!parseFadeArg(argv[++i], fade)) return 1;
            o.fades.push_back(fade);
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            o.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(argv[i], "-S") == 0 && i + 1 < argc) {
            scenario = argv[++i];
        } else if (strcmp(argv[i], "-C") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "-a") == 0 && i + 1 < argc) {
            archive_file = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            o.num_transmissions = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(argv[i], "-T") == 0 && i + 1 < argc) {
            o.pass_duration_sec = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            size_t limit = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
            archive_args.query.limit = limit > 0 ? std::optional<size_t>(limit) : std::nullopt;
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            archive_args.query.min_snr_db = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc) {
            archive_args.query.max_ber = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "-p") == 0) {
            realtime = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbosity++;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            // First non-option is the command, second the message
            if (!command) {
                command = argv[i];
            } else if (!message) {
                message = argv[i];
            } else if (!extra) {
                extra = argv[i];
            }
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    if (verbosity == 1) setLogLevel(LogLevel::DEBUG);
    else if (verbosity >= 2) setLogLevel(LogLevel::TRACE);
    if (verbosity >= 2) g_log_categories.fec = true;

    // Scenario, then config file, then command-line overrides
    config::MissionConfig mission;
    if (scenario && !config::presets::forName(scenario, mission)) {
        std::cerr << "Unknown scenario: " << scenario << "\n";
        return 1;
    }
    if (config_file && !mission.load(config_file)) {
        std::cerr << "Error: Cannot open config file: " << config_file << "\n";
        return 1;
    }
    applyOverrides(o, mission);

    std::unique_ptr<pipeline::CsvMissionArchive> archive;
    if (archive_file || mission.archive_enabled) {
        std::string path = archive_file ? archive_file
                         : (mission.archive_path.empty() ? pipeline::CsvMissionArchive::getDefaultPath()
                                                         : mission.archive_path);
        archive = std::make_unique<pipeline::CsvMissionArchive>(path);
        mission.link.save_to_archive = true;
    }

    try {
        if (strcmp(command, "send") == 0) {
            return runSend(message, mission, archive.get());
        } else if (strcmp(command, "pass") == 0) {
            return runPass(message, mission, archive.get(), output_file, realtime);
        } else if (strcmp(command, "sweep") == 0) {
            return runSweep(message, mission);
        } else if (strcmp(command, "inspect") == 0) {
            return runInspect(message, mission);
        } else if (strcmp(command, "archive") == 0) {
            if (!archive) {
                archive = std::make_unique<pipeline::CsvMissionArchive>(
                    mission.archive_path.empty() ? pipeline::CsvMissionArchive::getDefaultPath()
                                                 : mission.archive_path);
            }
            archive_args.action = message;
            archive_args.id = extra;
            return runArchive(archive_args, *archive);
        } else if (strcmp(command, "info") == 0) {
            printInfo(mission);
            return 0;
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
