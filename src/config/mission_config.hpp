#pragma once

#include "pipeline/satellite_pass.hpp"
#include <string>
#include <vector>

namespace orbiter {
namespace config {

/**
 * Mission configuration (INI file)
 *
 *   [Link]     distance_km, snr_db, carrier_freq_hz, sample_rate_hz,
 *              elevation_deg, weather, use_fec, seed
 *   [Fades]    fade=start,duration,attenuation   (one line per event)
 *   [Pass]     duration_sec, max_elevation_deg, min_snr_db, max_snr_db,
 *              min_distance_km, max_distance_km, num_transmissions
 *   [Archive]  enabled, path
 *
 * Unknown keys are ignored. A malformed value keeps its default and is
 * logged; an invalid fade line is skipped.
 */
struct MissionConfig {
    std::string name = "custom";

    pipeline::TransmissionConfig link;
    pipeline::PassConfig pass;

    bool archive_enabled = false;
    std::string archive_path;     // Empty = CsvMissionArchive::getDefaultPath()

    // Save to INI file (empty path = default)
    bool save(const std::string& path = "") const;

    // Load from INI file. Returns false if the file cannot be opened.
    bool load(const std::string& path = "");

    // $HOME/.config/orbiter/mission.ini
    static std::string getDefaultPath();
};

// Canned link scenarios
namespace presets {
    MissionConfig perfectConditions();   // 500 km, 30 dB, no FEC
    MissionConfig typicalLeo();          // 1000 km, 15 dB, FEC
    MissionConfig challenging();         // 2000 km, 8 dB, FEC, fades
    MissionConfig deepSpace();           // 5000 km, 3 dB, FEC

    // "perfect_conditions", "typical_leo", "challenging", "deep_space"
    bool forName(const std::string& name, MissionConfig& out);

    std::vector<std::string> names();
}

} // namespace config
} // namespace orbiter
