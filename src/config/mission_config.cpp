#include "mission_config.hpp"
#include "paths.hpp"
#include "orbiter/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace orbiter {
namespace config {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Leaves `out` untouched on a malformed value
void parseFloat(const std::string& key, const std::string& value, float& out) {
    char* end = nullptr;
    float v = std::strtof(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0') {
        LOG_WARN("CONFIG", "Bad value for %s: '%s', keeping %g", key.c_str(), value.c_str(), out);
        return;
    }
    out = v;
}

template <typename T>
void parseUnsigned(const std::string& key, const std::string& value, T& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || value[0] == '-') {
        LOG_WARN("CONFIG", "Bad value for %s: '%s'", key.c_str(), value.c_str());
        return;
    }
    out = static_cast<T>(v);
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

// "start,duration,attenuation"
bool parseFade(const std::string& value, sim::FadeEvent& out) {
    float f[3];
    size_t pos = 0;
    for (int i = 0; i < 3; i++) {
        size_t comma = value.find(',', pos);
        std::string field = trim(value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
        char* end = nullptr;
        f[i] = std::strtof(field.c_str(), &end);
        if (field.empty() || *end != '\0') return false;
        if (i < 2) {
            if (comma == std::string::npos) return false;
            pos = comma + 1;
        } else if (comma != std::string::npos) {
            return false;
        }
    }

    try {
        out = sim::FadeEvent(f[0], f[1], f[2]);
    } catch (const std::invalid_argument& e) {
        LOG_WARN("CONFIG", "Invalid fade '%s': %s", value.c_str(), e.what());
        return false;
    }
    return true;
}

} // namespace

std::string MissionConfig::getDefaultPath() {
    return defaultConfigFile("mission.ini");
}

bool MissionConfig::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureParentDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    const ChannelConfig& ch = link.channel;

    file << "# Orbiter mission: " << name << "\n";
    file << "[Link]\n";
    file << "distance_km=" << ch.distance_km << "\n";
    file << "snr_db=" << ch.snr_db << "\n";
    file << "carrier_freq_hz=" << ch.carrier_freq_hz << "\n";
    file << "sample_rate_hz=" << ch.sample_rate_hz << "\n";
    file << "elevation_deg=" << ch.elevation_deg << "\n";
    file << "weather=" << weatherToString(ch.weather) << "\n";
    file << "use_fec=" << (link.use_fec ? "1" : "0") << "\n";
    file << "seed=" << link.seed << "\n";

    file << "\n[Fades]\n";
    for (const auto& fade : link.fades) {
        file << "fade=" << fade.start_time << "," << fade.duration << "," << fade.attenuation << "\n";
    }

    file << "\n[Pass]\n";
    file << "duration_sec=" << pass.duration_sec << "\n";
    file << "max_elevation_deg=" << pass.max_elevation_deg << "\n";
    file << "min_snr_db=" << pass.min_snr_db << "\n";
    file << "max_snr_db=" << pass.max_snr_db << "\n";
    file << "min_distance_km=" << pass.min_distance_km << "\n";
    file << "max_distance_km=" << pass.max_distance_km << "\n";
    file << "num_transmissions=" << pass.num_transmissions << "\n";

    file << "\n[Archive]\n";
    file << "enabled=" << (archive_enabled ? "1" : "0") << "\n";
    file << "path=" << archive_path << "\n";

    return file.good();
}

bool MissionConfig::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    ChannelConfig& ch = link.channel;
    bool fades_cleared = false;

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Link
        if (key == "distance_km") {
            parseFloat(key, value, ch.distance_km);
        } else if (key == "snr_db") {
            parseFloat(key, value, ch.snr_db);
        } else if (key == "carrier_freq_hz") {
            parseFloat(key, value, ch.carrier_freq_hz);
        } else if (key == "sample_rate_hz") {
            parseFloat(key, value, ch.sample_rate_hz);
        } else if (key == "elevation_deg") {
            parseFloat(key, value, ch.elevation_deg);
        } else if (key == "weather") {
            ch.weather = parseWeather(value);
        } else if (key == "use_fec") {
            link.use_fec = parseBool(value);
        } else if (key == "seed") {
            parseUnsigned(key, value, link.seed);
        }
        // Fades (file replaces any preset fades)
        else if (key == "fade") {
            if (!fades_cleared) {
                link.fades.clear();
                fades_cleared = true;
            }
            sim::FadeEvent fade;
            if (parseFade(value, fade)) {
                link.fades.push_back(fade);
            } else {
                LOG_WARN("CONFIG", "Skipping fade line '%s'", value.c_str());
            }
        }
        // Pass
        else if (key == "duration_sec") {
            parseFloat(key, value, pass.duration_sec);
        } else if (key == "max_elevation_deg") {
            parseFloat(key, value, pass.max_elevation_deg);
        } else if (key == "min_snr_db") {
            parseFloat(key, value, pass.min_snr_db);
        } else if (key == "max_snr_db") {
            parseFloat(key, value, pass.max_snr_db);
        } else if (key == "min_distance_km") {
            parseFloat(key, value, pass.min_distance_km);
        } else if (key == "max_distance_km") {
            parseFloat(key, value, pass.max_distance_km);
        } else if (key == "num_transmissions") {
            parseUnsigned(key, value, pass.num_transmissions);
        }
        // Archive
        else if (key == "enabled") {
            archive_enabled = parseBool(value);
        } else if (key == "path") {
            archive_path = value;
        }
    }

    link.save_to_archive = archive_enabled;
    LOG_INFO("CONFIG", "Loaded mission config %s", filepath.c_str());
    return true;
}

namespace presets {

MissionConfig perfectConditions() {
    MissionConfig cfg;
    cfg.name = "perfect_conditions";
    cfg.link.channel.distance_km = 500.0f;
    cfg.link.channel.snr_db = 30.0f;
    cfg.link.use_fec = false;
    return cfg;
}

MissionConfig typicalLeo() {
    MissionConfig cfg;
    cfg.name = "typical_leo";
    cfg.link.channel.distance_km = 1000.0f;
    cfg.link.channel.snr_db = 15.0f;
    cfg.link.use_fec = true;
    return cfg;
}

MissionConfig challenging() {
    MissionConfig cfg;
    cfg.name = "challenging";
    cfg.link.channel.distance_km = 2000.0f;
    cfg.link.channel.snr_db = 8.0f;
    cfg.link.channel.weather = Weather::CLOUDY;
    cfg.link.use_fec = true;
    cfg.link.fades = {
        sim::FadeEvent(0.5f, 0.3f, 0.4f),
        sim::FadeEvent(1.2f, 0.2f, 0.6f),
    };
    return cfg;
}

MissionConfig deepSpace() {
    MissionConfig cfg;
    cfg.name = "deep_space";
    cfg.link.channel.distance_km = 5000.0f;
    cfg.link.channel.snr_db = 3.0f;
    cfg.link.use_fec = true;
    return cfg;
}

bool forName(const std::string& name, MissionConfig& out) {
    if (name == "perfect_conditions") out = perfectConditions();
    else if (name == "typical_leo") out = typicalLeo();
    else if (name == "challenging") out = challenging();
    else if (name == "deep_space") out = deepSpace();
    else return false;
    return true;
}

std::vector<std::string> names() {
    return {"perfect_conditions", "typical_leo", "challenging", "deep_space"};
}

} // namespace presets

} // namespace config
} // namespace orbiter
