#include "mission_archive.hpp"
#include "config/paths.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>

namespace orbiter {
namespace pipeline {

namespace {

constexpr const char* CSV_HEADER =
    "id,timestamp,message_sent,message_received,ber,snr_db,packets_total,packets_corrupted,metadata";

std::string isoTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &now);
#else
    gmtime_r(&now, &tm_utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

constexpr size_t CSV_FIELDS = 9;

using CsvRow = std::vector<std::string>;

// Every row in the file, header included. A quoted field may hold commas,
// doubled quotes and line breaks, so a record ends only at an unquoted newline.
std::vector<CsvRow> readRows(const std::string& path) {
    std::vector<CsvRow> rows;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return rows;

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool has_data = false;

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (in_quotes) {
            if (c != '"') {
                field += c;
            } else if (i + 1 < text.size() && text[i + 1] == '"') {
                field += '"';
                i++;
            } else {
                in_quotes = false;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            has_data = true;
        } else if (c == ',') {
            row.push_back(field);
            field.clear();
            has_data = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') i++;
            if (has_data) {
                row.push_back(field);
                rows.push_back(row);
            }
            row.clear();
            field.clear();
            has_data = false;
        } else {
            field += c;
            has_data = true;
        }
    }
    if (has_data) {
        row.push_back(field);
        rows.push_back(row);
    }
    return rows;
}

// Records in the file, header excluded
size_t countRecords(const std::string& path) {
    std::vector<CsvRow> rows = readRows(path);
    return rows.empty() ? 0 : rows.size() - 1;
}

std::vector<std::pair<std::string, std::string>> parseMetadata(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find(';', pos);
        if (end == std::string::npos) end = text.size();
        std::string item = text.substr(pos, end - pos);
        size_t eq = item.find('=');
        if (eq != std::string::npos) {
            out.emplace_back(item.substr(0, eq), item.substr(eq + 1));
        } else if (!item.empty()) {
            out.emplace_back(item, "");
        }
        pos = end + 1;
    }
    return out;
}

bool rowToMission(const CsvRow& row, ArchivedMission& out) {
    if (row.size() != CSV_FIELDS) return false;

    out.id = row[0];
    out.timestamp = row[1];
    out.record.message_sent = row[2];
    out.record.message_received = row[3];
    out.record.ber = std::strtof(row[4].c_str(), nullptr);
    out.record.snr_db = std::strtof(row[5].c_str(), nullptr);
    out.record.packets_total = std::atoi(row[6].c_str());
    out.record.packets_corrupted = std::atoi(row[7].c_str());
    out.record.metadata = parseMetadata(row[8]);
    return true;
}

} // namespace

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

CsvMissionArchive::CsvMissionArchive(std::string path)
    : path_(std::move(path))
{
    next_id_ = countRecords(path_) + 1;
}

std::string CsvMissionArchive::getDefaultPath() {
    return config::defaultConfigFile("missions.csv");
}

size_t CsvMissionArchive::count() const {
    return countRecords(path_);
}

std::vector<ArchivedMission> CsvMissionArchive::readAll() const {
    std::vector<ArchivedMission> missions;
    std::vector<CsvRow> rows = readRows(path_);

    for (size_t i = 1; i < rows.size(); i++) {
        ArchivedMission m;
        if (!rowToMission(rows[i], m)) {
            LOG_WARN("LINK", "Skipping malformed archive row %zu (%zu fields)", i, rows[i].size());
            continue;
        }
        missions.push_back(std::move(m));
    }
    return missions;
}

std::vector<ArchivedMission> CsvMissionArchive::query(const ArchiveQuery& q) const {
    std::vector<ArchivedMission> all = readAll();
    std::vector<ArchivedMission> out;

    // Rows are appended in time order
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (q.limit && out.size() >= *q.limit) break;
        if (q.min_snr_db && it->record.snr_db < *q.min_snr_db) continue;
        if (q.max_ber && it->record.ber > *q.max_ber) continue;
        out.push_back(std::move(*it));
    }
    return out;
}

std::optional<ArchivedMission> CsvMissionArchive::get(const std::string& id) const {
    for (auto& m : readAll()) {
        if (m.id == id) return m;
    }
    return std::nullopt;
}

ArchiveStatistics CsvMissionArchive::statistics() const {
    ArchiveStatistics stats;
    double ber_sum = 0.0;
    double snr_sum = 0.0;

    for (const auto& m : readAll()) {
        stats.total_missions++;
        ber_sum += m.record.ber;
        snr_sum += m.record.snr_db;
        stats.total_packets += m.record.packets_total;
        stats.total_corrupted += m.record.packets_corrupted;
    }

    if (stats.total_missions > 0) {
        stats.average_ber = static_cast<float>(ber_sum / stats.total_missions);
        stats.average_snr_db = static_cast<float>(snr_sum / stats.total_missions);
    }
    if (stats.total_packets > 0) {
        stats.packet_error_rate = static_cast<float>(stats.total_corrupted) /
                                  static_cast<float>(stats.total_packets);
    }
    return stats;
}

size_t CsvMissionArchive::clear() {
    if (!std::ifstream(path_).good()) {
        next_id_ = 1;
        return 0;
    }

    size_t removed = countRecords(path_);

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("LINK", "Cannot rewrite mission archive %s", path_.c_str());
        return 0;
    }
    file << CSV_HEADER << "\n";

    next_id_ = 1;
    LOG_LINK(INFO, "Cleared %zu missions from %s", removed, path_.c_str());
    return removed;
}

std::string CsvMissionArchive::save(const MissionRecord& record) {
    config::ensureParentDirectory(path_);

    bool is_new = !std::ifstream(path_).good();

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        LOG_ERROR("LINK", "Cannot open mission archive %s", path_.c_str());
        return "";
    }

    if (is_new) {
        file << CSV_HEADER << "\n";
    }

    std::string metadata;
    for (const auto& [key, value] : record.metadata) {
        if (!metadata.empty()) metadata += ';';
        metadata += key + "=" + value;
    }

    char ber[32], snr[32];
    snprintf(ber, sizeof(ber), "%.6g", record.ber);
    snprintf(snr, sizeof(snr), "%.2f", record.snr_db);

    std::string id = std::to_string(next_id_);
    file << id << ','
         << isoTimestamp() << ','
         << csvEscape(record.message_sent) << ','
         << csvEscape(record.message_received) << ','
         << ber << ','
         << snr << ','
         << record.packets_total << ','
         << record.packets_corrupted << ','
         << csvEscape(metadata) << "\n";

    if (!file.good()) {
        LOG_ERROR("LINK", "Write to mission archive %s failed", path_.c_str());
        return "";
    }

    next_id_++;
    LOG_LINK(INFO, "Saved mission #%s to %s", id.c_str(), path_.c_str());
    return id;
}

} // namespace pipeline
} // namespace orbiter
