#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orbiter {
namespace pipeline {

// One archived mission: a single transmission or a pass summary
struct MissionRecord {
    std::string message_sent;
    std::string message_received;
    float ber = 0.0f;
    float snr_db = 0.0f;
    int packets_total = 1;
    int packets_corrupted = 0;
    std::vector<std::pair<std::string, std::string>> metadata;  // Free-form key/value
};

/**
 * Persistence sink for finished missions
 *
 * The pipeline hands over a record and keeps the returned identifier.
 * It never reads records back.
 */
class MissionSink {
public:
    virtual ~MissionSink() = default;

    // Returns an identifier for the stored record, empty on failure
    virtual std::string save(const MissionRecord& record) = 0;
};

// A record read back from the archive
struct ArchivedMission {
    std::string id;
    std::string timestamp;                 // ISO 8601, UTC
    MissionRecord record;
};

struct ArchiveQuery {
    std::optional<size_t> limit = 100;     // nullopt: no limit
    std::optional<float> min_snr_db;
    std::optional<float> max_ber;
};

struct ArchiveStatistics {
    size_t total_missions = 0;
    float average_ber = 0.0f;
    float average_snr_db = 0.0f;
    long total_packets = 0;
    long total_corrupted = 0;
    float packet_error_rate = 0.0f;        // total_corrupted / total_packets
};

/**
 * CSV mission archive
 *
 * Appends one row per record:
 *   id,timestamp,message_sent,message_received,ber,snr_db,packets_total,packets_corrupted,metadata
 * The header is written when the file is new. Ids continue from the rows
 * already in the file. Metadata is "key=value" pairs joined by ';'.
 *
 * Rows that do not have all nine fields are skipped when reading.
 */
class CsvMissionArchive : public MissionSink {
public:
    explicit CsvMissionArchive(std::string path);

    std::string save(const MissionRecord& record) override;

    const std::string& path() const { return path_; }

    // Number of records currently in the file
    size_t count() const;

    // All records in file order
    std::vector<ArchivedMission> readAll() const;

    // Filtered records, most recent first
    std::vector<ArchivedMission> query(const ArchiveQuery& q = {}) const;

    std::optional<ArchivedMission> get(const std::string& id) const;

    ArchiveStatistics statistics() const;

    // Drops every record, keeps the header. Returns the number removed.
    // Ids start again from 1.
    size_t clear();

    // Default location: $HOME/.config/orbiter/missions.csv
    static std::string getDefaultPath();

private:
    std::string path_;
    size_t next_id_ = 1;
};

// RFC 4180 quoting when the field contains a comma, quote or newline
std::string csvEscape(const std::string& field);

} // namespace pipeline
} // namespace orbiter
