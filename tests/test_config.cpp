/**
 * Configuration Test Suite
 *
 * Mission INI save/load, malformed input handling, scenario presets and the
 * CSV mission archive. Files go to the system temp directory.
 */

#include "config/mission_config.hpp"
#include "pipeline/mission_archive.hpp"
#include "orbiter/logging.hpp"
#include <iostream>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace orbiter;
using namespace orbiter::config;
using namespace orbiter::pipeline;

namespace fs = std::filesystem;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static std::string tempPath(const char* name) {
    fs::path p = fs::temp_directory_path() / "orbiter_tests" / name;
    fs::remove(p);
    return p.string();
}

static bool writeFile(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << content;
    return f.good();
}

// ============================================================================
// Mission Config
// ============================================================================

bool test_save_load_roundtrip() {
    TEST("Save/load round trip");

    MissionConfig out;
    out.name = "roundtrip";
    out.link.channel.distance_km = 1234.5f;
    out.link.channel.snr_db = -7.25f;
    out.link.channel.carrier_freq_hz = 2000.0f;
    out.link.channel.sample_rate_hz = 48000.0f;
    out.link.channel.elevation_deg = 35.0f;
    out.link.channel.weather = Weather::RAIN;
    out.link.use_fec = false;
    out.link.seed = 9001;
    out.link.fades = {sim::FadeEvent(0.25f, 0.5f, 0.75f), sim::FadeEvent(1.0f, 0.125f, 0.0f)};
    out.pass.duration_sec = 420.0f;
    out.pass.max_elevation_deg = 65.0f;
    out.pass.min_snr_db = 2.0f;
    out.pass.max_snr_db = 18.0f;
    out.pass.min_distance_km = 800.0f;
    out.pass.max_distance_km = 2500.0f;
    out.pass.num_transmissions = 12;
    out.archive_enabled = true;
    out.archive_path = "/tmp/missions.csv";

    std::string path = tempPath("roundtrip.ini");
    if (!out.save(path)) FAIL("Save failed");

    MissionConfig in;
    if (!in.load(path)) FAIL("Load failed");

    const ChannelConfig& ch = in.link.channel;
    if (ch.distance_km != 1234.5f || ch.snr_db != -7.25f) FAIL("Link distance/SNR lost");
    if (ch.carrier_freq_hz != 2000.0f || ch.sample_rate_hz != 48000.0f) FAIL("Rates lost");
    if (ch.elevation_deg != 35.0f || ch.weather != Weather::RAIN) FAIL("Elevation/weather lost");
    if (in.link.use_fec || in.link.seed != 9001) FAIL("FEC flag/seed lost");

    if (in.link.fades.size() != 2) FAIL("Expected 2 fades, got " << in.link.fades.size());
    if (in.link.fades[0].start_time != 0.25f || in.link.fades[0].duration != 0.5f ||
        in.link.fades[0].attenuation != 0.75f) FAIL("First fade wrong");
    if (in.link.fades[1].attenuation != 0.0f) FAIL("Total dropout fade lost");

    if (in.pass.duration_sec != 420.0f || in.pass.max_elevation_deg != 65.0f) FAIL("Pass geometry lost");
    if (in.pass.min_snr_db != 2.0f || in.pass.max_snr_db != 18.0f) FAIL("Pass SNR range lost");
    if (in.pass.min_distance_km != 800.0f || in.pass.max_distance_km != 2500.0f) FAIL("Pass distances lost");
    if (in.pass.num_transmissions != 12) FAIL("Transmission count lost");

    if (!in.archive_enabled || in.archive_path != "/tmp/missions.csv") FAIL("Archive settings lost");
    if (!in.link.save_to_archive) FAIL("save_to_archive should follow archive_enabled");

    fs::remove(path);
    PASS();
    return true;
}

bool test_missing_file() {
    TEST("Missing file leaves defaults");

    MissionConfig cfg;
    if (cfg.load(tempPath("does_not_exist.ini"))) FAIL("Load of missing file succeeded");
    if (cfg.link.channel.distance_km != 1000.0f) FAIL("Defaults changed");

    PASS();
    return true;
}

bool test_malformed_values() {
    TEST("Malformed values keep their defaults");

    std::string path = tempPath("malformed.ini");
    writeFile(path,
        "# hand-edited\n"
        "[Link]\n"
        "distance_km = abc\n"
        "snr_db = 12.5dB\n"
        "elevation_deg =   45  \n"
        "seed = -3\n"
        "weather = fog\n"
        "unknown_key = 1\n"
        "no equals sign here\n"
        "[Pass]\n"
        "num_transmissions = lots\n"
        "max_snr_db = 25\n");

    MissionConfig cfg;
    if (!cfg.load(path)) FAIL("Load failed");

    if (cfg.link.channel.distance_km != 1000.0f) FAIL("Bad distance overwrote default");
    if (cfg.link.channel.snr_db != 15.0f) FAIL("Trailing junk accepted");
    if (cfg.link.channel.elevation_deg != 45.0f) FAIL("Whitespace not trimmed");
    if (cfg.link.seed != 42) FAIL("Negative seed accepted");
    if (cfg.link.channel.weather != Weather::CLEAR) FAIL("Unknown weather should be clear");
    if (cfg.pass.num_transmissions != 10) FAIL("Bad count overwrote default");
    if (cfg.pass.max_snr_db != 25.0f) FAIL("Valid value after bad ones not applied");

    fs::remove(path);
    PASS();
    return true;
}

bool test_fade_lines() {
    TEST("Fade lines replace preset fades, bad ones skipped");

    std::string path = tempPath("fades.ini");
    writeFile(path,
        "[Fades]\n"
        "fade=0.1,0.2,0.3\n"
        "fade=0.5, 0.5\n"          // Missing field
        "fade=1.0,-1.0,0.5\n"      // Negative duration
        "fade=2.0,0.4,1.5\n"       // Attenuation out of range
        "fade=3.0,0.1,0.9,7\n"     // Extra field
        "fade=4.0,0.25,0.5\n");

    MissionConfig cfg = presets::challenging();
    if (cfg.link.fades.size() != 2) FAIL("Preset should carry 2 fades");

    if (!cfg.load(path)) FAIL("Load failed");
    if (cfg.link.fades.size() != 2) FAIL("Expected 2 valid fades, got " << cfg.link.fades.size());
    if (cfg.link.fades[0].start_time != 0.1f || cfg.link.fades[1].start_time != 4.0f) FAIL("Wrong fades kept");

    // A file with no fade lines keeps the preset's
    std::string path2 = tempPath("nofades.ini");
    writeFile(path2, "[Link]\nsnr_db=9\n");
    MissionConfig cfg2 = presets::challenging();
    if (!cfg2.load(path2)) FAIL("Load failed");
    if (cfg2.link.fades.size() != 2) FAIL("Preset fades dropped");
    if (cfg2.link.channel.snr_db != 9.0f) FAIL("Override not applied");

    fs::remove(path);
    fs::remove(path2);
    PASS();
    return true;
}

bool test_presets() {
    TEST("Scenario presets");

    MissionConfig p = presets::perfectConditions();
    if (p.link.channel.distance_km != 500.0f || p.link.channel.snr_db != 30.0f || p.link.use_fec) {
        FAIL("perfect_conditions wrong");
    }

    MissionConfig t = presets::typicalLeo();
    if (t.link.channel.distance_km != 1000.0f || t.link.channel.snr_db != 15.0f || !t.link.use_fec) {
        FAIL("typical_leo wrong");
    }

    MissionConfig c = presets::challenging();
    if (c.link.channel.distance_km != 2000.0f || c.link.channel.snr_db != 8.0f || !c.link.use_fec) {
        FAIL("challenging wrong");
    }

    MissionConfig d = presets::deepSpace();
    if (d.link.channel.distance_km != 5000.0f || d.link.channel.snr_db != 3.0f || !d.link.use_fec) {
        FAIL("deep_space wrong");
    }

    for (const auto& name : presets::names()) {
        MissionConfig cfg;
        if (!presets::forName(name, cfg)) FAIL("forName rejected " << name);
        if (cfg.name != name) FAIL("Preset name mismatch for " << name);
    }

    MissionConfig untouched;
    untouched.link.channel.snr_db = 1.0f;
    if (presets::forName("geostationary", untouched)) FAIL("Unknown preset accepted");
    if (untouched.link.channel.snr_db != 1.0f) FAIL("Unknown preset modified output");

    PASS();
    return true;
}

// ============================================================================
// Mission Archive
// ============================================================================

bool test_csv_escape() {
    TEST("CSV field escaping");

    if (csvEscape("plain") != "plain") FAIL("Plain field quoted");
    if (csvEscape("a,b") != "\"a,b\"") FAIL("Comma not quoted");
    if (csvEscape("say \"hi\"") != "\"say \"\"hi\"\"\"") FAIL("Quotes not doubled");
    if (csvEscape("two\nlines") != "\"two\nlines\"") FAIL("Newline not quoted");
    if (csvEscape("") != "") FAIL("Empty field changed");

    PASS();
    return true;
}

bool test_archive_append() {
    TEST("Archive appends rows with continuing ids");

    std::string path = tempPath("missions.csv");

    MissionRecord rec;
    rec.message_sent = "Hello, \"ground\"";
    rec.message_received = "Hello, \"ground\"";
    rec.ber = 0.0f;
    rec.snr_db = 14.2f;
    rec.metadata = {{"distance_km", "1000.0"}, {"use_fec", "1"}};

    {
        CsvMissionArchive archive(path);
        if (archive.count() != 0) FAIL("New archive should be empty");
        if (archive.save(rec) != "1") FAIL("First id should be 1");
        if (archive.save(rec) != "2") FAIL("Second id should be 2");
        if (archive.count() != 2) FAIL("Expected 2 records");
    }

    // Reopening continues the numbering
    CsvMissionArchive reopened(path);
    if (reopened.count() != 2) FAIL("Reopened count wrong");
    if (reopened.save(rec) != "3") FAIL("Ids should continue from the file");

    std::ifstream f(path);
    std::string header;
    std::getline(f, header);
    if (header != "id,timestamp,message_sent,message_received,ber,snr_db,packets_total,packets_corrupted,metadata") {
        FAIL("Header wrong: " << header);
    }

    std::string row;
    std::getline(f, row);
    if (row.rfind("1,", 0) != 0) FAIL("Row should start with its id: " << row);
    if (row.find("\"Hello, \"\"ground\"\"\"") == std::string::npos) FAIL("Message not escaped: " << row);
    if (row.find("distance_km=1000.0;use_fec=1") == std::string::npos) FAIL("Metadata wrong: " << row);
    if (row.find(",14.20,") == std::string::npos) FAIL("SNR column wrong: " << row);

    // Timestamp column is ISO 8601 UTC
    size_t ts_start = row.find(',') + 1;
    std::string ts = row.substr(ts_start, row.find(',', ts_start) - ts_start);
    if (ts.size() != 20 || ts[4] != '-' || ts[10] != 'T' || ts.back() != 'Z') FAIL("Timestamp '" << ts << "'");
    f.close();

    fs::remove(path);
    PASS();
    return true;
}

bool test_archive_multiline_field() {
    TEST("Quoted newlines do not inflate the record count");

    std::string path = tempPath("multiline.csv");

    MissionRecord rec;
    rec.message_sent = "line one\nline two";
    rec.message_received = "line one\nline two";

    CsvMissionArchive archive(path);
    archive.save(rec);
    archive.save(rec);
    if (archive.count() != 2) FAIL("Expected 2 records, got " << archive.count());

    CsvMissionArchive reopened(path);
    if (reopened.save(rec) != "3") FAIL("Id should continue at 3");

    fs::remove(path);
    PASS();
    return true;
}

static MissionRecord makeRecord(const std::string& text, float ber, float snr_db,
                                int packets_total, int packets_corrupted) {
    MissionRecord rec;
    rec.message_sent = text;
    rec.message_received = text;
    rec.ber = ber;
    rec.snr_db = snr_db;
    rec.packets_total = packets_total;
    rec.packets_corrupted = packets_corrupted;
    return rec;
}

bool test_archive_read_back() {
    TEST("Archived records read back field by field");

    std::string path = tempPath("readback.csv");

    MissionRecord rec = makeRecord("line one\nline \"two\", three", 0.25f, 12.5f, 3, 1);
    rec.message_received = "line one";
    rec.metadata = {{"distance_km", "800.0"}, {"use_fec", "1"}};

    CsvMissionArchive archive(path);
    archive.save(makeRecord("first", 0.0f, 30.0f, 1, 0));
    std::string id = archive.save(rec);
    if (id != "2") FAIL("Expected id 2, got " << id);

    std::vector<ArchivedMission> all = archive.readAll();
    if (all.size() != 2) FAIL("Expected 2 records, got " << all.size());

    auto found = archive.get("2");
    if (!found) FAIL("Record 2 not found");
    const MissionRecord& r = found->record;
    if (r.message_sent != rec.message_sent) FAIL("Sent text '" << r.message_sent << "'");
    if (r.message_received != "line one") FAIL("Received text '" << r.message_received << "'");
    if (r.ber != 0.25f) FAIL("BER " << r.ber);
    if (r.snr_db != 12.5f) FAIL("SNR " << r.snr_db);
    if (r.packets_total != 3 || r.packets_corrupted != 1) FAIL("Packet counts wrong");
    if (r.metadata != rec.metadata) FAIL("Metadata not restored");
    if (found->timestamp.size() != 20 || found->timestamp.back() != 'Z') {
        FAIL("Timestamp '" << found->timestamp << "'");
    }

    if (archive.get("7")) FAIL("Unknown id should not be found");

    fs::remove(path);
    PASS();
    return true;
}

bool test_archive_query() {
    TEST("Archive query filters and orders newest first");

    std::string path = tempPath("query.csv");

    CsvMissionArchive archive(path);
    archive.save(makeRecord("weak", 0.5f, 10.0f, 1, 1));
    archive.save(makeRecord("fair", 0.25f, 20.0f, 4, 1));
    archive.save(makeRecord("strong", 0.0f, 30.0f, 5, 0));

    auto ids = [](const std::vector<ArchivedMission>& v) {
        std::string out;
        for (const auto& m : v) out += m.id;
        return out;
    };

    if (ids(archive.query()) != "321") FAIL("Default order " << ids(archive.query()));

    ArchiveQuery q;
    q.min_snr_db = 15.0f;
    if (ids(archive.query(q)) != "32") FAIL("min_snr_db gave " << ids(archive.query(q)));

    q = ArchiveQuery{};
    q.max_ber = 0.3f;
    if (ids(archive.query(q)) != "32") FAIL("max_ber gave " << ids(archive.query(q)));

    q.min_snr_db = 15.0f;
    q.max_ber = 0.1f;
    if (ids(archive.query(q)) != "3") FAIL("Combined filter gave " << ids(archive.query(q)));

    q = ArchiveQuery{};
    q.limit = 1;
    if (ids(archive.query(q)) != "3") FAIL("Limit 1 gave " << ids(archive.query(q)));

    q.limit = std::nullopt;
    if (archive.query(q).size() != 3) FAIL("No limit should return everything");

    CsvMissionArchive missing(tempPath("no_such_archive.csv"));
    if (!missing.query().empty()) FAIL("Missing file should give no records");

    fs::remove(path);
    PASS();
    return true;
}

bool test_archive_statistics() {
    TEST("Archive statistics");

    std::string path = tempPath("stats.csv");

    CsvMissionArchive archive(path);
    ArchiveStatistics empty = archive.statistics();
    if (empty.total_missions != 0 || empty.packet_error_rate != 0.0f) FAIL("Empty archive stats wrong");

    archive.save(makeRecord("a", 0.5f, 10.0f, 1, 1));
    archive.save(makeRecord("b", 0.25f, 20.0f, 4, 1));
    archive.save(makeRecord("c", 0.0f, 30.0f, 5, 0));

    ArchiveStatistics stats = archive.statistics();
    if (stats.total_missions != 3) FAIL("Missions " << stats.total_missions);
    if (std::abs(stats.average_ber - 0.25f) > 1e-6f) FAIL("Average BER " << stats.average_ber);
    if (std::abs(stats.average_snr_db - 20.0f) > 1e-4f) FAIL("Average SNR " << stats.average_snr_db);
    if (stats.total_packets != 10 || stats.total_corrupted != 2) FAIL("Packet totals wrong");
    if (std::abs(stats.packet_error_rate - 0.2f) > 1e-6f) FAIL("PER " << stats.packet_error_rate);

    fs::remove(path);
    PASS();
    return true;
}

bool test_archive_clear() {
    TEST("Clearing the archive keeps the header and restarts ids");

    std::string path = tempPath("clear.csv");

    CsvMissionArchive archive(path);
    if (archive.clear() != 0) FAIL("Clearing a missing file should remove nothing");

    archive.save(makeRecord("a", 0.0f, 10.0f, 1, 0));
    archive.save(makeRecord("b", 0.0f, 10.0f, 1, 0));
    archive.save(makeRecord("c", 0.0f, 10.0f, 1, 0));

    if (archive.clear() != 3) FAIL("Expected 3 records removed");
    if (archive.count() != 0) FAIL("Archive not empty after clear");
    if (archive.save(makeRecord("d", 0.0f, 10.0f, 1, 0)) != "1") FAIL("Ids should restart at 1");

    std::ifstream f(path);
    std::string line;
    int headers = 0;
    while (std::getline(f, line)) {
        if (line.rfind("id,timestamp,", 0) == 0) headers++;
    }
    if (headers != 1) FAIL("Expected one header line, found " << headers);
    f.close();

    fs::remove(path);
    PASS();
    return true;
}

bool test_archive_malformed_rows() {
    TEST("Malformed archive rows are skipped");

    std::string path = tempPath("malformed.csv");
    bool written = writeFile(path,
        "id,timestamp,message_sent,message_received,ber,snr_db,packets_total,packets_corrupted,metadata\n"
        "1,2024-01-01T00:00:00Z,a,a,0,10.00,1,0,\n"
        "not,a,mission\n"
        "3,2024-01-01T00:01:00Z,c,x,0.5,3.00,1,1,k=v\n");
    if (!written) FAIL("Cannot write " << path);

    CsvMissionArchive archive(path);
    std::vector<ArchivedMission> all = archive.readAll();
    if (all.size() != 2) FAIL("Expected 2 valid records, got " << all.size());
    if (all[0].id != "1" || all[1].id != "3") FAIL("Wrong records kept");
    if (!all[0].record.metadata.empty()) FAIL("Empty metadata should parse to nothing");
    if (all[1].record.metadata.size() != 1 || all[1].record.metadata[0].second != "v") {
        FAIL("Metadata k=v not parsed");
    }

    fs::remove(path);
    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    // Malformed-input tests log at WARN on purpose
    setLogLevel(LogLevel::ERROR);

    std::cout << "=== Configuration Test Suite ===\n\n";

    std::cout << "Mission Config:\n";
    test_save_load_roundtrip();
    test_missing_file();
    test_malformed_values();
    test_fade_lines();
    test_presets();

    std::cout << "\nMission Archive:\n";
    test_csv_escape();
    test_archive_append();
    test_archive_multiline_field();
    test_archive_read_back();
    test_archive_query();
    test_archive_statistics();
    test_archive_clear();
    test_archive_malformed_rows();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
