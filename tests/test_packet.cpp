/**
 * Packet Test Suite
 *
 * Wire layout, CRC16-CCITT coverage, structural parse failures, truncation
 * and the debug helpers.
 */

#include "protocol/packet.hpp"
#include "orbiter/logging.hpp"
#include <iostream>
#include <cmath>
#include <cstring>
#include <string>

using namespace orbiter;
using namespace orbiter::protocol;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

// ============================================================================
// Layout
// ============================================================================

bool test_packet_layout() {
    TEST("Packet wire layout");

    Bytes pkt = createPacket("Hi", 0x1234, 1.5f);
    if (pkt.size() != 16) FAIL("Expected 14 + 2 bytes, got " << pkt.size());

    for (int i = 0; i < 4; i++) {
        if (pkt[i] != 0xAA) FAIL("Preamble byte " << i << " wrong");
    }
    if (pkt[4] != 0x12 || pkt[5] != 0x34) FAIL("Packet id not big-endian");
    if (pkt[6] != 0x00 || pkt[7] != 0x02) FAIL("Payload length wrong");

    // 1.5f = 0x3FC00000
    if (pkt[8] != 0x3F || pkt[9] != 0xC0 || pkt[10] != 0x00 || pkt[11] != 0x00) {
        FAIL("Timestamp not big-endian IEEE 754");
    }
    if (pkt[12] != 'H' || pkt[13] != 'i') FAIL("Payload not at offset 12");

    uint16_t crc = calculateCRC(pkt.data() + 4, 10);
    if (pkt[14] != (crc >> 8) || pkt[15] != (crc & 0xFF)) FAIL("CRC not over header + payload");

    PASS();
    return true;
}

bool test_crc_reference() {
    TEST("CRC16-CCITT reference value");

    // CRC-16/CCITT-FALSE check value
    const char* check = "123456789";
    uint16_t crc = calculateCRC(reinterpret_cast<const uint8_t*>(check), std::strlen(check));
    if (crc != 0x29B1) FAIL("Expected 0x29B1, got 0x" << std::hex << crc);

    if (calculateCRC(nullptr, 0) != 0xFFFF) FAIL("Empty CRC should be the init value");

    PASS();
    return true;
}

bool test_roundtrip() {
    TEST("Create/parse round trip");

    std::string msg = "Telemetry: battery 87%, temp -12C";
    Bytes pkt = createPacket(msg, 42, 1700000000.0f);

    ParseResult r = parsePacket(pkt);
    if (!r.ok()) FAIL("Parse failed: " << parseStatusToString(r.status));
    if (r.packet.packet_id != 42) FAIL("Id mismatch");
    if (r.packet.payload_length != msg.size()) FAIL("Length mismatch");
    if (r.packet.timestamp != 1700000000.0f) FAIL("Timestamp mismatch");
    if (r.packet.payloadAsText() != msg) FAIL("Payload mismatch");
    if (!r.packet.crc_valid) FAIL("CRC should be valid");
    if (r.packet.truncated) FAIL("Should not be truncated");
    if (!validatePacket(pkt)) FAIL("validatePacket rejected a clean packet");

    // Empty payload is a legal packet
    Bytes empty = createPacket("", 1, 0.0f);
    if (empty.size() != 14) FAIL("Empty packet should be 14 bytes");
    if (!validatePacket(empty)) FAIL("Empty packet rejected");

    PASS();
    return true;
}

bool test_default_timestamp() {
    TEST("Timestamp defaults to the current time");

    Bytes pkt = createPacket("now", 7);
    ParseResult r = parsePacket(pkt);
    if (!r.ok()) FAIL("Parse failed");

    // Any time after 2020-01-01
    if (!(r.packet.timestamp > 1577836800.0f)) FAIL("Timestamp " << r.packet.timestamp << " is not wall time");

    PASS();
    return true;
}

bool test_packet_id_wrap() {
    TEST("Packet id wraps modulo 65536");

    ParseResult r = parsePacket(createPacket("x", 65536 + 5, 0.0f));
    if (!r.ok() || r.packet.packet_id != 5) FAIL("65541 should wrap to 5");

    r = parsePacket(createPacket("x", 0xFFFF, 0.0f));
    if (!r.ok() || r.packet.packet_id != 0xFFFF) FAIL("65535 should not wrap");

    PASS();
    return true;
}

// ============================================================================
// CRC Coverage
// ============================================================================

bool test_crc_detects_single_bit_flips() {
    TEST("Any single-bit flip in header or payload fails the CRC");

    Bytes pkt = createPacket("ORBIT", 300, 12.25f);

    // Bytes 4..16 are id, length, timestamp and payload. Flips in the length
    // field may also truncate; either way the packet must not validate.
    for (size_t byte = 4; byte < pkt.size() - 2; byte++) {
        for (int bit = 0; bit < 8; bit++) {
            Bytes bad = pkt;
            bad[byte] ^= static_cast<uint8_t>(1 << bit);
            if (validatePacket(bad)) FAIL("Flip at byte " << byte << " bit " << bit << " undetected");
        }
    }

    // Flips in the CRC itself
    for (size_t byte = pkt.size() - 2; byte < pkt.size(); byte++) {
        Bytes bad = pkt;
        bad[byte] ^= 0x01;
        ParseResult r = parsePacket(bad);
        if (!r.ok() || r.packet.crc_valid) FAIL("Corrupted CRC accepted");
    }

    PASS();
    return true;
}

bool test_crc_mismatch_still_decodes() {
    TEST("CRC mismatch keeps the payload");

    Bytes pkt = createPacket("Hello", 1, 0.0f);
    pkt[12] ^= 0x20;  // 'H' -> 'h'

    ParseResult r = parsePacket(pkt);
    if (!r.ok()) FAIL("Structural parse should still succeed");
    if (r.packet.crc_valid) FAIL("CRC should fail");
    if (r.packet.payloadAsText() != "hello") FAIL("Payload not decoded for diagnostics");
    if (r.packet.crc_received == r.packet.crc_calculated) FAIL("CRC fields should differ");

    PASS();
    return true;
}

// ============================================================================
// Structural Failures
// ============================================================================

bool test_too_short() {
    TEST("Buffers under 14 bytes are too short");

    Bytes pkt = createPacket("", 1, 0.0f);
    Bytes short_buf(pkt.begin(), pkt.begin() + 13);

    ParseResult r = parsePacket(short_buf);
    if (r.status != ParseStatus::TOO_SHORT) FAIL("Expected TOO_SHORT");
    if (r.ok()) FAIL("ok() should be false");

    if (parsePacket(Bytes{}).status != ParseStatus::TOO_SHORT) FAIL("Empty buffer not TOO_SHORT");
    if (validatePacket(short_buf)) FAIL("Short buffer validated");

    PASS();
    return true;
}

bool test_bad_preamble() {
    TEST("Damaged preamble is rejected");

    Bytes pkt = createPacket("data", 2, 0.0f);
    for (size_t i = 0; i < 4; i++) {
        Bytes bad = pkt;
        bad[i] = 0xAB;
        if (parsePacket(bad).status != ParseStatus::BAD_PREAMBLE) FAIL("Preamble byte " << i << " not checked");
    }

    PASS();
    return true;
}

bool test_truncation() {
    TEST("Declared length beyond the buffer marks truncation");

    Bytes pkt = createPacket("truncated payload", 3, 0.0f);

    // Missing the CRC only
    Bytes no_crc(pkt.begin(), pkt.end() - 2);
    ParseResult r = parsePacket(no_crc);
    if (!r.ok()) FAIL("Parse should succeed");
    if (!r.packet.truncated) FAIL("Missing CRC not flagged");
    if (r.packet.crc_valid) FAIL("Truncated packet cannot have a valid CRC");
    if (r.packet.payload.size() != 17) FAIL("Full payload should still be available");

    // Missing part of the payload
    Bytes cut(pkt.begin(), pkt.begin() + 20);
    r = parsePacket(cut);
    if (!r.ok() || !r.packet.truncated) FAIL("Short payload not flagged");
    if (r.packet.payload.size() != 8) FAIL("Expected the 8 available payload bytes");
    if (r.packet.payload_length != 17) FAIL("Declared length should be reported");
    if (validatePacket(cut)) FAIL("Truncated packet validated");

    PASS();
    return true;
}

bool test_trailing_bytes_ignored() {
    TEST("Bytes after the CRC are ignored");

    Bytes pkt = createPacket("pad", 4, 0.0f);
    pkt.push_back(0x00);
    pkt.push_back(0x00);
    if (!validatePacket(pkt)) FAIL("Trailing padding broke validation");

    PASS();
    return true;
}

bool test_oversized_payload() {
    TEST("Oversized payload is truncated to 65535 bytes");

    Bytes big(70000, 'z');
    Bytes pkt = createPacket(big, 1, 0.0f);
    if (pkt.size() != PacketLayout::OVERHEAD + PacketLayout::MAX_PAYLOAD) FAIL("Wrong packet size");

    ParseResult r = parsePacket(pkt);
    if (!r.ok() || r.packet.payload_length != 65535) FAIL("Length field wrong");
    if (!r.packet.crc_valid) FAIL("Truncated packet should still be self-consistent");

    PASS();
    return true;
}

// ============================================================================
// Helpers
// ============================================================================

bool test_overhead() {
    TEST("Framing overhead percentage");

    if (std::abs(calculateOverhead(0) - 100.0f) > 1e-4f) FAIL("Empty payload should be 100%");
    if (std::abs(calculateOverhead(86) - 14.0f) > 1e-4f) FAIL("86-byte payload should be 14%");
    if (!(calculateOverhead(1000) < calculateOverhead(10))) FAIL("Overhead should fall with size");

    PASS();
    return true;
}

bool test_hexdump() {
    TEST("Hexdump format");

    Bytes data = {'A', 'B', 0x00, 0xFF};
    std::string dump = hexdump(data, 4, true);
    if (dump != "00000000  41 42 00 ff  |AB..|\n") FAIL("Unexpected dump: " << dump);

    std::string no_ascii = hexdump(data, 4, false);
    if (no_ascii != "00000000  41 42 00 ff\n") FAIL("Unexpected dump: " << no_ascii);

    // Second line offset, padded hex column
    Bytes six = {1, 2, 3, 4, 5, 6};
    std::string two = hexdump(six, 4, true);
    if (two.find("00000004  05 06        |..|") == std::string::npos) FAIL("Second line wrong: " << two);

    if (!hexdump(Bytes{}).empty()) FAIL("Empty input should give empty dump");

    PASS();
    return true;
}

bool test_hexdump_wide_offset() {
    TEST("Hexdump prints 64-bit offsets in full");

    Bytes data = {'A', 'B', 0x00, 0xFF, 0x10};
    std::string dump = hexdump(data, 4, true, 0xFEDCBA9876543210ULL);
    std::string expected =
        "fedcba9876543210  41 42 00 ff  |AB..|\n"
        "fedcba9876543214  10           |.|\n";
    if (dump != expected) FAIL("Unexpected dump: " << dump);

    std::string mid = hexdump(data, 8, false, 0x100000000ULL);
    if (mid.rfind("100000000  41 42", 0) != 0) FAIL("9-digit offset wrong: " << mid);

    PASS();
    return true;
}

bool test_packet_to_string() {
    TEST("Packet summary string");

    std::string s = packetToString(createPacket("abc", 9, 0.0f));
    if (s.find("id=9") == std::string::npos) FAIL("Missing id: " << s);
    if (s.find("OK") == std::string::npos) FAIL("Missing CRC status: " << s);

    std::string bad = packetToString(Bytes{1, 2, 3});
    if (bad.find("TOO_SHORT") == std::string::npos) FAIL("Missing status: " << bad);

    PASS();
    return true;
}

// ============================================================================
// Sent versus received diagnosis
// ============================================================================

bool test_diff_bytes() {
    TEST("Byte diff finds flips and length changes");

    Bytes sent = {0x41, 0x42, 0x43};
    if (!diffBytes(sent, sent).empty()) FAIL("Identical input should have no diffs");

    Bytes flipped = sent;
    flipped[1] ^= 0x81;
    auto d = diffBytes(sent, flipped);
    if (d.size() != 1) FAIL("Expected one diff, got " << d.size());
    if (d[0].offset != 1 || d[0].sent != 0x42 || d[0].received != 0xC3) FAIL("Diff fields wrong");

    Bytes longer = {0x41, 0x42, 0x43, 0x44, 0x45};
    d = diffBytes(sent, longer);
    if (d.size() != 2) FAIL("Expected two diffs for extra bytes, got " << d.size());
    if (d[0].offset != 3 || d[0].sent.has_value() || d[0].received != 0x44) FAIL("Added byte wrong");

    d = diffBytes(longer, sent);
    if (d.size() != 2 || d[1].offset != 4 || d[1].received.has_value()) FAIL("Removed byte wrong");

    PASS();
    return true;
}

bool test_diff_report() {
    TEST("Diff report rows and limits");

    Bytes sent = {0x41, 0x42, 0x43, 0x44};
    if (formatDiffReport(sent, sent) != "Data sequences are identical\n") FAIL("Identical report wrong");

    Bytes recv = {0x41, 0x42, 0x43 ^ 0x03, 0x44};
    std::string report = formatDiffReport(sent, recv);
    if (report.find("Found 1 differences") == std::string::npos) FAIL("Missing count: " << report);
    if (report.find("0x43 (67)") == std::string::npos) FAIL("Missing sent byte: " << report);
    if (report.find("0x40 (64)") == std::string::npos) FAIL("Missing received byte: " << report);
    if (report.find("2 bit(s)") == std::string::npos) FAIL("Missing bit count: " << report);

    Bytes shorter = {0x41, 0x42};
    report = formatDiffReport(sent, shorter);
    if (report.find("REMOVED") == std::string::npos) FAIL("Missing REMOVED: " << report);
    if (formatDiffReport(shorter, sent).find("ADDED") == std::string::npos) FAIL("Missing ADDED");

    Bytes zeros(4, 0x00);
    report = formatDiffReport(sent, zeros, 2);
    if (report.find("... and 2 more differences") == std::string::npos) FAIL("Row limit ignored: " << report);

    PASS();
    return true;
}

bool test_visualize_bit_errors() {
    TEST("Bit error view marks flipped bits");

    Bytes sent = {0x41, 0x00};
    Bytes recv = {0x43, 0x00};
    std::string v = visualizeBitErrors(sent, recv);

    if (v.find("  Sent:     01000001  (0x41)\n") == std::string::npos) FAIL("Sent row wrong: " << v);
    if (v.find("  Received: 01000011  (0x43)\n") == std::string::npos) FAIL("Received row wrong: " << v);
    if (v.find(std::string("  Errors:   ") + "      ^ " + "\n") == std::string::npos) {
        FAIL("Marker row wrong: " << v);
    }

    Bytes many(12, 0x00);
    if (visualizeBitErrors(many, many).find("... (2 more bytes)") == std::string::npos) {
        FAIL("Byte limit not reported");
    }

    PASS();
    return true;
}

bool test_compare_packets() {
    TEST("Packet comparison by field");

    Bytes a = createPacket("telemetry", 1, 0.0f);

    PacketComparison same = comparePackets(a, a);
    if (!same.identical || !same.size_match || !same.preamble_match || !same.header_match ||
        !same.payload_match || !same.crc_match) {
        FAIL("Identical packets should match everywhere");
    }

    Bytes payload_hit = a;
    payload_hit[PacketLayout::PAYLOAD_OFFSET + 2] ^= 0x04;
    PacketComparison c = comparePackets(a, payload_hit);
    if (c.identical || !c.size_match || !c.preamble_match) FAIL("Size/preamble flags wrong");
    if (!c.header_match) FAIL("Header untouched but reported different");
    if (c.payload_match) FAIL("Payload change not detected");
    if (!c.crc_match) FAIL("CRC field untouched but reported different");

    Bytes b = createPacket("telemetry", 2, 0.0f);
    c = comparePackets(a, b);
    if (c.header_match) FAIL("Different ids should not match");
    if (!c.payload_match) FAIL("Same payload reported different");
    if (c.crc_match) FAIL("Different headers should give different CRCs");

    Bytes bad_preamble = a;
    bad_preamble[0] = 0x00;
    c = comparePackets(a, bad_preamble);
    if (c.preamble_match || c.header_match || c.payload_match) FAIL("Unparseable packet should not match");

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    setLogLevel(LogLevel::ERROR);

    std::cout << "=== Packet Test Suite ===\n\n";

    std::cout << "Layout:\n";
    test_packet_layout();
    test_crc_reference();
    test_roundtrip();
    test_default_timestamp();
    test_packet_id_wrap();

    std::cout << "\nCRC Coverage:\n";
    test_crc_detects_single_bit_flips();
    test_crc_mismatch_still_decodes();

    std::cout << "\nStructural Failures:\n";
    test_too_short();
    test_bad_preamble();
    test_truncation();
    test_trailing_bytes_ignored();
    test_oversized_payload();

    std::cout << "\nHelpers:\n";
    test_overhead();
    test_hexdump();
    test_hexdump_wide_offset();
    test_packet_to_string();

    std::cout << "\nDiagnosis:\n";
    test_diff_bytes();
    test_diff_report();
    test_visualize_bit_errors();
    test_compare_packets();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
