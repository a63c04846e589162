#include "packet.hpp"
#include "orbiter/modem.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>

namespace orbiter {
namespace protocol {

using namespace PacketLayout;

namespace {

void putU16(Bytes& out, uint16_t v) {
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

uint16_t getU16(ByteSpan data, size_t pos) {
    return (static_cast<uint16_t>(data[pos]) << 8) |
            static_cast<uint16_t>(data[pos + 1]);
}

void putF32(Bytes& out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    out.push_back((bits >> 24) & 0xFF);
    out.push_back((bits >> 16) & 0xFF);
    out.push_back((bits >> 8) & 0xFF);
    out.push_back(bits & 0xFF);
}

float getF32(ByteSpan data, size_t pos) {
    uint32_t bits = (static_cast<uint32_t>(data[pos]) << 24) |
                    (static_cast<uint32_t>(data[pos + 1]) << 16) |
                    (static_cast<uint32_t>(data[pos + 2]) << 8) |
                     static_cast<uint32_t>(data[pos + 3]);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

float unixTimeNow() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<float>(now).count();
}

} // namespace

const char* parseStatusToString(ParseStatus status) {
    switch (status) {
        case ParseStatus::OK:           return "OK";
        case ParseStatus::TOO_SHORT:    return "TOO_SHORT";
        case ParseStatus::BAD_PREAMBLE: return "BAD_PREAMBLE";
        default:                        return "UNKNOWN";
    }
}

uint16_t calculateCRC(const uint8_t* data, size_t len) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < len; i++) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int j = 0; j < 8; j++) {
            if (crc & 0x8000) {
                crc = (crc << 1) ^ 0x1021;
            } else {
                crc <<= 1;
            }
        }
    }
    return crc;
}

Bytes createPacket(ByteSpan payload, uint32_t packet_id, std::optional<float> timestamp) {
    size_t len = payload.size();
    if (len > MAX_PAYLOAD) {
        LOG_WARN("LINK", "Payload too large (%zu bytes), truncating to %zu", len, MAX_PAYLOAD);
        len = MAX_PAYLOAD;
    }

    Bytes result;
    result.reserve(OVERHEAD + len);

    // PREAMBLE (4 bytes)
    result.insert(result.end(), PREAMBLE_SIZE, PREAMBLE_BYTE);

    // PACKET_ID (2 bytes)
    putU16(result, static_cast<uint16_t>(packet_id & 0xFFFF));

    // PAYLOAD_LEN (2 bytes)
    putU16(result, static_cast<uint16_t>(len));

    // TIMESTAMP (4 bytes, IEEE 754)
    putF32(result, timestamp ? *timestamp : unixTimeNow());

    // PAYLOAD (N bytes)
    result.insert(result.end(), payload.begin(), payload.begin() + len);

    // CRC16 over header + payload
    uint16_t crc = calculateCRC(result.data() + PREAMBLE_SIZE, result.size() - PREAMBLE_SIZE);
    putU16(result, crc);

    return result;
}

Bytes createPacket(const std::string& text, uint32_t packet_id, std::optional<float> timestamp) {
    Bytes payload(text.begin(), text.end());
    return createPacket(payload, packet_id, timestamp);
}

ParseResult parsePacket(ByteSpan data) {
    ParseResult result;

    if (data.size() < OVERHEAD) {
        result.status = ParseStatus::TOO_SHORT;
        return result;
    }

    for (size_t i = 0; i < PREAMBLE_SIZE; i++) {
        if (data[i] != PREAMBLE_BYTE) {
            result.status = ParseStatus::BAD_PREAMBLE;
            return result;
        }
    }

    ParsedPacket& pkt = result.packet;
    pkt.packet_id = getU16(data, 4);
    pkt.payload_length = getU16(data, 6);
    pkt.timestamp = getF32(data, 8);

    size_t available = data.size() - PAYLOAD_OFFSET;
    size_t take = std::min<size_t>(pkt.payload_length, available);
    pkt.payload.assign(data.begin() + PAYLOAD_OFFSET, data.begin() + PAYLOAD_OFFSET + take);

    size_t crc_pos = PAYLOAD_OFFSET + take;
    pkt.crc_calculated = calculateCRC(data.data() + PREAMBLE_SIZE, crc_pos - PREAMBLE_SIZE);

    if (take < pkt.payload_length || crc_pos + CRC_SIZE > data.size()) {
        pkt.truncated = true;
        pkt.crc_valid = false;
        LOG_LINK(DEBUG, "Packet truncated: declared %u payload bytes, buffer has %zu",
                 pkt.payload_length, available);
        return result;
    }

    pkt.crc_received = getU16(data, crc_pos);
    pkt.crc_valid = (pkt.crc_received == pkt.crc_calculated);
    return result;
}

bool validatePacket(ByteSpan data) {
    ParseResult r = parsePacket(data);
    return r.ok() && !r.packet.truncated && r.packet.crc_valid;
}

float calculateOverhead(size_t payload_size) {
    return static_cast<float>(OVERHEAD) / static_cast<float>(OVERHEAD + payload_size) * 100.0f;
}

std::string ParsedPacket::payloadAsText() const {
    return sanitizeUtf8(payload);
}

std::string packetToString(ByteSpan data) {
    ParseResult r = parsePacket(data);
    char buf[256];
    if (!r.ok()) {
        snprintf(buf, sizeof(buf), "Packet{%s, %zu bytes}", parseStatusToString(r.status), data.size());
        return buf;
    }

    const ParsedPacket& p = r.packet;
    snprintf(buf, sizeof(buf),
             "Packet{id=%u len=%u ts=%.3f payload=%zu bytes crc=%04X/%04X %s%s}",
             p.packet_id, p.payload_length, p.timestamp, p.payload.size(),
             p.crc_received, p.crc_calculated,
             p.crc_valid ? "OK" : "BAD",
             p.truncated ? " truncated" : "");
    return buf;
}

std::string hexdump(ByteSpan data, size_t bytes_per_line, bool show_ascii,
                    size_t base_offset) {
    if (bytes_per_line == 0) bytes_per_line = 16;

    std::string out;
    char buf[24];  // 64-bit offset: 16 hex digits + 2 spaces
    for (size_t i = 0; i < data.size(); i += bytes_per_line) {
        size_t end = std::min(i + bytes_per_line, data.size());

        snprintf(buf, sizeof(buf), "%08zx  ", base_offset + i);
        out += buf;

        for (size_t j = i; j < i + bytes_per_line; j++) {
            if (j < end) {
                snprintf(buf, sizeof(buf), "%02x", data[j]);
                out += buf;
            } else {
                out += "  ";
            }
            if (j + 1 < i + bytes_per_line) out += ' ';
        }

        if (show_ascii) {
            out += "  |";
            for (size_t j = i; j < end; j++) {
                uint8_t b = data[j];
                out += (b >= 32 && b < 127) ? static_cast<char>(b) : '.';
            }
            out += '|';
        }
        out += '\n';
    }
    return out;
}


// ============================================================================
// Sent versus received diagnosis
// ============================================================================

namespace {

std::string bitString(uint8_t b) {
    std::string out(8, '0');
    for (int i = 0; i < 8; i++) {
        if (b & (0x80 >> i)) out[i] = '1';
    }
    return out;
}

int countSetBits(uint8_t b) {
    int n = 0;
    for (; b; b &= b - 1) n++;
    return n;
}

} // namespace

std::vector<ByteDiff> diffBytes(ByteSpan sent, ByteSpan received) {
    std::vector<ByteDiff> diffs;
    size_t n = std::max(sent.size(), received.size());
    for (size_t i = 0; i < n; i++) {
        ByteDiff d;
        d.offset = i;
        if (i < sent.size()) d.sent = sent[i];
        if (i < received.size()) d.received = received[i];
        if (d.sent != d.received) diffs.push_back(d);
    }
    return diffs;
}

std::string formatDiffReport(ByteSpan sent, ByteSpan received, size_t max_rows) {
    std::vector<ByteDiff> diffs = diffBytes(sent, received);
    if (diffs.empty()) {
        return "Data sequences are identical\n";
    }

    char line[96];
    snprintf(line, sizeof(line), "Found %zu differences:\n", diffs.size());
    std::string out = line;
    snprintf(line, sizeof(line), "%-10s %-12s %-12s %s\n", "Offset", "Sent", "Received", "Change");
    out += line;
    out += std::string(60, '-') + "\n";

    size_t rows = std::min(diffs.size(), max_rows);
    for (size_t k = 0; k < rows; k++) {
        const ByteDiff& d = diffs[k];
        char sent_str[16] = "(missing)";
        char recv_str[16] = "(missing)";
        char change[16];

        if (d.sent) snprintf(sent_str, sizeof(sent_str), "0x%02X (%u)", *d.sent, *d.sent);
        if (d.received) snprintf(recv_str, sizeof(recv_str), "0x%02X (%u)", *d.received, *d.received);

        if (!d.sent) {
            snprintf(change, sizeof(change), "ADDED");
        } else if (!d.received) {
            snprintf(change, sizeof(change), "REMOVED");
        } else {
            snprintf(change, sizeof(change), "%d bit(s)", countSetBits(*d.sent ^ *d.received));
        }

        snprintf(line, sizeof(line), "%-10zu %-12s %-12s %s\n", d.offset, sent_str, recv_str, change);
        out += line;
    }
    if (diffs.size() > rows) {
        snprintf(line, sizeof(line), "... and %zu more differences\n", diffs.size() - rows);
        out += line;
    }
    return out;
}

std::string visualizeBitErrors(ByteSpan sent, ByteSpan received, size_t max_bytes) {
    std::string out = "Bit-level errors\n";
    size_t n = std::min({sent.size(), received.size(), max_bytes});

    char line[64];
    for (size_t i = 0; i < n; i++) {
        std::string s = bitString(sent[i]);
        std::string r = bitString(received[i]);
        std::string marks(8, ' ');
        for (int b = 0; b < 8; b++) {
            if (s[b] != r[b]) marks[b] = '^';
        }

        snprintf(line, sizeof(line), "Byte %zu:\n", i);
        out += line;
        snprintf(line, sizeof(line), "  Sent:     %s  (0x%02X)\n", s.c_str(), sent[i]);
        out += line;
        snprintf(line, sizeof(line), "  Received: %s  (0x%02X)\n", r.c_str(), received[i]);
        out += line;
        out += "  Errors:   " + marks + "\n";
    }
    if (sent.size() > n) {
        snprintf(line, sizeof(line), "... (%zu more bytes)\n", sent.size() - n);
        out += line;
    }
    return out;
}

PacketComparison comparePackets(ByteSpan sent, ByteSpan received) {
    PacketComparison c;
    c.identical = std::equal(sent.begin(), sent.end(), received.begin(), received.end());
    c.size_match = sent.size() == received.size();
    c.preamble_match = sent.size() >= PREAMBLE_SIZE && received.size() >= PREAMBLE_SIZE &&
                       std::equal(sent.begin(), sent.begin() + PREAMBLE_SIZE, received.begin());

    ParseResult a = parsePacket(sent);
    ParseResult b = parsePacket(received);
    if (!a.ok() || !b.ok()) {
        return c;
    }

    const ParsedPacket& p = a.packet;
    const ParsedPacket& q = b.packet;
    c.header_match = p.packet_id == q.packet_id &&
                     p.payload_length == q.payload_length &&
                     std::memcmp(&p.timestamp, &q.timestamp, sizeof(float)) == 0;
    c.payload_match = p.payload == q.payload;
    c.crc_match = !p.truncated && !q.truncated && p.crc_received == q.crc_received;
    return c;
}

} // namespace protocol
} // namespace orbiter
