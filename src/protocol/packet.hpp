#pragma once

#include "orbiter/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace orbiter {
namespace protocol {

// Downlink packet
//
// Wire format (big-endian):
// ┌──────────┬───────────┬─────────────┬───────────┬─────────┬───────┐
// │ PREAMBLE │ PACKET_ID │ PAYLOAD_LEN │ TIMESTAMP │ PAYLOAD │ CRC16 │
// │    4B    │    2B     │     2B      │  4B f32   │    N    │  2B   │
// └──────────┴───────────┴─────────────┴───────────┴─────────┴───────┘
//
// CRC16-CCITT covers header + payload (bytes [4, 12+N)).
//
namespace PacketLayout {
    constexpr uint8_t PREAMBLE_BYTE = 0xAA;
    constexpr size_t PREAMBLE_SIZE = 4;
    constexpr size_t HEADER_SIZE = 8;                       // id + len + timestamp
    constexpr size_t PAYLOAD_OFFSET = PREAMBLE_SIZE + HEADER_SIZE;
    constexpr size_t CRC_SIZE = 2;
    constexpr size_t OVERHEAD = PAYLOAD_OFFSET + CRC_SIZE;  // 14 bytes
    constexpr size_t MAX_PAYLOAD = 0xFFFF;
}

struct ParsedPacket {
    uint16_t packet_id = 0;
    uint16_t payload_length = 0;   // As declared in the header
    float timestamp = 0.0f;
    Bytes payload;                 // Whatever was available, up to payload_length
    uint16_t crc_received = 0;
    uint16_t crc_calculated = 0;
    bool crc_valid = false;
    bool truncated = false;        // Buffer ended before payload + CRC

    std::string payloadAsText() const;
};

enum class ParseStatus : uint8_t {
    OK = 0,
    TOO_SHORT = 1,      // Fewer than 14 bytes
    BAD_PREAMBLE = 2,   // First 4 bytes are not 0xAA
};

const char* parseStatusToString(ParseStatus status);

struct ParseResult {
    ParseStatus status = ParseStatus::OK;
    ParsedPacket packet;           // Only meaningful when status == OK

    bool ok() const { return status == ParseStatus::OK; }
};

// packet_id wraps modulo 65536. timestamp defaults to the current Unix time.
// Payloads longer than MAX_PAYLOAD are truncated.
Bytes createPacket(ByteSpan payload, uint32_t packet_id = 0,
                   std::optional<float> timestamp = std::nullopt);
Bytes createPacket(const std::string& text, uint32_t packet_id = 0,
                   std::optional<float> timestamp = std::nullopt);

// Never throws. Structural problems are reported in status, a CRC mismatch
// in packet.crc_valid, a short buffer in packet.truncated.
ParseResult parsePacket(ByteSpan data);

// Parses cleanly, not truncated, CRC matches
bool validatePacket(ByteSpan data);

// Framing overhead as a percentage of the packet: 14 / (14 + N) * 100
float calculateOverhead(size_t payload_size);

// CRC16-CCITT: poly 0x1021, init 0xFFFF, no final XOR
uint16_t calculateCRC(const uint8_t* data, size_t len);

// Debug output
std::string packetToString(ByteSpan data);

// `hexdump -C` style: offset, hex bytes, |ascii|. Offsets start at base_offset.
std::string hexdump(ByteSpan data, size_t bytes_per_line = 16, bool show_ascii = true,
                    size_t base_offset = 0);

// ============================================================================
// Sent versus received diagnosis
// ============================================================================

struct ByteDiff {
    size_t offset = 0;
    std::optional<uint8_t> sent;       // Empty past the end of the sent bytes
    std::optional<uint8_t> received;   // Empty past the end of the received bytes
};

// Every offset where the two sequences differ, including length mismatch
std::vector<ByteDiff> diffBytes(ByteSpan sent, ByteSpan received);

// Offset / sent / received / change table, at most max_rows rows
std::string formatDiffReport(ByteSpan sent, ByteSpan received, size_t max_rows = 20);

// Bit patterns of the first max_bytes byte pairs with '^' under flipped bits
std::string visualizeBitErrors(ByteSpan sent, ByteSpan received, size_t max_bytes = 10);

struct PacketComparison {
    bool identical = false;
    bool size_match = false;
    bool preamble_match = false;
    bool header_match = false;         // id, length, timestamp
    bool payload_match = false;
    bool crc_match = false;            // Trailing CRC fields
};

// Field-by-field comparison. Header, payload and CRC only match when both
// packets parse.
PacketComparison comparePackets(ByteSpan sent, ByteSpan received);

} // namespace protocol
} // namespace orbiter
