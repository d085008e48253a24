/*
 * AdaTP - packet codec
 *
 * Every AdaTP packet is a fixed 45-byte header followed by the payload:
 *
 *   offset  size  field
 *        0     5  magic "ADATP"
 *        5     1  version
 *        6     1  flags
 *        7     4  payload length
 *       11     8  sequence number
 *       19     2  packet type
 *       21     8  timestamp (ms since the Unix epoch)
 *       29    16  session id
 *
 * All integers are big-endian. The codec knows nothing about payload
 * contents; payloads are plaintext for HANDSHAKE_INIT/RESPONSE and
 * AES-GCM ciphertext+tag for everything after the handshake.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adatp {

constexpr std::array<uint8_t, 5> kProtocolMagic = {'A', 'D', 'A', 'T', 'P'};
constexpr uint8_t kProtocolVersion = 1;
constexpr std::size_t kHeaderSize = 45;
constexpr std::size_t kSessionIdSize = 16;
constexpr uint32_t kDefaultMaxPayload = 1u << 20;
constexpr uint32_t kMaxPayloadCeiling = 16u << 20;

constexpr uint8_t kFlagEncrypted = 0x01;
// Room broadcast also goes back to the sender.
constexpr uint8_t kFlagEcho = 0x02;
// Route prefix carries a target session id instead of a room name.
constexpr uint8_t kFlagDirect = 0x04;

using SessionId = std::array<uint8_t, kSessionIdSize>;

struct SessionIdHash {
    std::size_t operator()(const SessionId& id) const noexcept;
};

// Random RFC 4122 version 4 identifier.
SessionId generate_session_id();

std::string format_session_id(const SessionId& id);

std::optional<SessionId> parse_session_id(const std::string& text);

bool is_nil(const SessionId& id);

enum class PacketType : uint16_t {
    HandshakeInit = 0x0001,
    HandshakeResponse = 0x0002,
    HandshakeComplete = 0x0003,

    AuthRequest = 0x0010,
    AuthSuccess = 0x0011,
    AuthFailure = 0x0012,

    CreateRoom = 0x0020,
    JoinRoom = 0x0021,
    LeaveRoom = 0x0022,
    RoomInvite = 0x0023,
    RoomStatus = 0x0024,
    PeerJoined = 0x0025,
    PeerLeft = 0x0026,

    Invite = 0x0030,
    Accept = 0x0031,
    TextMessage = 0x0040,
    AudioFrame = 0x0050,

    FileInit = 0x0060,
    FileChunk = 0x0061,
    FileComplete = 0x0062,
    FileAbort = 0x0063,

    Disconnect = 0x00F0,
    Error = 0x00FF
};

const char* packet_type_name(PacketType type);

// Packets peers address to each other (they carry a route prefix).
bool is_routable(PacketType type);

struct PacketHeader {
    uint8_t version = kProtocolVersion;
    uint8_t flags = 0;
    uint32_t payload_length = 0;
    uint64_t sequence = 0;
    PacketType type = PacketType::Error;
    uint64_t timestamp = 0;
    SessionId session_id{};
};

struct Packet {
    PacketHeader header;
    std::vector<uint8_t> payload;
};

bool operator==(const PacketHeader& lhs, const PacketHeader& rhs);
bool operator==(const Packet& lhs, const Packet& rhs);

Packet make_packet(PacketType type,
                   const SessionId& session_id,
                   std::vector<uint8_t> payload,
                   uint8_t flags = 0);

// Writes kHeaderSize bytes to out using payload_length for the length field.
void encode_header(const PacketHeader& header, uint32_t payload_length, uint8_t* out);

std::array<uint8_t, kHeaderSize> encode_header(const PacketHeader& header, uint32_t payload_length);

// The length field is always taken from packet.payload.size().
std::vector<uint8_t> encode_packet(const Packet& packet);

enum class DecodeStatus {
    Ok,
    NeedMoreData,
    BadMagic,
    UnsupportedVersion,
    PayloadTooLarge
};

const char* decode_status_name(DecodeStatus status);

inline bool is_malformed(DecodeStatus status) {
    return status != DecodeStatus::Ok && status != DecodeStatus::NeedMoreData;
}

struct DecodeResult {
    DecodeStatus status = DecodeStatus::NeedMoreData;
    std::size_t consumed = 0;
    std::optional<Packet> packet;
};

DecodeResult decode_packet(const uint8_t* data, std::size_t len, uint32_t max_payload = kDefaultMaxPayload);

inline DecodeResult decode_packet(const std::vector<uint8_t>& data, uint32_t max_payload = kDefaultMaxPayload) {
    return decode_packet(data.data(), data.size(), max_payload);
}

// Accumulates stream bytes and yields packets one at a time. After a
// malformed frame the reader stays poisoned and yields nothing more.
class FrameReader {
public:
    explicit FrameReader(uint32_t max_payload = kDefaultMaxPayload);

    void feed(const uint8_t* data, std::size_t len);

    DecodeResult next();

    std::size_t buffered() const { return buffer_.size() - offset_; }
    bool poisoned() const { return poisoned_; }

private:
    std::vector<uint8_t> buffer_;
    std::size_t offset_ = 0;
    uint32_t max_payload_;
    bool poisoned_ = false;
    DecodeStatus poison_status_ = DecodeStatus::Ok;
};

bool send_all(int socket_fd, const uint8_t* data, std::size_t len);

} // namespace adatp
