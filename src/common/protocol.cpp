/*
 * AdaTP - packet codec implementation
 */

#include "protocol.hpp"

#include "byte_io.hpp"
#include "utils.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace adatp {

namespace {
constexpr std::size_t kMagicOffset = 0;
constexpr std::size_t kVersionOffset = 5;
constexpr std::size_t kFlagsOffset = 6;
constexpr std::size_t kLengthOffset = 7;
constexpr std::size_t kSequenceOffset = 11;
constexpr std::size_t kTypeOffset = 19;
constexpr std::size_t kTimestampOffset = 21;
constexpr std::size_t kSessionOffset = 29;

static_assert(kSessionOffset + kSessionIdSize == kHeaderSize, "header layout mismatch");

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}
} // namespace

std::size_t SessionIdHash::operator()(const SessionId& id) const noexcept {
    // Ids are random, so any 8 bytes are well distributed.
    uint64_t value = 0;
    std::memcpy(&value, id.data(), sizeof(value));
    return static_cast<std::size_t>(value);
}

SessionId generate_session_id() {
    SessionId id{};
    auto bytes = random_bytes(id.size());
    std::copy(bytes.begin(), bytes.end(), id.begin());
    id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
    id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
    return id;
}

std::string format_session_id(const SessionId& id) {
    std::string hex = hex_encode(id.data(), id.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<SessionId> parse_session_id(const std::string& text) {
    SessionId id{};
    std::size_t nibble = 0;
    for (char ch : text) {
        if (ch == '-') {
            continue;
        }
        int value = hex_value(ch);
        if (value < 0 || nibble >= id.size() * 2) {
            return std::nullopt;
        }
        if (nibble % 2 == 0) {
            id[nibble / 2] = static_cast<uint8_t>(value << 4);
        } else {
            id[nibble / 2] = static_cast<uint8_t>(id[nibble / 2] | value);
        }
        ++nibble;
    }
    if (nibble != id.size() * 2) {
        return std::nullopt;
    }
    return id;
}

bool is_nil(const SessionId& id) {
    return std::all_of(id.begin(), id.end(), [](uint8_t b) { return b == 0; });
}

const char* packet_type_name(PacketType type) {
    switch (type) {
        case PacketType::HandshakeInit:
            return "HANDSHAKE_INIT";
        case PacketType::HandshakeResponse:
            return "HANDSHAKE_RESPONSE";
        case PacketType::HandshakeComplete:
            return "HANDSHAKE_COMPLETE";
        case PacketType::AuthRequest:
            return "AUTH_REQUEST";
        case PacketType::AuthSuccess:
            return "AUTH_SUCCESS";
        case PacketType::AuthFailure:
            return "AUTH_FAILURE";
        case PacketType::CreateRoom:
            return "CREATE_ROOM";
        case PacketType::JoinRoom:
            return "JOIN_ROOM";
        case PacketType::LeaveRoom:
            return "LEAVE_ROOM";
        case PacketType::RoomInvite:
            return "ROOM_INVITE";
        case PacketType::RoomStatus:
            return "ROOM_STATUS";
        case PacketType::PeerJoined:
            return "PEER_JOINED";
        case PacketType::PeerLeft:
            return "PEER_LEFT";
        case PacketType::Invite:
            return "INVITE";
        case PacketType::Accept:
            return "ACCEPT";
        case PacketType::TextMessage:
            return "TEXT_MESSAGE";
        case PacketType::AudioFrame:
            return "AUDIO_FRAME";
        case PacketType::FileInit:
            return "FILE_INIT";
        case PacketType::FileChunk:
            return "FILE_CHUNK";
        case PacketType::FileComplete:
            return "FILE_COMPLETE";
        case PacketType::FileAbort:
            return "FILE_ABORT";
        case PacketType::Disconnect:
            return "DISCONNECT";
        case PacketType::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

bool is_routable(PacketType type) {
    switch (type) {
        case PacketType::Invite:
        case PacketType::Accept:
        case PacketType::TextMessage:
        case PacketType::AudioFrame:
        case PacketType::FileInit:
        case PacketType::FileChunk:
        case PacketType::FileComplete:
        case PacketType::FileAbort:
            return true;
        default:
            return false;
    }
}

bool operator==(const PacketHeader& lhs, const PacketHeader& rhs) {
    return lhs.version == rhs.version && lhs.flags == rhs.flags &&
           lhs.payload_length == rhs.payload_length && lhs.sequence == rhs.sequence &&
           lhs.type == rhs.type && lhs.timestamp == rhs.timestamp &&
           lhs.session_id == rhs.session_id;
}

bool operator==(const Packet& lhs, const Packet& rhs) {
    return lhs.header == rhs.header && lhs.payload == rhs.payload;
}

Packet make_packet(PacketType type,
                   const SessionId& session_id,
                   std::vector<uint8_t> payload,
                   uint8_t flags) {
    Packet packet;
    packet.header.type = type;
    packet.header.flags = flags;
    packet.header.session_id = session_id;
    packet.header.timestamp = wall_clock_millis();
    packet.header.payload_length = static_cast<uint32_t>(payload.size());
    packet.payload = std::move(payload);
    return packet;
}

void encode_header(const PacketHeader& header, uint32_t payload_length, uint8_t* out) {
    std::memcpy(out + kMagicOffset, kProtocolMagic.data(), kProtocolMagic.size());
    out[kVersionOffset] = header.version;
    out[kFlagsOffset] = header.flags;
    store_u32(out + kLengthOffset, payload_length);
    store_u64(out + kSequenceOffset, header.sequence);
    store_u16(out + kTypeOffset, static_cast<uint16_t>(header.type));
    store_u64(out + kTimestampOffset, header.timestamp);
    std::memcpy(out + kSessionOffset, header.session_id.data(), kSessionIdSize);
}

std::array<uint8_t, kHeaderSize> encode_header(const PacketHeader& header, uint32_t payload_length) {
    std::array<uint8_t, kHeaderSize> out{};
    encode_header(header, payload_length, out.data());
    return out;
}

std::vector<uint8_t> encode_packet(const Packet& packet) {
    if (packet.payload.size() > kMaxPayloadCeiling) {
        throw std::invalid_argument("encode_packet: payload exceeds protocol maximum");
    }
    std::vector<uint8_t> out(kHeaderSize + packet.payload.size());
    encode_header(packet.header, static_cast<uint32_t>(packet.payload.size()), out.data());
    if (!packet.payload.empty()) {
        std::memcpy(out.data() + kHeaderSize, packet.payload.data(), packet.payload.size());
    }
    return out;
}

const char* decode_status_name(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:
            return "ok";
        case DecodeStatus::NeedMoreData:
            return "need-more-data";
        case DecodeStatus::BadMagic:
            return "bad-magic";
        case DecodeStatus::UnsupportedVersion:
            return "unsupported-version";
        case DecodeStatus::PayloadTooLarge:
            return "payload-too-large";
    }
    return "unknown";
}

DecodeResult decode_packet(const uint8_t* data, std::size_t len, uint32_t max_payload) {
    DecodeResult result;
    if (len == 0) {
        return result;
    }

    // Validate whatever part of the magic has arrived so garbage fails fast.
    std::size_t magic_bytes = std::min(len, kProtocolMagic.size());
    if (std::memcmp(data + kMagicOffset, kProtocolMagic.data(), magic_bytes) != 0) {
        result.status = DecodeStatus::BadMagic;
        return result;
    }
    if (len <= kVersionOffset) {
        return result;
    }
    if (data[kVersionOffset] != kProtocolVersion) {
        result.status = DecodeStatus::UnsupportedVersion;
        return result;
    }
    if (len < kLengthOffset + 4) {
        return result;
    }

    uint32_t payload_length = load_u32(data + kLengthOffset);
    if (payload_length > std::min(max_payload, kMaxPayloadCeiling)) {
        result.status = DecodeStatus::PayloadTooLarge;
        return result;
    }
    if (len < kHeaderSize + payload_length) {
        return result;
    }

    Packet packet;
    packet.header.version = data[kVersionOffset];
    packet.header.flags = data[kFlagsOffset];
    packet.header.payload_length = payload_length;
    packet.header.sequence = load_u64(data + kSequenceOffset);
    packet.header.type = static_cast<PacketType>(load_u16(data + kTypeOffset));
    packet.header.timestamp = load_u64(data + kTimestampOffset);
    std::memcpy(packet.header.session_id.data(), data + kSessionOffset, kSessionIdSize);
    packet.payload.assign(data + kHeaderSize, data + kHeaderSize + payload_length);

    result.status = DecodeStatus::Ok;
    result.consumed = kHeaderSize + payload_length;
    result.packet = std::move(packet);
    return result;
}

FrameReader::FrameReader(uint32_t max_payload) : max_payload_(max_payload) {}

void FrameReader::feed(const uint8_t* data, std::size_t len) {
    if (poisoned_ || len == 0) {
        return;
    }
    if (offset_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + len);
}

DecodeResult FrameReader::next() {
    if (poisoned_) {
        DecodeResult result;
        result.status = poison_status_;
        return result;
    }

    DecodeResult result = decode_packet(buffer_.data() + offset_, buffered(), max_payload_);
    if (result.status == DecodeStatus::Ok) {
        offset_ += result.consumed;
        if (offset_ == buffer_.size()) {
            buffer_.clear();
            offset_ = 0;
        }
    } else if (is_malformed(result.status)) {
        poisoned_ = true;
        poison_status_ = result.status;
        buffer_.clear();
        buffer_.shrink_to_fit();
        offset_ = 0;
    }
    return result;
}

bool send_all(int socket_fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(socket_fd, data + total, len - total, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}

} // namespace adatp
