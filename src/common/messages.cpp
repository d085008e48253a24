/*
 * AdaTP - payload bodies implementation
 */

#include "messages.hpp"

#include "byte_io.hpp"

#include <algorithm>

namespace adatp {

namespace {
bool read_short_string(ByteReader& reader, std::string& out) {
    uint8_t len = 0;
    return reader.read_u8(len) && reader.read_string(len, out);
}

void put_short_string(ByteWriter& writer, const std::string& text) {
    std::size_t len = std::min(text.size(), kMaxUserFieldLength);
    writer.put_u8(static_cast<uint8_t>(len));
    writer.put_string(text.substr(0, len));
}

bool valid_filename(const std::string& name) {
    if (name.empty() || name.size() > kMaxFilenameLength || name == "." || name == "..") {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char ch) {
        return ch == '/' || ch == '\\' || ch == '\0';
    });
}
} // namespace

bool is_valid_room_name(const std::string& name) {
    if (name.empty() || name.size() > kMaxRoomNameLength) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char ch) {
        return ch > 0x20 && ch < 0x7F;
    });
}

RoutePrefix room_route(const std::string& room) {
    RoutePrefix route;
    route.room = room;
    return route;
}

RoutePrefix direct_route(const SessionId& target) {
    RoutePrefix route;
    route.direct = true;
    route.target = target;
    return route;
}

std::vector<uint8_t> build_routed_payload(const RoutePrefix& route, const std::vector<uint8_t>& body) {
    ByteWriter writer(1 + kMaxRoomNameLength + body.size());
    if (route.direct) {
        writer.put_array(route.target);
    } else {
        writer.put_u8(static_cast<uint8_t>(route.room.size()));
        writer.put_string(route.room);
    }
    writer.put_bytes(body);
    return writer.take();
}

std::optional<RoutedPayload> parse_routed_payload(const std::vector<uint8_t>& plaintext, bool direct) {
    ByteReader reader(plaintext);
    RoutedPayload routed;
    routed.route.direct = direct;
    if (direct) {
        if (!reader.read_array(routed.route.target)) {
            return std::nullopt;
        }
    } else {
        if (!read_short_string(reader, routed.route.room) || !is_valid_room_name(routed.route.room)) {
            return std::nullopt;
        }
    }
    routed.body_offset = reader.position();
    return routed;
}

std::vector<uint8_t> encode_room_request(PacketType type, const RoomRequest& request) {
    ByteWriter writer;
    if (type == PacketType::CreateRoom) {
        writer.put_u8(static_cast<uint8_t>(request.visibility));
    }
    writer.put_u8(static_cast<uint8_t>(request.room.size()));
    writer.put_string(request.room);
    if (type == PacketType::RoomInvite) {
        writer.put_array(request.invitee);
    }
    return writer.take();
}

std::optional<RoomRequest> decode_room_request(PacketType type, const std::vector<uint8_t>& body) {
    ByteReader reader(body);
    RoomRequest request;
    if (type == PacketType::CreateRoom) {
        uint8_t visibility = 0;
        if (!reader.read_u8(visibility) || visibility > static_cast<uint8_t>(RoomVisibility::Private)) {
            return std::nullopt;
        }
        request.visibility = static_cast<RoomVisibility>(visibility);
    }
    if (!read_short_string(reader, request.room)) {
        return std::nullopt;
    }
    if (type == PacketType::RoomInvite && !reader.read_array(request.invitee)) {
        return std::nullopt;
    }
    if (reader.remaining() != 0) {
        return std::nullopt;
    }
    return request;
}

const char* room_status_name(RoomStatusCode code) {
    switch (code) {
        case RoomStatusCode::Joined:
            return "joined";
        case RoomStatusCode::Left:
            return "left";
        case RoomStatusCode::Created:
            return "created";
        case RoomStatusCode::Invited:
            return "invited";
        case RoomStatusCode::AlreadyMember:
            return "already-member";
        case RoomStatusCode::AlreadyExists:
            return "already-exists";
        case RoomStatusCode::NotInvited:
            return "not-invited";
        case RoomStatusCode::NotFound:
            return "not-found";
        case RoomStatusCode::NotMember:
            return "not-member";
        case RoomStatusCode::InvalidName:
            return "invalid-name";
        case RoomStatusCode::Unauthenticated:
            return "unauthenticated";
    }
    return "unknown";
}

std::vector<uint8_t> encode_room_status(const RoomStatusInfo& status) {
    ByteWriter writer;
    writer.put_u8(static_cast<uint8_t>(status.code));
    put_short_string(writer, status.room);
    return writer.take();
}

std::optional<RoomStatusInfo> decode_room_status(const std::vector<uint8_t>& body) {
    ByteReader reader(body);
    uint8_t code = 0;
    RoomStatusInfo status;
    if (!reader.read_u8(code) || code > static_cast<uint8_t>(RoomStatusCode::Unauthenticated) ||
        !read_short_string(reader, status.room)) {
        return std::nullopt;
    }
    status.code = static_cast<RoomStatusCode>(code);
    return status;
}

std::vector<uint8_t> encode_auth_request(const AuthRequestInfo& request) {
    ByteWriter writer;
    put_short_string(writer, request.username);
    writer.put_u16(static_cast<uint16_t>(request.password.size()));
    writer.put_string(request.password);
    return writer.take();
}

std::optional<AuthRequestInfo> decode_auth_request(const std::vector<uint8_t>& body) {
    ByteReader reader(body);
    AuthRequestInfo request;
    uint16_t password_len = 0;
    if (!read_short_string(reader, request.username) || request.username.empty() ||
        !reader.read_u16(password_len) || !reader.read_string(password_len, request.password) ||
        reader.remaining() != 0) {
        return std::nullopt;
    }
    return request;
}

std::vector<uint8_t> encode_auth_result(const AuthResultInfo& result) {
    ByteWriter writer;
    put_short_string(writer, result.user_id);
    put_short_string(writer, result.role);
    return writer.take();
}

std::optional<AuthResultInfo> decode_auth_result(const std::vector<uint8_t>& body) {
    ByteReader reader(body);
    AuthResultInfo result;
    if (!read_short_string(reader, result.user_id) || !read_short_string(reader, result.role)) {
        return std::nullopt;
    }
    return result;
}

std::vector<uint8_t> encode_peer_event(const std::string& room, const std::string& user_id) {
    ByteWriter body;
    put_short_string(body, user_id);
    return build_routed_payload(room_route(room), body.take());
}

std::optional<PeerEventInfo> decode_peer_event(const std::vector<uint8_t>& plaintext) {
    auto routed = parse_routed_payload(plaintext, false);
    if (!routed.has_value()) {
        return std::nullopt;
    }
    ByteReader reader(plaintext.data() + routed->body_offset, plaintext.size() - routed->body_offset);
    PeerEventInfo info;
    info.room = routed->route.room;
    if (!read_short_string(reader, info.user_id) || reader.remaining() != 0) {
        return std::nullopt;
    }
    return info;
}

std::vector<uint8_t> encode_file_init(const FileInitInfo& info) {
    ByteWriter writer(32 + info.filename.size());
    writer.put_array(info.transfer_id);
    writer.put_u64(info.total_size);
    writer.put_u32(info.chunk_size);
    writer.put_u16(static_cast<uint16_t>(info.filename.size()));
    writer.put_string(info.filename);
    return writer.take();
}

std::optional<FileInitInfo> decode_file_init(const uint8_t* body, std::size_t len) {
    ByteReader reader(body, len);
    FileInitInfo info;
    uint16_t name_len = 0;
    if (!reader.read_array(info.transfer_id) || !reader.read_u64(info.total_size) ||
        !reader.read_u32(info.chunk_size) || !reader.read_u16(name_len) ||
        !reader.read_string(name_len, info.filename)) {
        return std::nullopt;
    }
    if (info.chunk_size == 0 || !valid_filename(info.filename)) {
        return std::nullopt;
    }
    return info;
}

std::vector<uint8_t> encode_file_chunk(const TransferId& id, uint32_t index, const std::vector<uint8_t>& data) {
    ByteWriter writer(20 + data.size());
    writer.put_array(id);
    writer.put_u32(index);
    writer.put_bytes(data);
    return writer.take();
}

std::optional<FileChunkInfo> decode_file_chunk(const uint8_t* body, std::size_t len) {
    ByteReader reader(body, len);
    FileChunkInfo info;
    if (!reader.read_array(info.transfer_id) || !reader.read_u32(info.index)) {
        return std::nullopt;
    }
    info.data_offset = reader.position();
    info.data_length = reader.remaining();
    return info;
}

std::vector<uint8_t> encode_file_complete(const TransferId& id) {
    ByteWriter writer;
    writer.put_array(id);
    return writer.take();
}

std::optional<TransferId> decode_file_complete(const uint8_t* body, std::size_t len) {
    ByteReader reader(body, len);
    TransferId id{};
    if (!reader.read_array(id)) {
        return std::nullopt;
    }
    return id;
}

const char* abort_reason_name(AbortReason reason) {
    switch (reason) {
        case AbortReason::SenderAborted:
            return "sender-aborted";
        case AbortReason::SizeMismatch:
            return "size-mismatch";
        case AbortReason::SenderGone:
            return "sender-gone";
    }
    return "unknown";
}

std::vector<uint8_t> encode_file_abort(const FileAbortInfo& info) {
    ByteWriter writer;
    writer.put_array(info.transfer_id);
    writer.put_u8(static_cast<uint8_t>(info.reason));
    return writer.take();
}

std::optional<FileAbortInfo> decode_file_abort(const uint8_t* body, std::size_t len) {
    ByteReader reader(body, len);
    FileAbortInfo info;
    uint8_t reason = 0;
    if (!reader.read_array(info.transfer_id) || !reader.read_u8(reason) ||
        reason < static_cast<uint8_t>(AbortReason::SenderAborted) ||
        reason > static_cast<uint8_t>(AbortReason::SenderGone)) {
        return std::nullopt;
    }
    info.reason = static_cast<AbortReason>(reason);
    return info;
}

} // namespace adatp
