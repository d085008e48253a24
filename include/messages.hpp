/*
 * AdaTP - payload bodies carried inside sealed packets
 *
 * Routable packets (chat, audio, signaling, FILE_*) start with a route
 * prefix: a 16-byte target session id when kFlagDirect is set, otherwise a
 * one-byte length followed by the room name. Everything after the prefix is
 * the body. The server reads the prefix to pick recipients and forwards the
 * plaintext unchanged; only the FILE_* bodies below are observed.
 */

#pragma once

#include "protocol.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adatp {

constexpr std::size_t kMaxRoomNameLength = 64;
constexpr std::size_t kMaxFilenameLength = 255;
constexpr std::size_t kMaxUserFieldLength = 255;

using TransferId = std::array<uint8_t, 16>;

// Printable ASCII, no spaces, 1..kMaxRoomNameLength bytes.
bool is_valid_room_name(const std::string& name);

struct RoutePrefix {
    bool direct = false;
    SessionId target{};
    std::string room;
};

RoutePrefix room_route(const std::string& room);
RoutePrefix direct_route(const SessionId& target);

struct RoutedPayload {
    RoutePrefix route;
    std::size_t body_offset = 0;
};

std::vector<uint8_t> build_routed_payload(const RoutePrefix& route, const std::vector<uint8_t>& body);

// `direct` comes from the packet flags; nullopt on a truncated or invalid prefix.
std::optional<RoutedPayload> parse_routed_payload(const std::vector<uint8_t>& plaintext, bool direct);

enum class RoomVisibility : uint8_t {
    Public = 0,
    Private = 1
};

// CREATE_ROOM: visibility(1) name_len(1) name
// JOIN_ROOM / LEAVE_ROOM: name_len(1) name
// ROOM_INVITE: name_len(1) name invitee(16)
struct RoomRequest {
    std::string room;
    RoomVisibility visibility = RoomVisibility::Public;
    SessionId invitee{};
};

std::vector<uint8_t> encode_room_request(PacketType type, const RoomRequest& request);
std::optional<RoomRequest> decode_room_request(PacketType type, const std::vector<uint8_t>& body);

enum class RoomStatusCode : uint8_t {
    Joined = 0,
    Left = 1,
    Created = 2,
    Invited = 3,
    AlreadyMember = 4,
    AlreadyExists = 5,
    NotInvited = 6,
    NotFound = 7,
    NotMember = 8,
    InvalidName = 9,
    Unauthenticated = 10
};

const char* room_status_name(RoomStatusCode code);

struct RoomStatusInfo {
    RoomStatusCode code = RoomStatusCode::NotFound;
    std::string room;
};

std::vector<uint8_t> encode_room_status(const RoomStatusInfo& status);
std::optional<RoomStatusInfo> decode_room_status(const std::vector<uint8_t>& body);

// AUTH_REQUEST: user_len(1) user pass_len(2) pass
struct AuthRequestInfo {
    std::string username;
    std::string password;
};

std::vector<uint8_t> encode_auth_request(const AuthRequestInfo& request);
std::optional<AuthRequestInfo> decode_auth_request(const std::vector<uint8_t>& body);

// AUTH_SUCCESS: id_len(1) user_id role_len(1) role
struct AuthResultInfo {
    std::string user_id;
    std::string role;
};

std::vector<uint8_t> encode_auth_result(const AuthResultInfo& result);
std::optional<AuthResultInfo> decode_auth_result(const std::vector<uint8_t>& body);

// PEER_JOINED / PEER_LEFT body (after a room prefix): id_len(1) user_id
std::vector<uint8_t> encode_peer_event(const std::string& room, const std::string& user_id);

struct PeerEventInfo {
    std::string room;
    std::string user_id;
};

std::optional<PeerEventInfo> decode_peer_event(const std::vector<uint8_t>& plaintext);

// FILE_INIT: transfer_id(16) total_size(8) chunk_size(4) name_len(2) name
struct FileInitInfo {
    TransferId transfer_id{};
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    std::string filename;
};

std::vector<uint8_t> encode_file_init(const FileInitInfo& info);
std::optional<FileInitInfo> decode_file_init(const uint8_t* body, std::size_t len);

// FILE_CHUNK: transfer_id(16) index(4) data
struct FileChunkInfo {
    TransferId transfer_id{};
    uint32_t index = 0;
    std::size_t data_offset = 0;
    std::size_t data_length = 0;
};

std::vector<uint8_t> encode_file_chunk(const TransferId& id, uint32_t index, const std::vector<uint8_t>& data);
std::optional<FileChunkInfo> decode_file_chunk(const uint8_t* body, std::size_t len);

// FILE_COMPLETE: transfer_id(16)
std::vector<uint8_t> encode_file_complete(const TransferId& id);
std::optional<TransferId> decode_file_complete(const uint8_t* body, std::size_t len);

enum class AbortReason : uint8_t {
    SenderAborted = 1,
    SizeMismatch = 2,
    SenderGone = 3
};

const char* abort_reason_name(AbortReason reason);

// FILE_ABORT: transfer_id(16) reason(1)
struct FileAbortInfo {
    TransferId transfer_id{};
    AbortReason reason = AbortReason::SenderAborted;
};

std::vector<uint8_t> encode_file_abort(const FileAbortInfo& info);
std::optional<FileAbortInfo> decode_file_abort(const uint8_t* body, std::size_t len);

} // namespace adatp
