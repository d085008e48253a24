#include <gtest/gtest.h>

#include "messages.hpp"

#include <string>
#include <vector>

using namespace adatp;

namespace
{
std::vector<uint8_t> bytes(const std::string &s) { return std::vector<uint8_t>(s.begin(), s.end()); }
}  // namespace

TEST(RoutePrefix, RoomPrefixPrecedesOpaqueBody)
{
    auto plaintext = build_routed_payload(room_route("lobby"), bytes("hi there"));
    ASSERT_EQ(plaintext[0], 5);

    auto routed = parse_routed_payload(plaintext, false);
    ASSERT_TRUE(routed.has_value());
    EXPECT_FALSE(routed->route.direct);
    EXPECT_EQ(routed->route.room, "lobby");
    EXPECT_EQ(std::string(plaintext.begin() + routed->body_offset, plaintext.end()), "hi there");
}

TEST(RoutePrefix, DirectPrefixIsSessionId)
{
    SessionId target = generate_session_id();
    auto      plaintext = build_routed_payload(direct_route(target), bytes("x"));
    ASSERT_EQ(plaintext.size(), kSessionIdSize + 1);

    auto routed = parse_routed_payload(plaintext, true);
    ASSERT_TRUE(routed.has_value());
    EXPECT_TRUE(routed->route.direct);
    EXPECT_EQ(routed->route.target, target);
    EXPECT_EQ(routed->body_offset, kSessionIdSize);
}

TEST(RoutePrefix, RejectsTruncatedOrInvalidPrefix)
{
    EXPECT_FALSE(parse_routed_payload({}, false).has_value());
    EXPECT_FALSE(parse_routed_payload({9, 'a', 'b'}, false).has_value());
    EXPECT_FALSE(parse_routed_payload({0}, false).has_value());
    EXPECT_FALSE(parse_routed_payload(std::vector<uint8_t>(15, 1), true).has_value());
}

TEST(RoomNames, Validation)
{
    EXPECT_TRUE(is_valid_room_name("general"));
    EXPECT_TRUE(is_valid_room_name(std::string(kMaxRoomNameLength, 'r')));
    EXPECT_FALSE(is_valid_room_name(""));
    EXPECT_FALSE(is_valid_room_name("two words"));
    EXPECT_FALSE(is_valid_room_name(std::string(kMaxRoomNameLength + 1, 'r')));
}

TEST(RoomRequests, InviteCarriesInvitee)
{
    RoomRequest request;
    request.room    = "secret";
    request.invitee = generate_session_id();

    auto body    = encode_room_request(PacketType::RoomInvite, request);
    auto decoded = decode_room_request(PacketType::RoomInvite, body);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->room, "secret");
    EXPECT_EQ(decoded->invitee, request.invitee);

    // A join body is not a valid invite body.
    EXPECT_FALSE(decode_room_request(PacketType::RoomInvite, encode_room_request(PacketType::JoinRoom, request))
                     .has_value());
}

TEST(RoomRequests, CreateCarriesVisibility)
{
    RoomRequest request;
    request.room       = "vault";
    request.visibility = RoomVisibility::Private;

    auto decoded = decode_room_request(PacketType::CreateRoom, encode_room_request(PacketType::CreateRoom, request));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->visibility, RoomVisibility::Private);
}

TEST(PeerEvents, DecodeUserAndRoom)
{
    auto event = decode_peer_event(encode_peer_event("lobby", "alice"));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->room, "lobby");
    EXPECT_EQ(event->user_id, "alice");
}

TEST(FileBodies, InitRejectsPathLikeNamesAndZeroChunk)
{
    FileInitInfo info;
    info.total_size = 10;
    info.chunk_size = 4;
    info.filename   = "report.pdf";

    auto ok = encode_file_init(info);
    EXPECT_TRUE(decode_file_init(ok.data(), ok.size()).has_value());

    info.filename = "../etc/passwd";
    auto bad_name = encode_file_init(info);
    EXPECT_FALSE(decode_file_init(bad_name.data(), bad_name.size()).has_value());

    info.filename   = "report.pdf";
    info.chunk_size = 0;
    auto bad_chunk  = encode_file_init(info);
    EXPECT_FALSE(decode_file_init(bad_chunk.data(), bad_chunk.size()).has_value());
}

TEST(FileBodies, ChunkDataLocatedInBody)
{
    TransferId id{};
    id.fill(0xAB);
    auto body  = encode_file_chunk(id, 7, bytes("chunk-data"));
    auto chunk = decode_file_chunk(body.data(), body.size());
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->transfer_id, id);
    EXPECT_EQ(chunk->index, 7u);
    EXPECT_EQ(chunk->data_length, 10u);
    EXPECT_EQ(std::string(body.begin() + chunk->data_offset, body.end()), "chunk-data");
}

TEST(FileBodies, AbortReason)
{
    TransferId id{};
    id[0]     = 1;
    auto body = encode_file_abort(FileAbortInfo{id, AbortReason::SenderGone});
    auto info = decode_file_abort(body.data(), body.size());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->reason, AbortReason::SenderGone);
}
