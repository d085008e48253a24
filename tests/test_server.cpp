#include <gtest/gtest.h>

#include "client.hpp"
#include "messages.hpp"
#include "server.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace adatp;

namespace
{
constexpr int kWaitMs = 3000;

ServerConfig loopback_config()
{
    ServerConfig config;
    config.bind_address = "127.0.0.1";
    config.port         = 0;
    return config;
}

// Reads packets until one of `type` satisfies `match`; everything else is skipped.
std::optional<Packet> wait_for(AdatpClient &client, PacketType type,
                               const std::function<bool(const Packet &)> &match = nullptr, int timeout_ms = kWaitMs)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
            return std::nullopt;
        auto packet = client.receive(static_cast<int>(left.count()));
        if (!packet.has_value())
            return std::nullopt;
        if (packet->header.type == type && (!match || match(*packet)))
            return packet;
    }
}

std::optional<RoomStatusInfo> wait_room_status(AdatpClient &client, RoomStatusCode code)
{
    auto packet = wait_for(client, PacketType::RoomStatus, [code](const Packet &p) {
        auto status = decode_room_status(p.payload);
        return status.has_value() && status->code == code;
    });
    if (!packet.has_value())
        return std::nullopt;
    return decode_room_status(packet->payload);
}

std::string routed_text(const Packet &packet)
{
    auto routed = parse_routed_payload(packet.payload, (packet.header.flags & kFlagDirect) != 0);
    if (!routed.has_value())
        return {};
    return std::string(packet.payload.begin() + static_cast<std::ptrdiff_t>(routed->body_offset),
                       packet.payload.end());
}

bool eventually(const std::function<bool()> &condition, int timeout_ms = kWaitMs)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

int raw_connect(uint16_t port)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return -1;
    }
    timeval tv{};
    tv.tv_sec = 3;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

// True when the server closed the socket before the receive timeout.
bool closed_by_server(int fd)
{
    uint8_t buf[256];
    for (;;)
    {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0)
            return true;
        if (n < 0)
            return errno == ECONNRESET;
    }
}

class ServerTest : public ::testing::Test
{
  protected:
    void SetUp() override { set_log_level(LogLevel::Warn); }

    void start(ServerConfig config = loopback_config())
    {
        server_ = std::make_unique<AdatpServer>(std::move(config));
        server_->start();
        ASSERT_TRUE(server_->running());
        ASSERT_NE(server_->port(), 0);
        EXPECT_EQ(server_->config().bind_address, "127.0.0.1");
    }

    std::unique_ptr<AdatpClient> connect()
    {
        auto client = std::make_unique<AdatpClient>();
        EXPECT_TRUE(client->connect_to_server("127.0.0.1", server_->port()));
        return client;
    }

    std::unique_ptr<AdatpClient> connect_and_join(const std::string &room)
    {
        auto client = connect();
        client->join_room(room);
        EXPECT_TRUE(wait_room_status(*client, RoomStatusCode::Joined).has_value());
        return client;
    }

    void TearDown() override
    {
        if (server_)
            server_->stop();
    }

    std::unique_ptr<AdatpServer> server_;
};
}  // namespace

TEST_F(ServerTest, RoomBroadcastReachesPeersButNotSender)
{
    start();
    auto alice = connect_and_join("lobby");
    auto bob   = connect_and_join("lobby");

    auto joined = wait_for(*alice, PacketType::PeerJoined);
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->header.session_id, bob->session_id());
    EXPECT_TRUE(server_->rooms().is_member("lobby", alice->session_id()));
    EXPECT_EQ(server_->rooms().members_of("lobby").size(), 2u);

    ASSERT_TRUE(bob->send_text("lobby", "Hello"));

    auto got = wait_for(*alice, PacketType::TextMessage);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->header.session_id, bob->session_id());
    EXPECT_EQ(routed_text(*got), "Hello");

    EXPECT_FALSE(wait_for(*bob, PacketType::TextMessage, nullptr, 300).has_value());

    // With the echo flag the sender gets its own copy.
    ASSERT_TRUE(bob->send_text("lobby", "again", true));
    auto echoed = wait_for(*bob, PacketType::TextMessage);
    ASSERT_TRUE(echoed.has_value());
    EXPECT_EQ(routed_text(*echoed), "again");
}

TEST_F(ServerTest, NonMemberTextIsNotDelivered)
{
    start();
    auto alice = connect_and_join("lobby");
    auto mallory = connect();

    ASSERT_TRUE(mallory->send_text("lobby", "sneaky"));
    EXPECT_FALSE(wait_for(*alice, PacketType::TextMessage, nullptr, 300).has_value());
    EXPECT_TRUE(eventually([&] { return server_->stats().routing_misses >= 1; }));
}

TEST_F(ServerTest, DirectMessage)
{
    start();
    auto alice = connect_and_join("lobby");
    auto bob   = connect_and_join("lobby");

    ASSERT_TRUE(alice->send_direct(bob->session_id(), PacketType::TextMessage, {'p', 's', 's', 't'}));
    auto got = wait_for(*bob, PacketType::TextMessage);
    ASSERT_TRUE(got.has_value());
    EXPECT_TRUE(got->header.flags & kFlagDirect);
    EXPECT_EQ(got->header.session_id, alice->session_id());
    EXPECT_EQ(routed_text(*got), "psst");
}

TEST_F(ServerTest, LeavingAnnouncesPeerLeft)
{
    start();
    auto alice = connect_and_join("lobby");
    auto bob   = connect_and_join("lobby");

    bob->disconnect();
    auto left = wait_for(*alice, PacketType::PeerLeft);
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(left->header.session_id, bob->session_id());
    auto event = decode_peer_event(left->payload);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->room, "lobby");
    EXPECT_TRUE(eventually([&] { return server_->connection_count() == 1; }));
}

TEST_F(ServerTest, BadMagicClosesConnection)
{
    start();
    int fd = raw_connect(server_->port());
    ASSERT_GE(fd, 0);

    std::vector<uint8_t> junk(kHeaderSize, 'Z');
    ASSERT_TRUE(send_all(fd, junk.data(), junk.size()));
    EXPECT_TRUE(closed_by_server(fd));
    ::close(fd);

    EXPECT_TRUE(eventually([&] { return server_->stats().malformed_frames == 1; }));
    EXPECT_TRUE(eventually([&] { return server_->connection_count() == 0; }));
}

TEST_F(ServerTest, SilentPeerTimesOutDuringHandshake)
{
    ServerConfig config         = loopback_config();
    config.handshake_timeout_ms = 200;
    start(config);

    int fd = raw_connect(server_->port());
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(closed_by_server(fd));
    ::close(fd);
    EXPECT_TRUE(eventually([&] { return server_->stats().handshake_failures == 1; }));
}

TEST_F(ServerTest, AuthenticationGate)
{
    ServerConfig config = loopback_config();
    config.require_auth = true;
    config.default_room = "lobby";
    config.users["alice"] = UserRecord{"s3cret", "admin"};
    start(config);

    auto client = connect();
    client->join_room("lobby");
    EXPECT_TRUE(wait_room_status(*client, RoomStatusCode::Unauthenticated).has_value());

    client->send_text("lobby", "too early");
    auto error = wait_for(*client, PacketType::Error);
    ASSERT_TRUE(error.has_value());

    client->authenticate("alice", "wrong");
    auto failure = wait_for(*client, PacketType::AuthFailure);
    ASSERT_TRUE(failure.has_value());

    client->authenticate("alice", "s3cret");
    auto success = wait_for(*client, PacketType::AuthSuccess);
    ASSERT_TRUE(success.has_value());
    auto result = decode_auth_result(success->payload);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->user_id, "alice");
    EXPECT_EQ(result->role, "admin");

    // The default room is joined once authenticated.
    auto joined = wait_room_status(*client, RoomStatusCode::Joined);
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->room, "lobby");
    EXPECT_EQ(server_->stats().auth_failures, 1u);
}

TEST_F(ServerTest, TooManyAuthFailuresDisconnect)
{
    ServerConfig config      = loopback_config();
    config.require_auth      = true;
    config.max_auth_attempts = 2;
    start(config);

    auto client = connect();
    client->authenticate("nobody", "x");
    ASSERT_TRUE(wait_for(*client, PacketType::AuthFailure).has_value());
    client->authenticate("nobody", "y");
    ASSERT_TRUE(wait_for(*client, PacketType::AuthFailure).has_value());

    EXPECT_FALSE(client->receive(kWaitMs).has_value());
    EXPECT_FALSE(client->connected());
}

TEST_F(ServerTest, PrivateRoomInvite)
{
    start();
    auto owner = connect();
    auto guest = connect();

    owner->create_room("vault", RoomVisibility::Private);
    ASSERT_TRUE(wait_room_status(*owner, RoomStatusCode::Created).has_value());

    guest->join_room("vault");
    ASSERT_TRUE(wait_room_status(*guest, RoomStatusCode::NotInvited).has_value());

    owner->invite("vault", guest->session_id());
    ASSERT_TRUE(wait_room_status(*owner, RoomStatusCode::Invited).has_value());
    auto notice = wait_room_status(*guest, RoomStatusCode::Invited);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->room, "vault");

    guest->join_room("vault");
    EXPECT_TRUE(wait_room_status(*guest, RoomStatusCode::Joined).has_value());
}

TEST_F(ServerTest, FileTransferIsRelayed)
{
    start();
    auto sender   = connect_and_join("share");
    auto receiver = connect_and_join("share");

    const std::string path = ::testing::TempDir() + "adatp_relay.bin";
    {
        std::ofstream out(path, std::ios::binary);
        for (int i = 0; i < 10000; ++i)
            out.put(static_cast<char>(i & 0xff));
    }

    ASSERT_TRUE(sender->send_file("share", path, 4096));
    std::remove(path.c_str());

    auto init = wait_for(*receiver, PacketType::FileInit);
    ASSERT_TRUE(init.has_value());
    auto routed = parse_routed_payload(init->payload, false);
    ASSERT_TRUE(routed.has_value());
    auto info = decode_file_init(init->payload.data() + routed->body_offset,
                                 init->payload.size() - routed->body_offset);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->total_size, 10000u);
    EXPECT_EQ(info->filename, "adatp_relay.bin");

    uint64_t bytes = 0;
    for (uint32_t i = 0; i < 3; ++i)
    {
        auto chunk = wait_for(*receiver, PacketType::FileChunk);
        ASSERT_TRUE(chunk.has_value());
        auto r = parse_routed_payload(chunk->payload, false);
        ASSERT_TRUE(r.has_value());
        auto c = decode_file_chunk(chunk->payload.data() + r->body_offset, chunk->payload.size() - r->body_offset);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->index, i);
        bytes += c->data_length;
    }
    EXPECT_EQ(bytes, 10000u);

    ASSERT_TRUE(wait_for(*receiver, PacketType::FileComplete).has_value());
    EXPECT_TRUE(eventually([&] { return server_->stats().transfers_completed == 1; }));
}

TEST_F(ServerTest, DepartingSenderAbortsTransfer)
{
    start();
    auto sender   = connect_and_join("share");
    auto receiver = connect_and_join("share");

    FileInitInfo info;
    info.transfer_id.fill(0x42);
    info.total_size = 1000;
    info.chunk_size = 100;
    info.filename   = "partial.dat";
    ASSERT_TRUE(sender->send_packet(PacketType::FileInit, build_routed_payload(room_route("share"), encode_file_init(info))));
    ASSERT_TRUE(wait_for(*receiver, PacketType::FileInit).has_value());

    sender->close();

    auto abort = wait_for(*receiver, PacketType::FileAbort);
    ASSERT_TRUE(abort.has_value());
    auto routed = parse_routed_payload(abort->payload, false);
    ASSERT_TRUE(routed.has_value());
    auto body = decode_file_abort(abort->payload.data() + routed->body_offset,
                                  abort->payload.size() - routed->body_offset);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->transfer_id, info.transfer_id);
    EXPECT_EQ(body->reason, AbortReason::SenderGone);
}

TEST_F(ServerTest, ConnectionLimit)
{
    ServerConfig config    = loopback_config();
    config.max_connections = 1;
    start(config);

    auto first = connect();
    ASSERT_TRUE(eventually([&] { return server_->connection_count() == 1; }));

    int fd = raw_connect(server_->port());
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(closed_by_server(fd));
    ::close(fd);
    EXPECT_EQ(server_->stats().connections_rejected, 1u);
}

TEST_F(ServerTest, StopClosesClients)
{
    start();
    auto client = connect_and_join("lobby");
    server_->stop();

    EXPECT_EQ(server_->connection_count(), 0u);
    EXPECT_FALSE(server_->running());
    EXPECT_FALSE(client->receive(kWaitMs).has_value());
    EXPECT_FALSE(client->connected());
}
