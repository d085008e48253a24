#include <gtest/gtest.h>

#include "messages.hpp"
#include "room_registry.hpp"
#include "router.hpp"
#include "stats.hpp"

#include <memory>
#include <mutex>
#include <vector>

using namespace adatp;

namespace
{
class FakeSink : public PacketSink
{
  public:
    explicit FakeSink(DeliveryResult result = DeliveryResult::Queued) : result_(result) {}

    DeliveryResult deliver(OutboundItem item) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result_ == DeliveryResult::Queued)
            items_.push_back(std::move(item));
        return result_;
    }

    std::vector<OutboundItem> items()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

  private:
    DeliveryResult            result_;
    std::mutex                mutex_;
    std::vector<OutboundItem> items_;
};

struct RouterFixture : ::testing::Test
{
    ServerStats  stats;
    RoomRegistry rooms;
    Router       router{rooms, stats};
    // The router only holds weak references; the fixture owns the sinks.
    std::vector<std::shared_ptr<FakeSink>> sinks;

    std::shared_ptr<FakeSink> add(const SessionId &id, const std::string &room,
                                  DeliveryResult result = DeliveryResult::Queued)
    {
        auto sink = std::make_shared<FakeSink>(result);
        sinks.push_back(sink);
        router.register_session(id, sink);
        if (!room.empty())
            rooms.join(room, id);
        return sink;
    }

    static PacketHeader text_header(uint8_t flags = kFlagEncrypted)
    {
        PacketHeader h;
        h.type      = PacketType::TextMessage;
        h.flags     = flags;
        h.sequence  = 42;
        h.timestamp = 1234;
        return h;
    }

    static std::shared_ptr<const std::vector<uint8_t>> body(const std::string &room, const std::string &text)
    {
        return std::make_shared<const std::vector<uint8_t>>(
            build_routed_payload(room_route(room), std::vector<uint8_t>(text.begin(), text.end())));
    }
};
}  // namespace

TEST_F(RouterFixture, RoomBroadcastSkipsSender)
{
    SessionId a = generate_session_id(), b = generate_session_id(), c = generate_session_id();
    auto      sa = add(a, "lobby");
    auto      sb = add(b, "lobby");
    auto      sc = add(c, "lobby");

    auto payload = body("lobby", "Hello");
    auto outcome = router.route(a, text_header(), payload, room_route("lobby"));

    EXPECT_FALSE(outcome.rejected);
    EXPECT_EQ(outcome.delivered, 2u);
    EXPECT_TRUE(sa->items().empty());
    ASSERT_EQ(sb->items().size(), 1u);
    ASSERT_EQ(sc->items().size(), 1u);

    const OutboundItem got = sb->items()[0];
    EXPECT_EQ(got.header.session_id, a);
    EXPECT_EQ(got.header.timestamp, 1234u);
    EXPECT_EQ(got.header.sequence, 0u);
    EXPECT_EQ(got.header.flags & kFlagEncrypted, 0);
    EXPECT_TRUE(got.seal);
    // The plaintext is shared, never copied per destination.
    EXPECT_EQ(got.body.get(), payload.get());
    EXPECT_EQ(sc->items()[0].body.get(), payload.get());
}

TEST_F(RouterFixture, EchoFlagIncludesSender)
{
    SessionId a = generate_session_id(), b = generate_session_id();
    auto      sa = add(a, "lobby");
    add(b, "lobby");

    auto outcome = router.route(a, text_header(kFlagEncrypted | kFlagEcho), body("lobby", "hi"), room_route("lobby"));
    EXPECT_EQ(outcome.delivered, 2u);
    EXPECT_EQ(sa->items().size(), 1u);
}

TEST_F(RouterFixture, NonMemberCannotBroadcast)
{
    SessionId a = generate_session_id(), b = generate_session_id();
    add(a, "");
    auto sb = add(b, "lobby");

    auto outcome = router.route(a, text_header(), body("lobby", "hi"), room_route("lobby"));
    EXPECT_TRUE(outcome.rejected);
    EXPECT_TRUE(sb->items().empty());
    EXPECT_EQ(stats.routing_misses.load(), 1u);
}

TEST_F(RouterFixture, DirectDeliveryAndMiss)
{
    SessionId a = generate_session_id(), b = generate_session_id();
    add(a, "");
    auto sb = add(b, "");

    auto ok = router.route(a, text_header(kFlagEncrypted | kFlagDirect),
                           std::make_shared<const std::vector<uint8_t>>(
                               build_routed_payload(direct_route(b), {'y', 'o'})),
                           direct_route(b));
    EXPECT_EQ(ok.delivered, 1u);
    ASSERT_EQ(sb->items().size(), 1u);
    EXPECT_TRUE(sb->items()[0].header.flags & kFlagDirect);

    auto miss = router.route(a, text_header(kFlagDirect), body("x", "y"), direct_route(generate_session_id()));
    EXPECT_TRUE(miss.rejected);
    EXPECT_EQ(miss.missed, 1u);
    EXPECT_EQ(stats.routing_misses.load(), 1u);
}

TEST_F(RouterFixture, ClosedOrFullDestinationDoesNotStopFanOut)
{
    SessionId a = generate_session_id(), b = generate_session_id(), c = generate_session_id(),
              d = generate_session_id();
    add(a, "lobby");
    add(b, "lobby", DeliveryResult::Closed);
    add(c, "lobby", DeliveryResult::Dropped);
    auto sd = add(d, "lobby");

    auto outcome = router.route(a, text_header(), body("lobby", "hi"), room_route("lobby"));
    EXPECT_EQ(outcome.attempted, 3u);
    EXPECT_EQ(outcome.delivered, 1u);
    EXPECT_EQ(outcome.missed, 1u);
    EXPECT_EQ(outcome.dropped, 1u);
    EXPECT_EQ(sd->items().size(), 1u);
    EXPECT_EQ(stats.backpressure_drops.load(), 1u);
    EXPECT_EQ(stats.routing_misses.load(), 1u);
}

TEST_F(RouterFixture, ExpiredSinkIsAMiss)
{
    SessionId a = generate_session_id(), b = generate_session_id();
    add(a, "lobby");
    {
        auto gone = std::make_shared<FakeSink>();
        router.register_session(b, gone);
        rooms.join("lobby", b);
    }
    auto outcome = router.route(a, text_header(), body("lobby", "hi"), room_route("lobby"));
    EXPECT_EQ(outcome.missed, 1u);
    EXPECT_EQ(outcome.delivered, 0u);
}

TEST_F(RouterFixture, ServerNoticesSkipMembershipCheck)
{
    SessionId a = generate_session_id(), b = generate_session_id();
    auto      sa = add(a, "lobby");
    auto      sb = add(b, "lobby");

    PacketHeader h;
    h.type       = PacketType::PeerJoined;
    h.session_id = b;
    auto notice  = std::make_shared<const std::vector<uint8_t>>(encode_peer_event("lobby", "bob"));

    auto outcome = router.notify_room("lobby", h, notice, b);
    EXPECT_EQ(outcome.delivered, 1u);
    ASSERT_EQ(sa->items().size(), 1u);
    EXPECT_EQ(sa->items()[0].header.session_id, b);
    EXPECT_TRUE(sb->items().empty());
}

TEST_F(RouterFixture, UnregisterRemovesSession)
{
    SessionId a = generate_session_id();
    add(a, "");
    EXPECT_EQ(router.session_count(), 1u);
    EXPECT_NE(router.find(a), nullptr);
    router.unregister_session(a);
    EXPECT_EQ(router.find(a), nullptr);
    EXPECT_EQ(router.session_count(), 0u);
}
