#include <gtest/gtest.h>

#include "room_registry.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace adatp;

TEST(RoomRegistry, JoinAutoCreatesPublicRoom)
{
    RoomRegistry rooms;
    SessionId    a = generate_session_id();

    EXPECT_FALSE(rooms.exists("lobby"));
    EXPECT_EQ(rooms.join("lobby", a), JoinResult::Joined);
    EXPECT_TRUE(rooms.exists("lobby"));
    EXPECT_TRUE(rooms.is_member("lobby", a));
    EXPECT_EQ(rooms.join("lobby", a), JoinResult::AlreadyMember);
    EXPECT_EQ(rooms.join("bad name", a), JoinResult::InvalidName);
}

TEST(RoomRegistry, AutoCreatedRoomDisappearsWhenEmpty)
{
    RoomRegistry rooms;
    SessionId    a = generate_session_id();
    SessionId    b = generate_session_id();

    rooms.join("lobby", a);
    rooms.join("lobby", b);
    EXPECT_EQ(rooms.members_of("lobby").size(), 2u);

    EXPECT_EQ(rooms.leave("lobby", a), LeaveResult::Left);
    EXPECT_TRUE(rooms.exists("lobby"));
    EXPECT_EQ(rooms.leave("lobby", a), LeaveResult::NotMember);
    EXPECT_EQ(rooms.leave("lobby", b), LeaveResult::Left);
    EXPECT_FALSE(rooms.exists("lobby"));
    EXPECT_EQ(rooms.leave("lobby", b), LeaveResult::NotFound);
    EXPECT_TRUE(rooms.members_of("lobby").empty());
}

TEST(RoomRegistry, ExplicitRoomsPersistWhenConfigured)
{
    RoomRegistry persistent(true);
    RoomRegistry transient(false);
    SessionId    a = generate_session_id();

    ASSERT_EQ(persistent.create("standup", RoomVisibility::Public, a), CreateResult::Created);
    ASSERT_EQ(transient.create("standup", RoomVisibility::Public, a), CreateResult::Created);
    persistent.leave("standup", a);
    transient.leave("standup", a);

    EXPECT_TRUE(persistent.exists("standup"));
    EXPECT_FALSE(transient.exists("standup"));
}

TEST(RoomRegistry, CreateRejectsDuplicates)
{
    RoomRegistry rooms;
    EXPECT_EQ(rooms.create("ops", RoomVisibility::Public), CreateResult::Created);
    EXPECT_EQ(rooms.create("ops", RoomVisibility::Private), CreateResult::AlreadyExists);
    EXPECT_EQ(rooms.create("", RoomVisibility::Public), CreateResult::InvalidName);
}

TEST(RoomRegistry, PrivateRoomRequiresInvite)
{
    RoomRegistry rooms;
    SessionId    owner    = generate_session_id();
    SessionId    guest    = generate_session_id();
    SessionId    stranger = generate_session_id();

    ASSERT_EQ(rooms.create("vault", RoomVisibility::Private, owner), CreateResult::Created);
    EXPECT_TRUE(rooms.is_member("vault", owner));

    EXPECT_EQ(rooms.join("vault", guest), JoinResult::NotInvited);
    EXPECT_EQ(rooms.invite("vault", stranger, guest), InviteResult::NotMember);
    EXPECT_EQ(rooms.invite("vault", owner, guest), InviteResult::Invited);
    EXPECT_EQ(rooms.join("vault", guest), JoinResult::Joined);
    EXPECT_EQ(rooms.join("vault", stranger), JoinResult::NotInvited);
    EXPECT_EQ(rooms.invite("nowhere", owner, guest), InviteResult::NotFound);
}

TEST(RoomRegistry, LeaveAllReportsRooms)
{
    RoomRegistry rooms;
    SessionId    a = generate_session_id();
    SessionId    b = generate_session_id();
    rooms.join("one", a);
    rooms.join("two", a);
    rooms.join("two", b);

    auto left = rooms.leave_all(a);
    std::sort(left.begin(), left.end());
    EXPECT_EQ(left, std::vector<std::string>({"one", "two"}));
    EXPECT_FALSE(rooms.exists("one"));
    EXPECT_EQ(rooms.members_of("two"), std::vector<SessionId>({b}));
}

TEST(RoomRegistry, ClearDropsEverything)
{
    RoomRegistry rooms(true);
    rooms.create("a", RoomVisibility::Public);
    rooms.join("b", generate_session_id());
    EXPECT_EQ(rooms.room_count(), 2u);
    rooms.clear();
    EXPECT_EQ(rooms.room_count(), 0u);
    EXPECT_TRUE(rooms.rooms().empty());
}

TEST(RoomRegistry, ConcurrentJoinLeaveKeepsMembershipConsistent)
{
    RoomRegistry           rooms;
    constexpr int          kThreads    = 8;
    constexpr int          kIterations = 500;
    std::vector<SessionId> ids;
    for (int i = 0; i < kThreads; ++i)
        ids.push_back(generate_session_id());

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i)
            {
                EXPECT_EQ(rooms.join("busy", ids[t]), JoinResult::Joined);
                EXPECT_TRUE(rooms.is_member("busy", ids[t]));
                EXPECT_EQ(rooms.leave("busy", ids[t]), LeaveResult::Left);
            }
        });
    }
    for (auto &w : workers)
        w.join();

    EXPECT_TRUE(rooms.members_of("busy").empty());
    EXPECT_FALSE(rooms.exists("busy"));
}
