#include <gtest/gtest.h>

#include "outbound_queue.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace adatp;

namespace
{
OutboundItem item(uint64_t tag)
{
    OutboundItem it;
    it.header.type      = PacketType::TextMessage;
    it.header.timestamp = tag;
    it.body             = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{1, 2, 3});
    return it;
}
}  // namespace

TEST(OutboundQueue, PreservesOrder)
{
    OutboundQueue q(8, DropPolicy::DropNewest);
    for (uint64_t i = 0; i < 5; ++i)
        EXPECT_EQ(q.push(item(i)), EnqueueResult::Queued);
    for (uint64_t i = 0; i < 5; ++i)
    {
        auto got = q.pop();
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(got->header.timestamp, i);
    }
}

TEST(OutboundQueue, DropNewestKeepsBacklog)
{
    OutboundQueue q(2, DropPolicy::DropNewest);
    q.push(item(1));
    q.push(item(2));
    EXPECT_EQ(q.push(item(3)), EnqueueResult::DroppedNewest);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.dropped(), 1u);
    EXPECT_EQ(q.pop()->header.timestamp, 1u);
    EXPECT_EQ(q.pop()->header.timestamp, 2u);
}

TEST(OutboundQueue, DropOldestKeepsLatest)
{
    OutboundQueue q(2, DropPolicy::DropOldest);
    q.push(item(1));
    q.push(item(2));
    EXPECT_EQ(q.push(item(3)), EnqueueResult::DroppedOldest);
    EXPECT_EQ(q.pop()->header.timestamp, 2u);
    EXPECT_EQ(q.pop()->header.timestamp, 3u);
}

TEST(OutboundQueue, CloseDrainsThenEnds)
{
    OutboundQueue q(4, DropPolicy::DropNewest);
    q.push(item(7));
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_EQ(q.push(item(8)), EnqueueResult::Closed);
    ASSERT_TRUE(q.pop().has_value());
    EXPECT_FALSE(q.pop().has_value());
}

TEST(OutboundQueue, CloseWakesBlockedConsumer)
{
    OutboundQueue q(4, DropPolicy::DropNewest);
    auto          waiter = std::async(std::launch::async, [&] { return q.pop().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q.close();
    ASSERT_EQ(waiter.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(waiter.get());
}
