/*
 * AdaTP - bounded per-connection outbound queue
 */

#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace adatp {

// A packet waiting for the writer. The body is shared between every
// destination of a broadcast; the writer seals it under its own key.
struct OutboundItem {
    PacketHeader header;
    std::shared_ptr<const std::vector<uint8_t>> body;
    bool seal = true;
};

enum class EnqueueResult {
    Queued,
    DroppedNewest,
    DroppedOldest,
    Closed
};

class OutboundQueue {
public:
    OutboundQueue(std::size_t capacity, DropPolicy policy);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    // Never blocks. When full, the configured policy decides which packet
    // is discarded.
    EnqueueResult push(OutboundItem item);

    // Blocks until an item is available. After close() the remaining items
    // are still handed out, then nullopt.
    std::optional<OutboundItem> pop();

    void close();

    bool closed() const;
    std::size_t size() const;
    uint64_t dropped() const;

private:
    const std::size_t capacity_;
    const DropPolicy policy_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutboundItem> items_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

} // namespace adatp
