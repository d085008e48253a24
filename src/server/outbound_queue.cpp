/*
 * AdaTP - bounded per-connection outbound queue implementation
 */

#include "outbound_queue.hpp"

namespace adatp {

OutboundQueue::OutboundQueue(std::size_t capacity, DropPolicy policy)
    : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

EnqueueResult OutboundQueue::push(OutboundItem item) {
    EnqueueResult result = EnqueueResult::Queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return EnqueueResult::Closed;
        }
        if (items_.size() >= capacity_) {
            ++dropped_;
            if (policy_ == DropPolicy::DropNewest) {
                return EnqueueResult::DroppedNewest;
            }
            items_.pop_front();
            result = EnqueueResult::DroppedOldest;
        }
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return result;
}

std::optional<OutboundItem> OutboundQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    OutboundItem item = std::move(items_.front());
    items_.pop_front();
    return item;
}

void OutboundQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

uint64_t OutboundQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace adatp
