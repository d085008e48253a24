/*
 * AdaTP - routing and broadcast engine implementation
 */

#include "router.hpp"

#include "utils.hpp"

#include <mutex>

namespace adatp {

namespace {
PacketHeader forwarded_header(const PacketHeader& header) {
    PacketHeader out = header;
    out.sequence = 0;
    out.payload_length = 0;
    out.flags = static_cast<uint8_t>(header.flags & ~kFlagEncrypted);
    return out;
}
} // namespace

Router::Router(RoomRegistry& rooms, ServerStats& stats) : rooms_(rooms), stats_(stats) {}

void Router::register_session(const SessionId& id, const std::shared_ptr<PacketSink>& sink) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[id] = sink;
}

void Router::unregister_session(const SessionId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_.erase(id);
}

std::shared_ptr<PacketSink> Router::find(const SessionId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

std::size_t Router::session_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

RouteOutcome Router::route(const SessionId& sender,
                           const PacketHeader& header,
                           std::shared_ptr<const std::vector<uint8_t>> plaintext,
                           const RoutePrefix& route) {
    PacketHeader out = forwarded_header(header);
    out.session_id = sender;

    if (route.direct) {
        return notify_session(route.target, out, std::move(plaintext));
    }

    RouteOutcome outcome;
    if (!rooms_.is_member(route.room, sender)) {
        stats_.record(ErrorKind::RoutingMiss);
        log_debug("Dropping " + std::string(packet_type_name(header.type)) + " from " + format_session_id(sender) +
                  ": not a member of " + route.room);
        outcome.rejected = true;
        return outcome;
    }

    const bool echo = (header.flags & kFlagEcho) != 0;
    for (const auto& member : rooms_.members_of(route.room)) {
        if (member == sender && !echo) {
            continue;
        }
        deliver_to(member, out, plaintext, outcome);
    }
    return outcome;
}

RouteOutcome Router::notify_room(const std::string& room,
                                 const PacketHeader& header,
                                 std::shared_ptr<const std::vector<uint8_t>> body,
                                 const std::optional<SessionId>& exclude) {
    RouteOutcome outcome;
    PacketHeader out = forwarded_header(header);
    for (const auto& member : rooms_.members_of(room)) {
        if (exclude.has_value() && member == *exclude) {
            continue;
        }
        deliver_to(member, out, body, outcome);
    }
    return outcome;
}

RouteOutcome Router::notify_session(const SessionId& target,
                                    const PacketHeader& header,
                                    std::shared_ptr<const std::vector<uint8_t>> body) {
    RouteOutcome outcome;
    deliver_to(target, forwarded_header(header), body, outcome);
    if (outcome.missed != 0) {
        outcome.rejected = true;
    }
    return outcome;
}

void Router::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_.clear();
}

void Router::deliver_to(const SessionId& target,
                        const PacketHeader& header,
                        const std::shared_ptr<const std::vector<uint8_t>>& body,
                        RouteOutcome& outcome) {
    ++outcome.attempted;
    auto sink = find(target);
    if (!sink) {
        ++outcome.missed;
        stats_.record(ErrorKind::RoutingMiss);
        return;
    }

    OutboundItem item;
    item.header = header;
    item.body = body;
    item.seal = true;
    switch (sink->deliver(std::move(item))) {
        case DeliveryResult::Queued:
            ++outcome.delivered;
            break;
        case DeliveryResult::Dropped:
            ++outcome.dropped;
            stats_.record(ErrorKind::BackpressureDrop);
            break;
        case DeliveryResult::Closed:
            ++outcome.missed;
            stats_.record(ErrorKind::RoutingMiss);
            break;
    }
}

} // namespace adatp
