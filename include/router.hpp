/*
 * AdaTP - routing and broadcast engine
 *
 * Maps session ids to live connections and fans decrypted packets out to
 * room members or a single direct target. The plaintext body is shared
 * between every destination; each destination's writer seals its own copy.
 */

#pragma once

#include "messages.hpp"
#include "outbound_queue.hpp"
#include "protocol.hpp"
#include "room_registry.hpp"
#include "stats.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace adatp {

enum class DeliveryResult {
    Queued,
    Dropped,
    Closed
};

// Anything that can accept outbound packets for one session.
class PacketSink {
public:
    virtual ~PacketSink() = default;

    // Must not block.
    virtual DeliveryResult deliver(OutboundItem item) = 0;
};

struct RouteOutcome {
    bool rejected = false;
    std::size_t attempted = 0;
    std::size_t delivered = 0;
    std::size_t dropped = 0;
    std::size_t missed = 0;
};

class Router {
public:
    Router(RoomRegistry& rooms, ServerStats& stats);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void register_session(const SessionId& id, const std::shared_ptr<PacketSink>& sink);
    void unregister_session(const SessionId& id);
    std::shared_ptr<PacketSink> find(const SessionId& id) const;
    std::size_t session_count() const;

    // Forwards a packet a peer sent. Room traffic requires the sender to be
    // a member and skips the sender unless kFlagEcho is set. The forwarded
    // header keeps the sender's session id, type, flags and timestamp.
    RouteOutcome route(const SessionId& sender,
                       const PacketHeader& header,
                       std::shared_ptr<const std::vector<uint8_t>> plaintext,
                       const RoutePrefix& route);

    // Server-originated notices (peer events, transfer aborts). No
    // membership check.
    RouteOutcome notify_room(const std::string& room,
                             const PacketHeader& header,
                             std::shared_ptr<const std::vector<uint8_t>> body,
                             const std::optional<SessionId>& exclude = std::nullopt);

    RouteOutcome notify_session(const SessionId& target,
                                const PacketHeader& header,
                                std::shared_ptr<const std::vector<uint8_t>> body);

    void clear();

private:
    void deliver_to(const SessionId& target,
                    const PacketHeader& header,
                    const std::shared_ptr<const std::vector<uint8_t>>& body,
                    RouteOutcome& outcome);

    RoomRegistry& rooms_;
    ServerStats& stats_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<SessionId, std::weak_ptr<PacketSink>, SessionIdHash> sessions_;
};

} // namespace adatp
