/*
 * AdaTP - read-only server counters
 *
 * Shared by every connection; external metrics and administration tools
 * only ever read a snapshot.
 */

#pragma once

#include "errors.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace adatp {

struct StatsSnapshot {
    uint64_t connections_accepted = 0;
    uint64_t connections_rejected = 0;
    uint64_t active_connections = 0;
    uint64_t sessions_established = 0;
    uint64_t packets_in = 0;
    uint64_t packets_out = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint64_t malformed_frames = 0;
    uint64_t handshake_failures = 0;
    uint64_t auth_failures = 0;
    uint64_t routing_misses = 0;
    uint64_t backpressure_drops = 0;
    uint64_t transfers_completed = 0;
    uint64_t transfers_aborted = 0;
    uint64_t transfer_rejections = 0;
};

class ServerStats {
public:
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> connections_rejected{0};
    std::atomic<uint64_t> active_connections{0};
    std::atomic<uint64_t> sessions_established{0};
    std::atomic<uint64_t> packets_in{0};
    std::atomic<uint64_t> packets_out{0};
    std::atomic<uint64_t> bytes_in{0};
    std::atomic<uint64_t> bytes_out{0};
    std::atomic<uint64_t> malformed_frames{0};
    std::atomic<uint64_t> handshake_failures{0};
    std::atomic<uint64_t> auth_failures{0};
    std::atomic<uint64_t> routing_misses{0};
    std::atomic<uint64_t> backpressure_drops{0};
    std::atomic<uint64_t> transfers_completed{0};
    std::atomic<uint64_t> transfers_aborted{0};
    std::atomic<uint64_t> transfer_rejections{0};

    void record(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::MalformedFrame:
                ++malformed_frames;
                break;
            case ErrorKind::HandshakeFailure:
                ++handshake_failures;
                break;
            case ErrorKind::AuthFailure:
                ++auth_failures;
                break;
            case ErrorKind::RoutingMiss:
                ++routing_misses;
                break;
            case ErrorKind::TransferSizeMismatch:
                ++transfers_aborted;
                break;
            case ErrorKind::TransferOutOfRange:
                ++transfer_rejections;
                break;
            case ErrorKind::BackpressureDrop:
                ++backpressure_drops;
                break;
        }
    }

    StatsSnapshot snapshot() const {
        StatsSnapshot s;
        s.connections_accepted = connections_accepted.load();
        s.connections_rejected = connections_rejected.load();
        s.active_connections = active_connections.load();
        s.sessions_established = sessions_established.load();
        s.packets_in = packets_in.load();
        s.packets_out = packets_out.load();
        s.bytes_in = bytes_in.load();
        s.bytes_out = bytes_out.load();
        s.malformed_frames = malformed_frames.load();
        s.handshake_failures = handshake_failures.load();
        s.auth_failures = auth_failures.load();
        s.routing_misses = routing_misses.load();
        s.backpressure_drops = backpressure_drops.load();
        s.transfers_completed = transfers_completed.load();
        s.transfers_aborted = transfers_aborted.load();
        s.transfer_rejections = transfer_rejections.load();
        return s;
    }
};

std::string format_stats(const StatsSnapshot& snapshot);

} // namespace adatp
