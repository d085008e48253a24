/*
 * AdaTP - server counters formatting
 */

#include "stats.hpp"

#include <sstream>

namespace adatp {

std::string format_stats(const StatsSnapshot& s) {
    std::ostringstream oss;
    oss << "connections accepted=" << s.connections_accepted << " rejected=" << s.connections_rejected
        << " active=" << s.active_connections << " sessions=" << s.sessions_established
        << " | packets in=" << s.packets_in << " out=" << s.packets_out << " | bytes in=" << s.bytes_in
        << " out=" << s.bytes_out << " | malformed=" << s.malformed_frames
        << " handshake_failures=" << s.handshake_failures << " auth_failures=" << s.auth_failures
        << " routing_misses=" << s.routing_misses << " backpressure_drops=" << s.backpressure_drops
        << " | transfers completed=" << s.transfers_completed << " aborted=" << s.transfers_aborted
        << " rejected=" << s.transfer_rejections;
    return oss.str();
}

} // namespace adatp
