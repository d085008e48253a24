/*
 * AdaTP - connection actor
 *
 * One per accepted socket. The reader thread owns the handshake, the
 * receive side of the cipher and all dispatch; the writer thread drains the
 * outbound queue, sealing each item under the session's send key so that
 * wire order always matches sequence order. Other threads only reach a
 * connection through deliver() and close().
 */

#pragma once

#include "auth.hpp"
#include "config.hpp"
#include "file_transfer.hpp"
#include "handshake.hpp"
#include "outbound_queue.hpp"
#include "protocol.hpp"
#include "room_registry.hpp"
#include "router.hpp"
#include "session_cipher.hpp"
#include "stats.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace adatp {

enum class ConnectionState {
    Handshaking,
    Established,
    Closed
};

const char* connection_state_name(ConnectionState state);

// Shared server-wide collaborators. Every reference outlives all connections.
struct ServerContext {
    const ServerConfig& config;
    RoomRegistry& rooms;
    Router& router;
    FileTransferCoordinator& transfers;
    Authorizer& authorizer;
    ServerStats& stats;
};

struct ConnectionCounters {
    uint64_t packets_in = 0;
    uint64_t packets_out = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint64_t anomalies = 0;
};

class Connection : public PacketSink, public std::enable_shared_from_this<Connection> {
public:
    using CloseCallback = std::function<void(const std::shared_ptr<Connection>&)>;

    // Takes ownership of socket_fd.
    Connection(int socket_fd, std::string peer, ServerContext context);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Spawns the writer and a detached reader that keeps the connection
    // alive until cleanup finishes, then invokes on_closed.
    void start(CloseCallback on_closed);

    // Safe from any thread; only the first call has an effect.
    void close(const std::string& reason);

    DeliveryResult deliver(OutboundItem item) override;

    const SessionId& session_id() const { return session_id_; }
    const std::string& peer() const { return peer_; }
    ConnectionState state() const { return state_.load(); }
    bool authenticated() const { return authenticated_.load(); }
    std::string user_id() const;
    ConnectionCounters counters() const;

private:
    void reader_loop();
    void writer_loop();
    void finish();

    void process_packet(Packet packet);
    void handle_handshake(const Packet& packet);
    void handle_established(const Packet& packet);
    void handle_auth(const std::vector<uint8_t>& body);
    void handle_room_request(PacketType type, const std::vector<uint8_t>& body);
    void handle_routable(const PacketHeader& header, std::vector<uint8_t> plaintext);

    void join_room(const std::string& room);
    void announce(PacketType type, const std::string& room);
    void notify_transfer_abort(const Transfer& transfer, AbortReason reason, bool tell_sender);
    void send_room_status(RoomStatusCode code, const std::string& room);
    void send_control(PacketType type, std::vector<uint8_t> body);
    void set_receive_timeout(uint32_t timeout_ms);
    void request_close(const std::string& reason);

    int socket_fd_;
    std::string peer_;
    ServerContext ctx_;
    SessionId session_id_;
    std::string label_;

    std::atomic<ConnectionState> state_{ConnectionState::Handshaking};
    std::atomic<bool> closing_{false};
    std::atomic<bool> authenticated_{false};

    HandshakeEngine handshake_;
    std::unique_ptr<SessionCipher> cipher_;
    FrameReader reader_;
    OutboundQueue queue_;
    uint32_t auth_attempts_ = 0;

    mutable std::mutex identity_mutex_;
    std::string user_id_;
    std::string close_reason_;

    std::mutex socket_mutex_;
    bool registered_ = false;

    std::thread writer_thread_;
    CloseCallback on_closed_;

    std::atomic<uint64_t> packets_in_{0};
    std::atomic<uint64_t> packets_out_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> bytes_out_{0};
    std::atomic<uint64_t> anomalies_{0};
};

} // namespace adatp
