/*
 * AdaTP - reference client
 *
 * Connects, runs the initiator side of the handshake and then exchanges
 * sealed packets. receive() hands back packets whose payload is already
 * decrypted. run() is the interactive console used by adatp_client.
 */

#pragma once

#include "handshake.hpp"
#include "messages.hpp"
#include "protocol.hpp"
#include "session_cipher.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace adatp {

class AdatpClient {
public:
    AdatpClient();
    ~AdatpClient();

    AdatpClient(const AdatpClient&) = delete;
    AdatpClient& operator=(const AdatpClient&) = delete;

    // Connects and completes the handshake; false (with a logged reason)
    // otherwise.
    bool connect_to_server(const std::string& host, uint16_t port, int timeout_ms = 5000);

    bool connected() const { return connected_.load(); }
    const SessionId& session_id() const { return session_id_; }

    // Seals and sends one packet.
    bool send_packet(PacketType type, const std::vector<uint8_t>& plaintext, uint8_t flags = 0);

    bool authenticate(const std::string& username, const std::string& password);
    bool create_room(const std::string& room, RoomVisibility visibility = RoomVisibility::Public);
    bool join_room(const std::string& room);
    bool leave_room(const std::string& room);
    bool invite(const std::string& room, const SessionId& invitee);
    bool send_text(const std::string& room, const std::string& text, bool echo = false);
    bool send_direct(const SessionId& target, PacketType type, const std::vector<uint8_t>& body);

    // Announces, streams and completes a file to a room.
    bool send_file(const std::string& room, const std::string& path, uint32_t chunk_size = 16 * 1024);

    bool disconnect();

    // Next packet from the server with a decrypted payload; nullopt on
    // timeout or when the connection is gone.
    std::optional<Packet> receive(int timeout_ms);

    void run();
    void close();

private:
    std::optional<Packet> receive_raw(int timeout_ms);
    bool send_wire(const Packet& packet);
    void reader_loop();
    void print_packet(const Packet& packet);
    void process_user_input(const std::string& line);
    void show_prompt();

    int socket_fd_ = -1;
    SessionId session_id_{};
    std::unique_ptr<SessionCipher> cipher_;
    FrameReader reader_;
    std::mutex send_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread reader_thread_;

    std::mutex room_mutex_;
    std::string current_room_;
};

} // namespace adatp
