/*
 * AdaTP - reference client implementation
 */

#include "client.hpp"

#include "utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace adatp {

namespace {
constexpr std::size_t kReadBufferSize = 64 * 1024;

std::string short_id(const SessionId& id) {
    return format_session_id(id).substr(0, 8);
}

std::string text_of(const std::vector<uint8_t>& data, std::size_t offset = 0) {
    if (offset >= data.size()) {
        return {};
    }
    return std::string(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end());
}
} // namespace

AdatpClient::AdatpClient() = default;

AdatpClient::~AdatpClient() {
    close();
}

bool AdatpClient::connect_to_server(const std::string& host, uint16_t port, int timeout_ms) {
    socket_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        log_error("socket() failed: " + std::string(std::strerror(errno)));
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        hostent* he = gethostbyname(host.c_str());
        if (!he || he->h_addrtype != AF_INET) {
            log_error("Unable to resolve host " + host);
            close();
            return false;
        }
        std::memcpy(&addr.sin_addr, he->h_addr, he->h_length);
    }

    if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error("connect() failed: " + std::string(std::strerror(errno)));
        close();
        return false;
    }

    ClientHandshake handshake;
    if (!send_wire(handshake.start())) {
        log_error("Failed to send HANDSHAKE_INIT");
        close();
        return false;
    }
    auto response = receive_raw(timeout_ms);
    if (!response.has_value()) {
        log_error("No HANDSHAKE_RESPONSE from server");
        close();
        return false;
    }
    auto complete = handshake.on_response(*response);
    if (!complete.has_value()) {
        log_error("Handshake failed: " + handshake.failure_reason());
        close();
        return false;
    }
    if (!send_wire(*complete)) {
        log_error("Failed to send HANDSHAKE_COMPLETE");
        close();
        return false;
    }

    session_id_ = handshake.session_id();
    cipher_ = std::make_unique<SessionCipher>(handshake.take_keys());
    connected_ = true;
    log_info("Connected to " + host + ":" + std::to_string(port) + " as session " + format_session_id(session_id_));
    return true;
}

bool AdatpClient::send_wire(const Packet& packet) {
    if (socket_fd_ < 0) {
        return false;
    }
    auto wire = encode_packet(packet);
    return send_all(socket_fd_, wire.data(), wire.size());
}

bool AdatpClient::send_packet(PacketType type, const std::vector<uint8_t>& plaintext, uint8_t flags) {
    if (!connected_ || !cipher_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    Packet packet;
    packet.header.type = type;
    packet.header.flags = flags;
    packet.header.session_id = session_id_;
    packet.header.timestamp = wall_clock_millis();
    packet.payload = cipher_->seal(packet.header, plaintext);
    return send_wire(packet);
}

bool AdatpClient::authenticate(const std::string& username, const std::string& password) {
    return send_packet(PacketType::AuthRequest, encode_auth_request(AuthRequestInfo{username, password}));
}

bool AdatpClient::create_room(const std::string& room, RoomVisibility visibility) {
    RoomRequest request;
    request.room = room;
    request.visibility = visibility;
    return send_packet(PacketType::CreateRoom, encode_room_request(PacketType::CreateRoom, request));
}

bool AdatpClient::join_room(const std::string& room) {
    RoomRequest request;
    request.room = room;
    return send_packet(PacketType::JoinRoom, encode_room_request(PacketType::JoinRoom, request));
}

bool AdatpClient::leave_room(const std::string& room) {
    RoomRequest request;
    request.room = room;
    return send_packet(PacketType::LeaveRoom, encode_room_request(PacketType::LeaveRoom, request));
}

bool AdatpClient::invite(const std::string& room, const SessionId& invitee) {
    RoomRequest request;
    request.room = room;
    request.invitee = invitee;
    return send_packet(PacketType::RoomInvite, encode_room_request(PacketType::RoomInvite, request));
}

bool AdatpClient::send_text(const std::string& room, const std::string& text, bool echo) {
    std::vector<uint8_t> body(text.begin(), text.end());
    return send_packet(PacketType::TextMessage, build_routed_payload(room_route(room), body), echo ? kFlagEcho : 0);
}

bool AdatpClient::send_direct(const SessionId& target, PacketType type, const std::vector<uint8_t>& body) {
    return send_packet(type, build_routed_payload(direct_route(target), body), kFlagDirect);
}

bool AdatpClient::send_file(const std::string& room, const std::string& path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log_error("Failed to open " + path);
        return false;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        log_error("Failed to stat " + path + ": " + ec.message());
        return false;
    }

    FileInitInfo info;
    auto id = random_bytes(info.transfer_id.size());
    std::copy(id.begin(), id.end(), info.transfer_id.begin());
    info.total_size = static_cast<uint64_t>(size);
    info.chunk_size = chunk_size;
    info.filename = std::filesystem::path(path).filename().string();

    const RoutePrefix route = room_route(room);
    if (!send_packet(PacketType::FileInit, build_routed_payload(route, encode_file_init(info)))) {
        return false;
    }

    std::vector<uint8_t> chunk(chunk_size);
    uint32_t index = 0;
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        std::vector<uint8_t> data(chunk.begin(), chunk.begin() + got);
        if (!send_packet(PacketType::FileChunk,
                         build_routed_payload(route, encode_file_chunk(info.transfer_id, index++, data)))) {
            return false;
        }
    }

    return send_packet(PacketType::FileComplete,
                       build_routed_payload(route, encode_file_complete(info.transfer_id)));
}

bool AdatpClient::disconnect() {
    return send_packet(PacketType::Disconnect, {});
}

std::optional<Packet> AdatpClient::receive_raw(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));
    std::vector<uint8_t> buffer(kReadBufferSize);

    for (;;) {
        DecodeResult result = reader_.next();
        if (result.status == DecodeStatus::Ok) {
            return std::move(result.packet);
        }
        if (is_malformed(result.status)) {
            log_warn(std::string("Malformed frame from server: ") + decode_status_name(result.status));
            connected_ = false;
            return std::nullopt;
        }
        if (socket_fd_ < 0) {
            return std::nullopt;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd pfd{};
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            connected_ = false;
            return std::nullopt;
        }
        if (rc == 0) {
            return std::nullopt;
        }

        ssize_t received = ::recv(socket_fd_, buffer.data(), buffer.size(), 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            connected_ = false;
            return std::nullopt;
        }
        reader_.feed(buffer.data(), static_cast<std::size_t>(received));
    }
}

std::optional<Packet> AdatpClient::receive(int timeout_ms) {
    for (;;) {
        auto packet = receive_raw(timeout_ms);
        if (!packet.has_value()) {
            return std::nullopt;
        }
        if ((packet->header.flags & kFlagEncrypted) == 0 || !cipher_) {
            return packet;
        }
        auto plaintext = cipher_->open(*packet);
        if (!plaintext.has_value()) {
            log_warn("Dropping packet that failed authentication (seq " +
                     std::to_string(packet->header.sequence) + ")");
            continue;
        }
        packet->payload = std::move(*plaintext);
        return packet;
    }
}

void AdatpClient::close() {
    running_ = false;
    connected_ = false;
    if (socket_fd_ >= 0) {
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
        reader_thread_.join();
    }
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void AdatpClient::run() {
    if (!connected_) {
        std::cerr << "Not connected to any server.\n";
        return;
    }

    running_ = true;
    reader_thread_ = std::thread(&AdatpClient::reader_loop, this);

    show_prompt();
    std::string line;
    while (running_ && std::getline(std::cin, line)) {
        process_user_input(line);
        if (!running_) {
            break;
        }
        show_prompt();
    }

    if (connected_) {
        disconnect();
    }
    close();
}

void AdatpClient::reader_loop() {
    while (running_) {
        auto packet = receive(250);
        if (packet.has_value()) {
            print_packet(*packet);
            continue;
        }
        if (!connected_) {
            log_warn("Server disconnected.");
            running_ = false;
            break;
        }
    }
}

void AdatpClient::print_packet(const Packet& packet) {
    const PacketHeader& header = packet.header;
    const std::string from = short_id(header.session_id);

    switch (header.type) {
        case PacketType::TextMessage: {
            bool direct = (header.flags & kFlagDirect) != 0;
            auto routed = parse_routed_payload(packet.payload, direct);
            if (!routed.has_value()) {
                return;
            }
            std::string where = direct ? "direct" : routed->route.room;
            std::cout << "\n[" << where << "] " << from << ": " << text_of(packet.payload, routed->body_offset)
                      << std::endl;
            break;
        }
        case PacketType::RoomStatus: {
            auto status = decode_room_status(packet.payload);
            if (!status.has_value()) {
                return;
            }
            if (status->code == RoomStatusCode::Joined || status->code == RoomStatusCode::Created) {
                std::lock_guard<std::mutex> lock(room_mutex_);
                current_room_ = status->room;
            } else if (status->code == RoomStatusCode::Left) {
                std::lock_guard<std::mutex> lock(room_mutex_);
                if (current_room_ == status->room) {
                    current_room_.clear();
                }
            }
            std::cout << "\n[room] " << status->room << ": " << room_status_name(status->code) << std::endl;
            break;
        }
        case PacketType::PeerJoined:
        case PacketType::PeerLeft: {
            auto event = decode_peer_event(packet.payload);
            if (!event.has_value()) {
                return;
            }
            std::string who = event->user_id.empty() ? from : event->user_id;
            std::cout << "\n[room] " << who << (header.type == PacketType::PeerJoined ? " joined " : " left ")
                      << event->room << std::endl;
            break;
        }
        case PacketType::AuthSuccess: {
            auto result = decode_auth_result(packet.payload);
            if (result.has_value()) {
                std::cout << "\n[auth] signed in as " << result->user_id << " (" << result->role << ")" << std::endl;
            }
            break;
        }
        case PacketType::AuthFailure:
            std::cout << "\n[auth] " << text_of(packet.payload) << std::endl;
            break;
        case PacketType::Error:
            std::cout << "\n[error] " << text_of(packet.payload) << std::endl;
            break;
        case PacketType::FileInit: {
            auto routed = parse_routed_payload(packet.payload, (header.flags & kFlagDirect) != 0);
            if (!routed.has_value()) {
                return;
            }
            auto info = decode_file_init(packet.payload.data() + routed->body_offset,
                                         packet.payload.size() - routed->body_offset);
            if (info.has_value()) {
                std::cout << "\n[file] " << from << " is sending " << info->filename << " (" << info->total_size
                          << " bytes)" << std::endl;
            }
            break;
        }
        case PacketType::FileComplete:
            std::cout << "\n[file] transfer from " << from << " complete" << std::endl;
            break;
        case PacketType::FileAbort: {
            auto routed = parse_routed_payload(packet.payload, (header.flags & kFlagDirect) != 0);
            if (!routed.has_value()) {
                return;
            }
            auto info = decode_file_abort(packet.payload.data() + routed->body_offset,
                                          packet.payload.size() - routed->body_offset);
            if (info.has_value()) {
                std::cout << "\n[file] transfer from " << from << " aborted: " << abort_reason_name(info->reason)
                          << std::endl;
            }
            break;
        }
        case PacketType::FileChunk:
            log_debug("Chunk from " + from);
            break;
        default:
            std::cout << "\n[" << packet_type_name(header.type) << "] from " << from << std::endl;
            break;
    }
}

void AdatpClient::process_user_input(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return;
    }
    if (trimmed == "/quit") {
        running_ = false;
        return;
    }
    if (trimmed == "/help") {
        std::cout << "\nCommands:\n"
                  << "  /auth <user> <password>   - authenticate\n"
                  << "  /create <room> [private]  - create a room\n"
                  << "  /join <room>              - join (or auto-create) a room\n"
                  << "  /leave [room]             - leave a room\n"
                  << "  /invite <room> <session>  - invite a session into a private room\n"
                  << "  /msg <session> <text>     - direct message\n"
                  << "  /sendfile <path>          - send a file to the current room\n"
                  << "  /whoami                   - show your session id\n"
                  << "  /quit                     - exit client\n"
                  << "  <text>                    - send message to current room\n";
        return;
    }
    if (trimmed == "/whoami") {
        std::cout << "\n" << format_session_id(session_id_) << std::endl;
        return;
    }

    auto parts = split(trimmed, ' ');
    const std::string& command = parts[0];
    std::string room;
    {
        std::lock_guard<std::mutex> lock(room_mutex_);
        room = current_room_;
    }

    if (command == "/auth") {
        if (parts.size() < 3) {
            std::cout << "\nUsage: /auth <user> <password>" << std::endl;
            return;
        }
        authenticate(parts[1], parts[2]);
        return;
    }
    if (command == "/create") {
        if (parts.size() < 2) {
            std::cout << "\nUsage: /create <room> [private]" << std::endl;
            return;
        }
        bool is_private = parts.size() >= 3 && parts[2] == "private";
        create_room(parts[1], is_private ? RoomVisibility::Private : RoomVisibility::Public);
        return;
    }
    if (command == "/join") {
        if (parts.size() < 2) {
            std::cout << "\nUsage: /join <room>" << std::endl;
            return;
        }
        join_room(parts[1]);
        return;
    }
    if (command == "/leave") {
        std::string target = parts.size() >= 2 ? parts[1] : room;
        if (target.empty()) {
            std::cout << "\nNot in a room." << std::endl;
            return;
        }
        leave_room(target);
        return;
    }
    if (command == "/invite") {
        auto invitee = parts.size() >= 3 ? parse_session_id(parts[2]) : std::nullopt;
        if (!invitee.has_value()) {
            std::cout << "\nUsage: /invite <room> <session-id>" << std::endl;
            return;
        }
        invite(parts[1], *invitee);
        return;
    }
    if (command == "/msg") {
        auto target = parts.size() >= 3 ? parse_session_id(parts[1]) : std::nullopt;
        if (!target.has_value()) {
            std::cout << "\nUsage: /msg <session-id> <text>" << std::endl;
            return;
        }
        std::string text = trim(trimmed.substr(trimmed.find(parts[1]) + parts[1].size()));
        send_direct(*target, PacketType::TextMessage, std::vector<uint8_t>(text.begin(), text.end()));
        return;
    }
    if (command == "/sendfile") {
        if (parts.size() < 2 || room.empty()) {
            std::cout << "\nUsage: /sendfile <path> (after joining a room)" << std::endl;
            return;
        }
        if (!send_file(room, parts[1])) {
            std::cout << "\nFailed to send " << parts[1] << std::endl;
        }
        return;
    }

    if (room.empty()) {
        std::cout << "\nJoin a room first with /join <room>" << std::endl;
        return;
    }
    if (!send_text(room, trimmed)) {
        log_warn("Failed to send chat message");
    }
}

void AdatpClient::show_prompt() {
    std::string room;
    {
        std::lock_guard<std::mutex> lock(room_mutex_);
        room = current_room_;
    }
    std::cout << "[" << (room.empty() ? "?" : room) << "]> " << std::flush;
}

} // namespace adatp
