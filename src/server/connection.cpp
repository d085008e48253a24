/*
 * AdaTP - connection actor implementation
 */

#include "connection.hpp"

#include "errors.hpp"
#include "messages.hpp"
#include "utils.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace adatp {

namespace {
constexpr std::size_t kReadBufferSize = 64 * 1024;

std::vector<uint8_t> text_body(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

timeval to_timeval(uint32_t timeout_ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    return tv;
}
} // namespace

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Handshaking:
            return "Handshaking";
        case ConnectionState::Established:
            return "Established";
        case ConnectionState::Closed:
            return "Closed";
    }
    return "Unknown";
}

Connection::Connection(int socket_fd, std::string peer, ServerContext context)
    : socket_fd_(socket_fd),
      peer_(std::move(peer)),
      ctx_(context),
      session_id_(generate_session_id()),
      label_(peer_ + " [" + format_session_id(session_id_).substr(0, 8) + "]"),
      handshake_(session_id_),
      reader_(context.config.max_payload_size),
      queue_(context.config.outbound_queue_capacity, context.config.drop_policy) {}

Connection::~Connection() {
    queue_.close();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void Connection::start(CloseCallback on_closed) {
    on_closed_ = std::move(on_closed);

    if (ctx_.config.write_timeout_ms > 0) {
        timeval tv = to_timeval(ctx_.config.write_timeout_ms);
        if (::setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            log_warn("Failed to set send timeout for " + label_ + ": " + std::strerror(errno));
        }
    }

    writer_thread_ = std::thread(&Connection::writer_loop, this);
    auto self = shared_from_this();
    std::thread([self] { self->reader_loop(); }).detach();
}

void Connection::close(const std::string& reason) {
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
        return;
    }
    log_debug("Closing " + label_ + " in state " + connection_state_name(state_.load()) + ": " + reason);
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        close_reason_ = reason;
    }
    state_ = ConnectionState::Closed;
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        if (socket_fd_ >= 0) {
            ::shutdown(socket_fd_, SHUT_RDWR);
        }
    }
    queue_.close();
}

void Connection::request_close(const std::string& reason) {
    // Stops the reader without shutting the socket down, so anything already
    // queued (a final AUTH_FAILURE, say) is still flushed by the writer.
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        close_reason_ = reason;
    }
    state_ = ConnectionState::Closed;
}

DeliveryResult Connection::deliver(OutboundItem item) {
    if (state_.load() == ConnectionState::Closed) {
        return DeliveryResult::Closed;
    }
    switch (queue_.push(std::move(item))) {
        case EnqueueResult::Queued:
            return DeliveryResult::Queued;
        case EnqueueResult::DroppedNewest:
        case EnqueueResult::DroppedOldest:
            return DeliveryResult::Dropped;
        case EnqueueResult::Closed:
            break;
    }
    return DeliveryResult::Closed;
}

std::string Connection::user_id() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return user_id_;
}

ConnectionCounters Connection::counters() const {
    ConnectionCounters counters;
    counters.packets_in = packets_in_.load();
    counters.packets_out = packets_out_.load();
    counters.bytes_in = bytes_in_.load();
    counters.bytes_out = bytes_out_.load();
    counters.anomalies = anomalies_.load();
    return counters;
}

void Connection::reader_loop() {
    log_info("Client connected " + label_);
    set_receive_timeout(ctx_.config.handshake_timeout_ms);

    std::vector<uint8_t> buffer(kReadBufferSize);
    try {
        while (!closing_) {
            ssize_t received = ::recv(socket_fd_, buffer.data(), buffer.size(), 0);
            if (received == 0) {
                request_close("peer closed the connection");
                break;
            }
            if (received < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if ((errno == EAGAIN || errno == EWOULDBLOCK) && state_ == ConnectionState::Handshaking) {
                    throw ProtocolError(ErrorKind::HandshakeFailure, "handshake timed out");
                }
                request_close(std::string("receive failed: ") + std::strerror(errno));
                break;
            }

            bytes_in_ += static_cast<uint64_t>(received);
            ctx_.stats.bytes_in += static_cast<uint64_t>(received);
            reader_.feed(buffer.data(), static_cast<std::size_t>(received));

            while (!closing_) {
                DecodeResult result = reader_.next();
                if (result.status == DecodeStatus::NeedMoreData) {
                    break;
                }
                if (is_malformed(result.status)) {
                    throw ProtocolError(ErrorKind::MalformedFrame, decode_status_name(result.status));
                }
                process_packet(std::move(*result.packet));
            }
        }
    } catch (const ProtocolError& ex) {
        ctx_.stats.record(ex.kind());
        log_warn("Closing " + label_ + ": " + ex.what());
        request_close(ex.what());
    } catch (const std::exception& ex) {
        log_error("Connection " + label_ + " failed: " + ex.what());
        request_close(ex.what());
    }

    finish();
}

void Connection::writer_loop() {
    static const std::vector<uint8_t> kEmpty;

    while (auto item = queue_.pop()) {
        PacketHeader header = item->header;
        const std::vector<uint8_t>& body = item->body ? *item->body : kEmpty;

        std::vector<uint8_t> payload;
        if (item->seal) {
            if (!cipher_) {
                log_error("Dropping sealed " + std::string(packet_type_name(header.type)) + " for " + label_ +
                          ": no session keys");
                continue;
            }
            payload = cipher_->seal(header, body);
        } else {
            payload = body;
            header.payload_length = static_cast<uint32_t>(payload.size());
        }

        std::vector<uint8_t> wire(kHeaderSize + payload.size());
        encode_header(header, static_cast<uint32_t>(payload.size()), wire.data());
        std::copy(payload.begin(), payload.end(), wire.begin() + kHeaderSize);

        if (!send_all(socket_fd_, wire.data(), wire.size())) {
            close("send failed");
            break;
        }
        ++packets_out_;
        bytes_out_ += wire.size();
        ++ctx_.stats.packets_out;
        ctx_.stats.bytes_out += wire.size();
    }
}

void Connection::finish() {
    closing_ = true;
    state_ = ConnectionState::Closed;

    if (registered_) {
        ctx_.router.unregister_session(session_id_);
        for (const auto& room : ctx_.rooms.leave_all(session_id_)) {
            announce(PacketType::PeerLeft, room);
        }
        for (const auto& transfer : ctx_.transfers.abort_all_from(session_id_)) {
            notify_transfer_abort(transfer, AbortReason::SenderGone, false);
        }
    }

    queue_.close();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        if (socket_fd_ >= 0) {
            ::shutdown(socket_fd_, SHUT_RDWR);
            ::close(socket_fd_);
            socket_fd_ = -1;
        }
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        reason = close_reason_;
    }
    log_info("Client disconnected " + label_ + (reason.empty() ? "" : " (" + reason + ")"));

    if (on_closed_) {
        on_closed_(shared_from_this());
    }
}

void Connection::process_packet(Packet packet) {
    ++packets_in_;
    ++ctx_.stats.packets_in;
    if (state_ == ConnectionState::Handshaking) {
        handle_handshake(packet);
    } else {
        handle_established(packet);
    }
}

void Connection::handle_handshake(const Packet& packet) {
    auto reply = handshake_.advance(packet);
    log_debug(label_ + " handshake " + handshake_state_name(handshake_.state()));
    if (handshake_.state() == HandshakeState::Failed) {
        throw ProtocolError(ErrorKind::HandshakeFailure, handshake_.failure_reason());
    }

    if (reply.has_value()) {
        OutboundItem item;
        item.header = reply->header;
        item.body = std::make_shared<const std::vector<uint8_t>>(std::move(reply->payload));
        item.seal = false;
        if (queue_.push(std::move(item)) != EnqueueResult::Queued) {
            throw ProtocolError(ErrorKind::HandshakeFailure, "could not queue handshake response");
        }
    }

    if (handshake_.state() != HandshakeState::Established) {
        return;
    }

    cipher_ = std::make_unique<SessionCipher>(handshake_.take_keys());
    ConnectionState expected = ConnectionState::Handshaking;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Established)) {
        return;
    }
    set_receive_timeout(0);
    ctx_.router.register_session(session_id_, shared_from_this());
    registered_ = true;
    ++ctx_.stats.sessions_established;
    log_info("Session established " + label_ + " session=" + format_session_id(session_id_));

    if (!ctx_.config.require_auth && !ctx_.config.default_room.empty()) {
        join_room(ctx_.config.default_room);
    }
}

void Connection::handle_established(const Packet& packet) {
    std::optional<std::vector<uint8_t>> plaintext;
    if (packet.header.session_id != session_id_) {
        cipher_->record_anomaly();
        log_debug(label_ + " sent a packet for session " + format_session_id(packet.header.session_id));
    } else {
        plaintext = cipher_->open(packet);
    }
    if (!plaintext.has_value()) {
        anomalies_ = cipher_->anomalies();
        if (cipher_->anomalies() > ctx_.config.anomaly_threshold) {
            throw ProtocolError(ErrorKind::AuthFailure, "anomaly threshold exceeded");
        }
        ctx_.stats.record(ErrorKind::AuthFailure);
        log_warn("Rejected " + std::string(packet_type_name(packet.header.type)) + " seq=" +
                 std::to_string(packet.header.sequence) + " from " + label_);
        return;
    }

    const PacketType type = packet.header.type;
    switch (type) {
        case PacketType::HandshakeInit:
        case PacketType::HandshakeResponse:
        case PacketType::HandshakeComplete:
            throw ProtocolError(ErrorKind::HandshakeFailure, "handshake packet on an established session");
        case PacketType::AuthRequest:
            handle_auth(*plaintext);
            return;
        case PacketType::CreateRoom:
        case PacketType::JoinRoom:
        case PacketType::LeaveRoom:
        case PacketType::RoomInvite:
            handle_room_request(type, *plaintext);
            return;
        case PacketType::Disconnect:
            request_close("peer disconnected");
            return;
        default:
            break;
    }

    if (!is_routable(type)) {
        log_warn("Ignoring unexpected " + std::string(packet_type_name(type)) + " from " + label_);
        return;
    }
    if (ctx_.config.require_auth && !authenticated_) {
        log_warn("Dropping " + std::string(packet_type_name(type)) + " from unauthenticated " + label_);
        send_control(PacketType::Error, text_body("authentication required"));
        return;
    }
    handle_routable(packet.header, std::move(*plaintext));
}

void Connection::handle_auth(const std::vector<uint8_t>& body) {
    if (authenticated_) {
        send_control(PacketType::AuthFailure, text_body("already authenticated"));
        return;
    }

    AuthDecision decision;
    auto request = decode_auth_request(body);
    if (request.has_value()) {
        try {
            decision = ctx_.authorizer.authorize(request->username, request->password);
        } catch (const std::exception& ex) {
            log_error("Authorizer failed for " + label_ + ": " + ex.what());
            decision = AuthDecision{};
        }
    }

    if (decision.authorized) {
        {
            std::lock_guard<std::mutex> lock(identity_mutex_);
            user_id_ = decision.user_id;
        }
        authenticated_ = true;
        send_control(PacketType::AuthSuccess, encode_auth_result(AuthResultInfo{decision.user_id, decision.role}));
        log_info(label_ + " authenticated as " + decision.user_id + " (" + decision.role + ")");
        if (ctx_.config.require_auth && !ctx_.config.default_room.empty()) {
            join_room(ctx_.config.default_room);
        }
        return;
    }

    ++auth_attempts_;
    ctx_.stats.record(ErrorKind::AuthFailure);
    send_control(PacketType::AuthFailure, text_body(request.has_value() ? "invalid credentials" : "malformed request"));
    log_warn("Authentication failed for " + label_ + " (attempt " + std::to_string(auth_attempts_) + ")");
    if (auth_attempts_ >= ctx_.config.max_auth_attempts) {
        request_close("too many authentication attempts");
    }
}

void Connection::handle_room_request(PacketType type, const std::vector<uint8_t>& body) {
    auto request = decode_room_request(type, body);
    if (!request.has_value()) {
        send_room_status(RoomStatusCode::InvalidName, "");
        return;
    }
    const std::string& room = request->room;
    if (ctx_.config.require_auth && !authenticated_) {
        send_room_status(RoomStatusCode::Unauthenticated, room);
        return;
    }

    switch (type) {
        case PacketType::CreateRoom:
            switch (ctx_.rooms.create(room, request->visibility, session_id_)) {
                case CreateResult::Created:
                    send_room_status(RoomStatusCode::Created, room);
                    break;
                case CreateResult::AlreadyExists:
                    send_room_status(RoomStatusCode::AlreadyExists, room);
                    break;
                case CreateResult::InvalidName:
                    send_room_status(RoomStatusCode::InvalidName, room);
                    break;
            }
            break;
        case PacketType::JoinRoom:
            join_room(room);
            break;
        case PacketType::LeaveRoom:
            switch (ctx_.rooms.leave(room, session_id_)) {
                case LeaveResult::Left:
                    send_room_status(RoomStatusCode::Left, room);
                    announce(PacketType::PeerLeft, room);
                    break;
                case LeaveResult::NotMember:
                    send_room_status(RoomStatusCode::NotMember, room);
                    break;
                case LeaveResult::NotFound:
                    send_room_status(RoomStatusCode::NotFound, room);
                    break;
            }
            break;
        case PacketType::RoomInvite:
            switch (ctx_.rooms.invite(room, session_id_, request->invitee)) {
                case InviteResult::Invited: {
                    send_room_status(RoomStatusCode::Invited, room);
                    PacketHeader header;
                    header.type = PacketType::RoomStatus;
                    header.session_id = session_id_;
                    header.timestamp = wall_clock_millis();
                    auto notice = std::make_shared<const std::vector<uint8_t>>(
                        encode_room_status(RoomStatusInfo{RoomStatusCode::Invited, room}));
                    ctx_.router.notify_session(request->invitee, header, notice);
                    break;
                }
                case InviteResult::NotFound:
                    send_room_status(RoomStatusCode::NotFound, room);
                    break;
                case InviteResult::NotMember:
                    send_room_status(RoomStatusCode::NotMember, room);
                    break;
            }
            break;
        default:
            break;
    }
}

void Connection::handle_routable(const PacketHeader& header, std::vector<uint8_t> plaintext) {
    auto routed = parse_routed_payload(plaintext, (header.flags & kFlagDirect) != 0);
    if (!routed.has_value()) {
        ctx_.stats.record(ErrorKind::RoutingMiss);
        log_warn("Dropping " + std::string(packet_type_name(header.type)) + " from " + label_ +
                 ": bad route prefix");
        return;
    }
    const RoutePrefix route = routed->route;
    const uint8_t* body = plaintext.data() + routed->body_offset;
    const std::size_t body_len = plaintext.size() - routed->body_offset;

    switch (header.type) {
        case PacketType::FileInit: {
            auto info = decode_file_init(body, body_len);
            if (!info.has_value()) {
                ++ctx_.stats.transfer_rejections;
                log_warn("Rejected malformed FILE_INIT from " + label_);
                return;
            }
            bool reachable = route.direct ? ctx_.router.find(route.target) != nullptr
                                          : ctx_.rooms.is_member(route.room, session_id_);
            if (!reachable) {
                ctx_.stats.record(ErrorKind::RoutingMiss);
                log_warn("Rejected FILE_INIT from " + label_ + ": no such recipient");
                return;
            }
            InitVerdict verdict = ctx_.transfers.on_init(session_id_, *info, route);
            if (verdict != InitVerdict::Accepted) {
                log_warn("Rejected FILE_INIT from " + label_ + ": " + init_verdict_name(verdict));
                return;
            }
            break;
        }
        case PacketType::FileChunk: {
            auto chunk = decode_file_chunk(body, body_len);
            if (!chunk.has_value()) {
                ++ctx_.stats.transfer_rejections;
                log_warn("Rejected malformed FILE_CHUNK from " + label_);
                return;
            }
            ChunkVerdict verdict = ctx_.transfers.on_chunk(session_id_, route, *chunk);
            if (verdict != ChunkVerdict::Accepted) {
                log_warn("Rejected FILE_CHUNK #" + std::to_string(chunk->index) + " from " + label_ + ": " +
                         chunk_verdict_name(verdict));
                return;
            }
            break;
        }
        case PacketType::FileComplete: {
            auto id = decode_file_complete(body, body_len);
            if (!id.has_value()) {
                ++ctx_.stats.transfer_rejections;
                return;
            }
            auto transfer = ctx_.transfers.on_complete(session_id_, route, *id);
            if (!transfer.has_value()) {
                log_warn("FILE_COMPLETE for unknown transfer from " + label_);
                return;
            }
            if (transfer->state == TransferState::Aborted) {
                notify_transfer_abort(*transfer, AbortReason::SizeMismatch, true);
                return;
            }
            break;
        }
        case PacketType::FileAbort: {
            auto info = decode_file_abort(body, body_len);
            if (!info.has_value() || !ctx_.transfers.on_abort(session_id_, route, info->transfer_id).has_value()) {
                log_warn("Ignoring FILE_ABORT from " + label_);
                return;
            }
            break;
        }
        default:
            break;
    }

    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(plaintext));
    RouteOutcome outcome = ctx_.router.route(session_id_, header, std::move(shared), route);
    if (outcome.rejected) {
        log_debug("No route for " + std::string(packet_type_name(header.type)) + " from " + label_);
    }
}

void Connection::join_room(const std::string& room) {
    switch (ctx_.rooms.join(room, session_id_)) {
        case JoinResult::Joined:
            send_room_status(RoomStatusCode::Joined, room);
            announce(PacketType::PeerJoined, room);
            break;
        case JoinResult::AlreadyMember:
            send_room_status(RoomStatusCode::AlreadyMember, room);
            break;
        case JoinResult::NotInvited:
            send_room_status(RoomStatusCode::NotInvited, room);
            break;
        case JoinResult::InvalidName:
            send_room_status(RoomStatusCode::InvalidName, room);
            break;
    }
}

void Connection::announce(PacketType type, const std::string& room) {
    PacketHeader header;
    header.type = type;
    header.session_id = session_id_;
    header.timestamp = wall_clock_millis();
    auto body = std::make_shared<const std::vector<uint8_t>>(encode_peer_event(room, user_id()));
    ctx_.router.notify_room(room, header, body, session_id_);
}

void Connection::notify_transfer_abort(const Transfer& transfer, AbortReason reason, bool tell_sender) {
    PacketHeader header;
    header.type = PacketType::FileAbort;
    header.session_id = transfer.sender;
    header.timestamp = wall_clock_millis();
    header.flags = transfer.target.direct ? kFlagDirect : 0;
    auto body = std::make_shared<const std::vector<uint8_t>>(
        build_routed_payload(transfer.target, encode_file_abort(FileAbortInfo{transfer.id, reason})));

    if (transfer.target.direct) {
        ctx_.router.notify_session(transfer.target.target, header, body);
    } else {
        ctx_.router.notify_room(transfer.target.room, header, body, transfer.sender);
    }

    if (tell_sender) {
        OutboundItem item;
        item.header = header;
        item.body = body;
        if (deliver(std::move(item)) == DeliveryResult::Dropped) {
            ctx_.stats.record(ErrorKind::BackpressureDrop);
        }
    }
}

void Connection::send_room_status(RoomStatusCode code, const std::string& room) {
    send_control(PacketType::RoomStatus, encode_room_status(RoomStatusInfo{code, room}));
}

void Connection::send_control(PacketType type, std::vector<uint8_t> body) {
    OutboundItem item;
    item.header.type = type;
    item.header.session_id = session_id_;
    item.header.timestamp = wall_clock_millis();
    item.body = std::make_shared<const std::vector<uint8_t>>(std::move(body));
    if (deliver(std::move(item)) == DeliveryResult::Dropped) {
        ctx_.stats.record(ErrorKind::BackpressureDrop);
    }
}

void Connection::set_receive_timeout(uint32_t timeout_ms) {
    timeval tv = to_timeval(timeout_ms);
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        log_warn("Failed to set receive timeout for " + label_ + ": " + std::strerror(errno));
    }
}

} // namespace adatp
