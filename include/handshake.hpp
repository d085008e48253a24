/*
 * AdaTP - key exchange handshake
 *
 *   client                                   server
 *   HANDSHAKE_INIT      client_pub   --->
 *                                     <---   HANDSHAKE_RESPONSE  server_pub
 *                                            (header carries the session id)
 *   HANDSHAKE_COMPLETE  seal(confirm) --->
 *
 * Both sides compute the X25519 shared secret and run HKDF-SHA256 with
 * salt = client_pub || server_pub and the labels "adatp/1 c2s",
 * "adatp/1 s2c" and "adatp/1 confirm". The COMPLETE payload is the
 * confirmation value SHA-256("adatp/1 confirm" || client_pub || server_pub)
 * sealed with the confirm key under an all-zero nonce, with the COMPLETE
 * header as AAD. The confirm key protects exactly one message.
 */

#pragma once

#include "crypto.hpp"
#include "protocol.hpp"
#include "session_cipher.hpp"

#include <optional>
#include <string>
#include <vector>

namespace adatp {

enum class HandshakeState {
    AwaitingInit,
    AwaitingComplete,
    Established,
    Failed
};

const char* handshake_state_name(HandshakeState state);

// Responder side, one per accepted connection.
class HandshakeEngine {
public:
    explicit HandshakeEngine(const SessionId& session_id);
    ~HandshakeEngine();

    HandshakeEngine(const HandshakeEngine&) = delete;
    HandshakeEngine& operator=(const HandshakeEngine&) = delete;

    // Feeds one packet received before the session is established. Returns
    // the HANDSHAKE_RESPONSE to send after a valid INIT. Any packet that
    // does not fit the current state moves the engine to Failed.
    std::optional<Packet> advance(const Packet& packet);

    HandshakeState state() const { return state_; }
    const std::string& failure_reason() const { return failure_reason_; }
    const SessionId& session_id() const { return session_id_; }

    // Server send = s2c, receive = c2s. Only valid once Established.
    SessionKeys take_keys();

private:
    std::optional<Packet> on_init(const Packet& packet);
    void on_complete(const Packet& packet);
    void fail(const std::string& reason);

    SessionId session_id_;
    HandshakeState state_ = HandshakeState::AwaitingInit;
    std::string failure_reason_;
    std::vector<uint8_t> client_to_server_;
    std::vector<uint8_t> server_to_client_;
    std::vector<uint8_t> confirm_key_;
    std::vector<uint8_t> expected_confirmation_;
};

// Initiator side, used by AdatpClient and the tests.
class ClientHandshake {
public:
    ClientHandshake();
    ~ClientHandshake();

    ClientHandshake(const ClientHandshake&) = delete;
    ClientHandshake& operator=(const ClientHandshake&) = delete;

    Packet start();

    // Returns HANDSHAKE_COMPLETE; nullopt (and Failed) on a bad response.
    std::optional<Packet> on_response(const Packet& response);

    HandshakeState state() const { return state_; }
    const std::string& failure_reason() const { return failure_reason_; }
    const SessionId& session_id() const { return session_id_; }

    // Client send = c2s, receive = s2c. Only valid once Established.
    SessionKeys take_keys();

private:
    void fail(const std::string& reason);

    KeyPair keys_;
    SessionId session_id_{};
    HandshakeState state_ = HandshakeState::AwaitingInit;
    std::string failure_reason_;
    std::vector<uint8_t> client_to_server_;
    std::vector<uint8_t> server_to_client_;
};

} // namespace adatp
