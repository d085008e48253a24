/*
 * AdaTP - key exchange handshake implementation
 */

#include "handshake.hpp"

#include "utils.hpp"

#include <stdexcept>

namespace adatp {

namespace {
constexpr const char* kLabelClientToServer = "adatp/1 c2s";
constexpr const char* kLabelServerToClient = "adatp/1 s2c";
constexpr const char* kLabelConfirm = "adatp/1 confirm";

struct DerivedSecrets {
    std::vector<uint8_t> client_to_server;
    std::vector<uint8_t> server_to_client;
    std::vector<uint8_t> confirm_key;
    std::vector<uint8_t> confirmation;
};

DerivedSecrets derive_secrets(std::vector<uint8_t> shared,
                              const std::vector<uint8_t>& client_pub,
                              const std::vector<uint8_t>& server_pub) {
    std::vector<uint8_t> salt;
    salt.reserve(client_pub.size() + server_pub.size());
    salt.insert(salt.end(), client_pub.begin(), client_pub.end());
    salt.insert(salt.end(), server_pub.begin(), server_pub.end());

    DerivedSecrets secrets;
    secrets.client_to_server = hkdf_sha256(shared, salt, kLabelClientToServer, kAes256KeySize);
    secrets.server_to_client = hkdf_sha256(shared, salt, kLabelServerToClient, kAes256KeySize);
    secrets.confirm_key = hkdf_sha256(shared, salt, kLabelConfirm, kAes256KeySize);
    secure_wipe(shared);

    std::string label(kLabelConfirm);
    std::vector<uint8_t> transcript(label.begin(), label.end());
    transcript.insert(transcript.end(), salt.begin(), salt.end());
    secrets.confirmation = sha256(transcript);
    return secrets;
}

const std::array<uint8_t, kGcmNonceSize> kConfirmNonce{};
} // namespace

const char* handshake_state_name(HandshakeState state) {
    switch (state) {
        case HandshakeState::AwaitingInit:
            return "awaiting-init";
        case HandshakeState::AwaitingComplete:
            return "awaiting-complete";
        case HandshakeState::Established:
            return "established";
        case HandshakeState::Failed:
            return "failed";
    }
    return "unknown";
}

HandshakeEngine::HandshakeEngine(const SessionId& session_id) : session_id_(session_id) {}

HandshakeEngine::~HandshakeEngine() {
    secure_wipe(client_to_server_);
    secure_wipe(server_to_client_);
    secure_wipe(confirm_key_);
}

std::optional<Packet> HandshakeEngine::advance(const Packet& packet) {
    switch (state_) {
        case HandshakeState::AwaitingInit:
            if (packet.header.type != PacketType::HandshakeInit) {
                fail(std::string("expected HANDSHAKE_INIT, got ") + packet_type_name(packet.header.type));
                return std::nullopt;
            }
            return on_init(packet);
        case HandshakeState::AwaitingComplete:
            if (packet.header.type != PacketType::HandshakeComplete) {
                fail(std::string("expected HANDSHAKE_COMPLETE, got ") + packet_type_name(packet.header.type));
                return std::nullopt;
            }
            on_complete(packet);
            return std::nullopt;
        case HandshakeState::Established:
            fail("handshake packet after establishment");
            return std::nullopt;
        case HandshakeState::Failed:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Packet> HandshakeEngine::on_init(const Packet& packet) {
    if (packet.payload.size() != kX25519KeySize) {
        fail("client public key must be 32 bytes");
        return std::nullopt;
    }

    try {
        KeyPair server_keys = generate_x25519_keypair();
        auto shared = compute_x25519_shared(server_keys.private_key, packet.payload);
        auto secrets = derive_secrets(std::move(shared), packet.payload, server_keys.public_key);
        secure_wipe(server_keys.private_key);

        client_to_server_ = std::move(secrets.client_to_server);
        server_to_client_ = std::move(secrets.server_to_client);
        confirm_key_ = std::move(secrets.confirm_key);
        expected_confirmation_ = std::move(secrets.confirmation);

        state_ = HandshakeState::AwaitingComplete;
        return make_packet(PacketType::HandshakeResponse, session_id_, server_keys.public_key);
    } catch (const std::exception& ex) {
        fail(std::string("key agreement failed: ") + ex.what());
        return std::nullopt;
    }
}

void HandshakeEngine::on_complete(const Packet& packet) {
    if (packet.header.session_id != session_id_) {
        fail("HANDSHAKE_COMPLETE carries a foreign session id");
        return;
    }

    auto aad = encode_header(packet.header, static_cast<uint32_t>(packet.payload.size()));
    std::optional<std::vector<uint8_t>> confirmation;
    try {
        confirmation = aes256_gcm_open(confirm_key_,
                                       kConfirmNonce.data(),
                                       packet.payload.data(),
                                       packet.payload.size(),
                                       aad.data(),
                                       aad.size());
    } catch (const std::exception& ex) {
        fail(std::string("confirmation open failed: ") + ex.what());
        return;
    }
    secure_wipe(confirm_key_);

    if (!confirmation.has_value() || !constant_time_equal(*confirmation, expected_confirmation_)) {
        fail("confirmation value mismatch");
        return;
    }
    state_ = HandshakeState::Established;
}

SessionKeys HandshakeEngine::take_keys() {
    if (state_ != HandshakeState::Established) {
        throw std::logic_error("HandshakeEngine::take_keys before establishment");
    }
    SessionKeys keys;
    keys.send_key = std::move(server_to_client_);
    keys.recv_key = std::move(client_to_server_);
    return keys;
}

void HandshakeEngine::fail(const std::string& reason) {
    state_ = HandshakeState::Failed;
    failure_reason_ = reason;
    secure_wipe(client_to_server_);
    secure_wipe(server_to_client_);
    secure_wipe(confirm_key_);
}

ClientHandshake::ClientHandshake() = default;

ClientHandshake::~ClientHandshake() {
    secure_wipe(keys_.private_key);
    secure_wipe(client_to_server_);
    secure_wipe(server_to_client_);
}

Packet ClientHandshake::start() {
    if (state_ != HandshakeState::AwaitingInit) {
        throw std::logic_error("ClientHandshake::start called twice");
    }
    keys_ = generate_x25519_keypair();
    state_ = HandshakeState::AwaitingComplete;
    return make_packet(PacketType::HandshakeInit, SessionId{}, keys_.public_key);
}

std::optional<Packet> ClientHandshake::on_response(const Packet& response) {
    if (state_ != HandshakeState::AwaitingComplete) {
        fail("unexpected HANDSHAKE_RESPONSE");
        return std::nullopt;
    }
    if (response.header.type != PacketType::HandshakeResponse) {
        fail(std::string("expected HANDSHAKE_RESPONSE, got ") + packet_type_name(response.header.type));
        return std::nullopt;
    }
    if (response.payload.size() != kX25519KeySize || is_nil(response.header.session_id)) {
        fail("malformed HANDSHAKE_RESPONSE");
        return std::nullopt;
    }

    try {
        auto shared = compute_x25519_shared(keys_.private_key, response.payload);
        auto secrets = derive_secrets(std::move(shared), keys_.public_key, response.payload);
        secure_wipe(keys_.private_key);

        session_id_ = response.header.session_id;
        client_to_server_ = std::move(secrets.client_to_server);
        server_to_client_ = std::move(secrets.server_to_client);

        Packet complete = make_packet(PacketType::HandshakeComplete, session_id_, {}, kFlagEncrypted);
        const auto sealed_len = static_cast<uint32_t>(secrets.confirmation.size() + kGcmTagSize);
        complete.header.payload_length = sealed_len;
        auto aad = encode_header(complete.header, sealed_len);
        complete.payload = aes256_gcm_seal(secrets.confirm_key,
                                           kConfirmNonce.data(),
                                           secrets.confirmation.data(),
                                           secrets.confirmation.size(),
                                           aad.data(),
                                           aad.size());
        secure_wipe(secrets.confirm_key);

        state_ = HandshakeState::Established;
        return complete;
    } catch (const std::exception& ex) {
        fail(std::string("key agreement failed: ") + ex.what());
        return std::nullopt;
    }
}

SessionKeys ClientHandshake::take_keys() {
    if (state_ != HandshakeState::Established) {
        throw std::logic_error("ClientHandshake::take_keys before establishment");
    }
    SessionKeys keys;
    keys.send_key = std::move(client_to_server_);
    keys.recv_key = std::move(server_to_client_);
    return keys;
}

void ClientHandshake::fail(const std::string& reason) {
    state_ = HandshakeState::Failed;
    failure_reason_ = reason;
    secure_wipe(client_to_server_);
    secure_wipe(server_to_client_);
}

} // namespace adatp
