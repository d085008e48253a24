/*
 * AdaTP - per-session authenticated encryption
 *
 * AES-256-GCM with one key per direction. The nonce is four zero bytes
 * followed by the packet's 64-bit big-endian sequence number, and the AAD is
 * the encoded 45-byte header, so every header field is authenticated.
 * Sequence numbers start at 1 for the first sealed packet in each direction.
 */

#pragma once

#include "crypto.hpp"
#include "protocol.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace adatp {

struct SessionKeys {
    std::vector<uint8_t> send_key;
    std::vector<uint8_t> recv_key;
};

std::array<uint8_t, kGcmNonceSize> nonce_for_sequence(uint64_t sequence);

class SessionCipher {
public:
    explicit SessionCipher(SessionKeys keys);
    ~SessionCipher();

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    // Takes the next send sequence, sets kFlagEncrypted and the payload
    // length on `header`, and returns ciphertext || tag.
    std::vector<uint8_t> seal(PacketHeader& header, const std::vector<uint8_t>& plaintext);

    // Encrypts packet.payload in place.
    void seal(Packet& packet);

    // Fails closed: a bad tag, a missing encryption flag or a sequence number
    // that is not above the last accepted one yields nullopt and counts an
    // anomaly. The receive counter only moves on success.
    std::optional<std::vector<uint8_t>> open(const Packet& packet);

    uint64_t send_sequence() const { return send_sequence_.load(); }
    uint64_t recv_sequence() const { return recv_sequence_.load(); }
    uint64_t anomalies() const { return anomalies_.load(); }

    // For packets the caller refuses before they reach open().
    void record_anomaly() { ++anomalies_; }

private:
    SessionKeys keys_;
    std::atomic<uint64_t> send_sequence_{0};
    std::atomic<uint64_t> recv_sequence_{0};
    std::atomic<uint64_t> anomalies_{0};
};

} // namespace adatp
