/*
 * AdaTP - per-session authenticated encryption implementation
 */

#include "session_cipher.hpp"

#include "byte_io.hpp"

#include <stdexcept>

namespace adatp {

std::array<uint8_t, kGcmNonceSize> nonce_for_sequence(uint64_t sequence) {
    std::array<uint8_t, kGcmNonceSize> nonce{};
    store_u64(nonce.data() + (kGcmNonceSize - 8), sequence);
    return nonce;
}

SessionCipher::SessionCipher(SessionKeys keys) : keys_(std::move(keys)) {
    if (keys_.send_key.size() != kAes256KeySize || keys_.recv_key.size() != kAes256KeySize) {
        throw std::invalid_argument("SessionCipher: keys must be 32 bytes");
    }
}

SessionCipher::~SessionCipher() {
    secure_wipe(keys_.send_key);
    secure_wipe(keys_.recv_key);
}

std::vector<uint8_t> SessionCipher::seal(PacketHeader& header, const std::vector<uint8_t>& plaintext) {
    header.sequence = ++send_sequence_;
    header.flags = static_cast<uint8_t>(header.flags | kFlagEncrypted);
    header.payload_length = static_cast<uint32_t>(plaintext.size() + kGcmTagSize);

    auto aad = encode_header(header, header.payload_length);
    auto nonce = nonce_for_sequence(header.sequence);
    return aes256_gcm_seal(keys_.send_key,
                           nonce.data(),
                           plaintext.data(),
                           plaintext.size(),
                           aad.data(),
                           aad.size());
}

void SessionCipher::seal(Packet& packet) {
    auto sealed = seal(packet.header, packet.payload);
    secure_wipe(packet.payload);
    packet.payload = std::move(sealed);
}

std::optional<std::vector<uint8_t>> SessionCipher::open(const Packet& packet) {
    const PacketHeader& header = packet.header;
    if ((header.flags & kFlagEncrypted) == 0 || header.sequence <= recv_sequence_.load()) {
        ++anomalies_;
        return std::nullopt;
    }

    auto aad = encode_header(header, static_cast<uint32_t>(packet.payload.size()));
    auto nonce = nonce_for_sequence(header.sequence);
    auto plaintext = aes256_gcm_open(keys_.recv_key,
                                     nonce.data(),
                                     packet.payload.data(),
                                     packet.payload.size(),
                                     aad.data(),
                                     aad.size());
    if (!plaintext.has_value()) {
        ++anomalies_;
        return std::nullopt;
    }
    recv_sequence_ = header.sequence;
    return plaintext;
}

} // namespace adatp
