/*
 * AdaTP - cryptographic helpers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adatp {

constexpr std::size_t kX25519KeySize = 32;
constexpr std::size_t kAes256KeySize = 32;
constexpr std::size_t kGcmNonceSize = 12;
constexpr std::size_t kGcmTagSize = 16;
constexpr std::size_t kSha256Size = 32;

struct KeyPair {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> private_key;
};

KeyPair generate_x25519_keypair();

// Throws std::runtime_error when the peer key yields an all-zero secret.
std::vector<uint8_t> compute_x25519_shared(const std::vector<uint8_t>& private_key,
                                           const std::vector<uint8_t>& peer_public_key);

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& input_key,
                                 const std::vector<uint8_t>& salt,
                                 const std::string& info,
                                 std::size_t length);

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

// Returns ciphertext || tag.
std::vector<uint8_t> aes256_gcm_seal(const std::vector<uint8_t>& key,
                                     const uint8_t* nonce,
                                     const uint8_t* plaintext,
                                     std::size_t plaintext_len,
                                     const uint8_t* aad,
                                     std::size_t aad_len);

// Input is ciphertext || tag. Returns nullopt when authentication fails.
std::optional<std::vector<uint8_t>> aes256_gcm_open(const std::vector<uint8_t>& key,
                                                    const uint8_t* nonce,
                                                    const uint8_t* sealed,
                                                    std::size_t sealed_len,
                                                    const uint8_t* aad,
                                                    std::size_t aad_len);

bool constant_time_equal(const std::vector<uint8_t>& lhs, const std::vector<uint8_t>& rhs);

void secure_wipe(std::vector<uint8_t>& data);

} // namespace adatp
