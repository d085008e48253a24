/*
 * AdaTP - cryptographic helpers implementation
 */

#include "crypto.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace adatp {

namespace {
// Scope guards for the EVP handles; each frees its handle on every exit path.
struct PkeyGuard {
    EVP_PKEY* key = nullptr;
    ~PkeyGuard() { EVP_PKEY_free(key); }
};

struct PkeyCtxGuard {
    EVP_PKEY_CTX* ctx = nullptr;
    ~PkeyCtxGuard() { EVP_PKEY_CTX_free(ctx); }
};

struct CipherCtxGuard {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ~CipherCtxGuard() { EVP_CIPHER_CTX_free(ctx); }
};

void require(bool ok, const char* what) {
    if (!ok) {
        throw std::runtime_error(what);
    }
}

void check_aes_key(const std::vector<uint8_t>& key) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
}

// Prepares an AES-256-GCM context for one message under a 12-byte nonce.
void init_gcm(EVP_CIPHER_CTX* ctx, bool encrypt, const std::vector<uint8_t>& key, const uint8_t* nonce) {
    require(ctx != nullptr, "EVP_CIPHER_CTX_new failed");
    require(EVP_CipherInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr, encrypt ? 1 : 0) == 1 &&
                EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmNonceSize), nullptr) == 1 &&
                EVP_CipherInit_ex(ctx, nullptr, nullptr, key.data(), nonce, encrypt ? 1 : 0) == 1,
            "AES-GCM init failed");
}
} // namespace

KeyPair generate_x25519_keypair() {
    PkeyCtxGuard keygen{EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr)};
    require(keygen.ctx != nullptr, "EVP_PKEY_CTX_new_id(X25519) failed");

    PkeyGuard generated;
    require(EVP_PKEY_keygen_init(keygen.ctx) > 0 && EVP_PKEY_keygen(keygen.ctx, &generated.key) > 0,
            "X25519 key generation failed");

    KeyPair pair;
    pair.public_key.resize(kX25519KeySize);
    pair.private_key.resize(kX25519KeySize);
    std::size_t public_len = pair.public_key.size();
    std::size_t private_len = pair.private_key.size();
    require(EVP_PKEY_get_raw_public_key(generated.key, pair.public_key.data(), &public_len) > 0 &&
                EVP_PKEY_get_raw_private_key(generated.key, pair.private_key.data(), &private_len) > 0,
            "Failed to extract X25519 key material");
    return pair;
}

std::vector<uint8_t> compute_x25519_shared(const std::vector<uint8_t>& private_key,
                                           const std::vector<uint8_t>& peer_public_key) {
    if (private_key.size() != kX25519KeySize || peer_public_key.size() != kX25519KeySize) {
        throw std::invalid_argument("X25519 keys must be 32 bytes");
    }

    PkeyGuard own{EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, private_key.data(), private_key.size())};
    require(own.key != nullptr, "Invalid X25519 private key");
    PkeyGuard peer{
        EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public_key.data(), peer_public_key.size())};
    require(peer.key != nullptr, "Invalid X25519 public key");

    PkeyCtxGuard derive{EVP_PKEY_CTX_new(own.key, nullptr)};
    require(derive.ctx != nullptr, "EVP_PKEY_CTX_new failed");

    std::vector<uint8_t> secret(kX25519KeySize);
    std::size_t secret_len = secret.size();
    // OpenSSL refuses most low-order peer points here; the all-zero check
    // below catches the rest.
    require(EVP_PKEY_derive_init(derive.ctx) > 0 && EVP_PKEY_derive_set_peer(derive.ctx, peer.key) > 0 &&
                EVP_PKEY_derive(derive.ctx, secret.data(), &secret_len) > 0,
            "X25519 derive failed");
    secret.resize(secret_len);

    if (std::all_of(secret.begin(), secret.end(), [](uint8_t b) { return b == 0; })) {
        throw std::runtime_error("X25519 produced an all-zero shared secret");
    }
    return secret;
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& input_key,
                                 const std::vector<uint8_t>& salt,
                                 const std::string& info,
                                 std::size_t length) {
    PkeyCtxGuard hkdf{EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr)};
    require(hkdf.ctx != nullptr, "EVP_PKEY_CTX_new_id(HKDF) failed");

    // OpenSSL wants a valid pointer even for an empty salt.
    static const uint8_t kNoSalt[1] = {0};
    const uint8_t* salt_data = salt.empty() ? kNoSalt : salt.data();
    const auto* info_data = reinterpret_cast<const unsigned char*>(info.data());

    require(EVP_PKEY_derive_init(hkdf.ctx) > 0 && EVP_PKEY_CTX_set_hkdf_md(hkdf.ctx, EVP_sha256()) > 0 &&
                EVP_PKEY_CTX_set1_hkdf_salt(hkdf.ctx, salt_data, static_cast<int>(salt.size())) > 0 &&
                EVP_PKEY_CTX_set1_hkdf_key(hkdf.ctx, input_key.data(), static_cast<int>(input_key.size())) > 0 &&
                EVP_PKEY_CTX_add1_hkdf_info(hkdf.ctx, info_data, static_cast<int>(info.size())) > 0,
            "HKDF setup failed");

    std::vector<uint8_t> okm(length);
    require(EVP_PKEY_derive(hkdf.ctx, okm.data(), &length) > 0, "HKDF derive failed");
    okm.resize(length);
    return okm;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(kSha256Size);
    unsigned int digest_len = 0;
    require(EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) == 1,
            "SHA-256 digest failed");
    digest.resize(digest_len);
    return digest;
}

std::vector<uint8_t> aes256_gcm_seal(const std::vector<uint8_t>& key,
                                     const uint8_t* nonce,
                                     const uint8_t* plaintext,
                                     std::size_t plaintext_len,
                                     const uint8_t* aad,
                                     std::size_t aad_len) {
    check_aes_key(key);

    CipherCtxGuard gcm;
    init_gcm(gcm.ctx, true, key, nonce);

    // ciphertext || tag; GCM adds no padding.
    std::vector<uint8_t> sealed(plaintext_len + kGcmTagSize);
    int written = 0;
    if (aad_len > 0) {
        require(EVP_EncryptUpdate(gcm.ctx, nullptr, &written, aad, static_cast<int>(aad_len)) == 1,
                "AES-GCM AAD update failed");
    }
    std::size_t produced = 0;
    if (plaintext_len > 0) {
        require(EVP_EncryptUpdate(gcm.ctx, sealed.data(), &written, plaintext, static_cast<int>(plaintext_len)) == 1,
                "AES-GCM encrypt failed");
        produced = static_cast<std::size_t>(written);
    }
    require(EVP_EncryptFinal_ex(gcm.ctx, sealed.data() + produced, &written) == 1, "AES-GCM finalization failed");
    produced += static_cast<std::size_t>(written);

    require(EVP_CIPHER_CTX_ctrl(gcm.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                                sealed.data() + produced) == 1,
            "AES-GCM get tag failed");
    sealed.resize(produced + kGcmTagSize);
    return sealed;
}

std::optional<std::vector<uint8_t>> aes256_gcm_open(const std::vector<uint8_t>& key,
                                                    const uint8_t* nonce,
                                                    const uint8_t* sealed,
                                                    std::size_t sealed_len,
                                                    const uint8_t* aad,
                                                    std::size_t aad_len) {
    check_aes_key(key);
    if (sealed_len < kGcmTagSize) {
        return std::nullopt;
    }
    const std::size_t body_len = sealed_len - kGcmTagSize;

    CipherCtxGuard gcm;
    init_gcm(gcm.ctx, false, key, nonce);

    // One spare byte keeps data() valid for an empty message.
    std::vector<uint8_t> plaintext(body_len + 1);
    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer.
    std::vector<uint8_t> tag(sealed + body_len, sealed + sealed_len);

    int written = 0;
    if (aad_len > 0 && EVP_DecryptUpdate(gcm.ctx, nullptr, &written, aad, static_cast<int>(aad_len)) != 1) {
        return std::nullopt;
    }
    std::size_t produced = 0;
    if (body_len > 0) {
        if (EVP_DecryptUpdate(gcm.ctx, plaintext.data(), &written, sealed, static_cast<int>(body_len)) != 1) {
            return std::nullopt;
        }
        produced = static_cast<std::size_t>(written);
    }
    require(EVP_CIPHER_CTX_ctrl(gcm.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize), tag.data()) == 1,
            "AES-GCM set tag failed");

    if (EVP_DecryptFinal_ex(gcm.ctx, plaintext.data() + produced, &written) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    plaintext.resize(produced + static_cast<std::size_t>(written));
    return plaintext;
}

bool constant_time_equal(const std::vector<uint8_t>& lhs, const std::vector<uint8_t>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return lhs.empty() || CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

void secure_wipe(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

} // namespace adatp
