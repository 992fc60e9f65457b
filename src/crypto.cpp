#include "sitewarden/crypto.hpp"

#include <sodium.h>

#include <atomic>
#include <string>
#include <utility>

#include "sitewarden/errors.hpp"

namespace SiteWarden {

    static std::atomic<bool> g_sodium_initialized = false;

    constexpr size_t SYMMETRIC_KEY_SIZE = crypto_aead_chacha20poly1305_ietf_KEYBYTES;
    constexpr size_t NONCE_SIZE = crypto_aead_chacha20poly1305_ietf_NPUBBYTES;
    constexpr size_t TAG_SIZE = crypto_aead_chacha20poly1305_ietf_ABYTES;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_sign_keypair() {
        KeyPair kp;
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        kp.privateKey.data.resize(crypto_sign_SECRETKEYBYTES);
        crypto_sign_keypair(kp.publicKey.data.data(), kp.privateKey.data.data());
        return kp;
    }

    Signature Crypto::sign(const byte_vector& message, const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid private key size for signing.");
        }
        Signature sig;
        sig.data.resize(crypto_sign_BYTES);
        crypto_sign_detached(sig.data.data(), nullptr, message.data(), message.size(), private_key.data.data());
        return sig;
    }

    bool Crypto::verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key) {
        if (signature.data.size() != crypto_sign_BYTES || public_key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;  // Invalid sizes
        }
        return crypto_sign_verify_detached(
                   signature.data.data(), message.data(), message.size(), public_key.data.data()) == 0;
    }

    // --- Hybrid sealing ---

    static byte_vector to_curve25519_pk(const PublicKey& key) {
        if (key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            throw EncryptionError("Invalid public key size: expected " +
                                  std::to_string(crypto_sign_PUBLICKEYBYTES) + ", got " +
                                  std::to_string(key.data.size()));
        }
        byte_vector curve_pk(crypto_box_PUBLICKEYBYTES);
        if (crypto_sign_ed25519_pk_to_curve25519(curve_pk.data(), key.data.data()) != 0) {
            throw EncryptionError("Public key is not a valid Ed25519 point.");
        }
        return curve_pk;
    }

    SodiumHybridCipher::SodiumHybridCipher(PrivateKey private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid private key size for opening envelopes.");
        }
        private_key_ = std::move(private_key);
    }

    bool SodiumHybridCipher::can_open() const {
        return private_key_.has_value();
    }

    SealedMessage SodiumHybridCipher::seal(const byte_vector& plaintext, const PublicKey& key) {
        byte_vector curve_pk = to_curve25519_pk(key);

        byte_vector symmetric_key(SYMMETRIC_KEY_SIZE);
        crypto_aead_chacha20poly1305_ietf_keygen(symmetric_key.data());

        SealedMessage sealed;

        // Message: Nonce + Ciphertext + Auth Tag
        sealed.message.resize(NONCE_SIZE + plaintext.size() + TAG_SIZE);
        randombytes_buf(sealed.message.data(), NONCE_SIZE);

        unsigned long long ciphertext_len = 0;
        int rc = crypto_aead_chacha20poly1305_ietf_encrypt(sealed.message.data() + NONCE_SIZE,
                                                           &ciphertext_len,
                                                           plaintext.data(),
                                                           plaintext.size(),
                                                           nullptr,  // no additional data
                                                           0,
                                                           nullptr,  // nsec is not used
                                                           sealed.message.data(),
                                                           symmetric_key.data());
        if (rc != 0) {
            sodium_memzero(symmetric_key.data(), symmetric_key.size());
            throw EncryptionError("Unable to encrypt a message: payload encryption failed.");
        }
        sealed.message.resize(NONCE_SIZE + ciphertext_len);

        // crypto_box_seal: anonymous encryption to the recipient key
        sealed.key.resize(SYMMETRIC_KEY_SIZE + crypto_box_SEALBYTES);
        rc = crypto_box_seal(sealed.key.data(), symmetric_key.data(), symmetric_key.size(), curve_pk.data());
        sodium_memzero(symmetric_key.data(), symmetric_key.size());
        if (rc != 0) {
            throw EncryptionError("Unable to encrypt a message: sealing the message key failed.");
        }

        return sealed;
    }

    byte_vector SodiumHybridCipher::open(const SealedMessage& sealed, const PublicKey& key) {
        if (!private_key_) {
            throw EncryptionError("Unable to decrypt a message: no private key available.");
        }
        if (sealed.key.size() != SYMMETRIC_KEY_SIZE + crypto_box_SEALBYTES) {
            throw EncryptionError("Unable to decrypt a message: sealed key has the wrong size.");
        }
        if (sealed.message.size() < NONCE_SIZE + TAG_SIZE) {
            throw EncryptionError("Unable to decrypt a message: message too small to be valid.");
        }

        byte_vector curve_pk = to_curve25519_pk(key);
        byte_vector curve_sk(crypto_box_SECRETKEYBYTES);
        if (crypto_sign_ed25519_sk_to_curve25519(curve_sk.data(), private_key_->data.data()) != 0) {
            throw EncryptionError("Unable to decrypt a message: private key conversion failed.");
        }

        byte_vector symmetric_key(SYMMETRIC_KEY_SIZE);
        int rc = crypto_box_seal_open(symmetric_key.data(),
                                      sealed.key.data(),
                                      sealed.key.size(),
                                      curve_pk.data(),
                                      curve_sk.data());
        sodium_memzero(curve_sk.data(), curve_sk.size());
        if (rc != 0) {
            throw EncryptionError("Unable to decrypt a message: the message key could not be opened.");
        }

        const unsigned char* nonce = sealed.message.data();
        const unsigned char* ciphertext_with_tag = sealed.message.data() + NONCE_SIZE;
        size_t ciphertext_with_tag_len = sealed.message.size() - NONCE_SIZE;

        byte_vector plaintext(ciphertext_with_tag_len - TAG_SIZE);
        unsigned long long plaintext_len = 0;
        rc = crypto_aead_chacha20poly1305_ietf_decrypt(plaintext.data(),
                                                       &plaintext_len,
                                                       nullptr,  // nsec is not used
                                                       ciphertext_with_tag,
                                                       ciphertext_with_tag_len,
                                                       nullptr,
                                                       0,
                                                       nonce,
                                                       symmetric_key.data());
        sodium_memzero(symmetric_key.data(), symmetric_key.size());
        if (rc != 0) {
            throw EncryptionError("Unable to decrypt a message: authentication tag is invalid.");
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

}  // namespace SiteWarden
