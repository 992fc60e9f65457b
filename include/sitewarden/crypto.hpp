#ifndef SITEWARDEN_CRYPTO_HPP
#define SITEWARDEN_CRYPTO_HPP

#include "keys.hpp"

#include <optional>
#include <string>

namespace SiteWarden {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Safe to call more than once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a key pair for digital signatures (Ed25519).
         *
         * The same key pair anchors sealing: its keys are converted to X25519
         * for the sealed-box part of the envelope.
         * @return A KeyPair object.
         */
        static KeyPair generate_sign_keypair();

        /**
         * @brief Creates a detached digital signature for a given message.
         * @param message The data to sign.
         * @param private_key The signer's private key.
         * @return A Signature object.
         * @throws SiteWarden::InvalidArgument if the private key has the wrong size.
         */
        static Signature sign(const byte_vector& message, const PrivateKey& private_key);

        /**
         * @brief Verifies a detached digital signature.
         * @param signature The signature to verify.
         * @param message The message that was signed.
         * @param public_key The signer's public key.
         * @return True if the signature is valid, false otherwise (including malformed keys).
         */
        static bool verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key);
    };

    /**
     * @brief The output of a hybrid seal: a wrapped symmetric key and the payload ciphertext.
     */
    struct SealedMessage {
        byte_vector key;     // Symmetric key, sealed to the recipient key
        byte_vector message; // Payload encrypted with the symmetric key
    };

    /**
     * @brief Hybrid asymmetric encryption capability used by the envelope codec.
     */
    class HybridCipher {
    public:
        virtual ~HybridCipher() = default;

        /**
         * @brief Encrypts a plaintext under a fresh symmetric key and wraps that key with `key`.
         * @throws SiteWarden::EncryptionError if the primitive fails.
         */
        virtual SealedMessage seal(const byte_vector& plaintext, const PublicKey& key) = 0;

        /**
         * @brief Inverse of seal(), parameterized by the same authority key.
         * @throws SiteWarden::EncryptionError if the primitive fails.
         */
        virtual byte_vector open(const SealedMessage& sealed, const PublicKey& key) = 0;
    };

    /**
     * @brief HybridCipher built from libsodium sealed boxes and ChaCha20-Poly1305.
     *
     * The symmetric key is wrapped with crypto_box_seal to the X25519 form of
     * the Ed25519 authority key. The message is nonce || ciphertext || tag.
     * Opening needs the private counterpart of the authority key; without it,
     * open() always fails.
     */
    class SodiumHybridCipher : public HybridCipher {
    public:
        SodiumHybridCipher() = default;
        explicit SodiumHybridCipher(PrivateKey private_key);

        SealedMessage seal(const byte_vector& plaintext, const PublicKey& key) override;
        byte_vector open(const SealedMessage& sealed, const PublicKey& key) override;

        bool can_open() const;

    private:
        std::optional<PrivateKey> private_key_;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_CRYPTO_HPP
