#ifndef SITEWARDEN_ENVELOPE_HPP
#define SITEWARDEN_ENVELOPE_HPP

#include "crypto.hpp"
#include "key_cache.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SiteWarden {

    /**
     * @brief The wire envelope: base64 of a JSON object with two base64 fields.
     *
     * {"key": base64(sealed symmetric key), "message": base64(ciphertext)}
     */
    struct Envelope {
        std::string key;
        std::string message;

        /**
         * @brief Serializes the envelope to JSON and base64-encodes it.
         */
        std::string encode() const;

        /**
         * @brief Decodes a base64 envelope.
         * @return The envelope, or std::nullopt if the input is not base64 JSON
         *         with non-empty string fields `key` and `message`.
         */
        static std::optional<Envelope> decode(const std::string& encoded);
    };

    /**
     * @brief Encrypts and decrypts structured data for the remote authority.
     */
    class EnvelopeCodec {
    public:
        EnvelopeCodec(KeyCache& key_cache, HybridCipher& cipher);

        /**
         * @brief Serializes `data` to JSON and seals it to the authority key.
         * @param data The value to encrypt.
         * @return The base64 envelope.
         * @throws SiteWarden::EncryptionError if sealing fails or did not transform the input.
         * @throws SiteWarden::RemoteCommunicationError if the public key cannot be fetched.
         */
        std::string encrypt(const nlohmann::json& data);

        /**
         * @brief Opens a base64 envelope and parses the plaintext as JSON.
         * @param cypher_text The base64 envelope.
         * @return The original value.
         * @throws SiteWarden::EncryptionError if the envelope is malformed or opening fails.
         * @throws SiteWarden::RemoteCommunicationError if the public key cannot be fetched.
         */
        nlohmann::json decrypt(const std::string& cypher_text);

    private:
        KeyCache& key_cache_;
        HybridCipher& cipher_;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_ENVELOPE_HPP
