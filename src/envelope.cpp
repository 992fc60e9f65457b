#include "sitewarden/envelope.hpp"

#include <utility>

#include "sitewarden/encoding.hpp"
#include "sitewarden/errors.hpp"

namespace SiteWarden {

    std::string Envelope::encode() const {
        nlohmann::json object = {{"key", key}, {"message", message}};
        return base64_encode(object.dump());
    }

    std::optional<Envelope> Envelope::decode(const std::string& encoded) {
        auto object = detail::decode_json_object(encoded);
        if (!object) {
            return std::nullopt;
        }

        auto key = detail::non_empty_string(*object, "key");
        auto message = detail::non_empty_string(*object, "message");
        if (!key || !message) {
            return std::nullopt;
        }

        Envelope envelope;
        envelope.key = std::move(*key);
        envelope.message = std::move(*message);
        return envelope;
    }

    EnvelopeCodec::EnvelopeCodec(KeyCache& key_cache, HybridCipher& cipher)
        : key_cache_(key_cache), cipher_(cipher) {}

    std::string EnvelopeCodec::encrypt(const nlohmann::json& data) {
        std::string plaintext;
        try {
            plaintext = data.dump();
        } catch (const nlohmann::json::exception& e) {
            throw EncryptionError(std::string("Unable to encrypt a message: ") + e.what());
        }
        byte_vector plaintext_bytes = to_bytes(plaintext);

        PublicKey public_key = key_cache_.get_public_key();

        SealedMessage sealed = cipher_.seal(plaintext_bytes, public_key);

        // A primitive that hands back its input has not encrypted anything.
        if (sealed.key.empty() || sealed.message.empty() || sealed.message == plaintext_bytes) {
            throw EncryptionError("Unable to encrypt a message: the cipher produced no ciphertext.");
        }

        Envelope envelope;
        envelope.key = base64_encode(sealed.key);
        envelope.message = base64_encode(sealed.message);
        return envelope.encode();
    }

    nlohmann::json EnvelopeCodec::decrypt(const std::string& cypher_text) {
        auto envelope = Envelope::decode(cypher_text);
        if (!envelope) {
            throw EncryptionError("Encrypted message is not understood");
        }

        auto key = base64_decode(envelope->key);
        auto message = base64_decode(envelope->message);
        if (!key || !message || key->empty() || message->empty()) {
            throw EncryptionError("Encrypted message is not understood");
        }

        PublicKey public_key = key_cache_.get_public_key();

        SealedMessage sealed;
        sealed.key = std::move(*key);
        sealed.message = std::move(*message);
        byte_vector plaintext = cipher_.open(sealed, public_key);

        nlohmann::json value = nlohmann::json::parse(plaintext.begin(), plaintext.end(), nullptr, false);
        if (value.is_discarded()) {
            throw EncryptionError("Unable to decrypt a message: plaintext is not valid JSON.");
        }
        return value;
    }

} // namespace SiteWarden
