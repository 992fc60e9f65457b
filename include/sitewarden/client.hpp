#ifndef SITEWARDEN_CLIENT_HPP
#define SITEWARDEN_CLIENT_HPP

#include "crypto.hpp"
#include "envelope.hpp"
#include "key_cache.hpp"
#include "token.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace SiteWarden {

    /**
     * @brief Site-side entry point for talking to the remote authority.
     *
     * Owns the public key cache and wires it into the envelope codec and the
     * token verifier. All network access goes through the given Transport.
     */
    class Client {
    public:
        /**
         * @brief Construct a new Client object.
         * @param transport The transport to the remote authority.
         * @param cipher The hybrid cipher used for envelopes.
         * @throws SiteWarden::InvalidArgument if either argument is null.
         * @throws SiteWarden::RuntimeError if libsodium cannot be initialized.
         */
        Client(std::shared_ptr<Transport> transport, std::unique_ptr<HybridCipher> cipher);

        /**
         * @brief Construct a Client using the libsodium cipher.
         * @param transport The transport to the remote authority.
         * @param private_key The private counterpart used to open inbound envelopes, if any.
         */
        explicit Client(std::shared_ptr<Transport> transport,
                        std::optional<PrivateKey> private_key = std::nullopt);

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * @brief Returns the authority's public key, fetching it once per Client.
         */
        PublicKey public_key();

        /**
         * @brief Encrypts a value for transport to the authority.
         */
        std::string encrypt(const nlohmann::json& data);

        /**
         * @brief Decrypts an envelope produced by encrypt() or by the authority.
         */
        nlohmann::json decrypt(const std::string& cypher_text);

        /**
         * @brief Checks a token sent by the authority against a trusted clock reading.
         *
         * Never throws: anything other than a fresh, correctly signed token is false.
         */
        bool is_valid_token(const std::string& encrypted_remote_token, int64_t timestamp);

        /**
         * @brief Same as above, using the current system time.
         */
        bool is_valid_token(const std::string& encrypted_remote_token);

        /**
         * @brief Encrypts `data` and posts it to the authority's site update path.
         * @throws SiteWarden::RemoteCommunicationError if the post is not answered with 200.
         */
        void post_site_data(const nlohmann::json& data);

    private:
        std::shared_ptr<Transport> transport_;
        std::unique_ptr<HybridCipher> cipher_;
        KeyCache key_cache_;
        EnvelopeCodec codec_;
        TokenVerifier verifier_;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_CLIENT_HPP
