#include "sitewarden/client.hpp"

#include <chrono>
#include <utility>

#include "sitewarden/errors.hpp"

namespace SiteWarden {

namespace {

std::shared_ptr<Transport> require_transport(std::shared_ptr<Transport> transport) {
    if (!transport) {
        throw InvalidArgument("Client requires a transport.");
    }
    if (Crypto::init() != 0) {
        throw RuntimeError("Failed to initialize crypto library.");
    }
    return transport;
}

HybridCipher& require_cipher(const std::unique_ptr<HybridCipher>& cipher) {
    if (!cipher) {
        throw InvalidArgument("Client requires a cipher.");
    }
    return *cipher;
}

std::unique_ptr<HybridCipher> make_cipher(std::optional<PrivateKey> private_key) {
    if (private_key) {
        return std::make_unique<SodiumHybridCipher>(std::move(*private_key));
    }
    return std::make_unique<SodiumHybridCipher>();
}

}  // namespace

Client::Client(std::shared_ptr<Transport> transport, std::unique_ptr<HybridCipher> cipher)
    : transport_(require_transport(std::move(transport))),
      cipher_(std::move(cipher)),
      key_cache_(transport_),
      codec_(key_cache_, require_cipher(cipher_)),
      verifier_(key_cache_) {}

Client::Client(std::shared_ptr<Transport> transport, std::optional<PrivateKey> private_key)
    : Client(std::move(transport), make_cipher(std::move(private_key))) {}

PublicKey Client::public_key() {
    return key_cache_.get_public_key();
}

std::string Client::encrypt(const nlohmann::json& data) {
    return codec_.encrypt(data);
}

nlohmann::json Client::decrypt(const std::string& cypher_text) {
    return codec_.decrypt(cypher_text);
}

bool Client::is_valid_token(const std::string& encrypted_remote_token, int64_t timestamp) {
    return verifier_.is_valid(encrypted_remote_token, timestamp);
}

bool Client::is_valid_token(const std::string& encrypted_remote_token) {
    auto now = std::chrono::system_clock::now();
    int64_t timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return is_valid_token(encrypted_remote_token, timestamp);
}

void Client::post_site_data(const nlohmann::json& data) {
    std::string encrypted_message = encrypt(data);
    ensure_ok(transport_->post(SITE_UPDATE_PATH, encrypted_message));
}

} // namespace SiteWarden
