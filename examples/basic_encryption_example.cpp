#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "sitewarden/client.hpp"
#include "sitewarden/crypto.hpp"
#include "sitewarden/encoding.hpp"
#include "sitewarden/errors.hpp"
#include "sitewarden/token.hpp"

// Plays the remote authority in memory: serves its public key and keeps the last post.
class InMemoryAuthority : public SiteWarden::Transport {
public:
    explicit InMemoryAuthority(SiteWarden::PublicKey key) : key_(std::move(key)) {}

    SiteWarden::Response fetch(const std::string& path) override {
        if (path == SiteWarden::PUBLIC_KEY_PATH) {
            std::cout << "[AUTHORITY] Serving public key" << std::endl;
            return {200, "OK", SiteWarden::base64_encode(key_.data)};
        }
        return {404, "Not Found", ""};
    }

    SiteWarden::Response post(const std::string& path, const std::string& body) override {
        std::cout << "[AUTHORITY] Received POST " << path << " (" << body.size() << " bytes)" << std::endl;
        last_post = body;
        return {200, "OK", ""};
    }

    std::string last_post;

private:
    SiteWarden::PublicKey key_;
};

void print_bytes(const std::string& title, const SiteWarden::byte_vector& bytes) {
    std::cout << title << " (" << bytes.size() << " bytes): ";
    for (size_t i = 0; i < bytes.size() && i < 24; ++i) {
        printf("%02x", bytes[i]);
    }
    if (bytes.size() > 24) {
        std::cout << "...";
    }
    std::cout << std::endl;
}

int main() {
    // 1. Initialize the crypto library
    if (SiteWarden::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    // 2. Setup the authority and the site client
    auto authority_key = SiteWarden::Crypto::generate_sign_keypair();
    print_bytes("Authority Public Key", authority_key.publicKey.data);

    auto authority = std::make_shared<InMemoryAuthority>(authority_key.publicKey);
    SiteWarden::Client client(authority, authority_key.privateKey);

    // 3. Site -> Authority
    std::cout << "\n--- Posting site data ---" << std::endl;
    nlohmann::json site_data = {
        {"url", "https://www.example.com"},
        {"core", {{"drupal", {{"version", "7.56"}}}}},
    };

    try {
        client.post_site_data(site_data);
        std::cout << "[SITE] Envelope: " << authority->last_post.substr(0, 48) << "..." << std::endl;

        nlohmann::json received = client.decrypt(authority->last_post);
        std::cout << "[SITE] Envelope opens to: " << received.dump() << std::endl;
        if (received != site_data) {
            std::cerr << "Round trip mismatch!" << std::endl;
            return 1;
        }
    } catch (const SiteWarden::Exception& e) {
        std::cerr << "[SITE] Failed: " << e.what() << std::endl;
        return 1;
    }

    // 4. Authority -> Site: a signed token
    std::cout << "\n--- Verifying authority tokens ---" << std::endl;
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch()).count();

    auto make_token = [&](int64_t timestamp) {
        std::string time = std::to_string(timestamp);
        auto sig = SiteWarden::Crypto::sign(SiteWarden::to_bytes(time), authority_key.privateKey);
        SiteWarden::TokenEnvelope token;
        token.time = SiteWarden::base64_encode(time);
        token.signature = SiteWarden::base64_encode(sig.data);
        return token.encode();
    };

    std::cout << "[SITE] Fresh token valid: " << std::boolalpha << client.is_valid_token(make_token(now)) << std::endl;
    std::cout << "[SITE] Replayed token (60s old) valid: " << client.is_valid_token(make_token(now - 60)) << std::endl;

    std::cout << "\n--- Protocol simulation successful!---" << std::endl;

    return 0;
}
