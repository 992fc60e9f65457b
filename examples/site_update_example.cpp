#include <iostream>
#include <memory>

#include "sitewarden/client.hpp"
#include "sitewarden/errors.hpp"
#include "sitewarden/http_transport.hpp"

// Posts a small site report to a real authority.
// Configure with SITEWARDEN_URL and, optionally, SITEWARDEN_USERNAME,
// SITEWARDEN_PASSWORD, SITEWARDEN_CERTIFICATE and SITEWARDEN_TIMEOUT.
int main(int argc, char** argv) {
    try {
        auto config = SiteWarden::net::HttpConfig::from_env();
        auto transport = std::make_shared<SiteWarden::net::CurlTransport>(config);
        SiteWarden::Client client(transport);

        std::cout << "Fetching public key from " << transport->base_url() << std::endl;
        auto key = client.public_key();
        std::cout << "Public key: " << key.data.size() << " bytes" << std::endl;

        nlohmann::json site_data = {{"url", argc > 1 ? argv[1] : "https://www.example.com"}};
        client.post_site_data(site_data);
        std::cout << "Site data sent." << std::endl;

        if (argc > 2) {
            std::cout << "Token " << (client.is_valid_token(argv[2]) ? "is" : "is NOT") << " valid" << std::endl;
        }
    } catch (const SiteWarden::Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
