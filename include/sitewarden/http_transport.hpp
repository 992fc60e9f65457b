#ifndef SITEWARDEN_HTTP_TRANSPORT_HPP
#define SITEWARDEN_HTTP_TRANSPORT_HPP

#include "transport.hpp"

#include <string>

namespace SiteWarden {
namespace net {

struct HttpConfig {
    std::string base_url;          // e.g. "https://warden.example.com"
    std::string username;          // Basic auth is used when not empty
    std::string password;
    std::string certificate_path;  // PEM client certificate, used when not empty
    long timeout_seconds = 30;

    /**
     * @brief Reads SITEWARDEN_URL, SITEWARDEN_USERNAME, SITEWARDEN_PASSWORD,
     *        SITEWARDEN_CERTIFICATE and SITEWARDEN_TIMEOUT.
     * @throws SiteWarden::InvalidArgument if SITEWARDEN_URL is unset or the timeout is not a number.
     */
    static HttpConfig from_env();
};

/**
 * @brief Transport over HTTP(S) using libcurl.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(HttpConfig config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Response fetch(const std::string& path) override;
    Response post(const std::string& path, const std::string& body) override;

    /**
     * @brief Sends a request to the authority.
     * @param path The path including the leading slash, e.g. "/public-key".
     * @param content The request body. If this is not empty, the request is a POST.
     * @throws SiteWarden::RemoteCommunicationError if no response was received.
     */
    Response request(const std::string& path, const std::string& content = "");

    const std::string& base_url() const { return config_.base_url; }
    const std::string& username() const { return config_.username; }
    const std::string& password() const { return config_.password; }
    const std::string& certificate_path() const { return config_.certificate_path; }

private:
    HttpConfig config_;
};

/**
 * @brief Extracts the reason phrase from the last HTTP status line in raw headers.
 *
 * With redirects followed, the headers of every hop are present; only the
 * final one counts. Returns an empty string if there is no status line.
 */
std::string parse_reason_phrase(const std::string& raw_headers);

} // namespace net
} // namespace SiteWarden

#endif // SITEWARDEN_HTTP_TRANSPORT_HPP
