#ifndef SITEWARDEN_TRANSPORT_HPP
#define SITEWARDEN_TRANSPORT_HPP

#include <string>

namespace SiteWarden {

    // Paths on the remote authority.
    constexpr char PUBLIC_KEY_PATH[] = "/public-key";
    constexpr char SITE_UPDATE_PATH[] = "/site-update";

    // The only status the core treats as success.
    constexpr long STATUS_OK = 200;

    struct Response {
        long status = 0;
        std::string reason;
        std::string body;
    };

    /**
     * @brief Byte transport to the remote authority.
     *
     * Implementations return whatever response they received, success or not.
     * When no response was obtained at all they throw RemoteCommunicationError
     * with a status of 0.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Fetches the resource at `path` (a GET).
         * @param path The path including the leading slash, e.g. "/public-key".
         */
        virtual Response fetch(const std::string& path) = 0;

        /**
         * @brief Sends `body` to `path` (a POST).
         */
        virtual Response post(const std::string& path, const std::string& body) = 0;
    };

    /**
     * @brief Throws RemoteCommunicationError unless the response status is 200.
     */
    void ensure_ok(const Response& response);

} // namespace SiteWarden

#endif // SITEWARDEN_TRANSPORT_HPP
