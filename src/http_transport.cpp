#include "sitewarden/http_transport.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "sitewarden/errors.hpp"

namespace SiteWarden {
    namespace net {

        namespace {

            std::once_flag g_curl_init_flag;
            CURLcode g_curl_init_result = CURLE_OK;

            size_t append_to_string(char* data, size_t size, size_t count, void* user) {
                static_cast<std::string*>(user)->append(data, size * count);
                return size * count;
            }

            std::string env_or_empty(const char* name) {
                const char* value = std::getenv(name);
                return value ? std::string(value) : std::string();
            }

            struct CurlDeleter {
                void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
            };

        }  // namespace

        HttpConfig HttpConfig::from_env() {
            HttpConfig config;
            config.base_url = env_or_empty("SITEWARDEN_URL");
            if (config.base_url.empty()) {
                throw InvalidArgument("SITEWARDEN_URL is not set.");
            }
            config.username = env_or_empty("SITEWARDEN_USERNAME");
            config.password = env_or_empty("SITEWARDEN_PASSWORD");
            config.certificate_path = env_or_empty("SITEWARDEN_CERTIFICATE");

            std::string timeout = env_or_empty("SITEWARDEN_TIMEOUT");
            if (!timeout.empty()) {
                try {
                    size_t consumed = 0;
                    config.timeout_seconds = std::stol(timeout, &consumed);
                    if (consumed != timeout.size() || config.timeout_seconds < 0) {
                        throw InvalidArgument("SITEWARDEN_TIMEOUT must be a non-negative number of seconds.");
                    }
                } catch (const std::logic_error&) {
                    throw InvalidArgument("SITEWARDEN_TIMEOUT must be a non-negative number of seconds.");
                }
            }
            return config;
        }

        std::string parse_reason_phrase(const std::string& raw_headers) {
            std::string reason;
            std::istringstream lines(raw_headers);
            std::string line;
            while (std::getline(lines, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line.compare(0, 5, "HTTP/") != 0) {
                    continue;
                }
                // Status line: HTTP-version SP status-code [SP reason-phrase]
                size_t first_space = line.find(' ');
                size_t second_space = first_space == std::string::npos ? std::string::npos : line.find(' ', first_space + 1);
                reason = second_space == std::string::npos ? std::string() : line.substr(second_space + 1);
            }
            return reason;
        }

        CurlTransport::CurlTransport(HttpConfig config) : config_(std::move(config)) {
            if (config_.base_url.empty()) {
                throw InvalidArgument("CurlTransport requires a base URL.");
            }
            std::call_once(g_curl_init_flag, [] { g_curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
            if (g_curl_init_result != CURLE_OK) {
                throw RuntimeError(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(g_curl_init_result));
            }
        }

        CurlTransport::~CurlTransport() = default;

        Response CurlTransport::fetch(const std::string& path) {
            return request(path);
        }

        Response CurlTransport::post(const std::string& path, const std::string& body) {
            if (body.empty()) {
                throw InvalidArgument("Cannot post an empty body.");
            }
            return request(path, body);
        }

        Response CurlTransport::request(const std::string& path, const std::string& content) {
            std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
            if (!handle) {
                throw RemoteCommunicationError(0, "curl init failed");
            }
            CURL* h = handle.get();

            std::string url = config_.base_url + path;
            std::string body;
            std::string headers;
            char error_buffer[CURL_ERROR_SIZE] = {0};

            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_to_string);
            curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
            curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, append_to_string);
            curl_easy_setopt(h, CURLOPT_HEADERDATA, &headers);
            curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
            curl_easy_setopt(h, CURLOPT_TIMEOUT, config_.timeout_seconds);
            curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

            if (!config_.username.empty()) {
                curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
                curl_easy_setopt(h, CURLOPT_USERNAME, config_.username.c_str());
                curl_easy_setopt(h, CURLOPT_PASSWORD, config_.password.c_str());
            }

            if (!content.empty()) {
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, content.c_str());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(content.size()));
            }

            if (!config_.certificate_path.empty()) {
                curl_easy_setopt(h, CURLOPT_SSLCERT, config_.certificate_path.c_str());
                curl_easy_setopt(h, CURLOPT_SSLCERTTYPE, "PEM");
            }

            CURLcode rc = curl_easy_perform(h);
            if (rc != CURLE_OK) {
                std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(rc);
                std::cerr << "Request to " << url << " failed: " << detail << std::endl;
                throw RemoteCommunicationError(0, detail);
            }

            Response response;
            if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
                throw RemoteCommunicationError(0, "no response status");
            }
            response.reason = parse_reason_phrase(headers);
            response.body = std::move(body);
            return response;
        }

    } // namespace net
} // namespace SiteWarden
