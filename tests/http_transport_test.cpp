#include "sitewarden/http_transport.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "sitewarden/errors.hpp"

TEST(HttpTransportTest, Create) {
    SiteWarden::net::HttpConfig config;
    config.base_url = "http://www.example.com";
    config.username = "user";
    config.password = "pass";
    config.certificate_path = "/dev/null";

    SiteWarden::net::CurlTransport transport(config);

    ASSERT_EQ(transport.base_url(), "http://www.example.com");
    ASSERT_EQ(transport.username(), "user");
    ASSERT_EQ(transport.password(), "pass");
    ASSERT_EQ(transport.certificate_path(), "/dev/null");
}

TEST(HttpTransportTest, RequiresBaseUrl) {
    ASSERT_THROW(SiteWarden::net::CurlTransport(SiteWarden::net::HttpConfig{}), SiteWarden::InvalidArgument);
}

TEST(HttpTransportTest, RejectsEmptyPost) {
    SiteWarden::net::HttpConfig config;
    config.base_url = "http://127.0.0.1:9";
    SiteWarden::net::CurlTransport transport(config);
    ASSERT_THROW(transport.post(SiteWarden::SITE_UPDATE_PATH, ""), SiteWarden::InvalidArgument);
}

TEST(HttpTransportTest, UnreachableHostRaisesStatusZero) {
    SiteWarden::net::HttpConfig config;
    config.base_url = "http://127.0.0.1:9";  // discard port, nothing listening
    config.timeout_seconds = 5;
    SiteWarden::net::CurlTransport transport(config);

    try {
        transport.fetch(SiteWarden::PUBLIC_KEY_PATH);
        FAIL() << "Expected RemoteCommunicationError";
    } catch (const SiteWarden::RemoteCommunicationError& e) {
        ASSERT_EQ(e.status(), 0);
        ASSERT_FALSE(e.reason().empty());
    }
}

TEST(HttpTransportTest, ParsesReasonPhrase) {
    ASSERT_EQ(SiteWarden::net::parse_reason_phrase("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\n"), "OK");
    ASSERT_EQ(SiteWarden::net::parse_reason_phrase("HTTP/1.1 500 Internal Server Error\r\n\r\n"),
              "Internal Server Error");
    ASSERT_EQ(SiteWarden::net::parse_reason_phrase("HTTP/2 404\r\n\r\n"), "");
    ASSERT_EQ(SiteWarden::net::parse_reason_phrase(""), "");

    // After a redirect, the last status line wins
    ASSERT_EQ(SiteWarden::net::parse_reason_phrase(
                  "HTTP/1.1 301 Moved Permanently\r\nLocation: /x\r\n\r\nHTTP/1.1 403 Forbidden\r\n\r\n"),
              "Forbidden");
}

TEST(HttpTransportTest, ConfigFromEnvironment) {
    ::unsetenv("SITEWARDEN_URL");
    ASSERT_THROW(SiteWarden::net::HttpConfig::from_env(), SiteWarden::InvalidArgument);

    ::setenv("SITEWARDEN_URL", "https://warden.example.com", 1);
    ::setenv("SITEWARDEN_USERNAME", "user", 1);
    ::setenv("SITEWARDEN_PASSWORD", "pass", 1);
    ::setenv("SITEWARDEN_CERTIFICATE", "/etc/ssl/client.pem", 1);
    ::setenv("SITEWARDEN_TIMEOUT", "10", 1);

    auto config = SiteWarden::net::HttpConfig::from_env();
    ASSERT_EQ(config.base_url, "https://warden.example.com");
    ASSERT_EQ(config.username, "user");
    ASSERT_EQ(config.password, "pass");
    ASSERT_EQ(config.certificate_path, "/etc/ssl/client.pem");
    ASSERT_EQ(config.timeout_seconds, 10);

    ::setenv("SITEWARDEN_TIMEOUT", "ten", 1);
    ASSERT_THROW(SiteWarden::net::HttpConfig::from_env(), SiteWarden::InvalidArgument);
    ::setenv("SITEWARDEN_TIMEOUT", "-1", 1);
    ASSERT_THROW(SiteWarden::net::HttpConfig::from_env(), SiteWarden::InvalidArgument);

    for (const char* name : {"SITEWARDEN_URL", "SITEWARDEN_USERNAME", "SITEWARDEN_PASSWORD",
                             "SITEWARDEN_CERTIFICATE", "SITEWARDEN_TIMEOUT"}) {
        ::unsetenv(name);
    }
}
