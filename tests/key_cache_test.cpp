#include "sitewarden/key_cache.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "sitewarden/crypto.hpp"
#include "sitewarden/errors.hpp"
#include "test_helpers.hpp"

using SiteWarden::test::FakeTransport;

TEST(KeyCacheTest, FetchesOnceAndCaches) {
    ASSERT_EQ(SiteWarden::Crypto::init(), 0);
    auto authority_key = SiteWarden::Crypto::generate_sign_keypair();
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_public_key(authority_key.publicKey);

    SiteWarden::KeyCache cache(transport);
    ASSERT_FALSE(cache.has_public_key());
    ASSERT_TRUE(transport->requests.empty());

    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(cache.get_public_key().data, authority_key.publicKey.data);
    }

    ASSERT_TRUE(cache.has_public_key());
    ASSERT_EQ(transport->count("GET", SiteWarden::PUBLIC_KEY_PATH), 1u);
    ASSERT_EQ(transport->requests.size(), 1u);
}

TEST(KeyCacheTest, FailedFetchIsNotCached) {
    ASSERT_EQ(SiteWarden::Crypto::init(), 0);
    auto authority_key = SiteWarden::Crypto::generate_sign_keypair();
    auto transport = std::make_shared<FakeTransport>();
    transport->set_response(SiteWarden::PUBLIC_KEY_PATH, 500, "", "Internal Server Error");

    SiteWarden::KeyCache cache(transport);
    try {
        cache.get_public_key();
        FAIL() << "Expected RemoteCommunicationError";
    } catch (const SiteWarden::RemoteCommunicationError& e) {
        ASSERT_EQ(e.status(), 500);
        ASSERT_EQ(e.reason(), "Internal Server Error");
        ASSERT_STREQ(e.what(), "Unable to communicate with Warden (500) Internal Server Error");
    }
    ASSERT_FALSE(cache.has_public_key());

    // The next call retries the fetch
    transport->serve_public_key(authority_key.publicKey);
    ASSERT_EQ(cache.get_public_key().data, authority_key.publicKey.data);
    ASSERT_EQ(transport->count("GET", SiteWarden::PUBLIC_KEY_PATH), 2u);
}

TEST(KeyCacheTest, RejectsUndecodableKeyBody) {
    ASSERT_EQ(SiteWarden::Crypto::init(), 0);
    auto transport = std::make_shared<FakeTransport>();
    SiteWarden::KeyCache cache(transport);

    transport->set_response(SiteWarden::PUBLIC_KEY_PATH, 200, "***not base64***");
    ASSERT_THROW(cache.get_public_key(), SiteWarden::RemoteCommunicationError);
    ASSERT_FALSE(cache.has_public_key());

    transport->set_response(SiteWarden::PUBLIC_KEY_PATH, 200, "");
    ASSERT_THROW(cache.get_public_key(), SiteWarden::RemoteCommunicationError);
    ASSERT_FALSE(cache.has_public_key());
}

TEST(KeyCacheTest, AcceptsTrailingNewline) {
    ASSERT_EQ(SiteWarden::Crypto::init(), 0);
    auto authority_key = SiteWarden::Crypto::generate_sign_keypair();
    auto transport = std::make_shared<FakeTransport>();
    transport->set_response(SiteWarden::PUBLIC_KEY_PATH, 200,
                            SiteWarden::base64_encode(authority_key.publicKey.data) + "\n");

    SiteWarden::KeyCache cache(transport);
    ASSERT_EQ(cache.get_public_key().data, authority_key.publicKey.data);
}

TEST(KeyCacheTest, ConcurrentCallersShareOneFetch) {
    ASSERT_EQ(SiteWarden::Crypto::init(), 0);
    auto authority_key = SiteWarden::Crypto::generate_sign_keypair();
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_public_key(authority_key.publicKey);
    SiteWarden::KeyCache cache(transport);

    std::vector<std::thread> threads;
    std::vector<SiteWarden::byte_vector> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&cache, &results, i] { results[i] = cache.get_public_key().data; });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& r : results) {
        ASSERT_EQ(r, authority_key.publicKey.data);
    }
    ASSERT_EQ(transport->count("GET", SiteWarden::PUBLIC_KEY_PATH), 1u);
}

TEST(KeyCacheTest, RequiresTransport) {
    ASSERT_THROW(SiteWarden::KeyCache(nullptr), SiteWarden::InvalidArgument);
}
