#include "sitewarden/encoding.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(EncodingTest, EncodesStandardPaddedBase64) {
    ASSERT_EQ(SiteWarden::base64_encode(std::string("")), "");
    ASSERT_EQ(SiteWarden::base64_encode(std::string("f")), "Zg==");
    ASSERT_EQ(SiteWarden::base64_encode(std::string("foob")), "Zm9vYg==");
    ASSERT_EQ(SiteWarden::base64_encode(SiteWarden::byte_vector{0xFB, 0xFF}), "+/8=");
}

TEST(EncodingTest, DecodesStandardPaddedBase64) {
    auto decoded = SiteWarden::base64_decode_string("Zm9vYmFy");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, "foobar");

    auto bytes = SiteWarden::base64_decode("+/8=");
    ASSERT_TRUE(bytes.has_value());
    ASSERT_EQ(*bytes, (SiteWarden::byte_vector{0xFB, 0xFF}));

    auto empty = SiteWarden::base64_decode("");
    ASSERT_TRUE(empty.has_value());
    ASSERT_TRUE(empty->empty());
}

TEST(EncodingTest, IgnoresWhitespace) {
    auto decoded = SiteWarden::base64_decode_string("Zm9v\nYmFy\n");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, "foobar");
}

TEST(EncodingTest, RejectsInvalidInput) {
    ASSERT_FALSE(SiteWarden::base64_decode("not-a-valid-envelope").has_value());
    ASSERT_FALSE(SiteWarden::base64_decode("Zm9vYg").has_value());  // missing padding
    ASSERT_FALSE(SiteWarden::base64_decode("Zm9v!").has_value());
    ASSERT_FALSE(SiteWarden::base64_decode("-_8=").has_value());    // URL-safe alphabet
}

TEST(EncodingTest, DecodeJsonObject) {
    auto object = SiteWarden::detail::decode_json_object(SiteWarden::base64_encode(std::string("{\"a\":\"b\"}")));
    ASSERT_TRUE(object.has_value());
    ASSERT_EQ(SiteWarden::detail::non_empty_string(*object, "a"), std::optional<std::string>("b"));
    ASSERT_FALSE(SiteWarden::detail::non_empty_string(*object, "missing").has_value());

    ASSERT_FALSE(SiteWarden::detail::decode_json_object(SiteWarden::base64_encode(std::string("[1,2]"))).has_value());
    ASSERT_FALSE(SiteWarden::detail::decode_json_object(SiteWarden::base64_encode(std::string("42"))).has_value());
    ASSERT_FALSE(SiteWarden::detail::decode_json_object(SiteWarden::base64_encode(std::string("{broken"))).has_value());
    ASSERT_FALSE(SiteWarden::detail::decode_json_object("%%%").has_value());
}

TEST(EncodingTest, NonEmptyStringRejectsOtherTypes) {
    nlohmann::json object = {{"empty", ""}, {"number", 5}, {"null", nullptr}, {"ok", "x"}};
    ASSERT_FALSE(SiteWarden::detail::non_empty_string(object, "empty").has_value());
    ASSERT_FALSE(SiteWarden::detail::non_empty_string(object, "number").has_value());
    ASSERT_FALSE(SiteWarden::detail::non_empty_string(object, "null").has_value());
    ASSERT_TRUE(SiteWarden::detail::non_empty_string(object, "ok").has_value());
}
