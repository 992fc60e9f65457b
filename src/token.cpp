#include "sitewarden/token.hpp"

#include <cctype>
#include <exception>
#include <limits>
#include <utility>

#include "sitewarden/crypto.hpp"
#include "sitewarden/encoding.hpp"

namespace SiteWarden {

std::string TokenEnvelope::encode() const {
    nlohmann::json object = {{"time", time}, {"signature", signature}};
    return base64_encode(object.dump());
}

std::optional<TokenEnvelope> TokenEnvelope::decode(const std::string& encoded) {
    auto object = detail::decode_json_object(encoded);
    if (!object) {
        return std::nullopt;
    }

    auto time = detail::non_empty_string(*object, "time");
    auto signature = detail::non_empty_string(*object, "signature");
    if (!time || !signature) {
        return std::nullopt;
    }

    TokenEnvelope token;
    token.time = std::move(*time);
    token.signature = std::move(*signature);
    return token;
}

const char* to_string(TokenStatus status) {
    switch (status) {
        case TokenStatus::Valid: return "valid";
        case TokenStatus::Malformed: return "malformed";
        case TokenStatus::OutsideWindow: return "outside freshness window";
        case TokenStatus::BadSignature: return "bad signature";
        case TokenStatus::KeyUnavailable: return "public key unavailable";
    }
    return "unknown";
}

std::optional<int64_t> parse_timestamp(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    // Accumulate as a negative number so that INT64_MIN is representable.
    int64_t value = 0;
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    for (; pos < text.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        int digit = c - '0';
        if (value < (min + digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 - digit;
    }

    if (!negative) {
        if (value == min) {
            return std::nullopt;
        }
        value = -value;
    }
    return value;
}

TokenVerifier::TokenVerifier(KeyCache& key_cache) : key_cache_(key_cache) {}

TokenStatus TokenVerifier::check(const std::string& encrypted_remote_token, int64_t trusted_timestamp) {
    try {
        auto token = TokenEnvelope::decode(encrypted_remote_token);
        if (!token) {
            return TokenStatus::Malformed;
        }

        auto remote_time = base64_decode(token->time);
        if (!remote_time) {
            return TokenStatus::Malformed;
        }

        auto remote_timestamp = parse_timestamp(to_string(*remote_time));
        if (!remote_timestamp) {
            return TokenStatus::Malformed;
        }
        // Distance computed in unsigned arithmetic so extreme values cannot overflow.
        uint64_t distance = *remote_timestamp >= trusted_timestamp
            ? static_cast<uint64_t>(*remote_timestamp) - static_cast<uint64_t>(trusted_timestamp)
            : static_cast<uint64_t>(trusted_timestamp) - static_cast<uint64_t>(*remote_timestamp);
        if (distance > static_cast<uint64_t>(TOKEN_FRESHNESS_WINDOW)) {
            return TokenStatus::OutsideWindow;
        }

        auto signature = base64_decode(token->signature);
        if (!signature) {
            return TokenStatus::Malformed;
        }

        PublicKey public_key;
        try {
            public_key = key_cache_.get_public_key();
        } catch (const std::exception&) {
            return TokenStatus::KeyUnavailable;
        }

        Signature sig;
        sig.data = std::move(*signature);
        if (!Crypto::verify(sig, *remote_time, public_key)) {
            return TokenStatus::BadSignature;
        }
        return TokenStatus::Valid;
    } catch (const std::exception&) {
        // Token checks guard an authorization decision: fail closed.
        return TokenStatus::Malformed;
    }
}

bool TokenVerifier::is_valid(const std::string& encrypted_remote_token, int64_t trusted_timestamp) {
    return check(encrypted_remote_token, trusted_timestamp) == TokenStatus::Valid;
}

} // namespace SiteWarden
