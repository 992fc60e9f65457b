#ifndef SITEWARDEN_TOKEN_HPP
#define SITEWARDEN_TOKEN_HPP

#include "key_cache.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace SiteWarden {

    // A token is accepted within this many seconds either side of the trusted clock.
    constexpr int64_t TOKEN_FRESHNESS_WINDOW = 20;

    /**
     * @brief A token issued by the remote authority.
     *
     * Wire form: base64 of {"time": base64(decimal seconds), "signature": base64(bytes)},
     * where the signature covers the decimal string.
     */
    struct TokenEnvelope {
        std::string time;
        std::string signature;

        std::string encode() const;

        /**
         * @return The token, or std::nullopt unless the input is base64 JSON
         *         with non-empty string fields `time` and `signature`.
         */
        static std::optional<TokenEnvelope> decode(const std::string& encoded);
    };

    enum class TokenStatus {
        Valid,
        Malformed,
        OutsideWindow,
        BadSignature,
        KeyUnavailable
    };

    const char* to_string(TokenStatus status);

    /**
     * @brief Parses a decimal timestamp: optional sign followed by digits only.
     * @return std::nullopt if the text is not numeric or does not fit in 64 bits.
     */
    std::optional<int64_t> parse_timestamp(const std::string& text);

    /**
     * @brief Checks that a token was signed by the remote authority recently.
     *
     * Tokens can be replayed, so a token is only accepted within
     * TOKEN_FRESHNESS_WINDOW seconds of the caller's clock reading.
     */
    class TokenVerifier {
    public:
        explicit TokenVerifier(KeyCache& key_cache);

        /**
         * @brief Classifies a token. Never throws.
         * @param encrypted_remote_token The base64 token sent by the authority.
         * @param trusted_timestamp The local clock reading in seconds.
         */
        TokenStatus check(const std::string& encrypted_remote_token, int64_t trusted_timestamp);

        /**
         * @brief True if check() reports TokenStatus::Valid.
         */
        bool is_valid(const std::string& encrypted_remote_token, int64_t trusted_timestamp);

    private:
        KeyCache& key_cache_;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_TOKEN_HPP
