#ifndef SITEWARDEN_ENCODING_HPP
#define SITEWARDEN_ENCODING_HPP

#include "keys.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SiteWarden {

    /**
     * @brief Encodes bytes as standard, padded base64.
     */
    std::string base64_encode(const byte_vector& data);
    std::string base64_encode(const std::string& data);

    /**
     * @brief Decodes standard, padded base64. Embedded whitespace is ignored.
     * @return The decoded bytes, or std::nullopt if the input is not base64.
     */
    std::optional<byte_vector> base64_decode(const std::string& encoded);

    /**
     * @brief Same as base64_decode, returning the bytes as a string.
     */
    std::optional<std::string> base64_decode_string(const std::string& encoded);

    inline std::string to_string(const byte_vector& data) {
        return std::string(data.begin(), data.end());
    }

    inline byte_vector to_bytes(const std::string& data) {
        return byte_vector(data.begin(), data.end());
    }

    namespace detail {
        /**
         * @brief Base64-decodes `encoded` and parses it as a JSON object.
         * @return std::nullopt if either step fails or the value is not an object.
         */
        std::optional<nlohmann::json> decode_json_object(const std::string& encoded);

        /**
         * @brief Reads `field` from a JSON object if it is a non-empty string.
         */
        std::optional<std::string> non_empty_string(const nlohmann::json& object, const char* field);
    }

} // namespace SiteWarden

#endif // SITEWARDEN_ENCODING_HPP
