#include "sitewarden/encoding.hpp"

#include <sodium.h>

namespace SiteWarden {

    namespace {
        constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;
        constexpr char BASE64_IGNORE[] = " \t\r\n";

        std::string encode(const unsigned char* data, size_t size) {
            std::string out(sodium_base64_ENCODED_LEN(size, BASE64_VARIANT), '\0');
            sodium_bin2base64(out.data(), out.size(), data, size, BASE64_VARIANT);
            out.resize(out.size() - 1);  // Drop the terminating NUL
            return out;
        }
    }

    std::string base64_encode(const byte_vector& data) {
        return encode(data.data(), data.size());
    }

    std::string base64_encode(const std::string& data) {
        return encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    std::optional<byte_vector> base64_decode(const std::string& encoded) {
        // Every 4 characters decode to at most 3 bytes.
        byte_vector out(encoded.size() / 4 * 3 + 3);
        size_t decoded_len = 0;
        const char* end = nullptr;

        if (sodium_base642bin(out.data(), out.size(),
                              encoded.data(), encoded.size(),
                              BASE64_IGNORE, &decoded_len, &end,
                              BASE64_VARIANT) != 0) {
            return std::nullopt;
        }
        // Trailing garbage after a complete encoding is rejected.
        if (end != encoded.data() + encoded.size()) {
            return std::nullopt;
        }

        out.resize(decoded_len);
        return out;
    }

    std::optional<std::string> base64_decode_string(const std::string& encoded) {
        auto bytes = base64_decode(encoded);
        if (!bytes) {
            return std::nullopt;
        }
        return to_string(*bytes);
    }

    namespace detail {
        std::optional<nlohmann::json> decode_json_object(const std::string& encoded) {
            auto text = base64_decode_string(encoded);
            if (!text) {
                return std::nullopt;
            }
            // Parse without exceptions; a parse error yields a discarded value.
            nlohmann::json value = nlohmann::json::parse(*text, nullptr, false);
            if (value.is_discarded() || !value.is_object()) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<std::string> non_empty_string(const nlohmann::json& object, const char* field) {
            auto it = object.find(field);
            if (it == object.end() || !it->is_string()) {
                return std::nullopt;
            }
            const auto& value = it->get_ref<const std::string&>();
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
    }

} // namespace SiteWarden
