#ifndef SITEWARDEN_TEST_HELPERS_HPP
#define SITEWARDEN_TEST_HELPERS_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "sitewarden/crypto.hpp"
#include "sitewarden/encoding.hpp"
#include "sitewarden/token.hpp"
#include "sitewarden/transport.hpp"

namespace SiteWarden {
namespace test {

// In-memory transport that serves canned responses and records every request.
class FakeTransport : public Transport {
public:
    struct Request {
        std::string method;
        std::string path;
        std::string body;
    };

    void set_response(const std::string& path, long status, std::string body, std::string reason = "") {
        if (reason.empty()) {
            reason = status == STATUS_OK ? "OK" : "Internal Server Error";
        }
        responses_[path] = Response{status, std::move(reason), std::move(body)};
    }

    void serve_public_key(const PublicKey& key) {
        set_response(PUBLIC_KEY_PATH, STATUS_OK, base64_encode(key.data));
    }

    Response fetch(const std::string& path) override {
        requests.push_back({"GET", path, ""});
        return respond(path);
    }

    Response post(const std::string& path, const std::string& body) override {
        requests.push_back({"POST", path, body});
        return respond(path);
    }

    size_t count(const std::string& method, const std::string& path) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.method == method && r.path == path) {
                ++n;
            }
        }
        return n;
    }

    std::vector<Request> requests;

private:
    Response respond(const std::string& path) const {
        auto it = responses_.find(path);
        if (it == responses_.end()) {
            return Response{404, "Not Found", ""};
        }
        return it->second;
    }

    std::map<std::string, Response> responses_;
};

// Builds a token the way the authority does: the decimal time, signed, both base64 encoded.
inline std::string issue_token(const std::string& time, const PrivateKey& authority_key) {
    Signature sig = Crypto::sign(to_bytes(time), authority_key);
    TokenEnvelope token;
    token.time = base64_encode(time);
    token.signature = base64_encode(sig.data);
    return token.encode();
}

inline std::string issue_token(int64_t timestamp, const PrivateKey& authority_key) {
    return issue_token(std::to_string(timestamp), authority_key);
}

} // namespace test
} // namespace SiteWarden

#endif // SITEWARDEN_TEST_HELPERS_HPP
