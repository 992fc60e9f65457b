#include "sitewarden/key_cache.hpp"

#include <utility>

#include "sitewarden/encoding.hpp"
#include "sitewarden/errors.hpp"

namespace SiteWarden {

KeyCache::KeyCache(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw InvalidArgument("KeyCache requires a transport.");
    }
}

PublicKey KeyCache::get_public_key() {
    // The lock is held across the fetch so that concurrent callers wait for
    // the first one instead of issuing their own request.
    std::lock_guard<std::mutex> lock(mutex_);
    if (!public_key_) {
        public_key_ = fetch_public_key();
    }
    return *public_key_;
}

bool KeyCache::has_public_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return public_key_.has_value();
}

PublicKey KeyCache::fetch_public_key() {
    Response response = transport_->fetch(PUBLIC_KEY_PATH);
    ensure_ok(response);

    auto decoded = base64_decode(response.body);
    if (!decoded) {
        throw RemoteCommunicationError(response.status, "public key is not valid base64");
    }
    if (decoded->empty()) {
        throw RemoteCommunicationError(response.status, "public key is empty");
    }

    PublicKey key;
    key.data = std::move(*decoded);
    return key;
}

} // namespace SiteWarden
