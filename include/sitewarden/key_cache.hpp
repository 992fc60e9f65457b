#ifndef SITEWARDEN_KEY_CACHE_HPP
#define SITEWARDEN_KEY_CACHE_HPP

#include "keys.hpp"
#include "transport.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace SiteWarden {

    /**
     * @brief Holds the remote authority's public key for the lifetime of the owner.
     *
     * The cache starts empty. The first get_public_key() fetches the key from
     * the authority; later calls return the stored copy without I/O. A failed
     * fetch leaves the cache empty, so the next call tries again.
     */
    class KeyCache {
    public:
        explicit KeyCache(std::shared_ptr<Transport> transport);

        /**
         * @brief Returns the authority's public key, fetching it on first use.
         * @throws SiteWarden::RemoteCommunicationError if the fetch fails or the body is not a key.
         */
        PublicKey get_public_key();

        /**
         * @brief Checks whether a key has been fetched and stored.
         */
        bool has_public_key() const;

    private:
        PublicKey fetch_public_key();

        std::shared_ptr<Transport> transport_;

        // Guards public_key_ and serializes fetches.
        mutable std::mutex mutex_;
        std::optional<PublicKey> public_key_;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_KEY_CACHE_HPP
