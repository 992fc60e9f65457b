#ifndef SITEWARDEN_KEYS_HPP
#define SITEWARDEN_KEYS_HPP

#include <vector>
#include <cstdint>

namespace SiteWarden {

    // Using a simple vector of bytes for key and ciphertext material.
    using byte_vector = std::vector<uint8_t>;

    // The remote authority's public key (Ed25519).
    struct PublicKey {
        byte_vector data;
    };

    // The private counterpart held on this side for opening inbound envelopes.
    struct PrivateKey {
        byte_vector data;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    // A detached digital signature.
    struct Signature {
        byte_vector data;
    };

} // namespace SiteWarden

#endif // SITEWARDEN_KEYS_HPP
