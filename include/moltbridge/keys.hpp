#ifndef MOLTBRIDGE_KEYS_HPP
#define MOLTBRIDGE_KEYS_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

namespace MoltBridge {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // Ed25519 sizes as fixed by RFC 8032.
    constexpr size_t SEED_BYTES = 32;
    constexpr size_t PUBLIC_KEY_BYTES = 32;
    constexpr size_t SIGNATURE_BYTES = 64;

    // A 32-byte public key.
    struct PublicKey {
        byte_vector data;
    };

    // The libsodium secret key: seed followed by the public key (64 bytes).
    struct PrivateKey {
        byte_vector data;
    };

    // An agent's identity material. The public key is a pure function of the seed.
    struct KeyPair {
        byte_vector seed;
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    // A detached digital signature.
    struct Signature {
        byte_vector data;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_KEYS_HPP
