#ifndef MOLTBRIDGE_CRYPTO_HPP
#define MOLTBRIDGE_CRYPTO_HPP

#include "keys.hpp"
#include <string>

namespace MoltBridge {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Safe to call more than once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Derives the Ed25519 key pair for a seed.
         * @param seed Exactly 32 bytes.
         * @return The key pair; identical seeds always give identical keys.
         * @throws InvalidKeyMaterial if the seed is not 32 bytes.
         */
        static KeyPair keypair_from_seed(const byte_vector& seed);

        /**
         * @brief Generates a fresh random 32-byte seed.
         */
        static byte_vector generate_seed();

        // Bytes from the system CSPRNG.
        static byte_vector random_bytes(size_t count);

        /**
         * @brief Creates a detached Ed25519 signature.
         * @param message The data to sign.
         * @param private_key The signer's 64-byte secret key.
         * @return A Signature object.
         */
        static Signature sign(const byte_vector& message, const PrivateKey& private_key);

        /**
         * @brief Verifies a detached Ed25519 signature.
         * @return True if the signature is valid, false otherwise (including size mismatches).
         */
        static bool verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key);

        /**
         * @brief SHA-256 of the given bytes as 64 lowercase hex characters.
         */
        static std::string sha256_hex(const std::string& data);

        // base64url without padding
        static std::string base64url_encode(const byte_vector& data);
        static byte_vector base64url_decode(const std::string& text);

        // lowercase hex
        static std::string hex_encode(const byte_vector& data);
        static byte_vector hex_decode(const std::string& text);
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_CRYPTO_HPP
