#include "moltbridge/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "moltbridge/errors.hpp"

namespace MoltBridge {

    static std::atomic<bool> g_sodium_initialized = false;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::keypair_from_seed(const byte_vector& seed) {
        static_assert(crypto_sign_SEEDBYTES == SEED_BYTES, "Ed25519 seed size");
        static_assert(crypto_sign_PUBLICKEYBYTES == PUBLIC_KEY_BYTES, "Ed25519 public key size");

        if (seed.size() != crypto_sign_SEEDBYTES) {
            throw InvalidKeyMaterial("Ed25519 seed must be exactly 32 bytes, got " + std::to_string(seed.size()) + ".");
        }

        KeyPair kp;
        kp.seed = seed;
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        kp.privateKey.data.resize(crypto_sign_SECRETKEYBYTES);
        if (crypto_sign_seed_keypair(kp.publicKey.data.data(), kp.privateKey.data.data(), seed.data()) != 0) {
            throw RuntimeError("Failed to derive key pair from seed.");
        }
        return kp;
    }

    byte_vector Crypto::generate_seed() {
        return random_bytes(crypto_sign_SEEDBYTES);
    }

    byte_vector Crypto::random_bytes(size_t count) {
        if (init() != 0) {
            throw RuntimeError("Failed to initialize libsodium.");
        }
        byte_vector out(count);
        randombytes_buf(out.data(), out.size());
        return out;
    }

    Signature Crypto::sign(const byte_vector& message, const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid private key size for signing.");
        }
        Signature sig;
        sig.data.resize(crypto_sign_BYTES);
        crypto_sign_detached(sig.data.data(), nullptr, message.data(), message.size(), private_key.data.data());
        return sig;
    }

    bool Crypto::verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key) {
        if (signature.data.size() != crypto_sign_BYTES || public_key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;  // Invalid sizes
        }
        return crypto_sign_verify_detached(
                   signature.data.data(), message.data(), message.size(), public_key.data.data()) == 0;
    }

    std::string Crypto::sha256_hex(const std::string& data) {
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(data.data()), data.size());
        return hex_encode(digest);
    }

    std::string Crypto::base64url_encode(const byte_vector& data) {
        constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
        std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
        out.resize(out.size() - 1);  // drop the terminating NUL
        return out;
    }

    byte_vector Crypto::base64url_decode(const std::string& text) {
        byte_vector out(text.size() * 3 / 4 + 1);
        size_t out_len = 0;
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &out_len, nullptr,
                              sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
            throw InvalidArgument("Invalid base64url data.");
        }
        out.resize(out_len);
        return out;
    }

    std::string Crypto::hex_encode(const byte_vector& data) {
        std::string out(data.size() * 2 + 1, '\0');
        sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
        out.resize(data.size() * 2);
        return out;
    }

    byte_vector Crypto::hex_decode(const std::string& text) {
        if (text.size() % 2 != 0) {
            throw InvalidArgument("Hex string must have an even number of characters.");
        }
        byte_vector out(text.size() / 2);
        size_t out_len = 0;
        if (sodium_hex2bin(out.data(), out.size(), text.data(), text.size(), nullptr, &out_len, nullptr) != 0 ||
            out_len != out.size()) {
            throw InvalidArgument("Invalid hex data.");
        }
        return out;
    }

}  // namespace MoltBridge
