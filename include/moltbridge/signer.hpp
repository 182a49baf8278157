#ifndef MOLTBRIDGE_SIGNER_HPP
#define MOLTBRIDGE_SIGNER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "auth_header.hpp"
#include "keys.hpp"

namespace MoltBridge {

    // Source of the current Unix time in whole seconds.
    using Clock = std::function<int64_t()>;

    int64_t unix_time_seconds();

    /**
     * @brief The exact bytes that get signed: "method:path:timestamp:bodyDigest".
     */
    struct SigningMaterial {
        std::string method;
        std::string path;
        std::string timestamp;  // decimal text exactly as it appears in the header
        std::string body_digest;

        std::string message() const;

        static SigningMaterial for_request(const std::string& method,
                                           const std::string& path,
                                           int64_t timestamp,
                                           const std::optional<nlohmann::json>& body);

        // Verifier side: the timestamp field is signed as received, leading zeros included.
        static SigningMaterial for_request(const std::string& method,
                                           const std::string& path,
                                           const std::string& timestamp,
                                           const std::optional<nlohmann::json>& body);
    };

    /**
     * @brief Produces Authorization headers for one agent identity.
     *
     * The key material is immutable after construction, so a Signer can be shared
     * between threads without locking.
     */
    class Signer {
    public:
        /**
         * @brief Construct a new Signer.
         * @param seed The 32-byte Ed25519 seed.
         * @param agent_id The identity named in every header.
         * @param clock Time source for header timestamps.
         * @throws InvalidKeyMaterial if the seed is not exactly 32 bytes.
         * @throws InvalidArgument if the agent id is empty or contains ':' or whitespace.
         */
        Signer(const byte_vector& seed, std::string agent_id, Clock clock = unix_time_seconds);

        // Create from a 64-character hex seed.
        static Signer from_hex(const std::string& seed_hex, std::string agent_id);

        // Create with a fresh random seed.
        static Signer generate(std::string agent_id);

        /**
         * @brief Signs a request with the current time.
         * @return The Authorization header value.
         */
        std::string sign(const std::string& method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body = std::nullopt) const;

        AuthorizationHeader sign_at(const std::string& method,
                                    const std::string& path,
                                    const std::optional<nlohmann::json>& body,
                                    int64_t timestamp) const;

        const std::string& agent_id() const { return agent_id_; }
        const PublicKey& public_key() const { return key_.publicKey; }

        // Public key as base64url, the form used for registration.
        std::string public_key_b64() const;

        // Seed as hex, for persistence by the caller.
        std::string seed_hex() const;

    private:
        KeyPair key_;
        std::string agent_id_;
        Clock clock_;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_SIGNER_HPP
