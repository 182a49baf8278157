#ifndef MOLTBRIDGE_CHALLENGE_HPP
#define MOLTBRIDGE_CHALLENGE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "keys.hpp"

namespace MoltBridge {

    // --- /verify message bodies ---

    // Proof-of-work puzzle issued by the server.
    struct Challenge {
        std::string challenge_id;
        std::string nonce;
        int difficulty = 0;
        std::string expires_at;

        nlohmann::json to_json() const;
        static Challenge from_json(const nlohmann::json& data);
    };

    // Submission of a solved challenge; the counter travels as a decimal string.
    struct ChallengeSolution {
        std::string challenge_id;
        uint64_t proof_of_work = 0;

        nlohmann::json to_json() const;
    };

    // Outcome of a successful submission (or of an already verified agent).
    struct VerificationResult {
        bool verified = false;
        std::string token;

        nlohmann::json to_json() const;
        static VerificationResult from_json(const nlohmann::json& data);

        // True when a /verify response carries {"verified": true}.
        static bool is_verified_response(const nlohmann::json& data);
    };

    /**
     * @brief Issues and redeems proof-of-work challenges (the server side of /verify).
     *
     * Each challenge can be redeemed once. A successful redemption yields a
     * verification token "<base64url payload>.<base64url signature>" signed with
     * the issuer key. Thread-safe.
     */
    class ChallengeIssuer {
    public:
        // Unix time in milliseconds.
        using MillisClock = std::function<int64_t()>;

        static constexpr int DEFAULT_DIFFICULTY = 4;
        static constexpr std::chrono::milliseconds DEFAULT_TTL{30000};
        static constexpr std::chrono::milliseconds TOKEN_LIFETIME{3600000};

        ChallengeIssuer(KeyPair signing_key,
                        int difficulty = DEFAULT_DIFFICULTY,
                        std::chrono::milliseconds ttl = DEFAULT_TTL,
                        MillisClock clock = unix_time_millis);

        Challenge issue();

        /**
         * @brief Checks a solution and consumes its challenge.
         * @throws ValidationError (code VERIFICATION_FAILED) if the challenge is
         *         unknown, expired or the proof does not meet the difficulty.
         */
        VerificationResult redeem(const std::string& challenge_id, const std::string& proof_of_work);

        /**
         * @brief Validates a token produced by redeem().
         * @return The token payload.
         * @throws ValidationError if the token is malformed, forged or older than an hour.
         */
        nlohmann::json validate_token(const std::string& token) const;

        const PublicKey& public_key() const { return signing_key_.publicKey; }

        // Number of outstanding challenges, expired ones included until pruned.
        size_t pending() const;

        static int64_t unix_time_millis();

    private:
        struct Entry {
            std::string nonce;
            int difficulty;
            int64_t expires_at_ms;
        };

        void prune_expired(int64_t now_ms);

        KeyPair signing_key_;
        int difficulty_;
        std::chrono::milliseconds ttl_;
        MillisClock clock_;

        mutable std::mutex mutex_;
        std::map<std::string, Entry> challenges_;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_CHALLENGE_HPP
