#ifndef MOLTBRIDGE_CLIENT_HPP
#define MOLTBRIDGE_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "challenge.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "signer.hpp"
#include "transport.hpp"

namespace MoltBridge {

    struct RegistrationRequest {
        std::optional<std::string> name;  // defaults to the agent id
        std::string platform = "custom";
        std::vector<std::string> capabilities;
        std::vector<std::string> clusters;
        std::optional<std::string> a2a_endpoint;
        std::optional<std::string> verification_token;  // defaults to the token from verify()
        bool omniscience_acknowledged = true;
        bool article22_consent = true;
    };

    /**
     * @brief Agent-side entry point: identity, proof-of-work bootstrap and signed calls.
     */
    class Client {
    public:
        /**
         * @brief Construct a new Client.
         *
         * With an agent id and a signing key the client signs with that key; with
         * an agent id alone a fresh seed is generated (persist it via seed_hex()).
         *
         * @param config Client settings.
         * @param transport Defaults to an HttpTransport for config.base_url.
         * @throws InvalidKeyMaterial if the signing key is not 32 bytes of hex.
         */
        explicit Client(ClientConfig config, std::shared_ptr<net::Transport> transport = nullptr);

        // GET /health, unauthenticated, single attempt.
        nlohmann::json health();

        /**
         * @brief Completes the proof-of-work challenge and stores the verification token.
         * @throws ChallengeExhausted if the challenge cannot be solved within the iteration bound.
         */
        VerificationResult verify();

        /**
         * @brief POST /register with this agent's identity and verification token.
         * @throws NoAuthConfigured if no agent identity is configured.
         * @throws LogicError if no verification token is available.
         */
        nlohmann::json register_agent(const RegistrationRequest& registration = RegistrationRequest());

        // Generic call with the configured retry budget and timeout.
        nlohmann::json request(const std::string& method,
                               const std::string& path,
                               const std::optional<nlohmann::json>& body = std::nullopt,
                               bool requires_auth = true);

        std::optional<std::string> agent_id() const;
        std::optional<std::string> public_key() const;
        std::optional<std::string> seed_hex() const;
        const std::optional<std::string>& verification_token() const { return verification_token_; }

        const ClientConfig& config() const { return config_; }
        RequestExecutor& executor() { return executor_; }

    private:
        ClientConfig config_;
        std::shared_ptr<const Signer> signer_;
        RequestExecutor executor_;
        std::optional<std::string> verification_token_;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_CLIENT_HPP
