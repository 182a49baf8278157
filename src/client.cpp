#include "moltbridge/client.hpp"

#include "moltbridge/errors.hpp"
#include "moltbridge/http_transport.hpp"
#include "moltbridge/pow.hpp"

namespace MoltBridge {

namespace {

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::shared_ptr<const Signer> make_signer(const ClientConfig& config) {
    if (!config.agent_id) {
        return nullptr;
    }
    if (config.signing_key) {
        return std::make_shared<const Signer>(Signer::from_hex(*config.signing_key, *config.agent_id));
    }
    return std::make_shared<const Signer>(Signer::generate(*config.agent_id));
}

ClientConfig normalized(ClientConfig config) {
    config.base_url = strip_trailing_slashes(config.base_url);
    return config;
}

} // namespace

Client::Client(ClientConfig config, std::shared_ptr<net::Transport> transport)
    : config_(normalized(std::move(config))),
      signer_(make_signer(config_)),
      executor_(transport ? std::move(transport) : std::make_shared<net::HttpTransport>(config_.base_url), signer_) {}

nlohmann::json Client::health() {
    return executor_.execute("GET", "/health", std::nullopt, false, 1, config_.timeout);
}

VerificationResult Client::verify() {
    nlohmann::json response =
        executor_.execute("POST", "/verify", nlohmann::json::object(), false, config_.max_retries, config_.timeout);

    if (VerificationResult::is_verified_response(response)) {
        VerificationResult result = VerificationResult::from_json(response);
        if (!result.token.empty()) {
            verification_token_ = result.token;
        }
        return result;
    }

    Challenge challenge = Challenge::from_json(response);
    uint64_t proof = ProofOfWork::solve(challenge.nonce, challenge.difficulty, config_.pow_max_iterations);

    ChallengeSolution solution{challenge.challenge_id, proof};
    nlohmann::json submitted =
        executor_.execute("POST", "/verify", solution.to_json(), false, config_.max_retries, config_.timeout);

    VerificationResult result = VerificationResult::from_json(submitted);
    if (!result.token.empty()) {
        verification_token_ = result.token;
    }
    return result;
}

nlohmann::json Client::register_agent(const RegistrationRequest& registration) {
    if (!signer_) {
        throw NoAuthConfigured("Cannot register: no agent_id configured.");
    }
    const std::optional<std::string>& token =
        registration.verification_token ? registration.verification_token : verification_token_;
    if (!token) {
        throw LogicError("Cannot register: call verify() first to complete proof-of-work.");
    }

    nlohmann::json body = {
        {"agent_id", signer_->agent_id()},
        {"name", registration.name.value_or(signer_->agent_id())},
        {"platform", registration.platform},
        {"pubkey", signer_->public_key_b64()},
        {"capabilities", registration.capabilities},
        {"clusters", registration.clusters},
        {"verification_token", *token},
        {"omniscience_acknowledged", registration.omniscience_acknowledged},
        {"article22_consent", registration.article22_consent},
    };
    if (registration.a2a_endpoint && !registration.a2a_endpoint->empty()) {
        body["a2a_endpoint"] = *registration.a2a_endpoint;
    }

    return executor_.execute("POST", "/register", body, false, config_.max_retries, config_.timeout);
}

nlohmann::json Client::request(const std::string& method,
                               const std::string& path,
                               const std::optional<nlohmann::json>& body,
                               bool requires_auth) {
    return executor_.execute(method, path, body, requires_auth, config_.max_retries, config_.timeout);
}

std::optional<std::string> Client::agent_id() const {
    if (!signer_) {
        return std::nullopt;
    }
    return signer_->agent_id();
}

std::optional<std::string> Client::public_key() const {
    if (!signer_) {
        return std::nullopt;
    }
    return signer_->public_key_b64();
}

std::optional<std::string> Client::seed_hex() const {
    if (!signer_) {
        return std::nullopt;
    }
    return signer_->seed_hex();
}

} // namespace MoltBridge
