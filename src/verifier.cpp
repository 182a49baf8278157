#include "moltbridge/verifier.hpp"

#include "moltbridge/auth_header.hpp"
#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

Verifier::Verifier(std::chrono::seconds freshness_window, Clock clock)
    : freshness_window_(freshness_window), clock_(std::move(clock)) {
    if (freshness_window_.count() < 0) {
        throw InvalidArgument("Freshness window must not be negative.");
    }
    if (!clock_) {
        throw InvalidArgument("Verifier requires a clock.");
    }
    if (Crypto::init() != 0) {
        throw RuntimeError("Failed to initialize libsodium.");
    }
}

AuthenticatedAgent Verifier::verify(const std::string& header,
                                    const std::string& method,
                                    const std::string& path,
                                    const std::optional<nlohmann::json>& body,
                                    const PublicKeyLookup& lookup) const {
    AuthorizationHeader parsed = AuthorizationHeader::parse(header);

    const int64_t now = clock_();
    const int64_t skew = now > parsed.timestamp ? now - parsed.timestamp : parsed.timestamp - now;
    if (skew > freshness_window_.count()) {
        throw VerificationError(AuthFailure::StaleTimestamp,
                                "Request timestamp is stale (>" + std::to_string(freshness_window_.count()) +
                                    " seconds)");
    }

    const std::string message = SigningMaterial::for_request(method, path, parsed.timestamp_text, body).message();

    std::optional<PublicKey> public_key = lookup ? lookup(parsed.agent_id) : std::nullopt;
    if (!public_key) {
        throw VerificationError(AuthFailure::UnknownAgent, "Agent '" + parsed.agent_id + "' not found");
    }

    if (!Crypto::verify(parsed.signature, byte_vector(message.begin(), message.end()), *public_key)) {
        throw VerificationError(AuthFailure::SignatureMismatch, "Invalid signature");
    }

    return AuthenticatedAgent{parsed.agent_id, parsed.timestamp};
}

} // namespace MoltBridge
