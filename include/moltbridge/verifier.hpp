#ifndef MOLTBRIDGE_VERIFIER_HPP
#define MOLTBRIDGE_VERIFIER_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "keys.hpp"
#include "signer.hpp"

namespace MoltBridge {

    // Resolves an agent id to its registered public key, or std::nullopt if unknown.
    using PublicKeyLookup = std::function<std::optional<PublicKey>(const std::string& agent_id)>;

    constexpr std::chrono::seconds DEFAULT_FRESHNESS_WINDOW{300};

    // Identity recovered from a successfully verified request.
    struct AuthenticatedAgent {
        std::string agent_id;
        int64_t timestamp = 0;
    };

    /**
     * @brief Server-side check of Authorization headers.
     */
    class Verifier {
    public:
        explicit Verifier(std::chrono::seconds freshness_window = DEFAULT_FRESHNESS_WINDOW,
                          Clock clock = unix_time_seconds);

        /**
         * @brief Authenticates one request.
         *
         * Method, path and body must come from the transport layer, never from
         * the header. Checks run in order: header syntax, timestamp freshness,
         * agent lookup, signature.
         *
         * @param header The raw Authorization header value.
         * @param method The request method as received.
         * @param path The request path as received, without host or query.
         * @param body The parsed request body, std::nullopt when there was none.
         * @param lookup Public key resolver.
         * @return The authenticated identity and its signed timestamp.
         * @throws VerificationError with the failing AuthFailure reason.
         */
        AuthenticatedAgent verify(const std::string& header,
                                  const std::string& method,
                                  const std::string& path,
                                  const std::optional<nlohmann::json>& body,
                                  const PublicKeyLookup& lookup) const;

        std::chrono::seconds freshness_window() const { return freshness_window_; }

    private:
        std::chrono::seconds freshness_window_;
        Clock clock_;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_VERIFIER_HPP
