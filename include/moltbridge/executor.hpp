#ifndef MOLTBRIDGE_EXECUTOR_HPP
#define MOLTBRIDGE_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "signer.hpp"
#include "transport.hpp"

namespace MoltBridge {

    // Total attempts for one logical call.
    constexpr int DEFAULT_MAX_RETRIES = 3;
    constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

    /**
     * @brief Sends requests with a fresh signature per attempt, a per-attempt
     * timeout and bounded retries on connection-level failures.
     *
     * Attempts of one call run strictly one after another. Calls do not share
     * mutable state, so execute() may run concurrently from several threads
     * once the executor is configured.
     */
    class RequestExecutor {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        /**
         * @param transport The transport every attempt goes through.
         * @param signer Identity for authenticated calls; may be null.
         */
        explicit RequestExecutor(std::shared_ptr<net::Transport> transport,
                                 std::shared_ptr<const Signer> signer = nullptr);

        /**
         * @brief Performs one logical call.
         *
         * @param method HTTP verb; sent and signed upper-cased.
         * @param path Request path; the part before '?' is what gets signed.
         * @param body JSON body, sent in canonical form; std::nullopt for none.
         * @param requires_auth Attach an Authorization header, re-signed on every attempt.
         * @param max_retries Total number of attempts, at least 1.
         * @param timeout Bound for each attempt.
         * @return The parsed JSON response (an empty object for an empty body).
         * @throws NoAuthConfigured if requires_auth is set and there is no signer; nothing is sent.
         * @throws ApiError (or a subclass) for any status >= 400, without retrying.
         * @throws ConnectionExhausted once every attempt failed at the connection level.
         * @throws RuntimeError if a successful response is not valid JSON.
         */
        nlohmann::json execute(const std::string& method,
                               const std::string& path,
                               const std::optional<nlohmann::json>& body,
                               bool requires_auth,
                               int max_retries = DEFAULT_MAX_RETRIES,
                               std::chrono::milliseconds timeout = DEFAULT_TIMEOUT) const;

        // Delay before attempt n+1 is schedule[min(n-1, size-1)].
        void set_backoff(std::vector<std::chrono::milliseconds> schedule);
        const std::vector<std::chrono::milliseconds>& backoff() const { return backoff_; }

        void set_sleeper(Sleeper sleeper);

        bool has_signer() const { return signer_ != nullptr; }

        static const std::vector<std::chrono::milliseconds>& default_backoff();

    private:
        std::chrono::milliseconds delay_after(int attempt) const;

        std::shared_ptr<net::Transport> transport_;
        std::shared_ptr<const Signer> signer_;
        std::vector<std::chrono::milliseconds> backoff_;
        Sleeper sleeper_;
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_EXECUTOR_HPP
