#ifndef MOLTBRIDGE_CONFIG_HPP
#define MOLTBRIDGE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "executor.hpp"
#include "pow.hpp"

namespace MoltBridge {

    constexpr char DEFAULT_BASE_URL[] = "http://localhost:3040";

    /**
     * @brief Settings for a Client. Key material is passed in here explicitly;
     * where it is stored is up to the caller.
     */
    struct ClientConfig {
        std::string base_url = DEFAULT_BASE_URL;
        std::optional<std::string> agent_id;
        std::optional<std::string> signing_key;  // 64 hex characters (32-byte seed)
        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
        int max_retries = DEFAULT_MAX_RETRIES;
        uint64_t pow_max_iterations = DEFAULT_POW_MAX_ITERATIONS;

        /**
         * @brief Reads MOLTBRIDGE_BASE_URL, MOLTBRIDGE_AGENT_ID, MOLTBRIDGE_SIGNING_KEY,
         * MOLTBRIDGE_TIMEOUT_MS and MOLTBRIDGE_MAX_RETRIES. Unset or empty variables keep the defaults.
         * @throws InvalidArgument if a numeric variable is not a positive integer.
         */
        static ClientConfig from_env();
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_CONFIG_HPP
