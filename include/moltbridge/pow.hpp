#ifndef MOLTBRIDGE_POW_HPP
#define MOLTBRIDGE_POW_HPP

#include <cstdint>
#include <future>
#include <string>

namespace MoltBridge {

    // Bounds the worst-case client cost of one challenge.
    constexpr uint64_t DEFAULT_POW_MAX_ITERATIONS = 10000000;

    // A SHA-256 hex digest has 64 characters.
    constexpr int MAX_POW_DIFFICULTY = 64;

    /**
     * @brief SHA-256 proof-of-work: find a counter such that
     * sha256_hex(nonce + decimal(counter)) starts with `difficulty` '0' characters.
     */
    class ProofOfWork {
    public:
        /**
         * @brief Sequential sweep from counter 0; returns the lowest satisfying counter.
         * @param nonce The server-issued nonce.
         * @param difficulty Required leading zero hex digits, 0..64.
         * @param max_iterations Counters 0..max_iterations-1 are tried.
         * @throws InvalidArgument if difficulty is out of range.
         * @throws ChallengeExhausted if no counter in range satisfies the target.
         */
        static uint64_t solve(const std::string& nonce,
                              int difficulty,
                              uint64_t max_iterations = DEFAULT_POW_MAX_ITERATIONS);

        /**
         * @brief Runs solve() on a dedicated worker thread. Errors surface from future::get().
         */
        static std::future<uint64_t> solve_async(std::string nonce,
                                                 int difficulty,
                                                 uint64_t max_iterations = DEFAULT_POW_MAX_ITERATIONS);

        // Server-side check of a submitted proof string.
        static bool check(const std::string& nonce, const std::string& proof, int difficulty);

        static bool meets_difficulty(const std::string& hex_digest, int difficulty);
    };

} // namespace MoltBridge

#endif // MOLTBRIDGE_POW_HPP
