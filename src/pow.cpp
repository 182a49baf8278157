#include "moltbridge/pow.hpp"

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

namespace {

void check_difficulty(int difficulty) {
    if (difficulty < 0 || difficulty > MAX_POW_DIFFICULTY) {
        throw InvalidArgument("Difficulty must be between 0 and 64, got " + std::to_string(difficulty) + ".");
    }
}

} // namespace

bool ProofOfWork::meets_difficulty(const std::string& hex_digest, int difficulty) {
    if (difficulty < 0 || static_cast<size_t>(difficulty) > hex_digest.size()) {
        return false;
    }
    return hex_digest.compare(0, static_cast<size_t>(difficulty), std::string(static_cast<size_t>(difficulty), '0')) == 0;
}

uint64_t ProofOfWork::solve(const std::string& nonce, int difficulty, uint64_t max_iterations) {
    check_difficulty(difficulty);
    if (difficulty == 0) {
        return 0;
    }

    for (uint64_t counter = 0; counter < max_iterations; ++counter) {
        if (meets_difficulty(Crypto::sha256_hex(nonce + std::to_string(counter)), difficulty)) {
            return counter;
        }
    }
    throw ChallengeExhausted("Challenge solving exceeded " + std::to_string(max_iterations) + " iterations");
}

std::future<uint64_t> ProofOfWork::solve_async(std::string nonce, int difficulty, uint64_t max_iterations) {
    return std::async(std::launch::async, [nonce = std::move(nonce), difficulty, max_iterations]() {
        return solve(nonce, difficulty, max_iterations);
    });
}

bool ProofOfWork::check(const std::string& nonce, const std::string& proof, int difficulty) {
    check_difficulty(difficulty);
    return meets_difficulty(Crypto::sha256_hex(nonce + proof), difficulty);
}

} // namespace MoltBridge
