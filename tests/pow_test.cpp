#include "moltbridge/pow.hpp"

#include <gtest/gtest.h>

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

using MoltBridge::Crypto;
using MoltBridge::ProofOfWork;

TEST(ProofOfWorkTest, DifficultyZeroIsSolvedByCounterZero) {
    ASSERT_EQ(Crypto::init(), 0);
    ASSERT_EQ(ProofOfWork::solve("any-nonce", 0), 0u);
    ASSERT_EQ(ProofOfWork::solve("any-nonce", 0, 0), 0u);
}

TEST(ProofOfWorkTest, SolutionMeetsTargetAndIsLowest) {
    ASSERT_EQ(Crypto::init(), 0);

    const std::string nonce = "3f7a9c0e";
    const uint64_t proof = ProofOfWork::solve(nonce, 3);

    const std::string digest = Crypto::sha256_hex(nonce + std::to_string(proof));
    ASSERT_EQ(digest.substr(0, 3), "000");

    for (uint64_t counter = 0; counter < proof; ++counter) {
        ASSERT_NE(Crypto::sha256_hex(nonce + std::to_string(counter)).substr(0, 3), "000") << counter;
    }
    ASSERT_TRUE(ProofOfWork::check(nonce, std::to_string(proof), 3));
}

TEST(ProofOfWorkTest, ExhaustionIsReported) {
    ASSERT_EQ(Crypto::init(), 0);

    try {
        ProofOfWork::solve("nonce", 64, 1000);
        FAIL() << "expected ChallengeExhausted";
    } catch (const MoltBridge::ChallengeExhausted& e) {
        ASSERT_EQ(std::string(e.what()), "Challenge solving exceeded 1000 iterations");
        ASSERT_EQ(e.kind(), MoltBridge::ErrorKind::ChallengeExhausted);
        ASSERT_STREQ(MoltBridge::to_string(e.kind()), "CHALLENGE_TIMEOUT");
    }

    ASSERT_THROW(ProofOfWork::solve("nonce", 1, 0), MoltBridge::ChallengeExhausted);
}

TEST(ProofOfWorkTest, InvalidDifficulty) {
    ASSERT_THROW(ProofOfWork::solve("nonce", -1), MoltBridge::InvalidArgument);
    ASSERT_THROW(ProofOfWork::solve("nonce", 65), MoltBridge::InvalidArgument);
    ASSERT_THROW(ProofOfWork::check("nonce", "0", 65), MoltBridge::InvalidArgument);
}

TEST(ProofOfWorkTest, CheckRejectsWrongProof) {
    ASSERT_EQ(Crypto::init(), 0);

    const std::string nonce = "abcdef";
    const uint64_t proof = ProofOfWork::solve(nonce, 2);
    ASSERT_TRUE(ProofOfWork::check(nonce, std::to_string(proof), 2));
    ASSERT_FALSE(ProofOfWork::check(nonce, std::to_string(proof), 64));
    ASSERT_TRUE(ProofOfWork::check(nonce, "anything", 0));
}

TEST(ProofOfWorkTest, MeetsDifficulty) {
    ASSERT_TRUE(ProofOfWork::meets_difficulty("00ab", 2));
    ASSERT_FALSE(ProofOfWork::meets_difficulty("0a0b", 2));
    ASSERT_TRUE(ProofOfWork::meets_difficulty("abcd", 0));
    ASSERT_FALSE(ProofOfWork::meets_difficulty("00", 3));
}

TEST(ProofOfWorkTest, SolveAsyncMatchesSolve) {
    ASSERT_EQ(Crypto::init(), 0);

    auto future = ProofOfWork::solve_async("async-nonce", 2);
    ASSERT_EQ(future.get(), ProofOfWork::solve("async-nonce", 2));

    auto failing = ProofOfWork::solve_async("async-nonce", 64, 10);
    ASSERT_THROW(failing.get(), MoltBridge::ChallengeExhausted);
}
