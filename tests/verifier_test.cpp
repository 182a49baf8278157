#include "moltbridge/verifier.hpp"

#include <gtest/gtest.h>

#include <map>

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

using MoltBridge::AuthFailure;
using MoltBridge::Crypto;
using MoltBridge::PublicKey;
using MoltBridge::Signer;
using MoltBridge::Verifier;
using nlohmann::json;

namespace {

constexpr int64_t NOW = 1700000000;

class Registry {
public:
    void add(const Signer& signer) { keys_[signer.agent_id()] = signer.public_key(); }

    MoltBridge::PublicKeyLookup lookup() const {
        return [this](const std::string& agent_id) -> std::optional<PublicKey> {
            auto it = keys_.find(agent_id);
            if (it == keys_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

private:
    std::map<std::string, PublicKey> keys_;
};

AuthFailure failure_of(const Verifier& verifier,
                       const std::string& header,
                       const std::string& method,
                       const std::string& path,
                       const std::optional<json>& body,
                       const MoltBridge::PublicKeyLookup& lookup) {
    try {
        verifier.verify(header, method, path, body, lookup);
    } catch (const MoltBridge::VerificationError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "request was accepted";
    return AuthFailure::MalformedHeader;
}

// Re-encodes the header with one signature bit flipped.
std::string flip_signature_bit(const std::string& header) {
    auto parsed = MoltBridge::AuthorizationHeader::parse(header);
    parsed.signature.data[10] ^= 0x01;
    return parsed.format();
}

} // namespace

class VerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Crypto::init(), 0);
        now_ = NOW;
    }

    MoltBridge::Clock clock() {
        return [this]() { return now_; };
    }

    int64_t now_ = 0;
};

TEST_F(VerifierTest, RoundTripWithRandomSeeds) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    Registry registry;

    json body = {{"target", "agent-z"}, {"amount", 1.5}, {"nested", {{"b", 1}, {"a", {1, 2, 3}}}}};
    for (int i = 0; i < 8; ++i) {
        Signer signer(Crypto::generate_seed(), "agent-" + std::to_string(i), clock());
        registry.add(signer);

        auto agent = verifier.verify(signer.sign("POST", "/broker-request", body), "POST", "/broker-request", body,
                                     registry.lookup());
        ASSERT_EQ(agent.agent_id, signer.agent_id());
        ASSERT_EQ(agent.timestamp, NOW);

        auto no_body = verifier.verify(signer.sign("GET", "/discover"), "GET", "/discover", std::nullopt,
                                       registry.lookup());
        ASSERT_EQ(no_body.agent_id, signer.agent_id());
    }
}

TEST_F(VerifierTest, BodyKeyOrderDoesNotMatter) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    Registry registry;
    Signer signer(Crypto::generate_seed(), "agent-1", clock());
    registry.add(signer);

    json sent = json::parse(R"({"a":1,"b":{"d":2,"c":3}})");
    json received = json::parse(R"({"b":{"c":3,"d":2},"a":1})");
    ASSERT_NO_THROW(verifier.verify(signer.sign("POST", "/x", sent), "POST", "/x", received, registry.lookup()));
}

TEST_F(VerifierTest, TamperingIsDetected) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    Registry registry;
    Signer signer(Crypto::generate_seed(), "agent-1", clock());
    Signer other(Crypto::generate_seed(), "agent-2", clock());
    registry.add(signer);
    registry.add(other);

    json body = {{"amount", 10}};
    const std::string header = signer.sign("POST", "/payments", body);
    auto lookup = registry.lookup();

    ASSERT_EQ(failure_of(verifier, header, "PUT", "/payments", body, lookup), AuthFailure::SignatureMismatch);
    ASSERT_EQ(failure_of(verifier, header, "POST", "/payments/x", body, lookup), AuthFailure::SignatureMismatch);
    ASSERT_EQ(failure_of(verifier, header, "POST", "/payments", json{{"amount", 11}}, lookup),
              AuthFailure::SignatureMismatch);
    ASSERT_EQ(failure_of(verifier, header, "POST", "/payments", std::nullopt, lookup),
              AuthFailure::SignatureMismatch);
    ASSERT_EQ(failure_of(verifier, flip_signature_bit(header), "POST", "/payments", body, lookup),
              AuthFailure::SignatureMismatch);

    // Claiming another agent's identity with our signature
    auto parsed = MoltBridge::AuthorizationHeader::parse(header);
    parsed.agent_id = "agent-2";
    ASSERT_EQ(failure_of(verifier, parsed.format(), "POST", "/payments", body, lookup),
              AuthFailure::SignatureMismatch);

    // Shifting the timestamp within the window
    parsed = MoltBridge::AuthorizationHeader::parse(header);
    parsed.timestamp += 1;
    ASSERT_EQ(failure_of(verifier, parsed.format(), "POST", "/payments", body, lookup),
              AuthFailure::SignatureMismatch);
}

TEST_F(VerifierTest, StaleAndFutureTimestampsAreRejected) {
    Verifier verifier(std::chrono::seconds(60), clock());
    Registry registry;
    Signer signer(Crypto::generate_seed(), "agent-1", clock());
    registry.add(signer);

    auto old = signer.sign_at("GET", "/health", std::nullopt, NOW - 61).format();
    auto future = signer.sign_at("GET", "/health", std::nullopt, NOW + 61).format();
    auto edge = signer.sign_at("GET", "/health", std::nullopt, NOW - 60).format();

    ASSERT_EQ(failure_of(verifier, old, "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::StaleTimestamp);
    ASSERT_EQ(failure_of(verifier, future, "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::StaleTimestamp);
    ASSERT_NO_THROW(verifier.verify(edge, "GET", "/health", std::nullopt, registry.lookup()));
}

TEST_F(VerifierTest, StalenessIsCheckedBeforeLookup) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    Signer signer(Crypto::generate_seed(), "ghost", clock());

    bool looked_up = false;
    MoltBridge::PublicKeyLookup lookup = [&looked_up](const std::string&) -> std::optional<PublicKey> {
        looked_up = true;
        return std::nullopt;
    };

    auto stale = signer.sign_at("GET", "/health", std::nullopt, NOW - 301).format();
    ASSERT_EQ(failure_of(verifier, stale, "GET", "/health", std::nullopt, lookup), AuthFailure::StaleTimestamp);
    ASSERT_FALSE(looked_up);

    ASSERT_EQ(failure_of(verifier, signer.sign("GET", "/health"), "GET", "/health", std::nullopt, lookup),
              AuthFailure::UnknownAgent);
    ASSERT_TRUE(looked_up);
}

TEST_F(VerifierTest, MalformedHeaders) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    Registry registry;

    ASSERT_EQ(failure_of(verifier, "", "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::MalformedHeader);
    ASSERT_EQ(failure_of(verifier, "Bearer token", "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::MalformedHeader);
    ASSERT_EQ(failure_of(verifier, "MoltBridge-Ed25519 a:b:c:d", "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::MalformedHeader);
}

TEST_F(VerifierTest, ZeroSeedHealthCheckAges) {
    Signer signer(Crypto::hex_decode(std::string(64, '0')), "test-agent", clock());
    Registry registry;
    registry.add(signer);
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());

    const std::string header = signer.sign("GET", "/health");
    ASSERT_NO_THROW(verifier.verify(header, "GET", "/health", std::nullopt, registry.lookup()));

    now_ += 300;
    ASSERT_NO_THROW(verifier.verify(header, "GET", "/health", std::nullopt, registry.lookup()));

    now_ += 1;
    ASSERT_EQ(failure_of(verifier, header, "GET", "/health", std::nullopt, registry.lookup()),
              AuthFailure::StaleTimestamp);
}

TEST_F(VerifierTest, TimestampFieldIsSignedAsReceived) {
    Verifier verifier(MoltBridge::DEFAULT_FRESHNESS_WINDOW, clock());
    auto kp = Crypto::keypair_from_seed(Crypto::generate_seed());
    MoltBridge::PublicKeyLookup lookup = [&kp](const std::string&) -> std::optional<PublicKey> {
        return kp.publicKey;
    };

    // A client that zero-pads the timestamp signs the padded text
    const std::string padded = "0" + std::to_string(NOW);
    const std::string message = MoltBridge::SigningMaterial::for_request("GET", "/health", padded, std::nullopt).message();
    const std::string expected_prefix = "GET:/health:" + padded + ":";
    ASSERT_EQ(message.compare(0, expected_prefix.size(), expected_prefix), 0);
    auto signature = Crypto::sign(MoltBridge::byte_vector(message.begin(), message.end()), kp.privateKey);
    const std::string header =
        "MoltBridge-Ed25519 padded-agent:" + padded + ":" + Crypto::base64url_encode(signature.data);

    auto agent = verifier.verify(header, "GET", "/health", std::nullopt, lookup);
    ASSERT_EQ(agent.agent_id, "padded-agent");
    ASSERT_EQ(agent.timestamp, NOW);

    auto parsed = MoltBridge::AuthorizationHeader::parse(header);
    ASSERT_EQ(parsed.timestamp_text, padded);
}

TEST_F(VerifierTest, NegativeWindowIsRejected) {
    ASSERT_THROW(Verifier{std::chrono::seconds(-1)}, MoltBridge::InvalidArgument);
}
