#include "moltbridge/signer.hpp"

#include <chrono>

#include "moltbridge/canonical.hpp"
#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

int64_t unix_time_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string SigningMaterial::message() const {
    return method + ":" + path + ":" + timestamp + ":" + body_digest;
}

SigningMaterial SigningMaterial::for_request(const std::string& method,
                                             const std::string& path,
                                             int64_t timestamp,
                                             const std::optional<nlohmann::json>& body) {
    return for_request(method, path, std::to_string(timestamp), body);
}

SigningMaterial SigningMaterial::for_request(const std::string& method,
                                             const std::string& path,
                                             const std::string& timestamp,
                                             const std::optional<nlohmann::json>& body) {
    SigningMaterial material;
    material.method = method;
    material.path = path;
    material.timestamp = timestamp;
    material.body_digest = MoltBridge::body_digest(body);
    return material;
}

Signer::Signer(const byte_vector& seed, std::string agent_id, Clock clock)
    : agent_id_(std::move(agent_id)), clock_(std::move(clock)) {
    if (Crypto::init() != 0) {
        throw RuntimeError("Failed to initialize libsodium.");
    }
    if (!is_valid_agent_id(agent_id_)) {
        throw InvalidArgument("Agent id must be non-empty and contain no ':' or whitespace.");
    }
    if (!clock_) {
        throw InvalidArgument("Signer requires a clock.");
    }
    key_ = Crypto::keypair_from_seed(seed);
}

Signer Signer::from_hex(const std::string& seed_hex, std::string agent_id) {
    byte_vector seed;
    try {
        seed = Crypto::hex_decode(seed_hex);
    } catch (const InvalidArgument& e) {
        throw InvalidKeyMaterial(std::string("Signing key is not valid hex: ") + e.what());
    }
    return Signer(seed, std::move(agent_id));
}

Signer Signer::generate(std::string agent_id) {
    return Signer(Crypto::generate_seed(), std::move(agent_id));
}

std::string Signer::sign(const std::string& method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body) const {
    return sign_at(method, path, body, clock_()).format();
}

AuthorizationHeader Signer::sign_at(const std::string& method,
                                    const std::string& path,
                                    const std::optional<nlohmann::json>& body,
                                    int64_t timestamp) const {
    const std::string message = SigningMaterial::for_request(method, path, timestamp, body).message();

    AuthorizationHeader header;
    header.agent_id = agent_id_;
    header.timestamp = timestamp;
    header.signature = Crypto::sign(byte_vector(message.begin(), message.end()), key_.privateKey);
    return header;
}

std::string Signer::public_key_b64() const {
    return Crypto::base64url_encode(key_.publicKey.data);
}

std::string Signer::seed_hex() const {
    return Crypto::hex_encode(key_.seed);
}

} // namespace MoltBridge
