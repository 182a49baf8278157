#include "moltbridge/challenge.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "moltbridge/canonical.hpp"
#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"
#include "moltbridge/pow.hpp"

namespace MoltBridge {

namespace {

constexpr char TOKEN_TYPE[] = "verification-attestation";
constexpr char VERIFICATION_FAILED[] = "VERIFICATION_FAILED";

std::string iso8601_utc(int64_t unix_ms) {
    std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << (unix_ms % 1000)
        << 'Z';
    return oss.str();
}

// RFC 4122 version 4 layout over random bytes.
std::string random_uuid() {
    byte_vector bytes = Crypto::random_bytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    std::string hex = Crypto::hex_encode(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
           hex.substr(20);
}

[[noreturn]] void rejected(const std::string& message) {
    throw ValidationError(message, 400, VERIFICATION_FAILED);
}

const std::string& require_string(const nlohmann::json& data, const char* field) {
    auto it = data.find(field);
    if (it == data.end() || !it->is_string()) {
        throw RuntimeError(std::string("Malformed challenge response: missing string field '") + field + "'.");
    }
    return it->get_ref<const std::string&>();
}

} // namespace

// --- Message bodies ---

nlohmann::json Challenge::to_json() const {
    return {{"challenge_id", challenge_id}, {"nonce", nonce}, {"difficulty", difficulty}, {"expires_at", expires_at}};
}

Challenge Challenge::from_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw RuntimeError("Malformed challenge response: not a JSON object.");
    }
    Challenge challenge;
    challenge.challenge_id = require_string(data, "challenge_id");
    challenge.nonce = require_string(data, "nonce");

    auto difficulty = data.find("difficulty");
    if (difficulty == data.end() || !difficulty->is_number_integer() || difficulty->get<int64_t>() < 0 ||
        difficulty->get<int64_t>() > MAX_POW_DIFFICULTY) {
        throw RuntimeError("Malformed challenge response: difficulty must be an integer between 0 and 64.");
    }
    challenge.difficulty = difficulty->get<int>();

    auto expires = data.find("expires_at");
    if (expires != data.end()) {
        challenge.expires_at = expires->is_string() ? expires->get<std::string>() : expires->dump();
    }
    return challenge;
}

nlohmann::json ChallengeSolution::to_json() const {
    return {{"challenge_id", challenge_id}, {"proof_of_work", std::to_string(proof_of_work)}};
}

nlohmann::json VerificationResult::to_json() const {
    return {{"verified", verified}, {"token", token}};
}

VerificationResult VerificationResult::from_json(const nlohmann::json& data) {
    VerificationResult result;
    result.verified = is_verified_response(data);
    if (data.is_object()) {
        auto token = data.find("token");
        if (token != data.end() && token->is_string()) {
            result.token = token->get<std::string>();
        }
    }
    return result;
}

bool VerificationResult::is_verified_response(const nlohmann::json& data) {
    if (!data.is_object()) {
        return false;
    }
    auto verified = data.find("verified");
    return verified != data.end() && verified->is_boolean() && verified->get<bool>();
}

// --- ChallengeIssuer ---

ChallengeIssuer::ChallengeIssuer(KeyPair signing_key, int difficulty, std::chrono::milliseconds ttl, MillisClock clock)
    : signing_key_(std::move(signing_key)), difficulty_(difficulty), ttl_(ttl), clock_(std::move(clock)) {
    if (difficulty_ < 0 || difficulty_ > MAX_POW_DIFFICULTY) {
        throw InvalidArgument("Challenge difficulty must be between 0 and 64.");
    }
    if (!clock_) {
        throw InvalidArgument("ChallengeIssuer requires a clock.");
    }
}

int64_t ChallengeIssuer::unix_time_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Challenge ChallengeIssuer::issue() {
    const int64_t now = clock_();

    Challenge challenge;
    challenge.challenge_id = random_uuid();
    challenge.nonce = Crypto::hex_encode(Crypto::random_bytes(32));
    challenge.difficulty = difficulty_;
    challenge.expires_at = iso8601_utc(now + ttl_.count());

    std::lock_guard<std::mutex> lock(mutex_);
    prune_expired(now);
    challenges_[challenge.challenge_id] = Entry{challenge.nonce, difficulty_, now + ttl_.count()};
    return challenge;
}

VerificationResult ChallengeIssuer::redeem(const std::string& challenge_id, const std::string& proof_of_work) {
    const int64_t now = clock_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = challenges_.find(challenge_id);
        if (it == challenges_.end()) {
            rejected("Challenge not found or expired");
        }
        if (now > it->second.expires_at_ms) {
            challenges_.erase(it);
            rejected("Challenge expired");
        }
        if (!ProofOfWork::check(it->second.nonce, proof_of_work, it->second.difficulty)) {
            rejected("Invalid proof-of-work");
        }
        challenges_.erase(it);
    }

    nlohmann::json payload = {
        {"type", TOKEN_TYPE},
        {"challenge_id", challenge_id},
        {"verified_at", iso8601_utc(now)},
        {"iat", now / 1000},
        {"layers_passed", nlohmann::json::array({"computational"})},
    };
    const std::string payload_text = canonicalize(payload);
    const byte_vector payload_bytes(payload_text.begin(), payload_text.end());
    Signature signature = Crypto::sign(payload_bytes, signing_key_.privateKey);

    VerificationResult result;
    result.verified = true;
    result.token = Crypto::base64url_encode(payload_bytes) + "." + Crypto::base64url_encode(signature.data);
    return result;
}

nlohmann::json ChallengeIssuer::validate_token(const std::string& token) const {
    auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == token.size()) {
        throw ValidationError("Invalid token format", 400, "VALIDATION_ERROR");
    }

    byte_vector payload_bytes;
    Signature signature;
    try {
        payload_bytes = Crypto::base64url_decode(token.substr(0, dot));
        signature.data = Crypto::base64url_decode(token.substr(dot + 1));
    } catch (const InvalidArgument&) {
        throw ValidationError("Invalid token encoding", 400, "VALIDATION_ERROR");
    }
    if (!Crypto::verify(signature, payload_bytes, signing_key_.publicKey)) {
        throw ValidationError("Invalid token signature", 400, "VALIDATION_ERROR");
    }

    nlohmann::json payload = nlohmann::json::parse(payload_bytes.begin(), payload_bytes.end(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw ValidationError("Invalid token", 400, "VALIDATION_ERROR");
    }
    auto type = payload.find("type");
    if (type == payload.end() || !type->is_string() || type->get<std::string>() != TOKEN_TYPE) {
        throw ValidationError("Invalid token type", 400, "VALIDATION_ERROR");
    }
    auto iat = payload.find("iat");
    if (iat == payload.end() || !iat->is_number_integer()) {
        throw ValidationError("Invalid token", 400, "VALIDATION_ERROR");
    }
    if (clock_() - iat->get<int64_t>() * 1000 > TOKEN_LIFETIME.count()) {
        throw ValidationError("Verification token expired", 400, "VALIDATION_ERROR");
    }
    return payload;
}

size_t ChallengeIssuer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

void ChallengeIssuer::prune_expired(int64_t now_ms) {
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.expires_at_ms < now_ms) {
            it = challenges_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace MoltBridge
