#include "moltbridge/config.hpp"

#include <cstdlib>
#include <limits>

#include "moltbridge/errors.hpp"

namespace MoltBridge {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

long long positive_integer(const char* name, const std::string& text) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgument(std::string(name) + " must be a positive integer, got '" + text + "'.");
    }
    if (consumed != text.size() || value <= 0) {
        throw InvalidArgument(std::string(name) + " must be a positive integer, got '" + text + "'.");
    }
    return value;
}

} // namespace

ClientConfig ClientConfig::from_env() {
    ClientConfig config;
    if (auto base_url = env("MOLTBRIDGE_BASE_URL")) {
        config.base_url = *base_url;
    }
    config.agent_id = env("MOLTBRIDGE_AGENT_ID");
    config.signing_key = env("MOLTBRIDGE_SIGNING_KEY");
    if (auto timeout = env("MOLTBRIDGE_TIMEOUT_MS")) {
        config.timeout = std::chrono::milliseconds(positive_integer("MOLTBRIDGE_TIMEOUT_MS", *timeout));
    }
    if (auto retries = env("MOLTBRIDGE_MAX_RETRIES")) {
        long long value = positive_integer("MOLTBRIDGE_MAX_RETRIES", *retries);
        if (value > std::numeric_limits<int>::max()) {
            throw InvalidArgument("MOLTBRIDGE_MAX_RETRIES is too large.");
        }
        config.max_retries = static_cast<int>(value);
    }
    return config;
}

} // namespace MoltBridge
