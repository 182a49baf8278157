#include "moltbridge/errors.hpp"

#include <nlohmann/json.hpp>

namespace MoltBridge {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Runtime: return "RUNTIME_ERROR";
        case ErrorKind::Logic: return "LOGIC_ERROR";
        case ErrorKind::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorKind::InvalidKeyMaterial: return "INVALID_KEY_MATERIAL";
        case ErrorKind::NoAuthConfigured: return "NO_AUTH";
        case ErrorKind::Unauthenticated: return "UNAUTHENTICATED";
        case ErrorKind::ChallengeExhausted: return "CHALLENGE_TIMEOUT";
        case ErrorKind::Transport: return "TRANSPORT_ERROR";
        case ErrorKind::ConnectionExhausted: return "CONNECTION_ERROR";
        case ErrorKind::Api: return "API_ERROR";
    }
    return "UNKNOWN";
}

const char* to_string(AuthFailure reason) {
    switch (reason) {
        case AuthFailure::MalformedHeader: return "MALFORMED_HEADER";
        case AuthFailure::StaleTimestamp: return "STALE_TIMESTAMP";
        case AuthFailure::UnknownAgent: return "UNKNOWN_AGENT";
        case AuthFailure::SignatureMismatch: return "SIGNATURE_MISMATCH";
    }
    return "UNKNOWN";
}

void throw_api_error(int status_code, const std::string& raw_body) {
    std::string message = raw_body.empty() ? "Unknown error" : raw_body;
    std::string code = "UNKNOWN";

    nlohmann::json body = nlohmann::json::parse(raw_body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        auto it = body.find("error");
        if (it != body.end() && it->is_object()) {
            auto msg_it = it->find("message");
            message = (msg_it != it->end() && msg_it->is_string()) ? msg_it->get<std::string>() : "Unknown error";
            auto code_it = it->find("code");
            if (code_it != it->end() && code_it->is_string()) {
                code = code_it->get<std::string>();
            }
        }
    }

    switch (status_code) {
        case 400: throw ValidationError(message, status_code, code);
        case 401:
        case 403: throw AuthenticationError(message, status_code, code);
        case 404: throw NotFoundError(message, status_code, code);
        case 409: throw ConflictError(message, status_code, code);
        case 429: throw RateLimitError(message, status_code, code);
        case 503: throw ServiceUnavailableError(message, status_code, code);
        default: throw ApiError(message, status_code, code);
    }
}

} // namespace MoltBridge
