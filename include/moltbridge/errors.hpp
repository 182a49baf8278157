#ifndef MOLTBRIDGE_ERRORS_HPP
#define MOLTBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace MoltBridge {

/**
 * @brief Machine-readable category carried by every MoltBridge exception.
 */
enum class ErrorKind {
    Runtime,
    Logic,
    InvalidArgument,
    InvalidKeyMaterial,
    NoAuthConfigured,
    Unauthenticated,
    ChallengeExhausted,
    Transport,
    ConnectionExhausted,
    Api
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base class for all MoltBridge exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

    virtual ErrorKind kind() const noexcept = 0;

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::Runtime; }
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::Logic; }
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::InvalidArgument; }
};

/**
 * @brief The signing seed is not exactly 32 bytes (or is not valid hex).
 */
class InvalidKeyMaterial : public InvalidArgument {
public:
    explicit InvalidKeyMaterial(const std::string& message) : InvalidArgument(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::InvalidKeyMaterial; }
};

/**
 * @brief An authenticated call was requested but no signing identity is configured.
 */
class NoAuthConfigured : public LogicError {
public:
    explicit NoAuthConfigured(const std::string& message) : LogicError(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::NoAuthConfigured; }
};

enum class AuthFailure {
    MalformedHeader,
    StaleTimestamp,
    UnknownAgent,
    SignatureMismatch
};

const char* to_string(AuthFailure reason);

/**
 * @brief A request failed authentication. The reason is kept for diagnostics,
 * callers should treat every reason as "unauthenticated".
 */
class VerificationError : public RuntimeError {
public:
    VerificationError(AuthFailure reason, const std::string& message)
        : RuntimeError(message), reason_(reason) {}

    ErrorKind kind() const noexcept override { return ErrorKind::Unauthenticated; }
    AuthFailure reason() const noexcept { return reason_; }

private:
    AuthFailure reason_;
};

/**
 * @brief The proof-of-work solver hit its iteration ceiling.
 */
class ChallengeExhausted : public RuntimeError {
public:
    explicit ChallengeExhausted(const std::string& message) : RuntimeError(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::ChallengeExhausted; }
};

/**
 * @brief A single attempt failed at the connection level (resolve, connect,
 * read, write or per-attempt timeout). Retried by the executor.
 */
class TransportError : public RuntimeError {
public:
    TransportError(const std::string& message, bool timed_out)
        : RuntimeError(message), timed_out_(timed_out) {}

    ErrorKind kind() const noexcept override { return ErrorKind::Transport; }
    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

/**
 * @brief Every attempt of a logical call failed at the connection level.
 */
class ConnectionExhausted : public RuntimeError {
public:
    ConnectionExhausted(const std::string& message, int attempts)
        : RuntimeError(message), attempts_(attempts) {}

    ErrorKind kind() const noexcept override { return ErrorKind::ConnectionExhausted; }
    int attempts() const noexcept { return attempts_; }

private:
    int attempts_;
};

/**
 * @brief A structured error response from the remote side. Never retried.
 */
class ApiError : public RuntimeError {
public:
    ApiError(const std::string& message, int status_code, std::string code)
        : RuntimeError(message), status_code_(status_code), code_(std::move(code)) {}

    ErrorKind kind() const noexcept override { return ErrorKind::Api; }
    int status_code() const noexcept { return status_code_; }
    const std::string& code() const noexcept { return code_; }

private:
    int status_code_;
    std::string code_;
};

// 401 and 403
class AuthenticationError : public ApiError {
public:
    using ApiError::ApiError;
};

// 400
class ValidationError : public ApiError {
public:
    using ApiError::ApiError;
};

// 404
class NotFoundError : public ApiError {
public:
    using ApiError::ApiError;
};

// 409
class ConflictError : public ApiError {
public:
    using ApiError::ApiError;
};

// 429
class RateLimitError : public ApiError {
public:
    using ApiError::ApiError;
};

// 503
class ServiceUnavailableError : public ApiError {
public:
    using ApiError::ApiError;
};

/**
 * @brief Throws the ApiError subclass matching an HTTP error status.
 *
 * The body is expected to look like {"error": {"code": ..., "message": ...}};
 * anything else is reported with code "UNKNOWN" and the raw body as message.
 *
 * @param status_code The HTTP status (>= 400).
 * @param raw_body The response body as received.
 */
[[noreturn]] void throw_api_error(int status_code, const std::string& raw_body);

} // namespace MoltBridge

#endif // MOLTBRIDGE_ERRORS_HPP
