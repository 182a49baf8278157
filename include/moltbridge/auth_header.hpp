#ifndef MOLTBRIDGE_AUTH_HEADER_HPP
#define MOLTBRIDGE_AUTH_HEADER_HPP

#include <cstdint>
#include <string>

#include "keys.hpp"

namespace MoltBridge {

    // Scheme tag preceding the credentials in the Authorization header.
    constexpr char AUTH_SCHEME[] = "MoltBridge-Ed25519";

    /**
     * @brief Wire form of a request signature:
     * "MoltBridge-Ed25519 <agent_id>:<timestamp>:<base64url signature>".
     */
    struct AuthorizationHeader {
        std::string agent_id;
        int64_t timestamp = 0;  // Unix seconds
        std::string timestamp_text;  // the field as received by parse(), empty otherwise
        Signature signature;

        std::string format() const;

        /**
         * @brief Splits a header value into its three fields.
         * @throws VerificationError (MalformedHeader) if the scheme, the separator
         *         count, the timestamp digits or the signature encoding is wrong.
         */
        static AuthorizationHeader parse(const std::string& value);
    };

    /**
     * @brief True if the id can be carried in a header field: non-empty, no ':' and no whitespace.
     */
    bool is_valid_agent_id(const std::string& agent_id);

} // namespace MoltBridge

#endif // MOLTBRIDGE_AUTH_HEADER_HPP
