#ifndef MOLTBRIDGE_CANONICAL_HPP
#define MOLTBRIDGE_CANONICAL_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace MoltBridge {

    /**
     * @brief Renders a JSON value in canonical form.
     *
     * Object keys are sorted by byte value at every nesting level, array order is
     * kept, no whitespace is emitted, strings use minimal JSON escaping and
     * numbers are written in plain decimal with the fewest digits that round-trip
     * (never exponent notation, no trailing ".0").
     *
     * @param value The value to serialize.
     * @return The canonical byte string.
     * @throws InvalidArgument for non-finite numbers or strings that are not valid UTF-8.
     */
    std::string canonicalize(const nlohmann::json& value);

    /**
     * @brief Canonical form of an optional request body. An absent body is the
     * empty string, which is distinct from the canonical form of null ("null").
     */
    std::string canonical_body(const std::optional<nlohmann::json>& body);

    /**
     * @brief Lowercase hex SHA-256 of canonical_body(body).
     */
    std::string body_digest(const std::optional<nlohmann::json>& body);

} // namespace MoltBridge

#endif // MOLTBRIDGE_CANONICAL_HPP
