#include "moltbridge/auth_header.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

namespace {

// 18 digits always fit in int64_t
constexpr size_t MAX_TIMESTAMP_DIGITS = 18;

[[noreturn]] void malformed(const std::string& detail) {
    throw VerificationError(AuthFailure::MalformedHeader,
                            "Invalid Authorization header: " + detail +
                                ". Expected: MoltBridge-Ed25519 <agent_id>:<timestamp>:<signature>");
}

} // namespace

bool is_valid_agent_id(const std::string& agent_id) {
    if (agent_id.empty()) {
        return false;
    }
    return std::none_of(agent_id.begin(), agent_id.end(), [](unsigned char c) {
        return c == ':' || std::isspace(c);
    });
}

std::string AuthorizationHeader::format() const {
    return std::string(AUTH_SCHEME) + " " + agent_id + ":" + std::to_string(timestamp) + ":" +
           Crypto::base64url_encode(signature.data);
}

AuthorizationHeader AuthorizationHeader::parse(const std::string& value) {
    const std::string prefix = std::string(AUTH_SCHEME) + " ";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        malformed("missing scheme tag");
    }

    std::vector<std::string> fields;
    std::string::size_type start = prefix.size();
    for (;;) {
        auto colon = value.find(':', start);
        fields.push_back(value.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    if (fields.size() != 3) {
        malformed("expected 3 colon-separated fields, got " + std::to_string(fields.size()));
    }

    AuthorizationHeader header;
    header.agent_id = fields[0];
    if (!is_valid_agent_id(header.agent_id)) {
        malformed("bad agent id");
    }

    const std::string& ts = fields[1];
    if (ts.empty() || ts.size() > MAX_TIMESTAMP_DIGITS ||
        !std::all_of(ts.begin(), ts.end(), [](unsigned char c) { return std::isdigit(c); })) {
        malformed("bad timestamp");
    }
    header.timestamp = std::stoll(ts);
    header.timestamp_text = ts;

    if (fields[2].empty()) {
        malformed("empty signature");
    }
    try {
        header.signature.data = Crypto::base64url_decode(fields[2]);
    } catch (const InvalidArgument&) {
        malformed("signature is not base64url");
    }
    return header;
}

} // namespace MoltBridge
