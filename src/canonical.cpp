#include "moltbridge/canonical.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

namespace {

std::string quote(const std::string& text) {
    try {
        return nlohmann::json(text).dump();
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidArgument(std::string("String is not valid UTF-8: ") + e.what());
    }
}

// nlohmann emits the shortest round-trip digits but switches to exponent
// notation outside [1e-5, 1e15]; re-place the decimal point by hand.
std::string plain_decimal(double value) {
    if (!std::isfinite(value)) {
        throw InvalidArgument("NaN and infinite numbers have no canonical form.");
    }
    if (value == 0.0) {
        return "0";  // covers -0.0
    }

    std::string text = nlohmann::json(value).dump();
    std::string sign;
    if (text.front() == '-') {
        sign = "-";
        text.erase(0, 1);
    }

    int exponent = 0;
    auto e_pos = text.find_first_of("eE");
    if (e_pos != std::string::npos) {
        exponent = std::stoi(text.substr(e_pos + 1));
        text.resize(e_pos);
    }

    std::string digits;
    long point;
    auto dot = text.find('.');
    if (dot == std::string::npos) {
        digits = text;
        point = static_cast<long>(text.size());
    } else {
        digits = text.substr(0, dot) + text.substr(dot + 1);
        point = static_cast<long>(dot);
    }
    point += exponent;

    auto lead = digits.find_first_not_of('0');
    digits.erase(0, lead);
    point -= static_cast<long>(lead);
    digits.erase(digits.find_last_not_of('0') + 1);

    const long n = static_cast<long>(digits.size());
    std::string out;
    if (point <= 0) {
        out = "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    } else if (point >= n) {
        out = digits + std::string(static_cast<size_t>(point - n), '0');
    } else {
        out = digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    }
    return sign + out;
}

void write(const nlohmann::json& value, std::string& out) {
    using value_t = nlohmann::json::value_t;
    switch (value.type()) {
        case value_t::null:
            out += "null";
            break;
        case value_t::boolean:
            out += value.get<bool>() ? "true" : "false";
            break;
        case value_t::number_integer:
            out += std::to_string(value.get<int64_t>());
            break;
        case value_t::number_unsigned:
            out += std::to_string(value.get<uint64_t>());
            break;
        case value_t::number_float:
            out += plain_decimal(value.get<double>());
            break;
        case value_t::string:
            out += quote(value.get_ref<const std::string&>());
            break;
        case value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& element : value) {
                if (!first) out += ',';
                first = false;
                write(element, out);
            }
            out += ']';
            break;
        }
        case value_t::object: {
            std::vector<const std::string*> keys;
            keys.reserve(value.size());
            for (auto it = value.begin(); it != value.end(); ++it) {
                keys.push_back(&it.key());
            }
            // std::string ordering compares as unsigned char, i.e. by byte value
            std::sort(keys.begin(), keys.end(),
                      [](const std::string* a, const std::string* b) { return *a < *b; });

            out += '{';
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) out += ',';
                first = false;
                out += quote(*key);
                out += ':';
                write(value.at(*key), out);
            }
            out += '}';
            break;
        }
        default:
            throw InvalidArgument("Value has no canonical JSON form.");
    }
}

} // namespace

std::string canonicalize(const nlohmann::json& value) {
    std::string out;
    write(value, out);
    return out;
}

std::string canonical_body(const std::optional<nlohmann::json>& body) {
    return body ? canonicalize(*body) : std::string();
}

std::string body_digest(const std::optional<nlohmann::json>& body) {
    return Crypto::sha256_hex(canonical_body(body));
}

} // namespace MoltBridge
