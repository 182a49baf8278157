#include "moltbridge/executor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <thread>

#include "moltbridge/canonical.hpp"
#include "moltbridge/errors.hpp"

namespace MoltBridge {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
    return text;
}

nlohmann::json parse_success_body(const net::HttpResponse& response) {
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded()) {
        throw RuntimeError("Response with status " + std::to_string(response.status_code) + " is not valid JSON.");
    }
    return data;
}

} // namespace

RequestExecutor::RequestExecutor(std::shared_ptr<net::Transport> transport, std::shared_ptr<const Signer> signer)
    : transport_(std::move(transport)),
      signer_(std::move(signer)),
      backoff_(default_backoff()),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (!transport_) {
        throw InvalidArgument("RequestExecutor requires a transport.");
    }
}

const std::vector<std::chrono::milliseconds>& RequestExecutor::default_backoff() {
    static const std::vector<std::chrono::milliseconds> schedule = {
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000), std::chrono::milliseconds(4000)};
    return schedule;
}

void RequestExecutor::set_backoff(std::vector<std::chrono::milliseconds> schedule) {
    backoff_ = std::move(schedule);
}

void RequestExecutor::set_sleeper(Sleeper sleeper) {
    if (!sleeper) {
        throw InvalidArgument("Sleeper must not be empty.");
    }
    sleeper_ = std::move(sleeper);
}

std::chrono::milliseconds RequestExecutor::delay_after(int attempt) const {
    if (backoff_.empty()) {
        return std::chrono::milliseconds(0);
    }
    size_t index = std::min(static_cast<size_t>(attempt - 1), backoff_.size() - 1);
    return backoff_[index];
}

nlohmann::json RequestExecutor::execute(const std::string& method,
                                        const std::string& path,
                                        const std::optional<nlohmann::json>& body,
                                        bool requires_auth,
                                        int max_retries,
                                        std::chrono::milliseconds timeout) const {
    if (requires_auth && !signer_) {
        throw NoAuthConfigured(
            "Authentication required but no agent_id/signing_key configured. "
            "Set MOLTBRIDGE_AGENT_ID and MOLTBRIDGE_SIGNING_KEY environment variables.");
    }
    if (max_retries < 1) {
        throw InvalidArgument("max_retries must be at least 1.");
    }

    net::HttpRequest request;
    request.method = to_upper(method);
    request.path = path;
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    request.body = canonical_body(body);

    const std::string signed_path = path.substr(0, path.find('?'));

    for (int attempt = 1;; ++attempt) {
        // Never reuse a header: its timestamp ages with every retry.
        if (requires_auth) {
            request.headers["Authorization"] = signer_->sign(request.method, signed_path, body);
        }

        net::HttpResponse response;
        try {
            response = transport_->send(request, timeout);
        } catch (const TransportError& e) {
            if (attempt >= max_retries) {
                std::cerr << request.method << " " << path << " failed after " << attempt
                          << " attempt(s): " << e.what() << std::endl;
                throw ConnectionExhausted(
                    "Connection failed after " + std::to_string(attempt) + " attempts: " + e.what(), attempt);
            }
            const auto delay = delay_after(attempt);
            std::cerr << request.method << " " << path << " attempt " << attempt << "/" << max_retries
                      << " failed: " << e.what() << "; retrying in " << delay.count() << " ms" << std::endl;
            sleeper_(delay);
            continue;
        }

        if (response.status_code >= 400) {
            throw_api_error(response.status_code, response.body);
        }
        return parse_success_body(response);
    }
}

} // namespace MoltBridge
