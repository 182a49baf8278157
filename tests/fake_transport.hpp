#ifndef MOLTBRIDGE_TESTS_FAKE_TRANSPORT_HPP
#define MOLTBRIDGE_TESTS_FAKE_TRANSPORT_HPP

#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "moltbridge/errors.hpp"
#include "moltbridge/transport.hpp"

// Scripted transport: replays queued outcomes and records every request.
class FakeTransport : public MoltBridge::net::Transport {
public:
    using Outcome = std::function<MoltBridge::net::HttpResponse(const MoltBridge::net::HttpRequest&)>;

    void respond(int status, const std::string& body) {
        outcomes_.push_back([status, body](const MoltBridge::net::HttpRequest&) {
            MoltBridge::net::HttpResponse response;
            response.status_code = status;
            response.body = body;
            return response;
        });
    }

    void fail_connection(const std::string& message = "Connection refused") {
        outcomes_.push_back([message](const MoltBridge::net::HttpRequest&) -> MoltBridge::net::HttpResponse {
            throw MoltBridge::TransportError(message, false);
        });
    }

    void respond_with(Outcome outcome) { outcomes_.push_back(std::move(outcome)); }

    MoltBridge::net::HttpResponse send(const MoltBridge::net::HttpRequest& request,
                                       std::chrono::milliseconds timeout) override {
        Outcome outcome;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests.push_back(request);
            timeouts.push_back(timeout);
            if (outcomes_.empty()) {
                throw MoltBridge::TransportError("No scripted response", false);
            }
            outcome = std::move(outcomes_.front());
            outcomes_.pop_front();
        }
        return outcome(request);
    }

    std::vector<MoltBridge::net::HttpRequest> requests;
    std::vector<std::chrono::milliseconds> timeouts;

private:
    std::mutex mutex_;
    std::deque<Outcome> outcomes_;
};

#endif // MOLTBRIDGE_TESTS_FAKE_TRANSPORT_HPP
