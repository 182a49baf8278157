#ifndef MOLTBRIDGE_AUTH_SERVER_HPP
#define MOLTBRIDGE_AUTH_SERVER_HPP

#include "http_common.hpp"
#include "verifier.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

namespace MoltBridge {
namespace net {

struct ServerRequest {
    std::string method;
    std::string path;   // without the query string
    std::string query;  // text after '?', empty if none
    std::optional<nlohmann::json> body;
    std::optional<AuthenticatedAgent> agent;  // set on authenticated routes
};

struct ServerResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

/**
 * @brief Minimal HTTP server that authenticates signed requests.
 *
 * Routes are matched on (method, path). Handlers that throw an ApiError produce
 * its status and code in the error body format; any other exception becomes a
 * 500. Verification failures on authenticated routes are answered with 401.
 */
class AuthServer {
public:
    using RouteHandler = std::function<ServerResponse(const ServerRequest&)>;

    AuthServer(Verifier verifier, PublicKeyLookup lookup);
    ~AuthServer();

    AuthServer(const AuthServer&) = delete;
    AuthServer& operator=(const AuthServer&) = delete;

    /**
     * @brief Binds the IPv4 port, then serves on a background thread.
     * @throws RuntimeError if the port cannot be bound or the server is already running.
     */
    void run(uint16_t port);
    void stop();

    /**
     * @brief Registers a handler for a specific method and path.
     * @param method HTTP verb, matched case-insensitively.
     * @param path Exact path, without query string.
     * @param handler The function producing the response.
     * @param requires_auth Whether the Authorization header must verify first.
     */
    void register_route(const std::string& method, const std::string& path, RouteHandler handler,
                        bool requires_auth = true);

    /**
     * @brief Dispatches one request. Used by the HTTP handler; callable directly in tests.
     * @param method The request method.
     * @param resource The request target, path plus optional query.
     * @param authorization The Authorization header value, empty if absent.
     * @param raw_body The request body bytes.
     */
    ServerResponse handle(const std::string& method,
                          const std::string& resource,
                          const std::string& authorization,
                          const std::string& raw_body) const;

private:
    struct Route {
        RouteHandler handler;
        bool requires_auth;
    };

    void on_http(WsConnectionHdl hdl);

    WsServer server_;
    Verifier verifier_;
    PublicKeyLookup lookup_;

    mutable std::mutex routes_mutex_;
    std::map<std::pair<std::string, std::string>, Route> routes_;

    std::unique_ptr<std::thread> server_thread_;
};

// The error body format shared with the client side.
nlohmann::json error_body(int status, const std::string& code, const std::string& message);

} // namespace net
} // namespace MoltBridge

#endif // MOLTBRIDGE_AUTH_SERVER_HPP
