#ifndef MOLTBRIDGE_TRANSPORT_HPP
#define MOLTBRIDGE_TRANSPORT_HPP

#include <chrono>
#include <map>
#include <string>

namespace MoltBridge {
namespace net {

struct HttpRequest {
    std::string method;
    std::string path;  // relative to the transport's base URL, may carry a query
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
};

/**
 * @brief One request/response exchange with the remote service.
 *
 * Implementations must be safe to call from several threads at once and must
 * release every connection resource before send() returns, whether it
 * succeeded, failed or timed out.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Performs a single attempt.
     * @param request The request to send.
     * @param timeout Upper bound for the whole attempt (resolve, connect, write, read).
     * @return The response, whatever its status code.
     * @throws TransportError on connection-level failure or timeout.
     */
    virtual HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace net
} // namespace MoltBridge

#endif // MOLTBRIDGE_TRANSPORT_HPP
