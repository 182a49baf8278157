#ifndef MOLTBRIDGE_HTTP_TRANSPORT_HPP
#define MOLTBRIDGE_HTTP_TRANSPORT_HPP

#include "transport.hpp"

#include <string>

namespace MoltBridge {
namespace net {

/**
 * @brief Plain HTTP/1.1 transport on Asio with websocketpp's HTTP parsers.
 *
 * Each attempt opens its own connection ("Connection: close") on a private
 * io_context; the deadline timer closes the socket, so nothing outlives send().
 * Responses must be delimited by Content-Length or by connection close.
 */
class HttpTransport : public Transport {
public:
    /**
     * @param base_url e.g. "http://localhost:3040" or "http://host/api".
     * @throws InvalidArgument if the URL is not a valid http:// URL.
     */
    explicit HttpTransport(const std::string& base_url);

    HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) override;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& base_path() const { return base_path_; }

private:
    std::string host_;
    std::string port_;
    std::string base_path_;
    std::string host_header_;
};

} // namespace net
} // namespace MoltBridge

#endif // MOLTBRIDGE_HTTP_TRANSPORT_HPP
