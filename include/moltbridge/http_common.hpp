#ifndef MOLTBRIDGE_HTTP_COMMON_HPP
#define MOLTBRIDGE_HTTP_COMMON_HPP

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/http/request.hpp>
#include <websocketpp/http/response.hpp>
#include <websocketpp/uri.hpp>

namespace MoltBridge {
namespace net {

    // Define types for convenience
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using WsConnectionHdl = websocketpp::connection_hdl;
    using HttpWireRequest = websocketpp::http::parser::request;
    using HttpWireResponse = websocketpp::http::parser::response;

    // The Asio flavour websocketpp was configured with.
    namespace asio = websocketpp::lib::asio;

} // namespace net
} // namespace MoltBridge

#endif // MOLTBRIDGE_HTTP_COMMON_HPP
