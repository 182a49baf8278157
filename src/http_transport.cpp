#include "moltbridge/http_transport.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>

#include "moltbridge/errors.hpp"
#include "moltbridge/http_common.hpp"

namespace MoltBridge {
namespace net {

namespace {

bool is_chunked(std::string transfer_encoding) {
    std::transform(transfer_encoding.begin(), transfer_encoding.end(), transfer_encoding.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return transfer_encoding.find("chunked") != std::string::npos;
}

} // namespace

HttpTransport::HttpTransport(const std::string& base_url) {
    websocketpp::uri uri(base_url);
    if (!uri.get_valid()) {
        throw InvalidArgument("Invalid base URL: " + base_url);
    }
    if (uri.get_scheme() != "http") {
        throw InvalidArgument("HttpTransport only supports http:// URLs, got: " + base_url);
    }

    host_ = uri.get_host();
    port_ = uri.get_port_str();
    host_header_ = uri.get_port() == 80 ? host_ : host_ + ":" + port_;

    base_path_ = uri.get_resource();
    auto query = base_path_.find('?');
    if (query != std::string::npos) {
        throw InvalidArgument("Base URL must not contain a query: " + base_url);
    }
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }
}

HttpResponse HttpTransport::send(const HttpRequest& request, std::chrono::milliseconds timeout) {
    HttpWireRequest wire;
    try {
        wire.set_method(request.method);
        wire.set_uri(base_path_ + request.path);
        wire.set_version("HTTP/1.1");
        wire.replace_header("Host", host_header_);
        wire.replace_header("Connection", "close");
        for (const auto& [name, value] : request.headers) {
            wire.replace_header(name, value);
        }
        if (!request.body.empty()) {
            wire.set_body(request.body);
        }
    } catch (const websocketpp::http::exception& e) {
        throw InvalidArgument(std::string("Cannot build HTTP request: ") + e.what());
    }
    const std::string outgoing = wire.raw();

    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::ip::tcp::socket socket(io);
    asio::steady_timer deadline(io);

    HttpWireResponse parsed;
    std::array<char, 8192> buffer;
    std::string received_bytes;
    bool close_delimited = false;
    asio::error_code failure;
    std::string parse_error;
    bool finished = false;
    bool timed_out = false;
    bool complete = false;

    auto finish = [&]() {
        finished = true;
        deadline.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    };

    auto fail = [&](const asio::error_code& ec) {
        failure = ec;
        finish();
    };

    std::function<void()> read_some = [&]() {
        socket.async_read_some(asio::buffer(buffer), [&](const asio::error_code& ec, std::size_t received) {
            if (finished) {
                return;
            }
            received_bytes.append(buffer.data(), received);

            if (!close_delimited && received > 0) {
                try {
                    parsed.consume(buffer.data(), received);
                } catch (const websocketpp::http::exception& e) {
                    parse_error = e.what();
                    finish();
                    return;
                }
                const auto status = parsed.headers_ready() ? static_cast<int>(parsed.get_status_code()) : 0;
                if (status == 204 || status == 304) {
                    complete = true;
                    finish();
                    return;
                }
                if (parsed.headers_ready() && parsed.get_header("Content-Length").empty()) {
                    // The parser keeps no body without Content-Length; read raw bytes until close
                    if (is_chunked(parsed.get_header("Transfer-Encoding"))) {
                        parse_error = "chunked transfer encoding is not supported";
                        finish();
                        return;
                    }
                    close_delimited = true;
                } else if (parsed.ready()) {
                    complete = true;
                    finish();
                    return;
                }
            }
            if (close_delimited && ec == asio::error::eof) {
                complete = true;
                finish();
                return;
            }
            if (ec) {
                fail(ec);
                return;
            }
            read_some();
        });
    };

    deadline.expires_after(timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (ec || finished) {
            return;
        }
        timed_out = true;
        finished = true;
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    });

    resolver.async_resolve(host_, port_, [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type endpoints) {
        if (finished) {
            return;
        }
        if (ec) {
            fail(ec);
            return;
        }
        asio::async_connect(socket, endpoints, [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
            if (finished) {
                return;
            }
            if (ec) {
                fail(ec);
                return;
            }
            asio::async_write(socket, asio::buffer(outgoing), [&](const asio::error_code& ec, std::size_t) {
                if (finished) {
                    return;
                }
                if (ec) {
                    fail(ec);
                    return;
                }
                read_some();
            });
        });
    });

    io.run();

    if (timed_out) {
        throw TransportError("Request timed out after " + std::to_string(timeout.count()) + " ms", true);
    }
    if (!parse_error.empty()) {
        throw TransportError("Malformed HTTP response: " + parse_error, false);
    }
    if (failure) {
        throw TransportError("Connection to " + host_header_ + " failed: " + failure.message(), false);
    }
    if (!complete) {
        throw TransportError("Connection closed before a complete response was received", false);
    }

    HttpResponse response;
    response.status_code = static_cast<int>(parsed.get_status_code());
    if (close_delimited) {
        const auto header_end = received_bytes.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            throw TransportError("Malformed HTTP response: header block not terminated", false);
        }
        response.body = received_bytes.substr(header_end + 4);
    } else {
        response.body = parsed.get_body();
    }
    for (const auto& [name, value] : parsed.get_headers()) {
        response.headers[name] = value;
    }
    return response;
}

} // namespace net
} // namespace MoltBridge
