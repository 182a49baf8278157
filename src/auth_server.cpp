#include "moltbridge/auth_server.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "moltbridge/errors.hpp"

namespace MoltBridge {
    namespace net {

        namespace {

            std::string to_upper(std::string text) {
                std::transform(
                    text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
                return text;
            }

            ServerResponse error_response(int status, const std::string& code, const std::string& message) {
                return ServerResponse{status, error_body(status, code, message)};
            }

        } // namespace

        nlohmann::json error_body(int status, const std::string& code, const std::string& message) {
            return {{"error", {{"code", code}, {"message", message}, {"status", status}}}};
        }

        AuthServer::AuthServer(Verifier verifier, PublicKeyLookup lookup)
            : verifier_(std::move(verifier)), lookup_(std::move(lookup)) {
            if (!lookup_) {
                throw InvalidArgument("AuthServer requires a public key lookup.");
            }
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_http_handler(std::bind(&AuthServer::on_http, this, std::placeholders::_1));
            server_.clear_access_channels(websocketpp::log::alevel::all);
            server_.clear_error_channels(websocketpp::log::elevel::all);
        }

        AuthServer::~AuthServer() {
            stop();
        }

        void AuthServer::run(uint16_t port) {
            if (server_thread_) {
                throw RuntimeError("AuthServer is already running.");
            }
            websocketpp::lib::error_code ec;
            server_.listen(asio::ip::tcp::v4(), port, ec);
            if (ec) {
                throw RuntimeError("Cannot listen on port " + std::to_string(port) + ": " + ec.message());
            }
            server_.start_accept(ec);
            if (ec) {
                throw RuntimeError("Cannot accept on port " + std::to_string(port) + ": " + ec.message());
            }

            server_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    server_.run();
                } catch (const std::exception& e) {
                    std::cerr << "Server thread exception: " << e.what() << std::endl;
                }
            });
        }

        void AuthServer::stop() {
            if (server_.is_listening()) {
                websocketpp::lib::error_code ec;
                server_.stop_listening(ec);
                if (ec) {
                    std::cerr << "Error while stopping listener: " << ec.message() << std::endl;
                }
            }
            server_.stop();

            if (server_thread_ && server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();
        }

        void AuthServer::register_route(const std::string& method, const std::string& path, RouteHandler handler,
                                        bool requires_auth) {
            if (!handler) {
                throw InvalidArgument("Route handler must not be empty.");
            }
            std::lock_guard<std::mutex> lock(routes_mutex_);
            routes_[{to_upper(method), path}] = Route{std::move(handler), requires_auth};
        }

        ServerResponse AuthServer::handle(const std::string& method,
                                          const std::string& resource,
                                          const std::string& authorization,
                                          const std::string& raw_body) const {
            ServerRequest request;
            request.method = to_upper(method);
            size_t query_start = resource.find('?');
            request.path = resource.substr(0, query_start);
            if (query_start != std::string::npos) {
                request.query = resource.substr(query_start + 1);
            }

            Route route;
            {
                std::lock_guard<std::mutex> lock(routes_mutex_);
                auto it = routes_.find({request.method, request.path});
                if (it == routes_.end()) {
                    return error_response(404, "NOT_FOUND", "No route for " + request.method + " " + request.path);
                }
                route = it->second;
            }

            if (!raw_body.empty()) {
                nlohmann::json parsed = nlohmann::json::parse(raw_body, nullptr, false);
                if (parsed.is_discarded()) {
                    return error_response(400, "VALIDATION_ERROR", "Request body is not valid JSON");
                }
                request.body = std::move(parsed);
            }

            try {
                if (route.requires_auth) {
                    if (authorization.empty()) {
                        return error_response(401, "UNAUTHORIZED", "Missing Authorization header");
                    }
                    request.agent =
                        verifier_.verify(authorization, request.method, request.path, request.body, lookup_);
                }
                return route.handler(request);
            } catch (const VerificationError& e) {
                return error_response(401, "UNAUTHORIZED", e.what());
            } catch (const ApiError& e) {
                return error_response(e.status_code(), e.code(), e.what());
            } catch (const std::exception& e) {
                std::cerr << "Handler for " << request.method << " " << request.path << " failed: " << e.what()
                          << std::endl;
                return error_response(500, "INTERNAL_ERROR", "Internal server error");
            }
        }

        void AuthServer::on_http(WsConnectionHdl hdl) {
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
            const HttpWireRequest& wire = con->get_request();

            ServerResponse response =
                handle(wire.get_method(), wire.get_uri(), wire.get_header("Authorization"), wire.get_body());

            con->set_status(static_cast<websocketpp::http::status_code::value>(response.status));
            con->replace_header("Content-Type", "application/json");
            con->set_body(response.body.dump());
        }

    } // namespace net
} // namespace MoltBridge
