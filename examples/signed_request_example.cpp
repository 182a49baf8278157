#include <iostream>
#include <map>
#include <mutex>

#include "moltbridge/auth_server.hpp"
#include "moltbridge/challenge.hpp"
#include "moltbridge/client.hpp"
#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"

using nlohmann::json;

// Registered agents, shared between the route handlers and the key lookup
std::mutex directory_mtx;
std::map<std::string, MoltBridge::PublicKey> directory;

int main() {
    // 1. Initialize the crypto library
    if (MoltBridge::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // 2. Setup the server side: challenge issuer and routes
    MoltBridge::ChallengeIssuer issuer(MoltBridge::Crypto::keypair_from_seed(MoltBridge::Crypto::generate_seed()));

    MoltBridge::net::AuthServer server(MoltBridge::Verifier(), [](const std::string& agent_id) {
        std::lock_guard<std::mutex> lock(directory_mtx);
        auto it = directory.find(agent_id);
        return it == directory.end() ? std::nullopt : std::optional<MoltBridge::PublicKey>(it->second);
    });

    server.register_route("GET", "/health", [](const MoltBridge::net::ServerRequest&) {
        return MoltBridge::net::ServerResponse{200, {{"status", "healthy"}}};
    }, false);

    server.register_route("POST", "/verify", [&issuer](const MoltBridge::net::ServerRequest& request) {
        if (request.body && request.body->contains("challenge_id")) {
            auto result = issuer.redeem(request.body->value("challenge_id", ""), request.body->value("proof_of_work", ""));
            return MoltBridge::net::ServerResponse{200, result.to_json()};
        }
        return MoltBridge::net::ServerResponse{200, issuer.issue().to_json()};
    }, false);

    server.register_route("POST", "/register", [&issuer](const MoltBridge::net::ServerRequest& request) {
        if (!request.body) {
            throw MoltBridge::ValidationError("Missing body", 400, "VALIDATION_ERROR");
        }
        issuer.validate_token(request.body->value("verification_token", ""));
        const std::string agent_id = request.body->value("agent_id", "");
        auto key = MoltBridge::Crypto::base64url_decode(request.body->value("pubkey", ""));
        {
            std::lock_guard<std::mutex> lock(directory_mtx);
            directory[agent_id] = MoltBridge::PublicKey{key};
        }
        std::cout << "[SERVER] Registered " << agent_id << std::endl;
        return MoltBridge::net::ServerResponse{201, {{"agent", {{"id", agent_id}}}}};
    }, false);

    server.register_route("POST", "/discover", [](const MoltBridge::net::ServerRequest& request) {
        std::cout << "[SERVER] Signed request from " << request.agent->agent_id << std::endl;
        return MoltBridge::net::ServerResponse{200, {{"results", json::array()}, {"query", *request.body}}};
    });

    uint16_t port = 3040;
    try {
        server.run(port);
    } catch (const MoltBridge::Exception& e) {
        std::cerr << "Failed to start server: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[SERVER] Started on port " << port << std::endl;

    // 3. Client: proof-of-work bootstrap, registration and a signed call
    MoltBridge::ClientConfig config;
    config.agent_id = "example-agent";

    try {
        MoltBridge::Client client(config);
        std::cout << "[CLIENT] Health: " << client.health().dump() << std::endl;

        auto verification = client.verify();
        std::cout << "[CLIENT] Verified: " << std::boolalpha << verification.verified << std::endl;

        MoltBridge::RegistrationRequest registration;
        registration.capabilities = {"nlp", "reasoning"};
        client.register_agent(registration);

        json response = client.request("POST", "/discover", json{{"capability", "nlp"}, {"limit", 5}});
        std::cout << "[CLIENT] Response: " << response.dump() << std::endl;
        std::cout << "[CLIENT] Persist this seed to keep the identity: " << *client.seed_hex() << std::endl;
    } catch (const MoltBridge::Exception& e) {
        std::cerr << "[CLIENT] " << MoltBridge::to_string(e.kind()) << ": " << e.what() << std::endl;
        server.stop();
        return 1;
    }

    server.stop();
    return 0;
}
