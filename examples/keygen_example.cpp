#include <iostream>

#include "moltbridge/crypto.hpp"
#include "moltbridge/errors.hpp"
#include "moltbridge/signer.hpp"

int main(int argc, char** argv) {
    if (MoltBridge::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    const std::string agent_id = argc > 1 ? argv[1] : "my-agent";
    try {
        MoltBridge::Signer signer = MoltBridge::Signer::generate(agent_id);
        std::cout << "MOLTBRIDGE_AGENT_ID=" << signer.agent_id() << std::endl;
        std::cout << "MOLTBRIDGE_SIGNING_KEY=" << signer.seed_hex() << std::endl;
        std::cout << "# public key (base64url): " << signer.public_key_b64() << std::endl;
    } catch (const MoltBridge::InvalidArgument& e) {
        std::cerr << "Invalid agent id: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
