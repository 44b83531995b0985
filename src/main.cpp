// cosmkit signer
//
// Signs a bank send offline with a key derived from a fixed secret and
// prints the key material, the signable bytes and the encoded transaction.
// The result is also written to signed_tx.json.
//
// When a client config file is present next to the binary, the transaction
// is signed again with the node's account sequence, broadcast, and awaited.
//
// Usage: cosmkit-signer [secret]

#include "base64.hpp"
#include "broadcaster.hpp"
#include "config.hpp"
#include "hex_utils.hpp"
#include "keys.hpp"
#include "logging.hpp"
#include "msg.hpp"
#include "rest_node_client.hpp"
#include "sequence_tracker.hpp"
#include "transaction.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

// SECRET: default key secret, hashed into a secp256k1 scalar
// DESTINATION: recipient of the demo transfer
// CONFIG_FILE: optional node settings; broadcasting is skipped without it
// OUTPUT_FILE: where the signed transaction is written
constexpr auto SECRET = "mySecret";
constexpr auto DESTINATION = "cosmos1pr2n6tfymnn2tk6rkxlu9q5q2zq5ka3wtu7sdj";
constexpr auto OFFLINE_CHAIN_ID = "mychainid";
constexpr auto CONFIG_FILE = "cosmkit.json";
constexpr auto OUTPUT_FILE = "signed_tx.json";

namespace {

std::string describe(const cosmkit::SubmissionResult& result) {
    using namespace cosmkit;
    if (const auto* included = std::get_if<Included>(&result)) {
        return "included at height " + std::to_string(included->height) + " using " +
               std::to_string(included->gas_used) + " gas";
    }
    if (const auto* pending = std::get_if<Pending>(&result)) {
        return "pending as " + pending->tx_hash;
    }
    if (const auto* rejected = std::get_if<Rejected>(&result)) {
        return "rejected with " + rejected->codespace + " code " + std::to_string(rejected->code) + ": " +
               rejected->raw_log;
    }
    return "not included before the deadline";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const std::string secret = argc > 1 ? argv[1] : SECRET;
        std::cout << "Private key secret=\"" << secret << "\"" << std::endl;

        auto key = cosmkit::PrivateKey::from_secret(std::string_view(secret));
        auto address = key.to_bech32_address("cosmos");

        std::cout << "Address: " << address << std::endl;
        std::cout << "Public key: " << key.public_key().to_bech32("cosmospub") << std::endl;

        cosmkit::Coin coin{1, "validatortoken"};
        auto send = cosmkit::encode_msg_send(address, DESTINATION, {coin});

        cosmkit::UnsignedTx tx;
        tx.messages = {send};
        tx.fee.amount = {coin};
        tx.fee.gas_limit = 500'000;
        tx.timeout_height = 100;
        tx.signers.push_back(cosmkit::SignerInfo{key.public_key(), 0, 0});

        auto sign_doc = cosmkit::build_sign_doc(tx, OFFLINE_CHAIN_ID, 0);
        auto signed_tx = cosmkit::sign_transaction(tx, OFFLINE_CHAIN_ID, key);
        auto tx_bytes = signed_tx.encode();

        nlohmann::json output = {
            {"address", address},
            {"chain_id", OFFLINE_CHAIN_ID},
            {"sign_doc", cosmkit::HexUtils::encode(sign_doc)},
            {"signature", cosmkit::HexUtils::encode(signed_tx.signatures.front())},
            {"tx_bytes", cosmkit::Base64::encode(tx_bytes)},
            {"txhash", signed_tx.hash()}
        };

        std::cout << std::setw(4) << output << std::endl;

        std::ofstream file(OUTPUT_FILE);
        if (!file) {
            std::cerr << "Failed to open " << OUTPUT_FILE << " for writing" << std::endl;
            return 1;
        }
        file << std::setw(4) << output << std::endl;

        if (!std::filesystem::exists(CONFIG_FILE)) {
            return 0;
        }

        // Live submission against the configured node
        auto config = cosmkit::ClientConfig::load_from_file(CONFIG_FILE);
        cosmkit::logging::get_logger("broadcast").set_level(cosmkit::logging::Level::DEBUG);

        cosmkit::RestNodeClient node(config);
        cosmkit::SequenceTracker tracker([&node](const std::string& account) {
            return node.get_account(account);
        });
        cosmkit::Broadcaster broadcaster(node, tracker, config);

        auto live_send = cosmkit::encode_msg_send(key.to_bech32_address(config.address_prefix), DESTINATION, {coin});
        auto fee = broadcaster.estimate_fee({live_send}, {}, key);

        cosmkit::SendOptions options;
        options.timeout_blocks = 100;
        options.wait = std::chrono::seconds(60);

        std::cout << "\nBroadcasting to " << config.node_url << "..." << std::endl;
        auto result = broadcaster.send({live_send}, fee, key, options);
        std::cout << "Transaction " << describe(result) << std::endl;

        return std::holds_alternative<cosmkit::Included>(result) ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
