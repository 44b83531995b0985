#include "config.hpp"
#include "bech32.hpp"
#include "coin.hpp"
#include "error.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cosmkit {

std::chrono::milliseconds RetryConfig::backoff(uint32_t retry) const {
    uint64_t delay = initial_backoff_ms;
    for (uint32_t i = 1; i < retry && delay < max_backoff_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<uint64_t>(delay, max_backoff_ms));
}

ClientConfig ClientConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for reading: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload,
                            "Config file " + path + " is not valid JSON: " + e.what());
    }

    ClientConfig config = j.get<ClientConfig>();
    config.validate();
    return config;
}

void ClientConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << json(*this).dump(4) << std::endl;
}

void ClientConfig::validate() const {
    Bech32::validate_prefix(address_prefix);

    if (node_url.empty()) {
        throw std::invalid_argument("node_url must not be empty");
    }
    if (node_url.rfind("http://", 0) != 0 && node_url.rfind("https://", 0) != 0) {
        throw std::invalid_argument("node_url must start with http:// or https://, got " + node_url);
    }
    if (retry.max_attempts == 0) {
        throw std::invalid_argument("retry.max_attempts must be at least 1");
    }
    if (retry.initial_backoff_ms > retry.max_backoff_ms) {
        throw std::invalid_argument("retry.initial_backoff_ms exceeds retry.max_backoff_ms");
    }
    if (request_timeout_ms == 0 || poll_interval_ms == 0) {
        throw std::invalid_argument("request_timeout_ms and poll_interval_ms must be positive");
    }
    if (!gas_price.empty()) {
        GasPrice::parse(gas_price);
    }
}

void to_json(json& j, const RetryConfig& r) {
    j = json{
        {"max_attempts", r.max_attempts},
        {"initial_backoff_ms", r.initial_backoff_ms},
        {"max_backoff_ms", r.max_backoff_ms}
    };
}

void from_json(const json& j, RetryConfig& r) {
    RetryConfig defaults;
    r.max_attempts = j.value("max_attempts", defaults.max_attempts);
    r.initial_backoff_ms = j.value("initial_backoff_ms", defaults.initial_backoff_ms);
    r.max_backoff_ms = j.value("max_backoff_ms", defaults.max_backoff_ms);
}

void to_json(json& j, const ClientConfig& c) {
    j = json{
        {"node_url", c.node_url},
        {"chain_id", c.chain_id},
        {"address_prefix", c.address_prefix},
        {"request_timeout_ms", c.request_timeout_ms},
        {"retry", c.retry},
        {"poll_interval_ms", c.poll_interval_ms},
        {"default_memo", c.default_memo},
        {"gas_price", c.gas_price}
    };
}

void from_json(const json& j, ClientConfig& c) {
    ClientConfig defaults;
    c.node_url = j.value("node_url", defaults.node_url);
    c.chain_id = j.value("chain_id", defaults.chain_id);
    c.address_prefix = j.value("address_prefix", defaults.address_prefix);
    c.request_timeout_ms = j.value("request_timeout_ms", defaults.request_timeout_ms);
    if (j.contains("retry")) {
        j.at("retry").get_to(c.retry);
    } else {
        c.retry = defaults.retry;
    }
    c.poll_interval_ms = j.value("poll_interval_ms", defaults.poll_interval_ms);
    c.default_memo = j.value("default_memo", defaults.default_memo);
    c.gas_price = j.value("gas_price", defaults.gas_price);
}

} // namespace cosmkit
