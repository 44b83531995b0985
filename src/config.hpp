#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "consts.hpp"

namespace cosmkit {

// Bounded retry with exponential backoff for transient failures
struct RetryConfig {
    uint32_t max_attempts = 3;
    uint32_t initial_backoff_ms = 500;
    uint32_t max_backoff_ms = 8000;

    // Delay before retry number `retry` (1-based), doubling up to max_backoff_ms
    std::chrono::milliseconds backoff(uint32_t retry) const;
};

using RetryPolicy = RetryConfig;

struct ClientConfig {
    std::string node_url = "http://localhost:1317";
    std::string chain_id;
    std::string address_prefix = "cosmos";
    uint32_t request_timeout_ms = 10000;
    RetryConfig retry;
    uint32_t poll_interval_ms = 1000;
    std::string default_memo = std::string(DEFAULT_MEMO);
    std::string gas_price = "0.025stake";

    // Missing keys keep their defaults
    static ClientConfig load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;

    // Throws EncodingError::InvalidPrefix for a bad address prefix and
    // std::invalid_argument for other unusable values
    void validate() const;

    std::chrono::milliseconds request_timeout() const { return std::chrono::milliseconds(request_timeout_ms); }
    std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
};

void to_json(nlohmann::json& j, const RetryConfig& r);
void from_json(const nlohmann::json& j, RetryConfig& r);

void to_json(nlohmann::json& j, const ClientConfig& c);
void from_json(const nlohmann::json& j, ClientConfig& c);

} // namespace cosmkit
