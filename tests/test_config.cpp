#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "config.hpp"
#include "error.hpp"

namespace cosmkit {
namespace {

// ============================================================================
// RetryConfig
// ============================================================================

TEST(RetryConfigTest, BackoffDoublesUpToCap) {
    RetryConfig retry;
    retry.initial_backoff_ms = 100;
    retry.max_backoff_ms = 350;

    EXPECT_EQ(retry.backoff(1).count(), 100);
    EXPECT_EQ(retry.backoff(2).count(), 200);
    EXPECT_EQ(retry.backoff(3).count(), 350);
    EXPECT_EQ(retry.backoff(40).count(), 350);
}

TEST(RetryConfigTest, Defaults) {
    RetryPolicy retry;
    EXPECT_EQ(retry.max_attempts, 3u);
    EXPECT_EQ(retry.backoff(1).count(), 500);
    EXPECT_EQ(retry.backoff(5).count(), 8000);
}

// ============================================================================
// JSON
// ============================================================================

TEST(ClientConfigTest, DefaultsValidate) {
    ClientConfig config;
    EXPECT_EQ(config.node_url, "http://localhost:1317");
    EXPECT_EQ(config.address_prefix, "cosmos");
    EXPECT_EQ(config.default_memo, DEFAULT_MEMO);
    EXPECT_EQ(config.request_timeout().count(), 10000);
    EXPECT_NO_THROW(config.validate());
}

TEST(ClientConfigTest, JsonRoundTrip) {
    ClientConfig config;
    config.node_url = "https://lcd.example.org/api";
    config.chain_id = "testnet-4";
    config.address_prefix = "osmo";
    config.retry.max_attempts = 7;
    config.poll_interval_ms = 250;
    config.gas_price = "0.1uosmo";

    ClientConfig back = nlohmann::json(config).get<ClientConfig>();
    EXPECT_EQ(back.node_url, config.node_url);
    EXPECT_EQ(back.chain_id, "testnet-4");
    EXPECT_EQ(back.address_prefix, "osmo");
    EXPECT_EQ(back.retry.max_attempts, 7u);
    EXPECT_EQ(back.retry.max_backoff_ms, config.retry.max_backoff_ms);
    EXPECT_EQ(back.poll_interval().count(), 250);
    EXPECT_EQ(back.gas_price, "0.1uosmo");
}

TEST(ClientConfigTest, MissingKeysKeepDefaults) {
    auto j = nlohmann::json::parse(R"({"chain_id": "cosmoshub-4", "retry": {"max_attempts": 5}})");
    ClientConfig config = j.get<ClientConfig>();

    EXPECT_EQ(config.chain_id, "cosmoshub-4");
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.retry.initial_backoff_ms, 500u);
    EXPECT_EQ(config.node_url, "http://localhost:1317");
    EXPECT_EQ(config.gas_price, "0.025stake");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ClientConfigTest, RejectsBadPrefix) {
    ClientConfig config;
    config.address_prefix = "Cosmos";
    try {
        config.validate();
        FAIL() << "Expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.type(), EncodingError::ErrorType::InvalidPrefix);
    }

    config.address_prefix = "";
    EXPECT_THROW(config.validate(), EncodingError);
}

TEST(ClientConfigTest, RejectsUnusableValues) {
    ClientConfig config;
    config.node_url = "";
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.node_url = "localhost:1317";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClientConfig{};
    config.retry.max_attempts = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClientConfig{};
    config.retry.initial_backoff_ms = 10000;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClientConfig{};
    config.poll_interval_ms = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ClientConfig{};
    config.gas_price = "cheap";
    EXPECT_THROW(config.validate(), EncodingError);

    config = ClientConfig{};
    config.gas_price = "";
    EXPECT_NO_THROW(config.validate());
}

// ============================================================================
// Files
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("cosmkit_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json"))
                    .string();
    }

    void TearDown() override { std::remove(path_.c_str()); }

    void write(const std::string& text) {
        std::ofstream file(path_);
        file << text;
    }

    std::string path_;
};

TEST_F(ConfigFileTest, SaveThenLoad) {
    ClientConfig config;
    config.chain_id = "localnet";
    config.default_memo = "";
    config.save_to_file(path_);

    auto loaded = ClientConfig::load_from_file(path_);
    EXPECT_EQ(loaded.chain_id, "localnet");
    EXPECT_EQ(loaded.default_memo, "");
}

TEST_F(ConfigFileTest, LoadValidates) {
    write(R"({"node_url": "ftp://node"})");
    EXPECT_THROW(ClientConfig::load_from_file(path_), std::invalid_argument);
}

TEST_F(ConfigFileTest, LoadRejectsMalformedJson) {
    write("{ not json");
    try {
        ClientConfig::load_from_file(path_);
        FAIL() << "Expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.type(), EncodingError::ErrorType::MalformedPayload);
    }
}

TEST_F(ConfigFileTest, MissingFile) {
    EXPECT_THROW(ClientConfig::load_from_file(path_ + ".absent"), std::runtime_error);
}

} // namespace
} // namespace cosmkit
