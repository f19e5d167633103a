#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "Core/Errors.hpp"
#include "Utils/Config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path path_ = std::filesystem::temp_directory_path() / "binance_console_config_test.json";

    void SetUp() override {
        unsetenv("BINANCE_API_KEY");
        unsetenv("BINANCE_API_SECRET");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        unsetenv("BINANCE_API_KEY");
        unsetenv("BINANCE_API_SECRET");
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }
};

TEST_F(ConfigTest, EmptyObjectKeepsDefaults) {
    const auto config = parse_config("{}");

    EXPECT_EQ(config.api.rest_host, "api.binance.com");
    EXPECT_EQ(config.api.stream_port, "9443");
    EXPECT_EQ(config.api.timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.console.default_symbol, "BTCUSDT");
    EXPECT_EQ(config.console.default_limit, 10);
    EXPECT_TRUE(config.console.test_orders);
    EXPECT_FALSE(config.user.valid());
    EXPECT_FALSE(config.logging.timing);
    EXPECT_TRUE(config.logging.questdb_url.empty());
}

TEST_F(ConfigTest, ReadsAllSections) {
    const auto config = parse_config(R"({
        "Api": {"RestHost": "testnet.binance.vision", "RecvWindow": 6000, "TimeoutMs": 2500},
        "User": {"ApiKey": "k", "ApiSecret": "s"},
        "Console": {"DefaultSymbol": "ETHBTC", "DefaultLimit": 25, "TestOrders": false, "StopTimeoutMs": 750},
        "Logging": {"Timing": true, "QuestDbUrl": "http://localhost:9000"}
    })");

    EXPECT_EQ(config.api.rest_host, "testnet.binance.vision");
    EXPECT_EQ(config.api.rest_port, "443");
    EXPECT_EQ(config.api.recv_window, 6000);
    EXPECT_EQ(config.api.timeout, std::chrono::milliseconds(2500));
    EXPECT_TRUE(config.user.valid());
    EXPECT_EQ(config.console.default_symbol, "ETHBTC");
    EXPECT_EQ(config.console.default_limit, 25);
    EXPECT_FALSE(config.console.test_orders);
    EXPECT_EQ(config.console.stop_timeout, std::chrono::milliseconds(750));
    EXPECT_TRUE(config.logging.timing);
    EXPECT_EQ(config.logging.questdb_url, "http://localhost:9000");
}

TEST_F(ConfigTest, MalformedInputIsConfigError) {
    EXPECT_THROW(parse_config("{ not json"), ConfigError);
    EXPECT_THROW(parse_config("[1, 2]"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Console": {"DefaultLimit": "ten"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Api": "api.binance.com"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Console": {"DefaultLimit": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Console": {"DefaultSymbol": ""}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Console": {"StopTimeoutMs": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"Console": {"StopTimeoutMs": -100}})"), ConfigError);
}

TEST_F(ConfigTest, DefaultSymbolIsUppercased) {
    const auto config = parse_config(R"({"Console": {"DefaultSymbol": "btcusdt"}})");
    EXPECT_EQ(config.console.default_symbol, "BTCUSDT");
}

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto config = load_config(path_);
    EXPECT_EQ(config.console.default_symbol, "BTCUSDT");
}

TEST_F(ConfigTest, LoadsFileAndAppliesEnvironment) {
    write(R"({"User": {"ApiKey": "from-file", "ApiSecret": "file-secret"}})");
    setenv("BINANCE_API_KEY", "from-env", 1);

    const auto config = load_config(path_);
    EXPECT_EQ(config.user.api_key, "from-env");
    EXPECT_EQ(config.user.api_secret, "file-secret");
}

TEST_F(ConfigTest, BrokenFileIsFatal) {
    write("{\"Api\": ");
    EXPECT_THROW(load_config(path_), ConfigError);
}
