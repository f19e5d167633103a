#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "Clients/IBinanceApi.hpp"

struct ApiSettings {
    std::string rest_host = "api.binance.com";
    std::string rest_port = "443";
    std::string stream_host = "stream.binance.com";
    std::string stream_port = "9443";
    long recv_window = 5000;                   // ms, sent with every signed request
    std::chrono::milliseconds timeout{10000};  // per REST call
};

struct ConsoleSettings {
    std::string default_symbol = "BTCUSDT";
    int default_limit = 10;
    bool test_orders = true;
    std::chrono::milliseconds stop_timeout{5000};
};

struct LoggingSettings {
    bool timing = false;     // [TIMING] lines on stderr
    std::string questdb_url; // e.g. http://localhost:9000; empty disables QuestDB
};

struct AppConfig {
    ApiSettings api;
    Credentials user;
    ConsoleSettings console;
    LoggingSettings logging;
};

void from_json(const nlohmann::json& j, ApiSettings& s);
void from_json(const nlohmann::json& j, Credentials& c);
void from_json(const nlohmann::json& j, ConsoleSettings& s);
void from_json(const nlohmann::json& j, LoggingSettings& s);
void from_json(const nlohmann::json& j, AppConfig& c);

// Parses appsettings.json text. Absent sections and keys keep their defaults.
// Throws ConfigError on malformed JSON or a value of the wrong type.
AppConfig parse_config(const std::string& text);

// Reads `path` if it exists (a missing file yields the defaults) and applies
// the BINANCE_API_KEY / BINANCE_API_SECRET environment overrides.
AppConfig load_config(const std::filesystem::path& path);

void apply_environment(AppConfig& config);
