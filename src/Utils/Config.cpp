#include "Utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <fstream>
#include <iostream>
#include <sstream>

#include "Core/Errors.hpp"

using json = nlohmann::json;

namespace {

template <typename T>
void read_if_present(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void read_ms_if_present(const json& j, const char* key, std::chrono::milliseconds& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = std::chrono::milliseconds{j[key].get<long>()};
    }
}

} // namespace

void from_json(const json& j, ApiSettings& s) {
    read_if_present(j, "RestHost", s.rest_host);
    read_if_present(j, "RestPort", s.rest_port);
    read_if_present(j, "StreamHost", s.stream_host);
    read_if_present(j, "StreamPort", s.stream_port);
    read_if_present(j, "RecvWindow", s.recv_window);
    read_ms_if_present(j, "TimeoutMs", s.timeout);
}

void from_json(const json& j, Credentials& c) {
    read_if_present(j, "ApiKey", c.api_key);
    read_if_present(j, "ApiSecret", c.api_secret);
}

void from_json(const json& j, ConsoleSettings& s) {
    read_if_present(j, "DefaultSymbol", s.default_symbol);
    read_if_present(j, "DefaultLimit", s.default_limit);
    read_if_present(j, "TestOrders", s.test_orders);
    read_ms_if_present(j, "StopTimeoutMs", s.stop_timeout);
}

void from_json(const json& j, LoggingSettings& s) {
    read_if_present(j, "Timing", s.timing);
    read_if_present(j, "QuestDbUrl", s.questdb_url);
}

void from_json(const json& j, AppConfig& c) {
    for (const char* section : {"Api", "User", "Console", "Logging"}) {
        if (j.contains(section) && !j[section].is_object() && !j[section].is_null()) {
            throw ConfigError(std::string("section ") + section + " must be a JSON object");
        }
    }
    read_if_present(j, "Api", c.api);
    read_if_present(j, "User", c.user);
    read_if_present(j, "Console", c.console);
    read_if_present(j, "Logging", c.logging);
}

AppConfig parse_config(const std::string& text) {
    AppConfig config;
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigError("configuration root must be a JSON object");
        }
        config = j.get<AppConfig>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    if (config.console.default_limit <= 0) {
        throw ConfigError("Console.DefaultLimit must be greater than 0");
    }
    if (config.console.default_symbol.empty()) {
        throw ConfigError("Console.DefaultSymbol must not be empty");
    }
    if (config.console.stop_timeout.count() <= 0) {
        throw ConfigError("Console.StopTimeoutMs must be greater than 0");
    }
    std::transform(config.console.default_symbol.begin(), config.console.default_symbol.end(),
                   config.console.default_symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return config;
}

AppConfig load_config(const std::filesystem::path& path) {
    AppConfig config;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError("cannot open " + path.string());
        }
        std::ostringstream text;
        text << in.rdbuf();
        config = parse_config(text.str());
        std::cout << "[CONFIG] Loaded " << path.string() << std::endl;
    } else {
        std::cout << "[CONFIG] " << path.string() << " not found, using defaults" << std::endl;
    }

    apply_environment(config);
    return config;
}

void apply_environment(AppConfig& config) {
    if (const char* key = std::getenv("BINANCE_API_KEY"); key && *key) {
        config.user.api_key = key;
    }
    if (const char* secret = std::getenv("BINANCE_API_SECRET"); secret && *secret) {
        config.user.api_secret = secret;
    }
}
