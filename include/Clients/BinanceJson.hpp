#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Core/MarketTypes.hpp"
#include "Core/OrderBook.hpp"

// Decoders for the venue's REST and stream payloads.
// Prices and quantities arrive as decimal strings and are converted with
// std::stod. Malformed input throws nlohmann::json::exception or
// std::invalid_argument; the clients turn both into RemoteError.
namespace BinanceJson {

using json = nlohmann::json;

// {"code": -1121, "msg": "Invalid symbol."}
struct ApiError {
    int code = 0;
    std::string message;
};

// One diff-depth event: update ids U..u and the absolute level quantities.
struct DepthUpdate {
    std::string symbol;
    std::uint64_t first_update_id = 0;
    std::uint64_t final_update_id = 0;
    std::vector<OrderBook::Order> changes;
};

// Accepts both "0.001" and 0.001.
double decimal(const json& value);

// nullopt unless `body` is a JSON object carrying "code" and "msg".
std::optional<ApiError> api_error(const std::string& body);

std::uint64_t server_time(const json& j);
SymbolStats stats_24h(const json& j);
OrderBookSnapshot order_book(const json& j, const std::string& symbol);
std::vector<AggregateTrade> aggregate_trades(const json& j, const std::string& symbol);
std::vector<Candlestick> candlesticks(const json& j, const std::string& symbol, KlineInterval interval);
std::vector<std::string> symbols(const json& exchange_info);
std::vector<SymbolPrice> prices(const json& j);
OrderBookTop book_ticker(const json& j);
std::vector<OrderBookTop> book_tickers(const json& j);

Order order(const json& j);
std::vector<Order> orders(const json& j);
AccountInfo account(const json& j);
std::vector<AccountTrade> account_trades(const json& j);
std::vector<Deposit> deposits(const json& j);
std::vector<Withdrawal> withdrawals(const json& j);

// --- stream events ---
DepthUpdate depth_update(const json& j);
Candlestick kline_event(const json& j);
AggregateTrade aggregate_trade_event(const json& j);
// outboundAccountPosition or executionReport; nullopt for any other event.
std::optional<UserDataEvent> user_data_event(const json& j);

} // namespace BinanceJson
