#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Core/StreamKind.hpp"

// Value types shared by the REST client, the stream caches and the console.
// Prices and quantities are kept as double; all times are milliseconds since epoch.

enum class OrderSide { Buy, Sell };
enum class OrderKind { Market, Limit };

struct PriceLevel {
    double price = 0.0;
    double quantity = 0.0;
};

struct OrderBookTop {
    std::string symbol;
    PriceLevel bid;
    PriceLevel ask;

    [[nodiscard]] double mid_price() const noexcept { return (bid.price + ask.price) / 2.0; }
    [[nodiscard]] double spread() const noexcept { return ask.price - bid.price; }
};

struct OrderBookSnapshot {
    std::string symbol;
    std::uint64_t last_update_id = 0;
    std::vector<PriceLevel> bids; // best (highest) first
    std::vector<PriceLevel> asks; // best (lowest) first

    // Copy holding at most `depth` levels per side.
    [[nodiscard]] OrderBookSnapshot truncated(std::size_t depth) const;

    // nullopt while either side is empty.
    [[nodiscard]] std::optional<OrderBookTop> top() const;
};

struct Candlestick {
    std::string symbol;
    KlineInterval interval = kDefaultInterval;
    std::uint64_t open_time = 0;
    std::uint64_t close_time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double quote_volume = 0.0;
    std::uint64_t trade_count = 0;
    bool is_final = true;
};

struct CandlestickSeries {
    std::string symbol;
    KlineInterval interval = kDefaultInterval;
    std::vector<Candlestick> candles; // chronological
};

struct AggregateTrade {
    std::string symbol;
    std::uint64_t id = 0;
    double price = 0.0;
    double quantity = 0.0;
    std::uint64_t first_trade_id = 0;
    std::uint64_t last_trade_id = 0;
    std::uint64_t timestamp = 0;
    bool is_buyer_maker = false;
    bool is_best_price_match = false;
};

struct TradeSeries {
    std::string symbol;
    std::vector<AggregateTrade> trades; // chronological
};

struct SymbolStats {
    std::string symbol;
    double price_change_percent = 0.0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double last = 0.0;
    double bid = 0.0;
    double ask = 0.0;
    double weighted_average = 0.0;
    double volume = 0.0;
};

struct SymbolPrice {
    std::string symbol;
    double price = 0.0;
};

struct Balance {
    std::string asset;
    double free = 0.0;
    double locked = 0.0;
};

struct AccountInfo {
    int maker_commission = 0;
    int taker_commission = 0;
    int buyer_commission = 0;
    int seller_commission = 0;
    bool can_trade = false;
    bool can_withdraw = false;
    bool can_deposit = false;
    std::uint64_t update_time = 0;
    std::vector<Balance> balances;
};

struct Order {
    std::string symbol;
    std::uint64_t id = 0;
    std::string client_order_id;
    double price = 0.0;
    double original_quantity = 0.0;
    double executed_quantity = 0.0;
    double stop_price = 0.0;
    std::string side;   // "BUY" / "SELL"
    std::string type;   // "LIMIT", "MARKET", "STOP_LOSS", ...
    std::string status; // "NEW", "FILLED", ...
    std::uint64_t time = 0;
};

struct AccountTrade {
    std::string symbol;
    std::uint64_t id = 0;
    std::uint64_t order_id = 0;
    double price = 0.0;
    double quantity = 0.0;
    double commission = 0.0;
    std::string commission_asset;
    std::uint64_t time = 0;
    bool is_buyer = false;
    bool is_maker = false;
    bool is_best_price_match = false;
};

struct Deposit {
    std::string asset;
    double amount = 0.0;
    std::string address;
    std::string tx_id;
    int status = 0;
    std::uint64_t insert_time = 0;
};

struct Withdrawal {
    std::string id;
    std::string asset;
    double amount = 0.0;
    std::string address;
    int status = 0;
    std::string apply_time; // reported by the venue as "YYYY-MM-DD hh:mm:ss"
};

// What the operator asked for; handed to the API client unmodified.
struct OrderIntent {
    OrderSide side = OrderSide::Buy;
    OrderKind kind = OrderKind::Market;
    std::string symbol;
    double quantity = 0.0;
    std::optional<double> price;
    std::optional<double> stop_price;
    bool is_test_only = true;
};

// --- user data stream events ---

struct AccountUpdate {
    std::uint64_t event_time = 0;
    std::vector<Balance> balances;
};

struct OrderUpdate {
    std::uint64_t event_time = 0;
    std::string execution_type; // "NEW", "CANCELED", "TRADE", ...
    Order order;
    std::optional<AccountTrade> trade; // set when execution_type == "TRADE"
};

using UserDataEvent = std::variant<AccountUpdate, OrderUpdate>;

[[nodiscard]] std::string_view to_string(OrderSide side) noexcept;
