#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Core/MarketTypes.hpp"

// API key pair for the signed endpoints.
struct Credentials {
    std::string api_key;
    std::string api_secret;

    [[nodiscard]] bool valid() const noexcept { return !api_key.empty() && !api_secret.empty(); }
};

// One-shot REST boundary of the venue. Every call blocks until the response
// has been decoded and throws RemoteError on transport or API failure.
// Calls marked "signed" need credentials.
class IBinanceApi {
public:
    virtual ~IBinanceApi() = default;

    // --- connectivity ---
    virtual bool ping() = 0;
    virtual std::uint64_t server_time() = 0;

    // --- market data ---
    virtual SymbolStats stats_24h(const std::string& symbol) = 0;
    virtual OrderBookSnapshot order_book(const std::string& symbol, int limit) = 0;
    // Zero start/end/from_id leave the parameter out of the request.
    virtual std::vector<AggregateTrade> aggregate_trades(const std::string& symbol, int limit,
                                                         std::uint64_t from_id = 0,
                                                         std::uint64_t start_time = 0,
                                                         std::uint64_t end_time = 0) = 0;
    virtual std::vector<Candlestick> candlesticks(const std::string& symbol, KlineInterval interval,
                                                  int limit,
                                                  std::uint64_t start_time = 0,
                                                  std::uint64_t end_time = 0) = 0;
    virtual std::vector<std::string> symbols() = 0;
    virtual std::vector<SymbolPrice> prices() = 0;
    virtual std::vector<OrderBookTop> order_book_tops() = 0;
    virtual OrderBookTop order_book_top(const std::string& symbol) = 0;

    // --- account (signed) ---
    virtual Order place_order(const OrderIntent& intent) = 0;
    virtual std::vector<Order> orders(const std::string& symbol, int limit) = 0;
    virtual std::vector<Order> open_orders(const std::string& symbol) = 0;
    // nullopt when the venue does not know the order.
    virtual std::optional<Order> order(const std::string& symbol, std::uint64_t id) = 0;
    virtual std::optional<Order> order(const std::string& symbol, const std::string& client_order_id) = 0;
    virtual std::string cancel_order(const std::string& symbol, std::uint64_t id) = 0;
    virtual std::string cancel_order(const std::string& symbol, const std::string& client_order_id) = 0;
    virtual AccountInfo account() = 0;
    virtual std::vector<AccountTrade> account_trades(const std::string& symbol, int limit) = 0;
    // Empty asset means all assets.
    virtual std::vector<Deposit> deposits(const std::string& asset) = 0;
    virtual std::vector<Withdrawal> withdrawals(const std::string& asset) = 0;
    virtual std::string withdraw(const std::string& asset, const std::string& address, double amount) = 0;

    // --- user data stream listen key (api key only) ---
    virtual std::string open_user_stream() = 0;
    virtual void keepalive_user_stream(const std::string& listen_key) = 0;
    virtual void close_user_stream(const std::string& listen_key) = 0;

    [[nodiscard]] virtual bool has_credentials() const noexcept = 0;
};
