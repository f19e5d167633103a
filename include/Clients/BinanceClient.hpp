#pragma once
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Clients/IBinanceApi.hpp"
#include "Utils/Config.hpp"

// Binance spot REST client over Boost.Beast HTTPS.
// One TLS connection per call, bounded by ApiSettings::timeout.
class BinanceClient final : public IBinanceApi {
public:
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    BinanceClient(ApiSettings settings, Credentials credentials);

    bool ping() override;
    std::uint64_t server_time() override;

    SymbolStats stats_24h(const std::string& symbol) override;
    OrderBookSnapshot order_book(const std::string& symbol, int limit) override;
    std::vector<AggregateTrade> aggregate_trades(const std::string& symbol, int limit,
                                                 std::uint64_t from_id, std::uint64_t start_time,
                                                 std::uint64_t end_time) override;
    std::vector<Candlestick> candlesticks(const std::string& symbol, KlineInterval interval, int limit,
                                          std::uint64_t start_time, std::uint64_t end_time) override;
    std::vector<std::string> symbols() override;
    std::vector<SymbolPrice> prices() override;
    std::vector<OrderBookTop> order_book_tops() override;
    OrderBookTop order_book_top(const std::string& symbol) override;

    Order place_order(const OrderIntent& intent) override;
    std::vector<Order> orders(const std::string& symbol, int limit) override;
    std::vector<Order> open_orders(const std::string& symbol) override;
    std::optional<Order> order(const std::string& symbol, std::uint64_t id) override;
    std::optional<Order> order(const std::string& symbol, const std::string& client_order_id) override;
    std::string cancel_order(const std::string& symbol, std::uint64_t id) override;
    std::string cancel_order(const std::string& symbol, const std::string& client_order_id) override;
    AccountInfo account() override;
    std::vector<AccountTrade> account_trades(const std::string& symbol, int limit) override;
    std::vector<Deposit> deposits(const std::string& asset) override;
    std::vector<Withdrawal> withdrawals(const std::string& asset) override;
    std::string withdraw(const std::string& asset, const std::string& address, double amount) override;

    std::string open_user_stream() override;
    void keepalive_user_stream(const std::string& listen_key) override;
    void close_user_stream(const std::string& listen_key) override;

    [[nodiscard]] bool has_credentials() const noexcept override { return credentials_.valid(); }

    // Lower-case hex HMAC-SHA256 of `payload` keyed with `secret`.
    static std::string sign(const std::string& payload, const std::string& secret);

    // "k1=v1&k2=v2" with RFC 3986 percent-encoding of the values.
    static std::string encode_query(const QueryParams& params);

    // Plain decimal text without exponent or trailing zeros ("0.001", "25000").
    static std::string format_decimal(double value);

private:
    enum class Method { Get, Post, Put, Delete };
    enum class Security {
        Public,
        ApiKey, // X-MBX-APIKEY header only
        Signed  // header plus timestamp, recvWindow and signature
    };

    nlohmann::json call(Method method, const std::string& path, QueryParams params,
                        Security security = Security::Public);
    std::optional<Order> find_order(const std::string& symbol, QueryParams params);
    std::string cancel(const std::string& symbol, QueryParams params);

    ApiSettings settings_;
    Credentials credentials_;
};
