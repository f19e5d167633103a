#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Console/CommandResult.hpp"
#include "Console/IOutputSink.hpp"
#include "Core/MarketTypes.hpp"

// Text rendering for the console. Every public call writes whole lines under
// one mutex, so the read loop and the stream worker never interleave.
class ConsoleOutput final : public IOutputSink {
public:
    ConsoleOutput(std::ostream& out, std::string default_symbol, int default_limit);

    // --- IOutputSink ---
    void live_update(const LiveSnapshot& snapshot) override;
    void stream_fault(const StreamSubscription& subscription, const std::string& reason) override;

    // --- boundary ---
    void help();
    void api_notice();
    // Renders every non-Ok outcome of CommandInterpreter::execute().
    void report(const CommandResult& result, const std::string& line);

    // --- connectivity / market data ---
    void ping(bool ok);
    void server_time(std::uint64_t ms);
    void stats(const SymbolStats& stats);
    void order_book(const OrderBookSnapshot& book);
    void trades(const std::vector<AggregateTrade>& trades);
    void candlesticks(const std::vector<Candlestick>& candles);
    void symbols(const std::vector<std::string>& symbols);
    void prices(const std::vector<SymbolPrice>& prices);
    void tops(const std::vector<OrderBookTop>& tops);
    void top(const OrderBookTop& top);

    // --- live ---
    void live_enabled(const StreamSubscription& subscription);
    void live_disabled(StreamKind kind);

    // --- account ---
    void order_placed(const Order& order, OrderKind kind, bool test_only);
    void orders(const std::vector<Order>& orders);
    void order(const std::optional<Order>& order);
    void order_cancelled(const std::string& cancel_id);
    void account(const AccountInfo& account);
    void account_trades(const std::vector<AccountTrade>& trades);
    void deposits(const std::vector<Deposit>& deposits);
    void withdrawals(const std::vector<Withdrawal>& withdrawals);
    void withdraw_submitted(const std::string& asset, const std::string& address, double amount, const std::string& id);
    void test_mode(bool test_only);

    // "2024-05-17 09:30:00" in UTC or local time.
    static std::string format_time(std::uint64_t ms, bool local = true);

private:
    void write_trade(const AggregateTrade& trade);
    void write_candle(const Candlestick& candle);
    void write_order(const Order& order);
    void write_account_trade(const AccountTrade& trade);
    void write_balances(const std::vector<Balance>& balances);
    void write_help();
    void write_api_notice();

    std::ostream& out_;
    std::string default_symbol_;
    int default_limit_;
    std::mutex mtx_;
};
