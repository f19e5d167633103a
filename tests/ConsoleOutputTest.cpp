#include <gtest/gtest.h>

#include <sstream>

#include "Console/ConsoleOutput.hpp"

class ConsoleOutputTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    ConsoleOutput output_{out_, "ETHBTC", 25};

    bool contains(const std::string& text) const { return out_.str().find(text) != std::string::npos; }
};

TEST_F(ConsoleOutputTest, FormatsUtcTime) {
    EXPECT_EQ(ConsoleOutput::format_time(0, false), "1970-01-01 00:00:00");
    EXPECT_EQ(ConsoleOutput::format_time(1499827319559ULL, false), "2017-07-12 02:41:59");
}

TEST_F(ConsoleOutputTest, HelpShowsConfiguredDefaults) {
    output_.help();
    EXPECT_TRUE(contains("Usage: <command> <args>"));
    EXPECT_TRUE(contains("live off"));
    EXPECT_TRUE(contains("default symbol: ETHBTC"));
    EXPECT_TRUE(contains("default limit: 25"));
}

TEST_F(ConsoleOutputTest, ReportOkWritesNothing) {
    output_.report(CommandResult::ok(), "ping");
    output_.report(CommandResult::fail(CommandStatus::Quit), "quit");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConsoleOutputTest, ReportUnrecognizedEchoesLineAndHelp) {
    output_.report(CommandResult::fail(CommandStatus::UnrecognizedCommand), "frobnicate now");
    EXPECT_TRUE(contains("! Unrecognized Command: \"frobnicate now\"\n"));
    EXPECT_TRUE(contains("Usage: <command> <args>"));
}

TEST_F(ConsoleOutputTest, ReportErrors) {
    output_.report(CommandResult::fail(CommandStatus::ArgumentError, "A quantity greater than 0 is required."), "");
    output_.report(CommandResult::fail(CommandStatus::RemoteError, "Invalid symbol."), "");
    output_.report(CommandResult::fail(CommandStatus::SessionError,
                                       "A live task is currently active ...use 'live off' to disable."), "");

    EXPECT_TRUE(contains("A quantity greater than 0 is required.\n"));
    EXPECT_TRUE(contains("\n! Exception: Invalid symbol.\n"));
    EXPECT_TRUE(contains("! A live task is currently active ...use 'live off' to disable.\n"));
}

TEST_F(ConsoleOutputTest, ReportNotAuthorizedPrintsNotice) {
    output_.report(CommandResult::fail(CommandStatus::NotAuthorized), "account");
    EXPECT_TRUE(contains("NOTICE"));
    EXPECT_TRUE(contains("BINANCE_API_KEY"));
}

TEST_F(ConsoleOutputTest, LiveBookLine) {
    OrderBookSnapshot book;
    book.symbol = "BTCUSDT";
    book.bids = {{100.0, 1.0}};
    book.asks = {{101.0, 2.0}};

    output_.live_update(book);

    EXPECT_EQ(out_.str(),
              "  BTCUSDT  -  Bid: 100.00000000  |  100.50000000  |  Ask: 101.00000000  -  Spread: 1.00000000\n");
}

TEST_F(ConsoleOutputTest, LiveCandleLine) {
    Candlestick c;
    c.symbol = "BTCUSDT";
    c.open = 1.0;
    c.high = 2.0;
    c.low = 0.5;
    c.close = 1.5;
    c.volume = 123.456;
    c.is_final = false;

    output_.live_update(CandlestickSeries{"BTCUSDT", KlineInterval::Hour, {c}});

    EXPECT_TRUE(contains("Is Final: NO"));
    EXPECT_TRUE(contains("  BTCUSDT - O: 1.00000000 | H: 2.00000000 | L: 0.50000000 | C: 1.50000000 | V: 123.46 - ["));
}

TEST_F(ConsoleOutputTest, LiveOrderUpdate) {
    OrderUpdate update;
    update.execution_type = "CANCELED";
    update.order.symbol = "ETHBTC";
    update.order.id = 77;
    update.order.type = "LIMIT";
    update.order.side = "BUY";
    update.order.status = "CANCELED";

    output_.live_update(UserDataEvent{update});

    EXPECT_TRUE(contains("Order [77] update: CANCELED"));
    EXPECT_TRUE(contains("  ETHBTC -  LIMIT -  BUY - "));
    EXPECT_TRUE(contains("CANCELED  [ID: 77]"));
}

TEST_F(ConsoleOutputTest, EmptyListsAndMissingOrder) {
    output_.orders({});
    output_.deposits({});
    output_.order(std::nullopt);

    EXPECT_TRUE(contains("[None]"));
    EXPECT_TRUE(contains("[Not Found]"));
}

TEST_F(ConsoleOutputTest, PricesAndSymbols) {
    output_.prices({{"BTCUSDT", 25000.5}});
    output_.symbols({"BTCUSDT", "ETHBTC", "BNBBTC"});

    EXPECT_TRUE(contains("   BTCUSDT: 25000.5\n"));
    EXPECT_TRUE(contains("BTCUSDT, ETHBTC, BNBBTC\n"));
}

TEST_F(ConsoleOutputTest, OrderPlacedMarksTestOrders) {
    Order order;
    order.symbol = "BTCUSDT";
    order.side = "SELL";
    order.original_quantity = 0.5;

    output_.order_placed(order, OrderKind::Limit, true);
    output_.order_placed(order, OrderKind::Market, false);

    EXPECT_TRUE(contains("~ TEST ~ >> LIMIT SELL order (ID: 0) placed for 0.50000000 BTCUSDT @ 0.00000000.\n"));
    EXPECT_TRUE(contains("\n>> MARKET SELL order"));
}

TEST_F(ConsoleOutputTest, AccountShowsOnlyNonZeroBalances) {
    AccountInfo account;
    account.maker_commission = 15;
    account.can_trade = true;
    account.balances = {{"BTC", 1.25, 0.0}, {"DUST", 0.0, 0.0}};

    output_.account(account);

    EXPECT_TRUE(contains("    Maker Commission:   15 %\n"));
    EXPECT_TRUE(contains("    Can Trade:    Yes\n"));
    EXPECT_TRUE(contains("    Can Withdraw:  No\n"));
    EXPECT_TRUE(contains("      Asset: BTC - Free: 1.25 - Locked: 0\n"));
    EXPECT_FALSE(contains("DUST"));
}

TEST_F(ConsoleOutputTest, TestModeWarning) {
    output_.test_mode(true);
    EXPECT_FALSE(contains("WILL be placed"));
    output_.test_mode(false);
    EXPECT_TRUE(contains("  Test orders: OFF\n"));
    EXPECT_TRUE(contains("  !! Market and Limit orders WILL be placed !!\n"));
}

TEST_F(ConsoleOutputTest, LiveTransitions) {
    output_.live_enabled({StreamKind::Candlesticks, "BTCUSDT", KlineInterval::Minutes5});
    output_.live_disabled(StreamKind::Candlesticks);
    output_.stream_fault({StreamKind::Trades, "BTCUSDT", std::nullopt}, "connection reset");

    EXPECT_TRUE(contains("  ...live kline feed enabled for symbol: BTCUSDT, interval: 5m ...use 'live off' to disable.\n"));
    EXPECT_TRUE(contains("  ...live kline feed disabled.\n"));
    EXPECT_TRUE(contains("! Live trades feed stopped: connection reset\n"));
}
