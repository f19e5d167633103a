#include <gtest/gtest.h>

#include <sstream>

#include "Console/CommandInterpreter.hpp"
#include "Fakes.hpp"

using fakes::eventually;

class CommandInterpreterTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    ConsoleOutput output_{out_, "BTCUSDT", 10};
    fakes::FakeBinanceApi api_;
    fakes::FakeStreamClient client_;
    LiveSessionManager sessions_{client_, output_};
    QueryResolver resolver_{sessions_, api_};
    CommandInterpreter interpreter_{api_, sessions_, resolver_, output_, ConsoleSettings{}};

    CommandStatus run(std::string_view line) { return interpreter_.execute(line).status; }

    bool book_cached(const std::string& symbol) {
        return sessions_.snapshot_for(StreamKind::OrderBook, symbol) != nullptr;
    }
};

// --- the five reference scenarios ---

TEST_F(CommandInterpreterTest, BookWithoutSessionFetchesRemotely) {
    EXPECT_EQ(run("book BTCUSDT 5"), CommandStatus::Ok);

    EXPECT_EQ(api_.count("order_book"), 1);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 5);
    EXPECT_NE(out_.str().find("Bid:"), std::string::npos);
}

TEST_F(CommandInterpreterTest, BookWithLiveDepthUsesCache) {
    ASSERT_EQ(run("live depth BTCUSDT"), CommandStatus::Ok);
    ASSERT_TRUE(eventually([&] { return book_cached("BTCUSDT"); }));

    EXPECT_EQ(run("book BTCUSDT"), CommandStatus::Ok);
    EXPECT_EQ(api_.total_calls(), 0);
}

TEST_F(CommandInterpreterTest, SecondLiveStartIsRejected) {
    ASSERT_EQ(run("live depth BTCUSDT"), CommandStatus::Ok);
    const auto first = sessions_.active_view();
    ASSERT_TRUE(first.has_value());

    const auto result = interpreter_.execute("live depth BTCUSDT");
    EXPECT_EQ(result.status, CommandStatus::SessionError);
    EXPECT_NE(result.message.find("live off"), std::string::npos);

    const auto still = sessions_.active_view();
    ASSERT_TRUE(still.has_value());
    EXPECT_EQ(still->id, first->id);
    EXPECT_EQ(client_.runs(), 1);
}

TEST_F(CommandInterpreterTest, LiveOffWhenIdleIsNoOp) {
    EXPECT_FALSE(sessions_.active());
    EXPECT_EQ(run("live off"), CommandStatus::Ok);
    EXPECT_FALSE(sessions_.active());
    EXPECT_EQ(out_.str().find("disabled"), std::string::npos);
}

TEST_F(CommandInterpreterTest, UnknownVerbIsUnrecognized) {
    EXPECT_EQ(run("frobnicate"), CommandStatus::UnrecognizedCommand);
    EXPECT_EQ(api_.total_calls(), 0);
    EXPECT_FALSE(sessions_.active());
    EXPECT_EQ(run("ping"), CommandStatus::Ok);
}

// --- dispatch ---

TEST_F(CommandInterpreterTest, BlankLineIsEmpty) {
    EXPECT_EQ(run(""), CommandStatus::Empty);
    EXPECT_EQ(run("   \t "), CommandStatus::Empty);
}

TEST_F(CommandInterpreterTest, VerbsAreCaseInsensitive) {
    EXPECT_EQ(run("PING"), CommandStatus::Ok);
    EXPECT_EQ(run("TradesIn BTCUSDT 1 2"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("ping"), 1);
    EXPECT_EQ(api_.count("aggregate_trades"), 1);
}

TEST_F(CommandInterpreterTest, QuitAndExit) {
    EXPECT_EQ(run("quit"), CommandStatus::Quit);
    EXPECT_EQ(run("EXIT"), CommandStatus::Quit);
}

TEST_F(CommandInterpreterTest, RemoteErrorIsContained) {
    api_.fail_with = "Invalid symbol.";
    const auto result = interpreter_.execute("stats NOPE");
    EXPECT_EQ(result.status, CommandStatus::RemoteError);
    EXPECT_EQ(result.message, "Invalid symbol.");

    api_.fail_with.reset();
    EXPECT_EQ(run("stats BTCUSDT"), CommandStatus::Ok);
}

TEST_F(CommandInterpreterTest, UnexpectedFailureIsContained) {
    api_.break_with = "type must be number, but is string";
    const auto result = interpreter_.execute("stats BTCUSDT");
    EXPECT_EQ(result.status, CommandStatus::RemoteError);
    EXPECT_EQ(result.message, "type must be number, but is string");

    api_.break_with.reset();
    EXPECT_EQ(run("stats BTCUSDT"), CommandStatus::Ok);
    EXPECT_EQ(run("ping"), CommandStatus::Ok);
}

TEST_F(CommandInterpreterTest, SymbolsAreUppercased) {
    EXPECT_EQ(run("stats ethbtc"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "ETHBTC");
    EXPECT_EQ(run("top ethbtc"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("order_book_top"), 1);
    EXPECT_EQ(api_.last_symbol, "ETHBTC");
}

// --- argument defaults ---

TEST_F(CommandInterpreterTest, BookSlotIsLimitWhenNumeric) {
    EXPECT_EQ(run("book 7"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 7);
}

TEST_F(CommandInterpreterTest, BookSlotIsSymbolOtherwise) {
    EXPECT_EQ(run("depth ethbtc"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "ETHBTC");
    EXPECT_EQ(api_.last_limit, 10);
}

TEST_F(CommandInterpreterTest, MalformedOptionalNumbersFallBack) {
    EXPECT_EQ(run("book ethbtc lots"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_limit, 10);

    EXPECT_EQ(run("book -3"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 10);

    EXPECT_EQ(run("trades BTCUSDT 5x"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_limit, 10);

    EXPECT_EQ(run("candles BTCUSDT 7x 5"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_interval, KlineInterval::Hour);
    EXPECT_EQ(api_.last_limit, 5);
}

TEST_F(CommandInterpreterTest, DefaultsWithoutArguments) {
    EXPECT_EQ(run("trades"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 10);

    EXPECT_EQ(run("klines"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_interval, kDefaultInterval);
}

TEST_F(CommandInterpreterTest, RangedCandlesParseTimes) {
    EXPECT_EQ(run("klinesIn btcusdt 15m 100 abc"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_interval, KlineInterval::Minutes15);
    EXPECT_EQ(api_.last_start, 100u);
    EXPECT_EQ(api_.last_end, 0u);
}

TEST_F(CommandInterpreterTest, TradesFromPassesId) {
    EXPECT_EQ(run("tradesFrom BTCUSDT 12345 3"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_from_id, 12345u);
    EXPECT_EQ(api_.last_limit, 3);
}

// --- live ---

TEST_F(CommandInterpreterTest, LiveDefaultsToDepthOnDefaultSymbol) {
    EXPECT_EQ(run("live"), CommandStatus::Ok);
    const auto view = sessions_.active_view();
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->subscription.kind, StreamKind::OrderBook);
    EXPECT_EQ(view->subscription.symbol, "BTCUSDT");
}

TEST_F(CommandInterpreterTest, LiveKlineTakesInterval) {
    EXPECT_EQ(run("live candle ethbtc 5m"), CommandStatus::Ok);
    const auto view = sessions_.active_view();
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->subscription.kind, StreamKind::Candlesticks);
    EXPECT_EQ(view->subscription.symbol, "ETHBTC");
    EXPECT_EQ(view->subscription.interval, KlineInterval::Minutes5);
}

TEST_F(CommandInterpreterTest, LiveUnknownEndpointIsUnrecognized) {
    EXPECT_EQ(run("live bananas"), CommandStatus::UnrecognizedCommand);
    EXPECT_FALSE(sessions_.active());
}

TEST_F(CommandInterpreterTest, LiveOffStopsSession) {
    ASSERT_EQ(run("live trades BTCUSDT"), CommandStatus::Ok);
    ASSERT_TRUE(sessions_.active());

    EXPECT_EQ(run("LIVE OFF"), CommandStatus::Ok);
    EXPECT_FALSE(sessions_.active());
    EXPECT_NE(out_.str().find("...live trades feed disabled."), std::string::npos);
}

TEST_F(CommandInterpreterTest, LiveAccountNeedsCredentials) {
    api_.credentials = false;
    EXPECT_EQ(run("live account"), CommandStatus::NotAuthorized);
    EXPECT_FALSE(sessions_.active());

    api_.credentials = true;
    EXPECT_EQ(run("live user"), CommandStatus::Ok);
    const auto view = sessions_.active_view();
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->subscription.kind, StreamKind::UserData);
}

// --- credentials gate ---

TEST_F(CommandInterpreterTest, AccountVerbsRejectedWithoutCredentials) {
    api_.credentials = false;
    for (const char* line : {"market", "market buy BTCUSDT 1", "limit sell BTCUSDT 1 2", "orders",
                             "order BTCUSDT 1", "account", "balances", "positions", "myTrades",
                             "deposits", "withdrawals", "withdraw BTC addr 1"}) {
        EXPECT_EQ(run(line), CommandStatus::NotAuthorized) << line;
    }
    EXPECT_EQ(api_.total_calls(), 0);
}

TEST_F(CommandInterpreterTest, MarketDataNeedsNoCredentials) {
    api_.credentials = false;
    EXPECT_EQ(run("ping"), CommandStatus::Ok);
    EXPECT_EQ(run("prices"), CommandStatus::Ok);
    EXPECT_EQ(run("tops"), CommandStatus::Ok);
    EXPECT_EQ(run("symbols"), CommandStatus::Ok);
}

// --- orders ---

TEST_F(CommandInterpreterTest, MarketOrderValidation) {
    const auto missing = interpreter_.execute("market buy BTCUSDT");
    EXPECT_EQ(missing.status, CommandStatus::ArgumentError);
    EXPECT_EQ(missing.message, "A side, symbol, and quantity are required.");

    const auto side = interpreter_.execute("market hold BTCUSDT 1");
    EXPECT_EQ(side.message, "A valid order side is required ('buy' or 'sell').");

    const auto quantity = interpreter_.execute("market buy BTCUSDT 0");
    EXPECT_EQ(quantity.message, "A quantity greater than 0 is required.");

    const auto stop = interpreter_.execute("market sell BTCUSDT 1 -5");
    EXPECT_EQ(stop.message, "A stop price greater than 0 is required.");

    EXPECT_EQ(api_.count("place_order"), 0);
}

TEST_F(CommandInterpreterTest, MarketOrderIsTestOnlyByDefault) {
    EXPECT_EQ(run("market BUY btcusdt 0.5"), CommandStatus::Ok);

    ASSERT_TRUE(api_.last_intent.has_value());
    EXPECT_EQ(api_.last_intent->kind, OrderKind::Market);
    EXPECT_EQ(api_.last_intent->side, OrderSide::Buy);
    EXPECT_EQ(api_.last_intent->symbol, "BTCUSDT");
    EXPECT_DOUBLE_EQ(api_.last_intent->quantity, 0.5);
    EXPECT_FALSE(api_.last_intent->stop_price.has_value());
    EXPECT_TRUE(api_.last_intent->is_test_only);
    EXPECT_NE(out_.str().find("~ TEST ~ >> MARKET BUY"), std::string::npos);
}

TEST_F(CommandInterpreterTest, LimitOrderValidation) {
    EXPECT_EQ(interpreter_.execute("limit buy BTCUSDT 1").message,
              "A side, symbol, quantity and price are required.");
    EXPECT_EQ(interpreter_.execute("limit buy BTCUSDT 1 abc").message, "A price greater than 0 is required.");
    EXPECT_EQ(interpreter_.execute("limit buy BTCUSDT 1 100 0").message,
              "A stop price greater than 0 is required.");
    EXPECT_EQ(api_.count("place_order"), 0);
}

TEST_F(CommandInterpreterTest, LimitOrderCarriesPriceAndStop) {
    EXPECT_EQ(run("limit sell ethbtc 2 0.07 0.065"), CommandStatus::Ok);

    ASSERT_TRUE(api_.last_intent.has_value());
    EXPECT_EQ(api_.last_intent->kind, OrderKind::Limit);
    EXPECT_EQ(api_.last_intent->side, OrderSide::Sell);
    EXPECT_DOUBLE_EQ(api_.last_intent->price.value_or(0), 0.07);
    EXPECT_DOUBLE_EQ(api_.last_intent->stop_price.value_or(0), 0.065);
}

TEST_F(CommandInterpreterTest, TestToggleControlsOrderMode) {
    EXPECT_TRUE(interpreter_.test_orders());
    EXPECT_EQ(run("test off"), CommandStatus::Ok);
    EXPECT_FALSE(interpreter_.test_orders());
    EXPECT_NE(out_.str().find("!! Market and Limit orders WILL be placed !!"), std::string::npos);

    EXPECT_EQ(run("market buy BTCUSDT 1"), CommandStatus::Ok);
    EXPECT_FALSE(api_.last_intent->is_test_only);

    EXPECT_EQ(run("test"), CommandStatus::Ok);
    EXPECT_TRUE(interpreter_.test_orders());
}

TEST_F(CommandInterpreterTest, OrdersSlotAndOpenFlag) {
    EXPECT_EQ(run("orders 5"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("orders"), 1);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 5);

    EXPECT_EQ(run("orders ethbtc open"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("open_orders"), 1);
    EXPECT_EQ(api_.last_symbol, "ETHBTC");
}

TEST_F(CommandInterpreterTest, OrderLookupAndCancel) {
    EXPECT_EQ(interpreter_.execute("order BTCUSDT").message, "A symbol and order ID are required.");
    EXPECT_EQ(interpreter_.execute("order BTCUSDT -1").message, "An order ID not less than 0 is required.");
    EXPECT_EQ(api_.total_calls(), 0);

    EXPECT_EQ(run("order btcusdt 123"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("order"), 1);
    EXPECT_EQ(api_.last_order_id, 123u);
    EXPECT_NE(out_.str().find("[Not Found]"), std::string::npos);

    EXPECT_EQ(run("order btcusdt myOrder-7 CANCEL"), CommandStatus::Ok);
    EXPECT_EQ(api_.count("cancel_order"), 1);
    EXPECT_EQ(api_.last_client_order_id, "myOrder-7");
    EXPECT_NE(out_.str().find("Cancel Order ID: cancel-2"), std::string::npos);
}

TEST_F(CommandInterpreterTest, MyTradesUsesTwoPhaseSlot) {
    EXPECT_EQ(run("myTrades 3"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "BTCUSDT");
    EXPECT_EQ(api_.last_limit, 3);

    EXPECT_EQ(run("mytrades ethbtc"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_symbol, "ETHBTC");
    EXPECT_EQ(api_.last_limit, 10);
}

TEST_F(CommandInterpreterTest, DepositsAndWithdrawalsTakeOptionalAsset) {
    EXPECT_EQ(run("deposits"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_asset, "");
    EXPECT_EQ(run("withdrawals eth"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_asset, "ETH");
}

TEST_F(CommandInterpreterTest, WithdrawValidation) {
    EXPECT_EQ(interpreter_.execute("withdraw BTC addr").message, "An asset, address, and amount are required.");
    EXPECT_EQ(interpreter_.execute("withdraw BTC addr 0").message, "An amount greater than 0 is required.");
    EXPECT_EQ(api_.count("withdraw"), 0);

    EXPECT_EQ(run("withdraw btc 1BoatSLRHtKNngkdXEeobR76b53LETtpyT 0.25"), CommandStatus::Ok);
    EXPECT_EQ(api_.last_asset, "BTC");
    EXPECT_EQ(api_.last_address, "1BoatSLRHtKNngkdXEeobR76b53LETtpyT");
    EXPECT_DOUBLE_EQ(api_.last_amount, 0.25);
}
