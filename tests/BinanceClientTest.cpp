#include <gtest/gtest.h>

#include <stdexcept>

#include "Clients/BinanceClient.hpp"
#include "Clients/BinanceWSClient.hpp"
#include "Core/Errors.hpp"

TEST(BinanceClientTest, SignsWithHmacSha256) {
    // Example request from the Binance API documentation.
    const std::string secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
    const std::string payload =
        "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1"
        "&recvWindow=5000&timestamp=1499827319559";

    EXPECT_EQ(BinanceClient::sign(payload, secret),
              "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
}

TEST(BinanceClientTest, EncodesQueryValues) {
    EXPECT_EQ(BinanceClient::encode_query({}), "");
    EXPECT_EQ(BinanceClient::encode_query({{"symbol", "BTCUSDT"}, {"limit", "5"}}), "symbol=BTCUSDT&limit=5");
    EXPECT_EQ(BinanceClient::encode_query({{"address", "a b/c"}, {"tag", "x~y_z.-"}}),
              "address=a%20b%2Fc&tag=x~y_z.-");
}

TEST(BinanceClientTest, FormatsDecimalsWithoutExponent) {
    EXPECT_EQ(BinanceClient::format_decimal(0.001), "0.001");
    EXPECT_EQ(BinanceClient::format_decimal(25000.0), "25000");
    EXPECT_EQ(BinanceClient::format_decimal(0.00000001), "0.00000001");
    EXPECT_EQ(BinanceClient::format_decimal(1.5), "1.5");
}

TEST(BinanceClientTest, CredentialsGate) {
    BinanceClient anonymous(ApiSettings{}, Credentials{});
    EXPECT_FALSE(anonymous.has_credentials());

    BinanceClient keyed(ApiSettings{}, Credentials{"key", "secret"});
    EXPECT_TRUE(keyed.has_credentials());
}

TEST(BinanceClientTest, SignedCallWithoutKeyFailsLocally) {
    BinanceClient anonymous(ApiSettings{}, Credentials{});
    EXPECT_THROW(anonymous.account(), RemoteError);
    EXPECT_THROW(anonymous.open_user_stream(), RemoteError);
}

TEST(BinanceWSClientTest, StreamPaths) {
    EXPECT_EQ(BinanceWSClient::stream_path({StreamKind::OrderBook, "BTCUSDT", std::nullopt}),
              "/ws/btcusdt@depth@100ms");
    EXPECT_EQ(BinanceWSClient::stream_path({StreamKind::Candlesticks, "ETHBTC", KlineInterval::Minutes15}),
              "/ws/ethbtc@kline_15m");
    EXPECT_EQ(BinanceWSClient::stream_path({StreamKind::Candlesticks, "ETHBTC", std::nullopt}),
              "/ws/ethbtc@kline_1h");
    EXPECT_EQ(BinanceWSClient::stream_path({StreamKind::Trades, "BNBBTC", std::nullopt}),
              "/ws/bnbbtc@aggTrade");
    EXPECT_EQ(BinanceWSClient::stream_path({StreamKind::UserData, "", std::nullopt}, "pqia91ma19a5s61cv6a81va65sdf19v8a65a1a5s61cv6a81va65sdf19v8a65a1"),
              "/ws/pqia91ma19a5s61cv6a81va65sdf19v8a65a1a5s61cv6a81va65sdf19v8a65a1");
    EXPECT_THROW(BinanceWSClient::stream_path({StreamKind::UserData, "", std::nullopt}), std::invalid_argument);
}
