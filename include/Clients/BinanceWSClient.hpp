#ifndef BINANCEWSCLIENT_HPP
#define BINANCEWSCLIENT_HPP

#include <chrono>
#include <string>

#include "Clients/IBinanceApi.hpp"
#include "Clients/IStreamClient.hpp"
#include "Utils/Config.hpp"

// Binance WebSocket streams over Boost.Beast and TLS.
//
// Each run() opens one connection on a private io_context, seeds the local
// cache for the subscription over REST, and then applies stream events to
// it, handing a fresh snapshot to the caller after every change:
//   OrderBook    <sym>@depth@100ms, OrderBook seeded with depth 1000 and
//                re-seeded whenever an update-id gap shows up
//   Candlesticks <sym>@kline_<interval>, last 500 candles
//   Trades       <sym>@aggTrade, last 500 aggregate trades
//   UserData     /ws/<listenKey>, key kept alive every 30 minutes
class BinanceWSClient final : public IStreamClient {
public:
    struct Options {
        std::chrono::milliseconds poll_slice{100};            // how often stop is checked
        std::chrono::minutes keepalive_interval{30};          // listen key refresh
        std::size_t book_depth = 1000;                        // REST seed depth
        std::size_t snapshot_depth = 100;                     // levels per published book
    };

    BinanceWSClient(IBinanceApi& rest, ApiSettings settings);
    BinanceWSClient(IBinanceApi& rest, ApiSettings settings, Options opts);
    ~BinanceWSClient() override;

    void run(const StreamSubscription& subscription,
             const SnapshotHandler& on_snapshot,
             std::stop_token stop) override;

    // "/ws/btcusdt@depth@100ms", "/ws/btcusdt@kline_1h", "/ws/<listenKey>", ...
    static std::string stream_path(const StreamSubscription& subscription, const std::string& listen_key = {});

private:
    // PIMPL (Pointer to IMPLementation): one connection, created per run().
    class Impl;

    IBinanceApi& rest_;
    ApiSettings settings_;
    Options opts_;
};

#endif // BINANCEWSCLIENT_HPP
