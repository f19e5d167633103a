#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "Clients/IBinanceApi.hpp"
#include "Core/LiveSnapshot.hpp"
#include "Session/LiveSessionManager.hpp"
#include "Session/QueryRequest.hpp"

// Answers market-data reads from the live session's cache when it streams
// exactly what is asked for, and from a one-shot REST call otherwise.
// Remote failures propagate as RemoteError; nothing is retried here.
class QueryResolver {
public:
    QueryResolver(const LiveSessionManager& sessions, IBinanceApi& api);

    // OrderBook -> OrderBookSnapshot, Trades -> TradeSeries (chronological),
    // Candlesticks -> CandlestickSeries (chronological).
    // Throws std::invalid_argument for UserData, which has no read family.
    LiveSnapshot resolve(const QueryRequest& request);

    OrderBookSnapshot order_book(const std::string& symbol, int limit);

    // Newest trade first.
    std::vector<AggregateTrade> trades(const std::string& symbol, int limit);
    std::vector<AggregateTrade> trades_in(const std::string& symbol, std::uint64_t start_time, std::uint64_t end_time);
    std::vector<AggregateTrade> trades_from(const std::string& symbol, std::uint64_t from_id, int limit);

    std::vector<Candlestick> candlesticks(const std::string& symbol, KlineInterval interval, int limit);
    std::vector<Candlestick> candlesticks_in(const std::string& symbol, KlineInterval interval,
                                             std::uint64_t start_time, std::uint64_t end_time);

    OrderBookTop top_of_book(const std::string& symbol);

private:
    LiveSnapshot from_cache(const QueryRequest& request, const LiveSnapshot& cached) const;
    LiveSnapshot fetch(const QueryRequest& request);

    const LiveSessionManager& sessions_;
    IBinanceApi& api_;
};
