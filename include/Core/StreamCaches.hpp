#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "Core/MarketTypes.hpp"

// Rolling windows the stream client keeps next to the OrderBook.
// Both are seeded from a REST history and then fed by stream events.
// They are owned by one stream worker and carry no locking.

inline constexpr std::size_t kSeriesCapacity = 500;

class CandlestickCache {
public:
    CandlestickCache(std::string symbol, KlineInterval interval, std::size_t capacity = kSeriesCapacity);

    // Replaces the window; `candles` must be chronological.
    void seed(const std::vector<Candlestick>& candles);

    // An event for the open candle replaces it; a newer open time appends.
    // Returns false when the candle is older than the window and was ignored.
    bool apply(const Candlestick& candle);

    [[nodiscard]] CandlestickSeries snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept { return candles_.size(); }

private:
    void trim();

    std::string symbol_;
    KlineInterval interval_;
    std::size_t capacity_;
    std::deque<Candlestick> candles_;
};

class TradeCache {
public:
    explicit TradeCache(std::string symbol, std::size_t capacity = kSeriesCapacity);

    void seed(const std::vector<AggregateTrade>& trades);

    // Trades at or below the newest id already held are duplicates and ignored.
    bool apply(const AggregateTrade& trade);

    [[nodiscard]] TradeSeries snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept { return trades_.size(); }

private:
    void trim();

    std::string symbol_;
    std::size_t capacity_;
    std::deque<AggregateTrade> trades_;
};
