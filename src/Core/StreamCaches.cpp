#include "Core/StreamCaches.hpp"

#include <algorithm>
#include <utility>

CandlestickCache::CandlestickCache(std::string symbol, KlineInterval interval, std::size_t capacity)
    : symbol_(std::move(symbol)), interval_(interval), capacity_(capacity) {}

void CandlestickCache::seed(const std::vector<Candlestick>& candles) {
    candles_.assign(candles.begin(), candles.end());
    trim();
}

bool CandlestickCache::apply(const Candlestick& candle) {
    if (candles_.empty() || candle.open_time > candles_.back().open_time) {
        candles_.push_back(candle);
        trim();
        return true;
    }

    auto it = std::find_if(candles_.rbegin(), candles_.rend(),
                           [&](const Candlestick& c) { return c.open_time == candle.open_time; });
    if (it == candles_.rend()) {
        return false;
    }
    *it = candle;
    return true;
}

CandlestickSeries CandlestickCache::snapshot() const {
    return CandlestickSeries{symbol_, interval_, std::vector<Candlestick>(candles_.begin(), candles_.end())};
}

void CandlestickCache::trim() {
    while (candles_.size() > capacity_) candles_.pop_front();
}

TradeCache::TradeCache(std::string symbol, std::size_t capacity)
    : symbol_(std::move(symbol)), capacity_(capacity) {}

void TradeCache::seed(const std::vector<AggregateTrade>& trades) {
    trades_.assign(trades.begin(), trades.end());
    trim();
}

bool TradeCache::apply(const AggregateTrade& trade) {
    if (!trades_.empty() && trade.id <= trades_.back().id) {
        return false;
    }
    trades_.push_back(trade);
    trim();
    return true;
}

TradeSeries TradeCache::snapshot() const {
    return TradeSeries{symbol_, std::vector<AggregateTrade>(trades_.begin(), trades_.end())};
}

void TradeCache::trim() {
    while (trades_.size() > capacity_) trades_.pop_front();
}
