#include "Session/QueryResolver.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

// Last `limit` elements, order preserved.
template <typename T>
std::vector<T> tail(const std::vector<T>& items, int limit) {
    const auto n = std::min(items.size(), static_cast<std::size_t>(std::max(limit, 0)));
    return std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(n), items.end());
}

} // namespace

QueryResolver::QueryResolver(const LiveSessionManager& sessions, IBinanceApi& api)
    : sessions_(sessions), api_(api) {}

LiveSnapshot QueryResolver::resolve(const QueryRequest& request) {
    if (request.kind == StreamKind::UserData) {
        throw std::invalid_argument("account events cannot be queried");
    }

    if (request.cache_eligible()) {
        const auto interval = request.kind == StreamKind::Candlesticks
            ? std::optional<KlineInterval>(request.interval.value_or(kDefaultInterval))
            : std::nullopt;
        if (auto cached = sessions_.snapshot_for(request.kind, request.symbol, interval)) {
            return from_cache(request, *cached);
        }
    }
    return fetch(request);
}

LiveSnapshot QueryResolver::from_cache(const QueryRequest& request, const LiveSnapshot& cached) const {
    switch (request.kind) {
        case StreamKind::OrderBook:
            return std::get<OrderBookSnapshot>(cached).truncated(static_cast<std::size_t>(std::max(request.limit, 0)));
        case StreamKind::Trades: {
            const auto& series = std::get<TradeSeries>(cached);
            return TradeSeries{series.symbol, tail(series.trades, request.limit)};
        }
        case StreamKind::Candlesticks: {
            const auto& series = std::get<CandlestickSeries>(cached);
            return CandlestickSeries{series.symbol, series.interval, tail(series.candles, request.limit)};
        }
        case StreamKind::UserData:
            break;
    }
    throw std::invalid_argument("account events cannot be queried");
}

LiveSnapshot QueryResolver::fetch(const QueryRequest& request) {
    const std::uint64_t start = request.start_time.value_or(0);
    const std::uint64_t end = request.end_time.value_or(0);

    switch (request.kind) {
        case StreamKind::OrderBook:
            return api_.order_book(request.symbol, request.limit);
        case StreamKind::Trades:
            return TradeSeries{request.symbol,
                               api_.aggregate_trades(request.symbol, request.limit,
                                                     request.from_id.value_or(0), start, end)};
        case StreamKind::Candlesticks: {
            const auto interval = request.interval.value_or(kDefaultInterval);
            return CandlestickSeries{request.symbol, interval,
                                     api_.candlesticks(request.symbol, interval, request.limit, start, end)};
        }
        case StreamKind::UserData:
            break;
    }
    throw std::invalid_argument("account events cannot be queried");
}

OrderBookSnapshot QueryResolver::order_book(const std::string& symbol, int limit) {
    QueryRequest request;
    request.kind = StreamKind::OrderBook;
    request.symbol = symbol;
    request.limit = limit;
    return std::get<OrderBookSnapshot>(resolve(request));
}

std::vector<AggregateTrade> QueryResolver::trades(const std::string& symbol, int limit) {
    QueryRequest request;
    request.kind = StreamKind::Trades;
    request.symbol = symbol;
    request.limit = limit;
    auto trades = std::get<TradeSeries>(resolve(request)).trades;
    std::reverse(trades.begin(), trades.end());
    return trades;
}

std::vector<AggregateTrade> QueryResolver::trades_in(const std::string& symbol,
                                                     std::uint64_t start_time, std::uint64_t end_time) {
    QueryRequest request;
    request.kind = StreamKind::Trades;
    request.symbol = symbol;
    request.limit = 0; // the venue bounds a ranged query by time, not count
    request.start_time = start_time;
    request.end_time = end_time;
    return std::get<TradeSeries>(resolve(request)).trades;
}

std::vector<AggregateTrade> QueryResolver::trades_from(const std::string& symbol, std::uint64_t from_id, int limit) {
    QueryRequest request;
    request.kind = StreamKind::Trades;
    request.symbol = symbol;
    request.limit = limit;
    request.from_id = from_id;
    return std::get<TradeSeries>(resolve(request)).trades;
}

std::vector<Candlestick> QueryResolver::candlesticks(const std::string& symbol, KlineInterval interval, int limit) {
    QueryRequest request;
    request.kind = StreamKind::Candlesticks;
    request.symbol = symbol;
    request.interval = interval;
    request.limit = limit;
    return std::get<CandlestickSeries>(resolve(request)).candles;
}

std::vector<Candlestick> QueryResolver::candlesticks_in(const std::string& symbol, KlineInterval interval,
                                                        std::uint64_t start_time, std::uint64_t end_time) {
    QueryRequest request;
    request.kind = StreamKind::Candlesticks;
    request.symbol = symbol;
    request.interval = interval;
    request.limit = 0;
    request.start_time = start_time;
    request.end_time = end_time;
    return std::get<CandlestickSeries>(resolve(request)).candles;
}

OrderBookTop QueryResolver::top_of_book(const std::string& symbol) {
    if (auto cached = sessions_.snapshot_for(StreamKind::OrderBook, symbol)) {
        if (auto top = std::get<OrderBookSnapshot>(*cached).top()) {
            return *top;
        }
    }
    return api_.order_book_top(symbol);
}
