#pragma once
#include <variant>

#include "Core/MarketTypes.hpp"

// Latest state published by a live stream. The alternative held always
// corresponds to the session's StreamKind:
//   OrderBook    -> OrderBookSnapshot
//   Candlesticks -> CandlestickSeries
//   Trades       -> TradeSeries
//   UserData     -> UserDataEvent
using LiveSnapshot = std::variant<OrderBookSnapshot, CandlestickSeries, TradeSeries, UserDataEvent>;

[[nodiscard]] inline StreamKind kind_of(const LiveSnapshot& snapshot) noexcept {
    switch (snapshot.index()) {
        case 0:  return StreamKind::OrderBook;
        case 1:  return StreamKind::Candlesticks;
        case 2:  return StreamKind::Trades;
        default: return StreamKind::UserData;
    }
}
