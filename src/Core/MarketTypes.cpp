#include "Core/MarketTypes.hpp"

#include <algorithm>

OrderBookSnapshot OrderBookSnapshot::truncated(std::size_t depth) const {
    OrderBookSnapshot copy;
    copy.symbol = symbol;
    copy.last_update_id = last_update_id;
    copy.bids.assign(bids.begin(), bids.begin() + std::min(depth, bids.size()));
    copy.asks.assign(asks.begin(), asks.begin() + std::min(depth, asks.size()));
    return copy;
}

std::optional<OrderBookTop> OrderBookSnapshot::top() const {
    if (bids.empty() || asks.empty()) return std::nullopt;
    return OrderBookTop{symbol, bids.front(), asks.front()};
}

std::string_view to_string(OrderSide side) noexcept {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}
