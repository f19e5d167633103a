#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "Core/StreamKind.hpp"

// A read against one of the market-data families. Requests that pin a time
// range or a starting trade id ask for history, which a live cache never
// holds, so only plain "latest N" requests may be served from it.
struct QueryRequest {
    StreamKind kind = StreamKind::OrderBook;
    std::string symbol;
    int limit = 10;
    std::optional<KlineInterval> interval;  // candlesticks
    std::optional<std::uint64_t> start_time;
    std::optional<std::uint64_t> end_time;
    std::optional<std::uint64_t> from_id;   // trades

    [[nodiscard]] bool cache_eligible() const noexcept {
        return kind != StreamKind::UserData && !start_time && !end_time && !from_id;
    }
};
