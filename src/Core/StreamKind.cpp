#include "Core/StreamKind.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<KlineInterval, std::string_view>, 15> kIntervals{{
    {KlineInterval::Minute, "1m"},    {KlineInterval::Minutes3, "3m"},
    {KlineInterval::Minutes5, "5m"},  {KlineInterval::Minutes15, "15m"},
    {KlineInterval::Minutes30, "30m"}, {KlineInterval::Hour, "1h"},
    {KlineInterval::Hours2, "2h"},    {KlineInterval::Hours4, "4h"},
    {KlineInterval::Hours6, "6h"},    {KlineInterval::Hours8, "8h"},
    {KlineInterval::Hours12, "12h"},  {KlineInterval::Day, "1d"},
    {KlineInterval::Days3, "3d"},     {KlineInterval::Week, "1w"},
    {KlineInterval::Month, "1M"},
}};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string_view to_string(StreamKind kind) noexcept {
    switch (kind) {
        case StreamKind::OrderBook:    return "order book";
        case StreamKind::Candlesticks: return "kline";
        case StreamKind::Trades:       return "trades";
        case StreamKind::UserData:     return "account";
    }
    return "unknown";
}

std::string_view to_string(KlineInterval interval) noexcept {
    for (const auto& [value, text] : kIntervals) {
        if (value == interval) return text;
    }
    return "1h";
}

std::optional<KlineInterval> parse_interval(std::string_view text) {
    // Exact match first so that "1M" (month) never collapses into "1m" (minute).
    for (const auto& [value, wire] : kIntervals) {
        if (wire == text) return value;
    }
    for (const auto& [value, wire] : kIntervals) {
        if (value == KlineInterval::Month || value == KlineInterval::Minute) continue;
        if (iequals(wire, text)) return value;
    }
    return std::nullopt;
}

std::optional<StreamKind> parse_stream_kind(std::string_view text) {
    if (iequals(text, "depth") || iequals(text, "book"))    return StreamKind::OrderBook;
    if (iequals(text, "kline") || iequals(text, "candle"))  return StreamKind::Candlesticks;
    if (iequals(text, "trades"))                            return StreamKind::Trades;
    if (iequals(text, "account") || iequals(text, "user"))  return StreamKind::UserData;
    return std::nullopt;
}
