#pragma once
#include <optional>
#include <string>
#include <string_view>

// The four push-data families the console can attach to.
// Only one of them may be live at a time.
enum class StreamKind { OrderBook, Candlesticks, Trades, UserData };

// Binance candlestick intervals.
enum class KlineInterval {
    Minute, Minutes3, Minutes5, Minutes15, Minutes30,
    Hour, Hours2, Hours4, Hours6, Hours8, Hours12,
    Day, Days3, Week, Month
};

inline constexpr KlineInterval kDefaultInterval = KlineInterval::Hour;

[[nodiscard]] std::string_view to_string(StreamKind kind) noexcept;

// Wire form used by the REST and stream endpoints ("1m", "1h", "1M", ...).
[[nodiscard]] std::string_view to_string(KlineInterval interval) noexcept;

// "1m" is a minute and "1M" a month; everything else is matched
// case-insensitively. Returns nullopt for unknown text.
[[nodiscard]] std::optional<KlineInterval> parse_interval(std::string_view text);

// Maps the "live <endpoint>" aliases (depth|book, kline|candle, trades, account|user).
[[nodiscard]] std::optional<StreamKind> parse_stream_kind(std::string_view text);
