#include "Console/ConsoleOutput.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>

#include "Core/StreamKind.hpp"

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

// Shortest round-trip text, as the venue quotes it.
std::string plain(double value) {
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    return ss.str();
}

std::string pad_left(const std::string& text, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << text;
    return ss.str();
}

} // namespace

ConsoleOutput::ConsoleOutput(std::ostream& out, std::string default_symbol, int default_limit)
    : out_(out), default_symbol_(std::move(default_symbol)), default_limit_(default_limit) {}

std::string ConsoleOutput::format_time(std::uint64_t ms, bool local) {
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    if (local) {
        localtime_r(&seconds, &tm);
    } else {
        gmtime_r(&seconds, &tm);
    }
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// --- IOutputSink ---

void ConsoleOutput::live_update(const LiveSnapshot& snapshot) {
    std::lock_guard lock(mtx_);
    std::visit([this](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, OrderBookSnapshot>) {
            const auto top = value.top();
            if (!top) return;
            out_ << "  " << top->symbol
                 << "  -  Bid: " << fixed(top->bid.price, 8)
                 << "  |  " << fixed(top->mid_price(), 8)
                 << "  |  Ask: " << fixed(top->ask.price, 8)
                 << "  -  Spread: " << fixed(top->spread(), 8) << "\n";
        } else if constexpr (std::is_same_v<T, CandlestickSeries>) {
            if (value.candles.empty()) return;
            const auto& latest = value.candles.back();
            out_ << " Candlestick [" << format_time(latest.open_time) << "] - Is Final: "
                 << (latest.is_final ? "YES" : "NO") << "\n";
            write_candle(latest);
        } else if constexpr (std::is_same_v<T, TradeSeries>) {
            if (value.trades.empty()) return;
            write_trade(value.trades.back());
        } else {
            std::visit([this](const auto& event) {
                using E = std::decay_t<decltype(event)>;
                if constexpr (std::is_same_v<E, AccountUpdate>) {
                    out_ << "\n  Account update [" << format_time(event.event_time) << "]:\n";
                    write_balances(event.balances);
                } else {
                    out_ << "\nOrder [" << event.order.id << "] update: " << event.execution_type << "\n";
                    write_order(event.order);
                    if (event.trade) {
                        out_ << "\n";
                        write_account_trade(*event.trade);
                    }
                    out_ << "\n";
                }
            }, value);
        }
    }, snapshot);
    out_.flush();
}

void ConsoleOutput::stream_fault(const StreamSubscription& subscription, const std::string& reason) {
    std::lock_guard lock(mtx_);
    out_ << "\n! Live " << to_string(subscription.kind) << " feed stopped: " << reason << "\n";
    out_ << "  ...live feed disabled." << std::endl;
}

// --- boundary ---

void ConsoleOutput::help() {
    std::lock_guard lock(mtx_);
    write_help();
}

void ConsoleOutput::api_notice() {
    std::lock_guard lock(mtx_);
    write_api_notice();
}

void ConsoleOutput::report(const CommandResult& result, const std::string& line) {
    std::lock_guard lock(mtx_);
    switch (result.status) {
        case CommandStatus::Ok:
        case CommandStatus::Quit:
            return;
        case CommandStatus::Empty:
            write_help();
            return;
        case CommandStatus::UnrecognizedCommand:
            out_ << "! Unrecognized Command: \"" << line << "\"\n";
            write_help();
            return;
        case CommandStatus::ArgumentError:
            out_ << result.message << std::endl;
            return;
        case CommandStatus::NotAuthorized:
            write_api_notice();
            return;
        case CommandStatus::SessionError:
            out_ << "! " << result.message << std::endl;
            return;
        case CommandStatus::RemoteError:
            out_ << "\n! Exception: " << result.message << std::endl;
            return;
    }
}

void ConsoleOutput::write_help() {
    out_ << "\n"
         << "Usage: <command> <args>\n"
         << "\n"
         << "Commands:\n"
         << "\n"
         << " Connectivity:\n"
         << "  ping                                                 test connection to server.\n"
         << "  time                                                 display the current server time (UTC).\n"
         << "\n"
         << " Market Data:\n"
         << "  stats <symbol>                                       display 24h stats for symbol.\n"
         << "  depth|book <symbol> [limit]                          display symbol order book, where limit: [1-100].\n"
         << "  trades <symbol> [limit]                              display latest trades, where limit: [1-500].\n"
         << "  tradesIn <symbol> <start> <end>                      display trades within a time range (inclusive).\n"
         << "  tradesFrom <symbol> <tradeId> [limit]                display trades beginning with trade ID.\n"
         << "  candles|klines <symbol> <interval> [limit]           display candlestick bars for a symbol.\n"
         << "  candlesIn|klinesIn <symbol> <interval> <start> <end> display candlestick bars for a symbol in time range.\n"
         << "  symbols                                              display all symbols.\n"
         << "  prices                                               display current price for all symbols.\n"
         << "  tops                                                 display order book top price and quantity for all symbols.\n"
         << "  top <symbol>                                         display order book top price and quantity for a symbol.\n"
         << "  live depth|book <symbol>                             enable order book live feed for a symbol.\n"
         << "  live kline|candle <symbol> <interval>                enable kline live feed for a symbol and interval.\n"
         << "  live trades <symbol>                                 enable trades live feed for a symbol.\n"
         << "  live account|user                                    enable user data live feed (api key required).\n"
         << "  live off                                             disable the websocket live feed (there can be only one).\n"
         << "\n"
         << " Account (authentication required):\n"
         << "  market <side> <symbol> <qty> [stop]                  create a market order.\n"
         << "  limit <side> <symbol> <qty> <price> [stop]           create a limit order.\n"
         << "  orders <symbol> [limit]                              display orders for a symbol, where limit: [1-500].\n"
         << "  orders <symbol> open                                 display all open orders for a symbol.\n"
         << "  order <symbol> <ID>                                  display an order by ID.\n"
         << "  order <symbol> <ID> cancel                           cancel an order by ID.\n"
         << "  account|balances|positions                           display user account information (including balances).\n"
         << "  myTrades <symbol> [limit]                            display user trades of a symbol.\n"
         << "  deposits [asset]                                     display user deposits of an asset or all deposits.\n"
         << "  withdrawals [asset]                                  display user withdrawals of an asset or all withdrawals.\n"
         << "  withdraw <asset> <address> <amount>                  submit a withdraw request (NOTE: 'test only' does NOT apply).\n"
         << "  test <on|off>                                        determines if orders are test only (default: on).\n"
         << "\n"
         << "  help                                                 display this text.\n"
         << "  quit | exit                                          terminate the application.\n"
         << "\n"
         << " * default symbol: " << default_symbol_ << "\n"
         << " * default limit: " << default_limit_ << "\n"
         << "\n";
    out_.flush();
}

void ConsoleOutput::write_api_notice() {
    out_ << "* NOTICE: To access some Binance endpoint features, your API Key and Secret may be required.\n"
         << "\n"
         << "  You can either modify the 'ApiKey' and 'ApiSecret' values of the 'User' section in appsettings.json.\n"
         << "\n"
         << "  Or set the following environment variables before starting the console:\n"
         << "\n"
         << "    export BINANCE_API_KEY=<your api key>\n"
         << "    export BINANCE_API_SECRET=<your api secret>\n"
         << "\n";
    out_.flush();
}

// --- connectivity / market data ---

void ConsoleOutput::ping(bool ok) {
    std::lock_guard lock(mtx_);
    out_ << "  Ping: " << (ok ? "SUCCESSFUL" : "FAILED") << "\n" << std::endl;
}

void ConsoleOutput::server_time(std::uint64_t ms) {
    std::lock_guard lock(mtx_);
    out_ << "  UTC Time: " << format_time(ms, false) << "  [Local: " << format_time(ms) << "]\n" << std::endl;
}

void ConsoleOutput::stats(const SymbolStats& stats) {
    std::lock_guard lock(mtx_);
    out_ << "\n"
         << "  24-hour statistics for " << stats.symbol << ":\n"
         << "    %: " << fixed(stats.price_change_percent, 2)
         << " | O: " << fixed(stats.open, 8)
         << " | H: " << fixed(stats.high, 8)
         << " | L: " << fixed(stats.low, 8)
         << " | V: " << fixed(stats.volume, 0) << "\n"
         << "    Bid: " << fixed(stats.bid, 8)
         << " | Last: " << fixed(stats.last, 8)
         << " | Ask: " << fixed(stats.ask, 8)
         << " | Avg: " << fixed(stats.weighted_average, 8) << "\n"
         << std::endl;
}

void ConsoleOutput::order_book(const OrderBookSnapshot& book) {
    std::lock_guard lock(mtx_);
    out_ << "\n  " << book.symbol << " order book [update " << book.last_update_id << "]:\n\n";

    // Asks from the deepest shown level down to the best one, then the bids.
    for (auto it = book.asks.rbegin(); it != book.asks.rend(); ++it) {
        out_ << "    Ask: " << pad_left(fixed(it->price, 8), 18) << " | " << fixed(it->quantity, 8) << "\n";
    }
    if (auto top = book.top()) {
        out_ << "    " << std::string(22, '-') << "  mid: " << fixed(top->mid_price(), 8)
             << "  spread: " << fixed(top->spread(), 8) << "\n";
    } else {
        out_ << "    " << std::string(22, '-') << "\n";
    }
    for (const auto& level : book.bids) {
        out_ << "    Bid: " << pad_left(fixed(level.price, 8), 18) << " | " << fixed(level.quantity, 8) << "\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::trades(const std::vector<AggregateTrade>& trades) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    for (const auto& trade : trades) {
        write_trade(trade);
    }
    out_ << std::endl;
}

void ConsoleOutput::candlesticks(const std::vector<Candlestick>& candles) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    for (const auto& candle : candles) {
        write_candle(candle);
    }
    out_ << std::endl;
}

void ConsoleOutput::symbols(const std::vector<std::string>& symbols) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        if (i > 0) out_ << ", ";
        out_ << symbols[i];
    }
    out_ << "\n" << std::endl;
}

void ConsoleOutput::prices(const std::vector<SymbolPrice>& prices) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    for (const auto& price : prices) {
        out_ << "  " << pad_left(price.symbol, 8) << ": " << plain(price.price) << "\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::tops(const std::vector<OrderBookTop>& tops) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    for (const auto& top : tops) {
        out_ << "  " << pad_left(top.symbol, 8)
             << "  -  Bid: " << pad_left(plain(top.bid.price), 12) << " (qty: " << plain(top.bid.quantity) << ")"
             << "  |  Ask: " << plain(top.ask.price) << " (qty: " << plain(top.ask.quantity) << ")\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::top(const OrderBookTop& top) {
    std::lock_guard lock(mtx_);
    out_ << "\n"
         << "  " << top.symbol
         << "  -  Bid: " << fixed(top.bid.price, 8) << " (qty: " << plain(top.bid.quantity) << ")"
         << "  |  Ask: " << fixed(top.ask.price, 8) << " (qty: " << plain(top.ask.quantity) << ")"
         << "  -  Spread: " << fixed(top.spread(), 8) << "\n"
         << std::endl;
}

// --- live ---

void ConsoleOutput::live_enabled(const StreamSubscription& subscription) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    switch (subscription.kind) {
        case StreamKind::OrderBook:
            out_ << "  ...live order book enabled for symbol: " << subscription.symbol;
            break;
        case StreamKind::Candlesticks:
            out_ << "  ...live kline feed enabled for symbol: " << subscription.symbol
                 << ", interval: " << to_string(subscription.interval.value_or(kDefaultInterval));
            break;
        case StreamKind::Trades:
            out_ << "  ...live trades feed enabled for symbol: " << subscription.symbol;
            break;
        case StreamKind::UserData:
            out_ << "  ...live account feed enabled";
            break;
    }
    out_ << " ...use 'live off' to disable." << std::endl;
}

void ConsoleOutput::live_disabled(StreamKind kind) {
    std::lock_guard lock(mtx_);
    out_ << "\n  ...live " << to_string(kind) << " feed disabled." << std::endl;
}

// --- account ---

void ConsoleOutput::order_placed(const Order& order, OrderKind kind, bool test_only) {
    std::lock_guard lock(mtx_);
    out_ << (test_only ? "~ TEST ~ " : "")
         << ">> " << (kind == OrderKind::Market ? "MARKET" : "LIMIT") << " " << order.side
         << " order (ID: " << order.id << ") placed for " << fixed(order.original_quantity, 8)
         << " " << order.symbol << " @ " << fixed(order.price, 8) << "." << std::endl;
}

void ConsoleOutput::orders(const std::vector<Order>& orders) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    if (orders.empty()) {
        out_ << "[None]\n";
    }
    for (const auto& order : orders) {
        write_order(order);
    }
    out_ << std::endl;
}

void ConsoleOutput::order(const std::optional<Order>& order) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    if (order) {
        write_order(*order);
    } else {
        out_ << "[Not Found]\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::order_cancelled(const std::string& cancel_id) {
    std::lock_guard lock(mtx_);
    out_ << "\nCancel Order ID: " << cancel_id << "\n" << std::endl;
}

void ConsoleOutput::account(const AccountInfo& account) {
    std::lock_guard lock(mtx_);
    const auto yes_no = [](bool value) { return pad_left(value ? "Yes" : "No", 3); };
    out_ << "    Maker Commission:  " << std::setw(3) << account.maker_commission << " %\n"
         << "    Taker Commission:  " << std::setw(3) << account.taker_commission << " %\n"
         << "    Buyer Commission:  " << std::setw(3) << account.buyer_commission << " %\n"
         << "    Seller Commission: " << std::setw(3) << account.seller_commission << " %\n"
         << "    Can Trade:    " << yes_no(account.can_trade) << "\n"
         << "    Can Withdraw: " << yes_no(account.can_withdraw) << "\n"
         << "    Can Deposit:  " << yes_no(account.can_deposit) << "\n"
         << "\n"
         << "    Balances (only amounts > 0):\n"
         << "\n";
    write_balances(account.balances);
    out_ << std::endl;
}

void ConsoleOutput::account_trades(const std::vector<AccountTrade>& trades) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    if (trades.empty()) {
        out_ << "[None]\n";
    }
    for (const auto& trade : trades) {
        write_account_trade(trade);
    }
    out_ << std::endl;
}

void ConsoleOutput::deposits(const std::vector<Deposit>& deposits) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    if (deposits.empty()) {
        out_ << "[None]\n";
    }
    for (const auto& deposit : deposits) {
        out_ << "  " << format_time(deposit.insert_time) << " - " << pad_left(deposit.asset, 4)
             << " - " << fixed(deposit.amount, 8) << " - Status: " << deposit.status << "\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::withdrawals(const std::vector<Withdrawal>& withdrawals) {
    std::lock_guard lock(mtx_);
    out_ << "\n";
    if (withdrawals.empty()) {
        out_ << "[None]\n";
    }
    for (const auto& withdrawal : withdrawals) {
        out_ << "  " << withdrawal.apply_time << " - " << pad_left(withdrawal.asset, 4)
             << " - " << fixed(withdrawal.amount, 8) << " => " << withdrawal.address
             << " - Status: " << withdrawal.status << "\n";
    }
    out_ << std::endl;
}

void ConsoleOutput::withdraw_submitted(const std::string& asset, const std::string& address, double amount,
                                       const std::string& id) {
    std::lock_guard lock(mtx_);
    out_ << "\n  Withdraw request successful: " << plain(amount) << " " << asset << " => " << address
         << "  [ID: " << id << "]" << std::endl;
}

void ConsoleOutput::test_mode(bool test_only) {
    std::lock_guard lock(mtx_);
    out_ << "\n  Test orders: " << (test_only ? "ON" : "OFF") << "\n";
    if (!test_only) {
        out_ << "  !! Market and Limit orders WILL be placed !!\n";
    }
    out_ << std::endl;
}

// --- line writers (caller holds mtx_) ---

void ConsoleOutput::write_trade(const AggregateTrade& trade) {
    out_ << "  " << format_time(trade.timestamp) << " - " << pad_left(trade.symbol, 8)
         << " - " << pad_left(trade.is_buyer_maker ? "Sell" : "Buy", 4)
         << " - " << fixed(trade.quantity, 8) << " @ " << fixed(trade.price, 8)
         << (trade.is_best_price_match ? "*" : " ")
         << " - [ID: " << trade.id << "] - " << trade.timestamp << "\n";
}

void ConsoleOutput::write_candle(const Candlestick& candle) {
    out_ << "  " << candle.symbol
         << " - O: " << fixed(candle.open, 8)
         << " | H: " << fixed(candle.high, 8)
         << " | L: " << fixed(candle.low, 8)
         << " | C: " << fixed(candle.close, 8)
         << " | V: " << fixed(candle.volume, 2)
         << " - [" << format_time(candle.open_time) << "]\n";
}

void ConsoleOutput::write_order(const Order& order) {
    out_ << "  " << pad_left(order.symbol, 8) << " - " << pad_left(order.type, 6)
         << " - " << pad_left(order.side, 4)
         << " - " << fixed(order.original_quantity, 8) << " @ " << fixed(order.price, 8)
         << " - " << order.status << "  [ID: " << order.id << "]\n";
}

void ConsoleOutput::write_account_trade(const AccountTrade& trade) {
    out_ << "  " << pad_left(format_time(trade.time), 22) << " - " << pad_left(trade.symbol, 8)
         << " - " << pad_left(trade.is_buyer ? "Buy" : "Sell", 4)
         << " - " << (trade.is_maker ? "Maker" : "Taker")
         << " - " << fixed(trade.quantity, 8) << " @ " << fixed(trade.price, 8)
         << (trade.is_best_price_match ? "*" : " ")
         << " - Fee: " << fixed(trade.commission, 8) << " " << pad_left(trade.commission_asset, 5)
         << " [ID: " << trade.id << "]\n";
}

void ConsoleOutput::write_balances(const std::vector<Balance>& balances) {
    for (const auto& balance : balances) {
        if (balance.free > 0 || balance.locked > 0) {
            out_ << "      Asset: " << balance.asset << " - Free: " << plain(balance.free)
                 << " - Locked: " << plain(balance.locked) << "\n";
        }
    }
}
