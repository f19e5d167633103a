#pragma once
#include <string>
#include <string_view>
#include <unordered_map>

#include "Clients/IBinanceApi.hpp"
#include "Console/CommandParser.hpp"
#include "Console/CommandResult.hpp"
#include "Console/ConsoleOutput.hpp"
#include "Session/LiveSessionManager.hpp"
#include "Session/QueryResolver.hpp"
#include "Utils/Config.hpp"

// Turns one console line into a call on the resolver, the session manager or
// the REST client, and renders the result through ConsoleOutput.
//
// Argument contract:
//  - verbs are case-insensitive, symbols and assets are upper-cased;
//  - an optional numeric argument that does not parse (or a limit that is not
//    positive) silently takes its default;
//  - a required argument that fails validation aborts with ArgumentError and
//    nothing is sent;
//  - `book`, `orders` and `myTrades` take either a symbol or a limit in their
//    first slot: an integer is a limit on the default symbol, anything else
//    is a symbol with the default limit.
// Account verbs and `live account` need credentials and are rejected with
// NotAuthorized, before any other check, when there are none.
class CommandInterpreter {
public:
    CommandInterpreter(IBinanceApi& api, LiveSessionManager& sessions, QueryResolver& resolver,
                       ConsoleOutput& output, ConsoleSettings settings);

    // Never throws for a venue failure: RemoteError becomes CommandStatus::RemoteError.
    CommandResult execute(std::string_view line);

    [[nodiscard]] bool test_orders() const noexcept { return test_only_; }

private:
    using Handler = CommandResult (CommandInterpreter::*)(const Command&);

    // --- connectivity / market data ---
    CommandResult on_ping(const Command& cmd);
    CommandResult on_time(const Command& cmd);
    CommandResult on_stats(const Command& cmd);
    CommandResult on_book(const Command& cmd);
    CommandResult on_trades(const Command& cmd);
    CommandResult on_trades_in(const Command& cmd);
    CommandResult on_trades_from(const Command& cmd);
    CommandResult on_candles(const Command& cmd);
    CommandResult on_candles_in(const Command& cmd);
    CommandResult on_symbols(const Command& cmd);
    CommandResult on_prices(const Command& cmd);
    CommandResult on_tops(const Command& cmd);
    CommandResult on_top(const Command& cmd);
    CommandResult on_live(const Command& cmd);

    // --- account ---
    CommandResult on_market(const Command& cmd);
    CommandResult on_limit(const Command& cmd);
    CommandResult on_orders(const Command& cmd);
    CommandResult on_order(const Command& cmd);
    CommandResult on_account(const Command& cmd);
    CommandResult on_my_trades(const Command& cmd);
    CommandResult on_deposits(const Command& cmd);
    CommandResult on_withdrawals(const Command& cmd);
    CommandResult on_withdraw(const Command& cmd);

    // --- console ---
    CommandResult on_test(const Command& cmd);
    CommandResult on_help(const Command& cmd);
    CommandResult on_quit(const Command& cmd);

    CommandResult live_off();

    std::string symbol_at(const Command& cmd, std::size_t index) const;
    int limit_at(const Command& cmd, std::size_t index) const;
    // Symbol-or-limit slot followed by an optional limit.
    void symbol_or_limit(const Command& cmd, std::string& symbol, int& limit) const;

    IBinanceApi& api_;
    LiveSessionManager& sessions_;
    QueryResolver& resolver_;
    ConsoleOutput& output_;
    ConsoleSettings settings_;
    bool test_only_;
    std::unordered_map<std::string, Handler> handlers_;
};
