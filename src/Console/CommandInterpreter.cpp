#include "Console/CommandInterpreter.hpp"

#include <exception>
#include <utility>

#include "Core/Errors.hpp"

namespace {

constexpr const char* kLiveActive = "A live task is currently active ...use 'live off' to disable.";

// Malformed or negative times are left out of the request.
std::uint64_t time_at(const Command& cmd, std::size_t index) {
    const std::string* text = cmd.arg(index);
    if (!text) return 0;
    const auto value = try_parse_long(*text);
    return value && *value > 0 ? static_cast<std::uint64_t>(*value) : 0;
}

KlineInterval interval_at(const Command& cmd, std::size_t index) {
    const std::string* text = cmd.arg(index);
    if (!text) return kDefaultInterval;
    return parse_interval(*text).value_or(kDefaultInterval);
}

std::optional<OrderSide> parse_side(const std::string& text) {
    if (iequals(text, "buy")) return OrderSide::Buy;
    if (iequals(text, "sell")) return OrderSide::Sell;
    return std::nullopt;
}

CommandResult argument_error(std::string message) {
    return CommandResult::fail(CommandStatus::ArgumentError, std::move(message));
}

} // namespace

CommandInterpreter::CommandInterpreter(IBinanceApi& api, LiveSessionManager& sessions, QueryResolver& resolver,
                                       ConsoleOutput& output, ConsoleSettings settings)
    : api_(api),
      sessions_(sessions),
      resolver_(resolver),
      output_(output),
      settings_(std::move(settings)),
      test_only_(settings_.test_orders),
      handlers_{
          {"ping", &CommandInterpreter::on_ping},
          {"time", &CommandInterpreter::on_time},
          {"stats", &CommandInterpreter::on_stats},
          {"depth", &CommandInterpreter::on_book},
          {"book", &CommandInterpreter::on_book},
          {"trades", &CommandInterpreter::on_trades},
          {"tradesin", &CommandInterpreter::on_trades_in},
          {"tradesfrom", &CommandInterpreter::on_trades_from},
          {"candles", &CommandInterpreter::on_candles},
          {"klines", &CommandInterpreter::on_candles},
          {"candlesin", &CommandInterpreter::on_candles_in},
          {"klinesin", &CommandInterpreter::on_candles_in},
          {"symbols", &CommandInterpreter::on_symbols},
          {"prices", &CommandInterpreter::on_prices},
          {"tops", &CommandInterpreter::on_tops},
          {"top", &CommandInterpreter::on_top},
          {"live", &CommandInterpreter::on_live},
          {"market", &CommandInterpreter::on_market},
          {"limit", &CommandInterpreter::on_limit},
          {"orders", &CommandInterpreter::on_orders},
          {"order", &CommandInterpreter::on_order},
          {"account", &CommandInterpreter::on_account},
          {"balances", &CommandInterpreter::on_account},
          {"positions", &CommandInterpreter::on_account},
          {"mytrades", &CommandInterpreter::on_my_trades},
          {"deposits", &CommandInterpreter::on_deposits},
          {"withdrawals", &CommandInterpreter::on_withdrawals},
          {"withdraw", &CommandInterpreter::on_withdraw},
          {"test", &CommandInterpreter::on_test},
          {"help", &CommandInterpreter::on_help},
          {"quit", &CommandInterpreter::on_quit},
          {"exit", &CommandInterpreter::on_quit},
      } {}

CommandResult CommandInterpreter::execute(std::string_view line) {
    const Command cmd = parse_line(line);
    if (cmd.empty()) {
        return CommandResult::fail(CommandStatus::Empty);
    }

    const auto it = handlers_.find(lowercase(cmd.verb));
    if (it == handlers_.end()) {
        return CommandResult::fail(CommandStatus::UnrecognizedCommand);
    }

    try {
        return (this->*(it->second))(cmd);
    } catch (const RemoteError& e) {
        return CommandResult::fail(CommandStatus::RemoteError, e.what());
    } catch (const std::exception& e) {
        return CommandResult::fail(CommandStatus::RemoteError, e.what());
    }
}

// --- argument helpers ---

std::string CommandInterpreter::symbol_at(const Command& cmd, std::size_t index) const {
    const std::string* text = cmd.arg(index);
    return text ? uppercase(*text) : settings_.default_symbol;
}

int CommandInterpreter::limit_at(const Command& cmd, std::size_t index) const {
    const std::string* text = cmd.arg(index);
    if (!text) return settings_.default_limit;
    const auto value = try_parse_int(*text);
    return value && *value > 0 ? *value : settings_.default_limit;
}

void CommandInterpreter::symbol_or_limit(const Command& cmd, std::string& symbol, int& limit) const {
    symbol = settings_.default_symbol;
    limit = settings_.default_limit;
    if (const std::string* first = cmd.arg(0)) {
        if (const auto value = try_parse_int(*first)) {
            if (*value > 0) limit = *value;
        } else {
            symbol = uppercase(*first);
        }
    }
    if (cmd.arg(1)) {
        limit = limit_at(cmd, 1);
    }
}

// --- connectivity / market data ---

CommandResult CommandInterpreter::on_ping(const Command&) {
    output_.ping(api_.ping());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_time(const Command&) {
    output_.server_time(api_.server_time());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_stats(const Command& cmd) {
    output_.stats(api_.stats_24h(symbol_at(cmd, 0)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_book(const Command& cmd) {
    std::string symbol;
    int limit = 0;
    symbol_or_limit(cmd, symbol, limit);
    output_.order_book(resolver_.order_book(symbol, limit));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_trades(const Command& cmd) {
    output_.trades(resolver_.trades(symbol_at(cmd, 0), limit_at(cmd, 1)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_trades_in(const Command& cmd) {
    output_.trades(resolver_.trades_in(symbol_at(cmd, 0), time_at(cmd, 1), time_at(cmd, 2)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_trades_from(const Command& cmd) {
    output_.trades(resolver_.trades_from(symbol_at(cmd, 0), time_at(cmd, 1), limit_at(cmd, 2)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_candles(const Command& cmd) {
    output_.candlesticks(resolver_.candlesticks(symbol_at(cmd, 0), interval_at(cmd, 1), limit_at(cmd, 2)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_candles_in(const Command& cmd) {
    output_.candlesticks(resolver_.candlesticks_in(symbol_at(cmd, 0), interval_at(cmd, 1),
                                                   time_at(cmd, 2), time_at(cmd, 3)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_symbols(const Command&) {
    output_.symbols(api_.symbols());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_prices(const Command&) {
    output_.prices(api_.prices());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_tops(const Command&) {
    output_.tops(api_.order_book_tops());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_top(const Command& cmd) {
    output_.top(resolver_.top_of_book(symbol_at(cmd, 0)));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_live(const Command& cmd) {
    const std::string endpoint = cmd.arg(0) ? *cmd.arg(0) : "depth";
    if (iequals(endpoint, "off")) {
        return live_off();
    }

    const auto kind = parse_stream_kind(endpoint);
    if (!kind) {
        return CommandResult::fail(CommandStatus::UnrecognizedCommand);
    }
    if (*kind == StreamKind::UserData && !api_.has_credentials()) {
        return CommandResult::fail(CommandStatus::NotAuthorized);
    }

    StreamSubscription subscription;
    subscription.kind = *kind;
    if (*kind != StreamKind::UserData) {
        subscription.symbol = symbol_at(cmd, 1);
    }
    if (*kind == StreamKind::Candlesticks) {
        subscription.interval = interval_at(cmd, 2);
    }

    auto handle = sessions_.start(std::move(subscription));
    if (!handle) {
        return CommandResult::fail(CommandStatus::SessionError, kLiveActive);
    }
    output_.live_enabled(handle->subscription);
    return CommandResult::ok();
}

CommandResult CommandInterpreter::live_off() {
    const auto view = sessions_.active_view();
    sessions_.stop();
    if (view) {
        output_.live_disabled(view->subscription.kind);
    }
    return CommandResult::ok();
}

// --- account ---

CommandResult CommandInterpreter::on_market(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    if (cmd.args.size() < 3) {
        return argument_error("A side, symbol, and quantity are required.");
    }

    const auto side = parse_side(cmd.args[0]);
    if (!side) {
        return argument_error("A valid order side is required ('buy' or 'sell').");
    }
    const auto quantity = try_parse_decimal(cmd.args[2]);
    if (!quantity || *quantity <= 0) {
        return argument_error("A quantity greater than 0 is required.");
    }

    OrderIntent intent;
    intent.side = *side;
    intent.kind = OrderKind::Market;
    intent.symbol = uppercase(cmd.args[1]);
    intent.quantity = *quantity;
    intent.is_test_only = test_only_;
    if (const std::string* stop = cmd.arg(3)) {
        const auto stop_price = try_parse_decimal(*stop);
        if (!stop_price || *stop_price <= 0) {
            return argument_error("A stop price greater than 0 is required.");
        }
        intent.stop_price = *stop_price;
    }

    output_.order_placed(api_.place_order(intent), intent.kind, intent.is_test_only);
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_limit(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    if (cmd.args.size() < 4) {
        return argument_error("A side, symbol, quantity and price are required.");
    }

    const auto side = parse_side(cmd.args[0]);
    if (!side) {
        return argument_error("A valid order side is required ('buy' or 'sell').");
    }
    const auto quantity = try_parse_decimal(cmd.args[2]);
    if (!quantity || *quantity <= 0) {
        return argument_error("A quantity greater than 0 is required.");
    }
    const auto price = try_parse_decimal(cmd.args[3]);
    if (!price || *price <= 0) {
        return argument_error("A price greater than 0 is required.");
    }

    OrderIntent intent;
    intent.side = *side;
    intent.kind = OrderKind::Limit;
    intent.symbol = uppercase(cmd.args[1]);
    intent.quantity = *quantity;
    intent.price = *price;
    intent.is_test_only = test_only_;
    if (const std::string* stop = cmd.arg(4)) {
        const auto stop_price = try_parse_decimal(*stop);
        if (!stop_price || *stop_price <= 0) {
            return argument_error("A stop price greater than 0 is required.");
        }
        intent.stop_price = *stop_price;
    }

    output_.order_placed(api_.place_order(intent), intent.kind, intent.is_test_only);
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_orders(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);

    std::string symbol;
    int limit = 0;
    symbol_or_limit(cmd, symbol, limit);
    const std::string* second = cmd.arg(1);
    if (second && iequals(*second, "open")) {
        output_.orders(api_.open_orders(symbol));
    } else {
        output_.orders(api_.orders(symbol, limit));
    }
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_order(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    if (cmd.args.size() < 2) {
        return argument_error("A symbol and order ID are required.");
    }

    const std::string symbol = uppercase(cmd.args[0]);
    const auto id = try_parse_long(cmd.args[1]);
    if (id && *id < 0) {
        return argument_error("An order ID not less than 0 is required.");
    }
    const std::string* action = cmd.arg(2);
    const bool cancel = action && iequals(*action, "cancel");

    if (cancel) {
        output_.order_cancelled(id ? api_.cancel_order(symbol, static_cast<std::uint64_t>(*id))
                                   : api_.cancel_order(symbol, cmd.args[1]));
    } else {
        output_.order(id ? api_.order(symbol, static_cast<std::uint64_t>(*id))
                         : api_.order(symbol, cmd.args[1]));
    }
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_account(const Command&) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    output_.account(api_.account());
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_my_trades(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);

    std::string symbol;
    int limit = 0;
    symbol_or_limit(cmd, symbol, limit);
    output_.account_trades(api_.account_trades(symbol, limit));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_deposits(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    const std::string* asset = cmd.arg(0);
    output_.deposits(api_.deposits(asset ? uppercase(*asset) : std::string{}));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_withdrawals(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    const std::string* asset = cmd.arg(0);
    output_.withdrawals(api_.withdrawals(asset ? uppercase(*asset) : std::string{}));
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_withdraw(const Command& cmd) {
    if (!api_.has_credentials()) return CommandResult::fail(CommandStatus::NotAuthorized);
    if (cmd.args.size() < 3) {
        return argument_error("An asset, address, and amount are required.");
    }

    const std::string asset = uppercase(cmd.args[0]);
    const std::string& address = cmd.args[1];
    const auto amount = try_parse_decimal(cmd.args[2]);
    if (!amount || *amount <= 0) {
        return argument_error("An amount greater than 0 is required.");
    }

    const std::string id = api_.withdraw(asset, address, *amount);
    output_.withdraw_submitted(asset, address, *amount, id);
    return CommandResult::ok();
}

// --- console ---

CommandResult CommandInterpreter::on_test(const Command& cmd) {
    const std::string* value = cmd.arg(0);
    test_only_ = !(value && iequals(*value, "off"));
    output_.test_mode(test_only_);
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_help(const Command&) {
    output_.help();
    return CommandResult::ok();
}

CommandResult CommandInterpreter::on_quit(const Command&) {
    return CommandResult::fail(CommandStatus::Quit);
}
