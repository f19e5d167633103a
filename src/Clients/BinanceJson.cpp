#include "Clients/BinanceJson.hpp"

#include <stdexcept>
#include <utility>

namespace BinanceJson {

namespace {

std::string text_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Candlestick kline_row(const json& row, const std::string& symbol, KlineInterval interval) {
    // [openTime, open, high, low, close, volume, closeTime, quoteVolume, trades, ...]
    if (!row.is_array() || row.size() < 9) {
        throw std::invalid_argument("kline row has " + std::to_string(row.size()) + " fields");
    }
    Candlestick c;
    c.symbol = symbol;
    c.interval = interval;
    c.open_time = row[0].get<std::uint64_t>();
    c.open = decimal(row[1]);
    c.high = decimal(row[2]);
    c.low = decimal(row[3]);
    c.close = decimal(row[4]);
    c.volume = decimal(row[5]);
    c.close_time = row[6].get<std::uint64_t>();
    c.quote_volume = decimal(row[7]);
    c.trade_count = row[8].get<std::uint64_t>();
    return c;
}

AggregateTrade trade_fields(const json& j, const std::string& symbol) {
    AggregateTrade t;
    t.symbol = symbol;
    t.id = j.at("a").get<std::uint64_t>();
    t.price = decimal(j.at("p"));
    t.quantity = decimal(j.at("q"));
    t.first_trade_id = j.at("f").get<std::uint64_t>();
    t.last_trade_id = j.at("l").get<std::uint64_t>();
    t.timestamp = j.at("T").get<std::uint64_t>();
    t.is_buyer_maker = j.at("m").get<bool>();
    t.is_best_price_match = j.value("M", false);
    return t;
}

void append_levels(const json& side, bool is_bid, std::vector<OrderBook::Order>& out) {
    for (const auto& level : side) {
        if (level.is_array() && level.size() >= 2) {
            out.emplace_back(decimal(level[0]), decimal(level[1]), is_bid);
        }
    }
}

std::vector<PriceLevel> price_levels(const json& side) {
    std::vector<PriceLevel> levels;
    levels.reserve(side.size());
    for (const auto& level : side) {
        if (level.is_array() && level.size() >= 2) {
            levels.push_back({decimal(level[0]), decimal(level[1])});
        }
    }
    return levels;
}

} // namespace

double decimal(const json& value) {
    if (value.is_string()) return std::stod(value.get<std::string>());
    if (value.is_number()) return value.get<double>();
    throw std::invalid_argument("expected a decimal, got " + value.dump());
}

std::optional<ApiError> api_error(const std::string& body) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("code") || !j.contains("msg")) {
        return std::nullopt;
    }
    if (!j["code"].is_number_integer() || !j["msg"].is_string()) {
        return std::nullopt;
    }
    return ApiError{j["code"].get<int>(), j["msg"].get<std::string>()};
}

std::uint64_t server_time(const json& j) {
    return j.at("serverTime").get<std::uint64_t>();
}

SymbolStats stats_24h(const json& j) {
    SymbolStats s;
    s.symbol = j.at("symbol").get<std::string>();
    s.price_change_percent = decimal(j.at("priceChangePercent"));
    s.open = decimal(j.at("openPrice"));
    s.high = decimal(j.at("highPrice"));
    s.low = decimal(j.at("lowPrice"));
    s.last = decimal(j.at("lastPrice"));
    s.bid = decimal(j.at("bidPrice"));
    s.ask = decimal(j.at("askPrice"));
    s.weighted_average = decimal(j.at("weightedAvgPrice"));
    s.volume = decimal(j.at("volume"));
    return s;
}

OrderBookSnapshot order_book(const json& j, const std::string& symbol) {
    OrderBookSnapshot book;
    book.symbol = symbol;
    book.last_update_id = j.at("lastUpdateId").get<std::uint64_t>();
    book.bids = price_levels(j.at("bids"));
    book.asks = price_levels(j.at("asks"));
    return book;
}

std::vector<AggregateTrade> aggregate_trades(const json& j, const std::string& symbol) {
    std::vector<AggregateTrade> trades;
    trades.reserve(j.size());
    for (const auto& item : j) {
        trades.push_back(trade_fields(item, symbol));
    }
    return trades;
}

std::vector<Candlestick> candlesticks(const json& j, const std::string& symbol, KlineInterval interval) {
    std::vector<Candlestick> candles;
    candles.reserve(j.size());
    for (const auto& row : j) {
        candles.push_back(kline_row(row, symbol, interval));
    }
    return candles;
}

std::vector<std::string> symbols(const json& exchange_info) {
    std::vector<std::string> out;
    for (const auto& s : exchange_info.at("symbols")) {
        out.push_back(s.at("symbol").get<std::string>());
    }
    return out;
}

std::vector<SymbolPrice> prices(const json& j) {
    std::vector<SymbolPrice> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back({item.at("symbol").get<std::string>(), decimal(item.at("price"))});
    }
    return out;
}

OrderBookTop book_ticker(const json& j) {
    OrderBookTop top;
    top.symbol = j.at("symbol").get<std::string>();
    top.bid = {decimal(j.at("bidPrice")), decimal(j.at("bidQty"))};
    top.ask = {decimal(j.at("askPrice")), decimal(j.at("askQty"))};
    return top;
}

std::vector<OrderBookTop> book_tickers(const json& j) {
    std::vector<OrderBookTop> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back(book_ticker(item));
    }
    return out;
}

Order order(const json& j) {
    Order o;
    o.symbol = j.at("symbol").get<std::string>();
    o.id = j.at("orderId").get<std::uint64_t>();
    o.client_order_id = text_or_empty(j, "clientOrderId");
    o.price = decimal(j.at("price"));
    o.original_quantity = decimal(j.at("origQty"));
    o.executed_quantity = decimal(j.at("executedQty"));
    if (j.contains("stopPrice")) o.stop_price = decimal(j["stopPrice"]);
    o.side = j.at("side").get<std::string>();
    o.type = j.at("type").get<std::string>();
    o.status = j.at("status").get<std::string>();
    // GET returns "time", POST returns "transactTime".
    o.time = j.contains("time") ? j["time"].get<std::uint64_t>() : j.value("transactTime", std::uint64_t{0});
    return o;
}

std::vector<Order> orders(const json& j) {
    std::vector<Order> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back(order(item));
    }
    return out;
}

AccountInfo account(const json& j) {
    AccountInfo a;
    a.maker_commission = j.at("makerCommission").get<int>();
    a.taker_commission = j.at("takerCommission").get<int>();
    a.buyer_commission = j.at("buyerCommission").get<int>();
    a.seller_commission = j.at("sellerCommission").get<int>();
    a.can_trade = j.at("canTrade").get<bool>();
    a.can_withdraw = j.at("canWithdraw").get<bool>();
    a.can_deposit = j.at("canDeposit").get<bool>();
    a.update_time = j.value("updateTime", std::uint64_t{0});
    for (const auto& b : j.at("balances")) {
        a.balances.push_back({b.at("asset").get<std::string>(), decimal(b.at("free")), decimal(b.at("locked"))});
    }
    return a;
}

std::vector<AccountTrade> account_trades(const json& j) {
    std::vector<AccountTrade> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        AccountTrade t;
        t.symbol = item.at("symbol").get<std::string>();
        t.id = item.at("id").get<std::uint64_t>();
        t.order_id = item.at("orderId").get<std::uint64_t>();
        t.price = decimal(item.at("price"));
        t.quantity = decimal(item.at("qty"));
        t.commission = decimal(item.at("commission"));
        t.commission_asset = text_or_empty(item, "commissionAsset");
        t.time = item.at("time").get<std::uint64_t>();
        t.is_buyer = item.at("isBuyer").get<bool>();
        t.is_maker = item.at("isMaker").get<bool>();
        t.is_best_price_match = item.value("isBestMatch", false);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<Deposit> deposits(const json& j) {
    std::vector<Deposit> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        Deposit d;
        d.asset = item.at("coin").get<std::string>();
        d.amount = decimal(item.at("amount"));
        d.address = text_or_empty(item, "address");
        d.tx_id = text_or_empty(item, "txId");
        d.status = item.value("status", 0);
        d.insert_time = item.value("insertTime", std::uint64_t{0});
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<Withdrawal> withdrawals(const json& j) {
    std::vector<Withdrawal> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        Withdrawal w;
        w.id = text_or_empty(item, "id");
        w.asset = item.at("coin").get<std::string>();
        w.amount = decimal(item.at("amount"));
        w.address = text_or_empty(item, "address");
        w.status = item.value("status", 0);
        w.apply_time = text_or_empty(item, "applyTime");
        out.push_back(std::move(w));
    }
    return out;
}

DepthUpdate depth_update(const json& j) {
    DepthUpdate update;
    update.symbol = j.at("s").get<std::string>();
    update.first_update_id = j.at("U").get<std::uint64_t>();
    update.final_update_id = j.at("u").get<std::uint64_t>();
    append_levels(j.at("b"), true, update.changes);
    append_levels(j.at("a"), false, update.changes);
    return update;
}

Candlestick kline_event(const json& j) {
    const auto& k = j.at("k");
    const auto interval = parse_interval(k.at("i").get<std::string>());
    if (!interval) {
        throw std::invalid_argument("unknown kline interval " + k.at("i").dump());
    }
    Candlestick c;
    c.symbol = k.at("s").get<std::string>();
    c.interval = *interval;
    c.open_time = k.at("t").get<std::uint64_t>();
    c.close_time = k.at("T").get<std::uint64_t>();
    c.open = decimal(k.at("o"));
    c.high = decimal(k.at("h"));
    c.low = decimal(k.at("l"));
    c.close = decimal(k.at("c"));
    c.volume = decimal(k.at("v"));
    c.quote_volume = decimal(k.at("q"));
    c.trade_count = k.at("n").get<std::uint64_t>();
    c.is_final = k.at("x").get<bool>();
    return c;
}

AggregateTrade aggregate_trade_event(const json& j) {
    return trade_fields(j, j.at("s").get<std::string>());
}

std::optional<UserDataEvent> user_data_event(const json& j) {
    const auto type = text_or_empty(j, "e");

    if (type == "outboundAccountPosition") {
        AccountUpdate update;
        update.event_time = j.at("E").get<std::uint64_t>();
        for (const auto& b : j.at("B")) {
            update.balances.push_back({b.at("a").get<std::string>(), decimal(b.at("f")), decimal(b.at("l"))});
        }
        return update;
    }

    if (type == "executionReport") {
        OrderUpdate update;
        update.event_time = j.at("E").get<std::uint64_t>();
        update.execution_type = j.at("x").get<std::string>();

        Order& o = update.order;
        o.symbol = j.at("s").get<std::string>();
        o.id = j.at("i").get<std::uint64_t>();
        o.client_order_id = text_or_empty(j, "c");
        o.price = decimal(j.at("p"));
        o.original_quantity = decimal(j.at("q"));
        o.executed_quantity = decimal(j.at("z"));
        o.stop_price = decimal(j.at("P"));
        o.side = j.at("S").get<std::string>();
        o.type = j.at("o").get<std::string>();
        o.status = j.at("X").get<std::string>();
        o.time = j.value("O", j.at("T").get<std::uint64_t>());

        if (update.execution_type == "TRADE") {
            AccountTrade t;
            t.symbol = o.symbol;
            t.id = j.at("t").get<std::uint64_t>();
            t.order_id = o.id;
            t.price = decimal(j.at("L"));
            t.quantity = decimal(j.at("l"));
            t.commission = decimal(j.at("n"));
            t.commission_asset = text_or_empty(j, "N"); // null until a fee is charged
            t.time = j.at("T").get<std::uint64_t>();
            t.is_buyer = o.side == "BUY";
            t.is_maker = j.at("m").get<bool>();
            update.trade = std::move(t);
        }
        return update;
    }

    return std::nullopt;
}

} // namespace BinanceJson
