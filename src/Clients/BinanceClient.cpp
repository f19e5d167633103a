#include "Clients/BinanceClient.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "Clients/BinanceJson.hpp"
#include "Core/Errors.hpp"

namespace beast = boost::beast;         // from <boost/beast/core.hpp>
namespace http = beast::http;           // from <boost/beast/http.hpp>
namespace net = boost::asio;            // from <boost/asio/io_context.hpp>
namespace ssl = net::ssl;               // from <boost/asio/ssl/context.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>
using json = nlohmann::json;            // from <nlohmann/json.hpp>

namespace {

constexpr int kOrderDoesNotExist = -2013;

std::uint64_t now_ms() {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
        .count());
}

// Runs the single pending operation queued on `ioc` to completion.
void run_step(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void throw_if(const beast::error_code& ec, const std::string& what) {
    if (ec) {
        throw RemoteError(what + " failed: " + ec.message());
    }
}

// Payload decoding failures surface as RemoteError like any other bad response.
template <typename F>
auto decode(const char* what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const json::exception& e) {
        throw RemoteError(std::string("unexpected ") + what + " payload: " + e.what());
    } catch (const std::logic_error& e) {
        throw RemoteError(std::string("unexpected ") + what + " payload: " + e.what());
    }
}

} // namespace

BinanceClient::BinanceClient(ApiSettings settings, Credentials credentials)
    : settings_(std::move(settings)), credentials_(std::move(credentials)) {}

// --- static helpers ---

std::string BinanceClient::sign(const std::string& payload, const std::string& secret) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!HMAC(EVP_sha256(),
              secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
              digest, &digest_len)) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        throw RemoteError(std::string("request signing failed: ") + buf);
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string BinanceClient::encode_query(const QueryParams& params) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) out << '&';
        first = false;
        out << key << '=';
        for (const unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out << static_cast<char>(c);
            } else {
                out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
        }
    }
    return out.str();
}

std::string BinanceClient::format_decimal(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(8) << value;
    std::string text = ss.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

// --- transport ---

json BinanceClient::call(Method method, const std::string& path, QueryParams params, Security security) {
    if (security != Security::Public && credentials_.api_key.empty()) {
        throw RemoteError("an API key is required for " + path);
    }
    if (security == Security::Signed) {
        if (credentials_.api_secret.empty()) {
            throw RemoteError("an API secret is required for " + path);
        }
        params.emplace_back("recvWindow", std::to_string(settings_.recv_window));
        params.emplace_back("timestamp", std::to_string(now_ms()));
    }

    std::string query = encode_query(params);
    if (security == Security::Signed) {
        query += (query.empty() ? "" : "&") + std::string("signature=") + sign(query, credentials_.api_secret);
    }
    const std::string target = query.empty() ? path : path + "?" + query;
    const std::string& host = settings_.rest_host;

    net::io_context ioc; // private context; every step below runs it to completion
    ssl::context ctx{ssl::context::tlsv12_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    beast::error_code ec;

    // Set SNI for SSL handshake
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw_if(ec, "SNI setup for " + host);
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    tcp::resolver::results_type results;
    resolver.async_resolve(host, settings_.rest_port,
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                               ec = e;
                               results = std::move(r);
                           });
    run_step(ioc);
    throw_if(ec, "resolve " + host);

    // One deadline for connect, handshake, write and read.
    beast::get_lowest_layer(stream).expires_after(settings_.timeout);

    beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_step(ioc);
    throw_if(ec, "connect to " + host);

    stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
    run_step(ioc);
    throw_if(ec, "TLS handshake with " + host);

    http::verb verb = http::verb::get;
    switch (method) {
        case Method::Get: verb = http::verb::get; break;
        case Method::Post: verb = http::verb::post; break;
        case Method::Put: verb = http::verb::put; break;
        case Method::Delete: verb = http::verb::delete_; break;
    }

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (security != Security::Public) {
        req.set("X-MBX-APIKEY", credentials_.api_key);
    }
    req.prepare_payload();

    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    run_step(ioc);
    throw_if(ec, "write request " + path);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    run_step(ioc);
    throw_if(ec, "read response " + path);

    stream.async_shutdown([&](beast::error_code e) { ec = e; });
    run_step(ioc);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated || ec == beast::error::timeout) {
        // Rationale: http://www.boost.org/doc/libs/1_80_0/libs/beast/doc/html/beast/using_http/graceful_shutdown.html
        ec = {};
    }
    if (ec) {
        std::cerr << "[REST] Shutdown after " << path << ": " << ec.message() << std::endl;
    }

    const unsigned status = res.result_int();
    if (status < 200 || status >= 300) {
        if (auto error = BinanceJson::api_error(res.body())) {
            throw RemoteError(error->message + " (code " + std::to_string(error->code) + ")",
                              static_cast<int>(status), error->code);
        }
        throw RemoteError("HTTP " + std::to_string(status) + " " + std::string(res.reason()) + " from " + path,
                          static_cast<int>(status));
    }

    json body = json::parse(res.body(), nullptr, false);
    if (body.is_discarded()) {
        throw RemoteError("malformed JSON from " + path, static_cast<int>(status));
    }
    return body;
}

// --- connectivity ---

bool BinanceClient::ping() {
    return call(Method::Get, "/api/v3/ping", {}).is_object();
}

std::uint64_t BinanceClient::server_time() {
    const auto body = call(Method::Get, "/api/v3/time", {});
    return decode("time", [&] { return BinanceJson::server_time(body); });
}

// --- market data ---

SymbolStats BinanceClient::stats_24h(const std::string& symbol) {
    const auto body = call(Method::Get, "/api/v3/ticker/24hr", {{"symbol", symbol}});
    return decode("24h stats", [&] { return BinanceJson::stats_24h(body); });
}

OrderBookSnapshot BinanceClient::order_book(const std::string& symbol, int limit) {
    const auto body = call(Method::Get, "/api/v3/depth", {{"symbol", symbol}, {"limit", std::to_string(limit)}});
    return decode("order book", [&] { return BinanceJson::order_book(body, symbol); });
}

std::vector<AggregateTrade> BinanceClient::aggregate_trades(const std::string& symbol, int limit,
                                                            std::uint64_t from_id, std::uint64_t start_time,
                                                            std::uint64_t end_time) {
    QueryParams params{{"symbol", symbol}};
    if (limit > 0) params.emplace_back("limit", std::to_string(limit));
    if (from_id > 0) params.emplace_back("fromId", std::to_string(from_id));
    if (start_time > 0) params.emplace_back("startTime", std::to_string(start_time));
    if (end_time > 0) params.emplace_back("endTime", std::to_string(end_time));

    const auto body = call(Method::Get, "/api/v3/aggTrades", std::move(params));
    return decode("aggregate trades", [&] { return BinanceJson::aggregate_trades(body, symbol); });
}

std::vector<Candlestick> BinanceClient::candlesticks(const std::string& symbol, KlineInterval interval, int limit,
                                                     std::uint64_t start_time, std::uint64_t end_time) {
    QueryParams params{{"symbol", symbol}, {"interval", std::string(to_string(interval))}};
    if (limit > 0) params.emplace_back("limit", std::to_string(limit));
    if (start_time > 0) params.emplace_back("startTime", std::to_string(start_time));
    if (end_time > 0) params.emplace_back("endTime", std::to_string(end_time));

    const auto body = call(Method::Get, "/api/v3/klines", std::move(params));
    return decode("klines", [&] { return BinanceJson::candlesticks(body, symbol, interval); });
}

std::vector<std::string> BinanceClient::symbols() {
    const auto body = call(Method::Get, "/api/v3/exchangeInfo", {});
    return decode("exchange info", [&] { return BinanceJson::symbols(body); });
}

std::vector<SymbolPrice> BinanceClient::prices() {
    const auto body = call(Method::Get, "/api/v3/ticker/price", {});
    return decode("prices", [&] { return BinanceJson::prices(body); });
}

std::vector<OrderBookTop> BinanceClient::order_book_tops() {
    const auto body = call(Method::Get, "/api/v3/ticker/bookTicker", {});
    return decode("book tickers", [&] { return BinanceJson::book_tickers(body); });
}

OrderBookTop BinanceClient::order_book_top(const std::string& symbol) {
    const auto body = call(Method::Get, "/api/v3/ticker/bookTicker", {{"symbol", symbol}});
    return decode("book ticker", [&] { return BinanceJson::book_ticker(body); });
}

// --- account ---

Order BinanceClient::place_order(const OrderIntent& intent) {
    std::string type;
    if (intent.kind == OrderKind::Market) {
        type = intent.stop_price ? "STOP_LOSS" : "MARKET";
    } else {
        type = intent.stop_price ? "STOP_LOSS_LIMIT" : "LIMIT";
    }

    QueryParams params{{"symbol", intent.symbol},
                       {"side", std::string(to_string(intent.side))},
                       {"type", type}};
    if (intent.kind == OrderKind::Limit) params.emplace_back("timeInForce", "GTC");
    params.emplace_back("quantity", format_decimal(intent.quantity));
    if (intent.price) params.emplace_back("price", format_decimal(*intent.price));
    if (intent.stop_price) params.emplace_back("stopPrice", format_decimal(*intent.stop_price));
    params.emplace_back("newOrderRespType", "RESULT");

    const auto body = call(Method::Post, intent.is_test_only ? "/api/v3/order/test" : "/api/v3/order",
                           std::move(params), Security::Signed);

    if (intent.is_test_only) {
        // The test endpoint only validates; it answers with {}.
        Order order;
        order.symbol = intent.symbol;
        order.side = std::string(to_string(intent.side));
        order.type = type;
        order.price = intent.price.value_or(0.0);
        order.original_quantity = intent.quantity;
        order.stop_price = intent.stop_price.value_or(0.0);
        order.status = "TEST";
        order.time = now_ms();
        return order;
    }
    return decode("order", [&] { return BinanceJson::order(body); });
}

std::vector<Order> BinanceClient::orders(const std::string& symbol, int limit) {
    const auto body = call(Method::Get, "/api/v3/allOrders",
                           {{"symbol", symbol}, {"limit", std::to_string(limit)}}, Security::Signed);
    return decode("orders", [&] { return BinanceJson::orders(body); });
}

std::vector<Order> BinanceClient::open_orders(const std::string& symbol) {
    const auto body = call(Method::Get, "/api/v3/openOrders", {{"symbol", symbol}}, Security::Signed);
    return decode("open orders", [&] { return BinanceJson::orders(body); });
}

std::optional<Order> BinanceClient::find_order(const std::string& symbol, QueryParams params) {
    params.emplace(params.begin(), "symbol", symbol);
    try {
        const auto body = call(Method::Get, "/api/v3/order", std::move(params), Security::Signed);
        return decode("order", [&] { return BinanceJson::order(body); });
    } catch (const RemoteError& e) {
        if (e.code() == kOrderDoesNotExist) return std::nullopt;
        throw;
    }
}

std::optional<Order> BinanceClient::order(const std::string& symbol, std::uint64_t id) {
    return find_order(symbol, {{"orderId", std::to_string(id)}});
}

std::optional<Order> BinanceClient::order(const std::string& symbol, const std::string& client_order_id) {
    return find_order(symbol, {{"origClientOrderId", client_order_id}});
}

std::string BinanceClient::cancel(const std::string& symbol, QueryParams params) {
    params.emplace(params.begin(), "symbol", symbol);
    const auto body = call(Method::Delete, "/api/v3/order", std::move(params), Security::Signed);
    return decode("cancel", [&] { return body.at("clientOrderId").get<std::string>(); });
}

std::string BinanceClient::cancel_order(const std::string& symbol, std::uint64_t id) {
    return cancel(symbol, {{"orderId", std::to_string(id)}});
}

std::string BinanceClient::cancel_order(const std::string& symbol, const std::string& client_order_id) {
    return cancel(symbol, {{"origClientOrderId", client_order_id}});
}

AccountInfo BinanceClient::account() {
    const auto body = call(Method::Get, "/api/v3/account", {}, Security::Signed);
    return decode("account", [&] { return BinanceJson::account(body); });
}

std::vector<AccountTrade> BinanceClient::account_trades(const std::string& symbol, int limit) {
    const auto body = call(Method::Get, "/api/v3/myTrades",
                           {{"symbol", symbol}, {"limit", std::to_string(limit)}}, Security::Signed);
    return decode("account trades", [&] { return BinanceJson::account_trades(body); });
}

std::vector<Deposit> BinanceClient::deposits(const std::string& asset) {
    QueryParams params;
    if (!asset.empty()) params.emplace_back("coin", asset);
    const auto body = call(Method::Get, "/sapi/v1/capital/deposit/hisrec", std::move(params), Security::Signed);
    return decode("deposit history", [&] { return BinanceJson::deposits(body); });
}

std::vector<Withdrawal> BinanceClient::withdrawals(const std::string& asset) {
    QueryParams params;
    if (!asset.empty()) params.emplace_back("coin", asset);
    const auto body = call(Method::Get, "/sapi/v1/capital/withdraw/history", std::move(params), Security::Signed);
    return decode("withdraw history", [&] { return BinanceJson::withdrawals(body); });
}

std::string BinanceClient::withdraw(const std::string& asset, const std::string& address, double amount) {
    const auto body = call(Method::Post, "/sapi/v1/capital/withdraw/apply",
                           {{"coin", asset}, {"address", address}, {"amount", format_decimal(amount)}},
                           Security::Signed);
    return decode("withdraw", [&] { return body.at("id").get<std::string>(); });
}

// --- user data stream ---

std::string BinanceClient::open_user_stream() {
    const auto body = call(Method::Post, "/api/v3/userDataStream", {}, Security::ApiKey);
    return decode("listen key", [&] { return body.at("listenKey").get<std::string>(); });
}

void BinanceClient::keepalive_user_stream(const std::string& listen_key) {
    call(Method::Put, "/api/v3/userDataStream", {{"listenKey", listen_key}}, Security::ApiKey);
}

void BinanceClient::close_user_stream(const std::string& listen_key) {
    call(Method::Delete, "/api/v3/userDataStream", {{"listenKey", listen_key}}, Security::ApiKey);
}
