#include "Clients/BinanceWSClient.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility> // For std::move

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>

#include "Clients/BinanceJson.hpp"
#include "Core/Errors.hpp"
#include "Core/OrderBook.hpp"
#include "Core/StreamCaches.hpp"

namespace beast = boost::beast;         // from <boost/beast/core.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace net = boost::asio;            // from <boost/asio/io_context.hpp>
namespace ssl = net::ssl;               // from <boost/asio/ssl/context.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>
using json = nlohmann::json;            // from <nlohmann/json.hpp>

namespace {

ssl::context make_tls_context() {
    ssl::context ctx{ssl::context::tlsv12_client};
    ctx.set_default_verify_paths(); // Load system default SSL certificates
    ctx.set_verify_mode(ssl::verify_peer);
    return ctx;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

// One connection for one subscription. Lives on the worker thread for the
// duration of BinanceWSClient::run() and is driven by its own io_context.
class BinanceWSClient::Impl {
public:
    Impl(IBinanceApi& rest, const ApiSettings& settings, const Options& opts,
         const StreamSubscription& subscription, const SnapshotHandler& on_snapshot)
        : rest_(rest),
          settings_(settings),
          opts_(opts),
          subscription_(subscription),
          on_snapshot_(on_snapshot),
          ctx_(make_tls_context()),
          resolver_(net::make_strand(ioc_)),
          ws_(net::make_strand(ioc_), ctx_),
          keepalive_timer_(ioc_),
          book_(subscription.symbol),
          candles_(subscription.symbol, subscription.interval.value_or(kDefaultInterval)),
          trades_(subscription.symbol) {}

    ~Impl() {
        if (listen_key_.empty()) return;
        try {
            rest_.close_user_stream(listen_key_);
        } catch (const RemoteError& e) {
            std::cerr << "[WS] Closing listen key failed: " << e.what() << std::endl;
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    void run(std::stop_token stop) {
        if (subscription_.kind == StreamKind::UserData) {
            listen_key_ = rest_.open_user_stream();
        }
        path_ = stream_path(subscription_, listen_key_);

        std::cerr << "[WS] Connecting to " << settings_.stream_host << path_ << std::endl;
        resolver_.async_resolve(
            settings_.stream_host,
            settings_.stream_port,
            beast::bind_front_handler(
                &Impl::on_resolve,
                this));

        // Slice the event loop so that a stop request is seen promptly.
        while (!stop.stop_requested() && !failure_) {
            ioc_.run_for(opts_.poll_slice);
            if (ioc_.stopped() && !failure_ && !stop.stop_requested()) {
                failure_ = "stream ended without an error";
            }
        }

        close();

        if (failure_) {
            throw RemoteError(*failure_);
        }
    }

private:
    IBinanceApi& rest_;
    const ApiSettings& settings_;
    const Options& opts_;
    const StreamSubscription& subscription_;
    const SnapshotHandler& on_snapshot_;

    net::io_context ioc_;
    ssl::context ctx_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    net::steady_timer keepalive_timer_;
    beast::flat_buffer buffer_;

    std::string path_;
    std::string listen_key_;
    std::optional<std::string> failure_;
    bool closing_ = false;

    OrderBook book_;
    CandlestickCache candles_;
    TradeCache trades_;

    // --- connection chain ---

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return handle_error(ec, "resolve");
        }

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws_).async_connect(
            results,
            beast::bind_front_handler(
                &Impl::on_connect,
                this));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
        if (ec) {
            return handle_error(ec, "connect");
        }

        std::cerr << "[WS] TCP connection established to " << ep << std::endl;

        // Set SNI for SSL handshake (Host for WebSocket)
        if (!SSL_set_tlsext_host_name(
                ws_.next_layer().native_handle(),
                settings_.stream_host.c_str())) {
            ec = beast::error_code(
                static_cast<int>(::ERR_get_error()),
                net::error::get_ssl_category());
            return handle_error(ec, "SSL_set_tlsext_host_name");
        }
        ws_.next_layer().set_verify_callback(ssl::host_name_verification(settings_.stream_host));

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        ws_.next_layer().async_handshake(
            ssl::stream_base::client,
            beast::bind_front_handler(
                &Impl::on_ssl_handshake,
                this));
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) {
            char buf[256];
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            std::cerr << "[WS] OpenSSL error: " << buf << std::endl;
            return handle_error(ec, "ssl_handshake");
        }

        // The websocket stream applies its own timeouts from here on.
        beast::get_lowest_layer(ws_).expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.idle_timeout = std::chrono::minutes(3);
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);

        ws_.async_handshake(
            settings_.stream_host,
            path_,
            beast::bind_front_handler(
                &Impl::on_handshake,
                this));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            return handle_error(ec, "handshake");
        }

        std::cerr << "[WS] Streaming " << to_string(subscription_.kind) << " from " << path_ << std::endl;

        // Events that arrive while seeding wait in the socket and are
        // reconciled against the seed once reading starts.
        try {
            seed();
        } catch (const RemoteError& e) {
            return fail(std::string("seeding ") + std::string(to_string(subscription_.kind)) + " cache failed: " + e.what());
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(
                &Impl::on_read,
                this));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            if (closing_) return;
            if (ec == websocket::error::closed) {
                std::string reason = "connection closed by server";
                if (ws_.reason().code != websocket::close_code::none) {
                    reason += " (code " + std::to_string(ws_.reason().code) + ": " + std::string(ws_.reason().reason.c_str()) + ")";
                }
                return fail(reason);
            }
            return handle_error(ec, "read");
        }

        const auto msg = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        try {
            on_message(json::parse(msg));
        } catch (const RemoteError& e) {
            return fail(std::string("order book resync failed: ") + e.what());
        } catch (const json::exception& e) {
            std::cerr << "[WS] Parse error: " << e.what() << "\n[WS] Raw data: " << msg << std::endl;
        } catch (const std::logic_error& e) {
            std::cerr << "[WS] Parse error: " << e.what() << "\n[WS] Raw data: " << msg << std::endl;
        }

        if (failure_) return;
        do_read();
    }

    // --- caches ---

    void seed() {
        const auto& symbol = subscription_.symbol;
        switch (subscription_.kind) {
            case StreamKind::OrderBook:
                resync_book();
                break;
            case StreamKind::Candlesticks:
                candles_.seed(rest_.candlesticks(symbol, subscription_.interval.value_or(kDefaultInterval),
                                                 static_cast<int>(kSeriesCapacity)));
                emit(candles_.snapshot());
                break;
            case StreamKind::Trades:
                trades_.seed(rest_.aggregate_trades(symbol, static_cast<int>(kSeriesCapacity)));
                emit(trades_.snapshot());
                break;
            case StreamKind::UserData:
                schedule_keepalive();
                break;
        }
    }

    void resync_book() {
        const auto snapshot = rest_.order_book(subscription_.symbol, static_cast<int>(opts_.book_depth));

        std::vector<OrderBook::Order> levels;
        levels.reserve(snapshot.bids.size() + snapshot.asks.size());
        for (const auto& level : snapshot.bids) levels.emplace_back(level.price, level.quantity, true);
        for (const auto& level : snapshot.asks) levels.emplace_back(level.price, level.quantity, false);

        book_.initialize(snapshot.last_update_id, levels);
        std::cerr << "[WS] " << subscription_.symbol << " book seeded at update " << snapshot.last_update_id
                  << " with " << levels.size() << " levels" << std::endl;
        emit(book_.snapshot(opts_.snapshot_depth));
    }

    void on_message(const json& data) {
        switch (subscription_.kind) {
            case StreamKind::OrderBook:
                return on_depth(BinanceJson::depth_update(data));
            case StreamKind::Candlesticks:
                if (candles_.apply(BinanceJson::kline_event(data))) {
                    emit(candles_.snapshot());
                }
                return;
            case StreamKind::Trades:
                if (trades_.apply(BinanceJson::aggregate_trade_event(data))) {
                    emit(trades_.snapshot());
                }
                return;
            case StreamKind::UserData:
                if (data.value("e", std::string()) == "listenKeyExpired") {
                    return fail("listen key expired");
                }
                if (auto event = BinanceJson::user_data_event(data)) {
                    emit(std::move(*event));
                }
                return;
        }
    }

    void on_depth(const BinanceJson::DepthUpdate& update) {
        auto result = book_.update(update.first_update_id, update.final_update_id, update.changes);
        if (result == OrderBook::UpdateResult::Gap) {
            std::cerr << "[WS] " << update.symbol << " depth gap at update " << update.first_update_id
                      << " (book at " << book_.last_update_id() << "), resynchronising" << std::endl;
            resync_book();
            result = book_.update(update.first_update_id, update.final_update_id, update.changes);
        }
        if (result == OrderBook::UpdateResult::Applied) {
            emit(book_.snapshot(opts_.snapshot_depth));
        }
    }

    void emit(LiveSnapshot snapshot) {
        on_snapshot_(std::move(snapshot));
    }

    // --- user data keep-alive ---

    void schedule_keepalive() {
        keepalive_timer_.expires_after(opts_.keepalive_interval);
        keepalive_timer_.async_wait(
            beast::bind_front_handler(
                &Impl::on_keepalive,
                this));
    }

    void on_keepalive(beast::error_code ec) {
        if (ec == net::error::operation_aborted || closing_) {
            return;
        }
        try {
            rest_.keepalive_user_stream(listen_key_);
        } catch (const RemoteError& e) {
            return fail(std::string("listen key keep-alive failed: ") + e.what());
        }
        std::cerr << "[WS] Listen key refreshed" << std::endl;
        schedule_keepalive();
    }

    // --- teardown ---

    void close() {
        closing_ = true;
        keepalive_timer_.cancel();

        if (ws_.is_open()) {
            ws_.async_close(
                websocket::close_code::normal,
                [](beast::error_code ec) {
                    if (ec) {
                        std::cerr << "[WS] Close failed: " << ec.message() << std::endl;
                    }
                });
            ioc_.restart();
            ioc_.run_for(std::chrono::seconds(1));
        }
        std::cerr << "[WS] " << to_string(subscription_.kind) << " stream closed" << std::endl;
    }

    void handle_error(beast::error_code ec, const char* what) {
        fail(std::string(what) + " failed: " + ec.message()
             + " (code: " + std::to_string(ec.value()) + ", category: " + ec.category().name() + ")");
    }

    void fail(std::string reason) {
        if (closing_ || failure_) return;
        std::cerr << "[WS ERROR] " << reason << std::endl;
        failure_ = std::move(reason);
    }
};

// --- BinanceWSClient Public Interface Implementations ---

BinanceWSClient::BinanceWSClient(IBinanceApi& rest, ApiSettings settings)
    : BinanceWSClient(rest, std::move(settings), Options{}) {}

BinanceWSClient::BinanceWSClient(IBinanceApi& rest, ApiSettings settings, Options opts)
    : rest_(rest), settings_(std::move(settings)), opts_(opts) {}

BinanceWSClient::~BinanceWSClient() = default;

void BinanceWSClient::run(const StreamSubscription& subscription,
                          const SnapshotHandler& on_snapshot,
                          std::stop_token stop) {
    Impl impl(rest_, settings_, opts_, subscription, on_snapshot);
    impl.run(stop);
}

std::string BinanceWSClient::stream_path(const StreamSubscription& subscription, const std::string& listen_key) {
    const std::string symbol = lowercase(subscription.symbol);
    switch (subscription.kind) {
        case StreamKind::OrderBook:
            return "/ws/" + symbol + "@depth@100ms";
        case StreamKind::Candlesticks:
            return "/ws/" + symbol + "@kline_" + std::string(to_string(subscription.interval.value_or(kDefaultInterval)));
        case StreamKind::Trades:
            return "/ws/" + symbol + "@aggTrade";
        case StreamKind::UserData:
            break;
    }
    if (listen_key.empty()) {
        throw std::invalid_argument("a listen key is required for the user data stream");
    }
    return "/ws/" + listen_key;
}
