#include "Core/OrderBook.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

OrderBook::OrderBook(std::string symbol) : symbol_(std::move(symbol)) {}

void OrderBook::initialize(std::uint64_t last_update_id, const std::vector<Order>& snapshot) noexcept {
    // Writer lock: the snapshot replaces both sides atomically for readers.
    std::unique_lock lock(mtx_);

    bids_.clear();
    asks_.clear();

    for (const auto& order : snapshot) {
        apply_unlocked(order);
    }
    last_update_id_ = last_update_id;
    initialized_ = true;

    if (bids_.empty() || asks_.empty()) {
        std::cerr << "[BOOK] Warning: " << symbol_ << " initialized with empty side(s)\n";
    }
}

OrderBook::UpdateResult OrderBook::update(std::uint64_t first_update_id,
                                          std::uint64_t final_update_id,
                                          const std::vector<Order>& orders) noexcept {
    std::unique_lock lock(mtx_);

    if (!initialized_) {
        return UpdateResult::Gap;
    }
    // Already covered by the snapshot (or a previous event).
    if (final_update_id <= last_update_id_) {
        return UpdateResult::Stale;
    }
    // The event must pick up exactly where the book left off.
    if (first_update_id > last_update_id_ + 1) {
        return UpdateResult::Gap;
    }

    for (const auto& order : orders) {
        apply_unlocked(order);
    }
    last_update_id_ = final_update_id;
    return UpdateResult::Applied;
}

void OrderBook::apply_unlocked(const Order& order) {
    auto& side = order.is_bid ? bids_ : asks_;
    if (order.amount <= 0.0) {
        side.erase(order.price);
    } else {
        side.insert_or_assign(order.price, order.amount);
    }
}

OrderBookSnapshot OrderBook::snapshot(std::size_t depth) const {
    std::shared_lock lock(mtx_);

    OrderBookSnapshot out;
    out.symbol = symbol_;
    out.last_update_id = last_update_id_;
    out.bids.reserve(std::min(depth, bids_.size()));
    out.asks.reserve(std::min(depth, asks_.size()));

    for (auto it = bids_.rbegin(); it != bids_.rend() && out.bids.size() < depth; ++it) {
        out.bids.push_back({it->first, it->second});
    }
    for (auto it = asks_.begin(); it != asks_.end() && out.asks.size() < depth; ++it) {
        out.asks.push_back({it->first, it->second});
    }
    return out;
}

std::pair<double, double> OrderBook::get_bbo() const noexcept {
    std::shared_lock lock(mtx_);
    const double best_bid = bids_.empty() ? 0.0 : bids_.rbegin()->first;
    const double best_ask = asks_.empty() ? 0.0 : asks_.begin()->first;
    return {best_bid, best_ask};
}

bool OrderBook::initialized() const noexcept {
    std::shared_lock lock(mtx_);
    return initialized_;
}

std::uint64_t OrderBook::last_update_id() const noexcept {
    std::shared_lock lock(mtx_);
    return last_update_id_;
}
