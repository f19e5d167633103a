#pragma once

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "Core/MarketTypes.hpp"

// Local depth book for one symbol, seeded from a REST snapshot and kept
// current with the venue's diff-depth events.
class OrderBook {
public:
    struct Order {
        double price;
        double amount; // absolute quantity at this level; 0 removes the level
        bool is_bid;   // true for bid, false for ask

        Order(double p, double a, bool bid) : price(p), amount(a), is_bid(bid) {}
        Order() : price(0.0), amount(0.0), is_bid(false) {}
    };

    enum class UpdateResult {
        Applied,
        Stale, // every change in the event is already part of the book
        Gap    // events were missed; the book must be re-seeded
    };

    explicit OrderBook(std::string symbol);

    // Replace the book with a snapshot taken at `last_update_id`.
    void initialize(std::uint64_t last_update_id, const std::vector<Order>& snapshot) noexcept;

    // Apply one diff event covering update ids [first_update_id, final_update_id].
    UpdateResult update(std::uint64_t first_update_id, std::uint64_t final_update_id,
                        const std::vector<Order>& orders) noexcept;

    [[nodiscard]] OrderBookSnapshot snapshot(std::size_t depth) const;
    [[nodiscard]] std::pair<double, double> get_bbo() const noexcept; // (highest bid, lowest ask)
    [[nodiscard]] bool initialized() const noexcept;
    [[nodiscard]] std::uint64_t last_update_id() const noexcept;
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

private:
    // Keyed by price; bids are read from rbegin() so the best level comes first.
    using BookSide = std::map<double, double>;

    void apply_unlocked(const Order& order);

    std::string symbol_;
    BookSide bids_;
    BookSide asks_;
    std::uint64_t last_update_id_{0};
    bool initialized_{false};

    // Multiple readers (snapshot for the console) or a single writer (the stream worker).
    mutable std::shared_mutex mtx_;
};
