#pragma once
#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <optional>
#include <vector>

#include "dgrid/error.hpp"
#include "dgrid/order.hpp"
#include "dgrid/types.hpp"

namespace dgrid {

// Price + total resting size + number of resting orders.
struct LevelSummary {
  Price    price{};
  Amount   total_size{};
  uint32_t order_count{};
};

struct PendingFills {
  Amount base{};
  Amount quote{};
};

// Outcome of one simulated price move.
struct TradeOutcome {
  Price    old_mid{};
  Price    new_mid{};
  uint32_t bids_filled{};
  uint32_t asks_filled{};
  Amount   base_bought{};   // sum of filled bid sizes
  Amount   quote_earned{};  // sum of size * price over filled asks
  std::vector<Order> fills;
};

// Deterministic stand-in for an external order book. Orders rest until the
// reference price gaps through them, at which point they fill completely.
class OrderBook {
public:
  OrderBook(ObjectId id, Price initial_mid) : id_(id), mid_price_(initial_mid) {}

  ObjectId id() const noexcept { return id_; }
  Price mid_price() const noexcept { return mid_price_; }

  // No balance check: the caller must not over-commit.
  OrderId place(Side side, Price price, Amount size, ObjectId owner);

  // Removes every order of `owner` from both sides.
  std::size_t cancel_all(ObjectId owner);

  // Moves the mid by +/- delta (a downward move floors at 1), then fills every
  // ask at or below the new mid (up) or every bid at or above it (down).
  // Rejected with ArithmeticOverflow, leaving the book untouched, when the new
  // mid or the pending accumulators would not fit 64 bits.
  Result<TradeOutcome> simulate_trade(bool up, Price delta);

  // Reads and zeroes the pending accumulators. A second call returns zeros.
  PendingFills take_pending_fills() noexcept;
  PendingFills pending_fills() const noexcept { return {pending_fill_base_, pending_fill_quote_}; }

  std::optional<Price> best_bid() const noexcept;
  std::optional<Price> best_ask() const noexcept;

  std::vector<LevelSummary> depth(Side side, std::size_t levels) const;
  std::vector<Order> orders_of(ObjectId owner) const;

  std::size_t order_count(Side side) const noexcept;
  std::size_t order_count(ObjectId owner) const;
  bool empty(Side side) const noexcept;

private:
  using Queue = std::list<Order>;

  struct Level {
    Queue q;
    Amount total_size{0};
  };

  using BidMap = std::map<Price, Level, std::greater<Price>>;
  using AskMap = std::map<Price, Level, std::less<Price>>;

  ObjectId id_{};
  Price mid_price_{};
  OrderId next_order_id_{1};

  BidMap bids_;
  AskMap asks_;

  Amount pending_fill_base_{0};
  Amount pending_fill_quote_{0};

  template <class Map>
  static std::size_t cancel_owner_in_(Map& side, ObjectId owner);

  template <class Map>
  static void summarize_(const Map& side, std::size_t levels, std::vector<LevelSummary>& out);
};

} // namespace dgrid
