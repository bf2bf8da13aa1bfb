#include "dgrid/book.hpp"

#include <limits>

#include "dgrid/wide_math.hpp"

namespace dgrid {

OrderId OrderBook::place(Side side, Price price, Amount size, ObjectId owner) {
  Order o{};
  o.id = next_order_id_++;
  o.side = side;
  o.price = price;
  o.size = size;
  o.owner = owner;

  const OrderId id = o.id;
  if (side == Side::Bid) {
    auto& lvl = bids_[price];
    lvl.total_size += size;
    lvl.q.push_back(std::move(o));
  } else {
    auto& lvl = asks_[price];
    lvl.total_size += size;
    lvl.q.push_back(std::move(o));
  }
  return id;
}

template <class Map>
std::size_t OrderBook::cancel_owner_in_(Map& side, ObjectId owner) {
  std::size_t n = 0;
  for (auto it = side.begin(); it != side.end(); ) {
    auto& lvl = it->second;
    for (auto qit = lvl.q.begin(); qit != lvl.q.end(); ) {
      if (qit->owner == owner) {
        lvl.total_size -= qit->size;
        qit = lvl.q.erase(qit);
        ++n;
      } else {
        ++qit;
      }
    }
    if (lvl.q.empty()) it = side.erase(it);
    else ++it;
  }
  return n;
}

std::size_t OrderBook::cancel_all(ObjectId owner) {
  return cancel_owner_in_(bids_, owner) + cancel_owner_in_(asks_, owner);
}

Result<TradeOutcome> OrderBook::simulate_trade(bool up, Price delta) {
  TradeOutcome out{};
  out.old_mid = mid_price_;

  if (up) {
    if (delta > std::numeric_limits<Price>::max() - mid_price_) {
      return Result<TradeOutcome>::reject(Error::ArithmeticOverflow);
    }
    out.new_mid = mid_price_ + delta;
  } else {
    out.new_mid = (delta >= mid_price_) ? Price{1} : mid_price_ - delta;
  }

  // First pass: totals only, so an overflow leaves the book as it was.
  Wide base = pending_fill_base_;
  Wide quote = pending_fill_quote_;
  if (up) {
    for (auto it = asks_.begin(); it != asks_.end() && it->first <= out.new_mid; ++it) {
      for (const auto& o : it->second.q) {
        quote += Wide(o.size) * Wide(o.price) / Wide(kScale);
        out.asks_filled++;
      }
    }
  } else {
    for (auto it = bids_.begin(); it != bids_.end() && it->first >= out.new_mid; ++it) {
      for (const auto& o : it->second.q) {
        base += Wide(o.size);
        out.bids_filled++;
      }
    }
  }

  const Wide cap(std::numeric_limits<Amount>::max());
  if (base > cap || quote > cap) {
    return Result<TradeOutcome>::reject(Error::ArithmeticOverflow);
  }

  out.base_bought = static_cast<Amount>(base - Wide(pending_fill_base_));
  out.quote_earned = static_cast<Amount>(quote - Wide(pending_fill_quote_));

  // Second pass: commit.
  out.fills.reserve(static_cast<std::size_t>(out.asks_filled) + out.bids_filled);
  if (up) {
    while (!asks_.empty() && asks_.begin()->first <= out.new_mid) {
      for (auto& o : asks_.begin()->second.q) {
        o.filled = o.size;
        out.fills.push_back(o);
      }
      asks_.erase(asks_.begin());
    }
  } else {
    while (!bids_.empty() && bids_.begin()->first >= out.new_mid) {
      for (auto& o : bids_.begin()->second.q) {
        o.filled = o.size;
        out.fills.push_back(o);
      }
      bids_.erase(bids_.begin());
    }
  }

  mid_price_ = out.new_mid;
  pending_fill_base_ = static_cast<Amount>(base);
  pending_fill_quote_ = static_cast<Amount>(quote);
  return Result<TradeOutcome>::success(std::move(out));
}

PendingFills OrderBook::take_pending_fills() noexcept {
  PendingFills f{pending_fill_base_, pending_fill_quote_};
  pending_fill_base_ = 0;
  pending_fill_quote_ = 0;
  return f;
}

std::optional<Price> OrderBook::best_bid() const noexcept {
  if (bids_.empty()) return std::nullopt;
  return bids_.begin()->first;
}

std::optional<Price> OrderBook::best_ask() const noexcept {
  if (asks_.empty()) return std::nullopt;
  return asks_.begin()->first;
}

template <class Map>
void OrderBook::summarize_(const Map& side, std::size_t levels, std::vector<LevelSummary>& out) {
  for (auto it = side.begin(); it != side.end() && out.size() < levels; ++it) {
    const auto& lvl = it->second;
    out.push_back(LevelSummary{it->first, lvl.total_size, static_cast<uint32_t>(lvl.q.size())});
  }
}

std::vector<LevelSummary> OrderBook::depth(Side side, std::size_t levels) const {
  std::vector<LevelSummary> out;
  if (levels == 0) return out;
  out.reserve(levels);

  if (side == Side::Bid) summarize_(bids_, levels, out);
  else summarize_(asks_, levels, out);
  return out;
}

std::vector<Order> OrderBook::orders_of(ObjectId owner) const {
  std::vector<Order> out;
  for (const auto& [px, lvl] : bids_) {
    for (const auto& o : lvl.q) if (o.owner == owner) out.push_back(o);
  }
  for (const auto& [px, lvl] : asks_) {
    for (const auto& o : lvl.q) if (o.owner == owner) out.push_back(o);
  }
  return out;
}

std::size_t OrderBook::order_count(Side side) const noexcept {
  std::size_t n = 0;
  if (side == Side::Bid) {
    for (const auto& [px, lvl] : bids_) n += lvl.q.size();
  } else {
    for (const auto& [px, lvl] : asks_) n += lvl.q.size();
  }
  return n;
}

std::size_t OrderBook::order_count(ObjectId owner) const {
  return orders_of(owner).size();
}

bool OrderBook::empty(Side side) const noexcept {
  return (side == Side::Bid) ? bids_.empty() : asks_.empty();
}

} // namespace dgrid
