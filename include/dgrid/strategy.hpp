#pragma once
#include <cstdint>

#include "dgrid/book.hpp"
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/vault.hpp"

namespace dgrid {

// Immutable once created.
struct StrategyConfig {
  ObjectId id{};
  Bps      spread_bps{50};
  Amount   order_size{1'000'000'000};
  uint32_t num_orders_per_side{2};
  Address  keeper{};
};

// spread_bps must be below 10000, order_size and num_orders non-zero.
Result<StrategyConfig> make_strategy_config(ObjectId id, Bps spread_bps, Amount order_size,
                                            uint32_t num_orders_per_side, Address keeper);

// Moves vault capital onto the book and back.
class StrategyController {
public:
  // Keeper only. Cancels the vault's orders, releases all locked balance,
  // then quotes num_orders_per_side bids and asks at mid -/+ spread, locking
  // the quote cost of each bid and the base size of each ask. Orders the
  // available balance cannot cover are skipped.
  static Result<RebalanceRecord> rebalance(Vault& vault, const StrategyConfig& cfg, OrderBook& book,
                                           Address caller);

  // Sweeps the book's pending fills into the vault: unlocks
  // min(fill, locked) per asset and books the quote fill as accrued fee.
  static Result<SettleRecord> settle(Vault& vault, OrderBook& book);
};

} // namespace dgrid
