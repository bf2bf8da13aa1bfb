#include "dgrid/strategy.hpp"

#include <algorithm>
#include <limits>

#include "dgrid/wide_math.hpp"

namespace dgrid {

Result<StrategyConfig> make_strategy_config(ObjectId id, Bps spread_bps, Amount order_size,
                                            uint32_t num_orders_per_side, Address keeper) {
  if (spread_bps >= kBpsDenominator || order_size == 0 || num_orders_per_side == 0) {
    return Result<StrategyConfig>::reject(Error::InvalidConfig);
  }
  StrategyConfig cfg{};
  cfg.id = id;
  cfg.spread_bps = spread_bps;
  cfg.order_size = order_size;
  cfg.num_orders_per_side = num_orders_per_side;
  cfg.keeper = keeper;
  return Result<StrategyConfig>::success(cfg);
}

Result<RebalanceRecord> StrategyController::rebalance(Vault& vault, const StrategyConfig& cfg,
                                                      OrderBook& book, Address caller) {
  using R = Result<RebalanceRecord>;

  if (caller != cfg.keeper) return R::reject(Error::NotKeeper);

  const Price mid = book.mid_price();
  const Price half_spread = bps_of(mid, cfg.spread_bps);
  if (half_spread > std::numeric_limits<Price>::max() - mid) return R::reject(Error::ArithmeticOverflow);

  const Price bid_px = mid - half_spread;
  const Price ask_px = mid + half_spread;

  const auto bid_cost = mul_div(cfg.order_size, bid_px, kScale);
  if (!bid_cost) return R::reject(Error::ArithmeticOverflow);

  RebalanceRecord rec{};
  rec.vault = vault.id();
  rec.book = book.id();
  rec.mid_price = mid;
  rec.bid_price = bid_px;
  rec.ask_price = ask_px;

  // start from a clean slate: no resting orders, nothing locked
  rec.orders_cancelled = static_cast<uint32_t>(book.cancel_all(vault.id()));
  vault.unlock_base(vault.locked_base());
  vault.unlock_quote(vault.locked_quote());

  for (uint32_t i = 0; i < cfg.num_orders_per_side; ++i) {
    if (*bid_cost <= vault.available_quote()) {
      (void)book.place(Side::Bid, bid_px, cfg.order_size, vault.id());
      vault.lock_quote(*bid_cost);
      rec.bids_placed++;
    }
    if (cfg.order_size <= vault.available_base()) {
      (void)book.place(Side::Ask, ask_px, cfg.order_size, vault.id());
      vault.lock_base(cfg.order_size);
      rec.asks_placed++;
    }
  }

  rec.orders_placed = rec.bids_placed + rec.asks_placed;
  return R::success(rec);
}

Result<SettleRecord> StrategyController::settle(Vault& vault, OrderBook& book) {
  using R = Result<SettleRecord>;

  const PendingFills peek = book.pending_fills();
  if (peek.quote > std::numeric_limits<Amount>::max() - vault.accrued_fee_quote()) {
    return R::reject(Error::ArithmeticOverflow);
  }

  const PendingFills fills = book.take_pending_fills();

  SettleRecord rec{};
  rec.vault = vault.id();
  rec.book = book.id();
  rec.base_returned = fills.base;
  rec.quote_earned = fills.quote;
  rec.base_unlocked = std::min(fills.base, vault.locked_base());
  rec.quote_unlocked = std::min(fills.quote, vault.locked_quote());

  vault.unlock_base(rec.base_unlocked);
  vault.unlock_quote(rec.quote_unlocked);
  if (fills.quote > 0) vault.add_fee_quote(fills.quote);

  return R::success(rec);
}

} // namespace dgrid
