#include "dgrid/protocol.hpp"

#include <stdexcept>
#include <utility>

namespace dgrid {

void validate(const ProtocolParams& p) {
  if (p.emission_per_accrue == 0) throw std::invalid_argument("emission_per_accrue must be > 0");
  if (p.lp_share_bps > kBpsDenominator) throw std::invalid_argument("lp_share_bps must be <= 10000");
  if (p.burn_share_bps > kBpsDenominator) throw std::invalid_argument("burn_share_bps must be <= 10000");
}

Protocol::Protocol(ProtocolParams p)
  : Protocol(p, TokenIssuer::create(kIssuerId, p.token)) {}

Protocol::Protocol(ProtocolParams p, std::pair<TokenIssuer, TreasuryCap> issued)
  : params_(std::move(p)),
    token_(std::move(issued.first)),
    cap_(std::move(issued.second)),
    incentive_(params_.emission_per_accrue),
    buyback_(BuybackParams{params_.lp_share_bps, params_.burn_share_bps}) {
  validate(params_);
}

std::optional<TreasuryCap> Protocol::take_treasury_cap() {
  std::optional<TreasuryCap> out = std::move(cap_);
  cap_.reset();
  return out;
}

// ---------------- vault ledger ----------------

ObjectId Protocol::create_vault() {
  const ObjectId id = next_id_();
  vaults_.emplace(id, Vault(id));
  (void)log_.append(VaultCreatedRecord{id});
  return id;
}

Result<DepositRecord> Protocol::deposit(ObjectId vault_id, Address caller, Amount base_amount,
                                        Amount quote_amount) {
  using R = Result<DepositRecord>;

  Vault* v = find_(vaults_, vault_id);
  if (!v) return R::reject(Error::UnknownObject);

  auto res = v->deposit(caller, base_amount, quote_amount, next_id_value_);
  if (!res) return R::reject(res.error);

  const ObjectId pos_id = next_id_();
  positions_.emplace(pos_id, res.value.position);
  (void)log_.append(res.value.record);
  return R::success(res.value.record);
}

Result<WithdrawRecord> Protocol::withdraw(ObjectId vault_id, ObjectId position_id, Address caller) {
  using R = Result<WithdrawRecord>;

  Vault* v = find_(vaults_, vault_id);
  const SharePosition* pos = find_(positions_, position_id);
  if (!v || !pos) return R::reject(Error::UnknownObject);
  if (pos->vault != vault_id) return R::reject(Error::VaultMismatch);
  if (pos->owner != caller) return R::reject(Error::NotOwner);

  auto res = v->withdraw(*pos);
  if (!res) return res;

  positions_.erase(position_id);
  (void)log_.append(res.value);
  return res;
}

// ---------------- strategy / order book ----------------

Result<StrategyConfigRecord> Protocol::create_strategy_config(Bps spread_bps, Amount order_size,
                                                              uint32_t num_orders_per_side, Address keeper) {
  using R = Result<StrategyConfigRecord>;

  auto cfg = make_strategy_config(next_id_value_, spread_bps, order_size, num_orders_per_side, keeper);
  if (!cfg) return R::reject(cfg.error);

  const ObjectId id = next_id_();
  configs_.emplace(id, cfg.value);

  StrategyConfigRecord rec{id, spread_bps, order_size, num_orders_per_side, keeper};
  (void)log_.append(rec);
  return R::success(rec);
}

ObjectId Protocol::create_order_book(Price initial_mid) {
  const ObjectId id = next_id_();
  books_.emplace(id, OrderBook(id, initial_mid));
  (void)log_.append(OrderBookCreatedRecord{id, initial_mid});
  return id;
}

Result<RebalanceRecord> Protocol::rebalance(ObjectId vault_id, ObjectId config_id, ObjectId book_id,
                                            Address caller) {
  Vault* v = find_(vaults_, vault_id);
  const StrategyConfig* cfg = find_(configs_, config_id);
  OrderBook* book = find_(books_, book_id);
  if (!v || !cfg || !book) return Result<RebalanceRecord>::reject(Error::UnknownObject);

  auto res = StrategyController::rebalance(*v, *cfg, *book, caller);
  if (res) (void)log_.append(res.value);
  return res;
}

Result<SettleRecord> Protocol::settle(ObjectId vault_id, ObjectId book_id) {
  Vault* v = find_(vaults_, vault_id);
  OrderBook* book = find_(books_, book_id);
  if (!v || !book) return Result<SettleRecord>::reject(Error::UnknownObject);

  auto res = StrategyController::settle(*v, *book);
  if (res) (void)log_.append(res.value);
  return res;
}

Result<TradeRecord> Protocol::simulate_trade(ObjectId book_id, bool price_up, Price delta) {
  using R = Result<TradeRecord>;

  OrderBook* book = find_(books_, book_id);
  if (!book) return R::reject(Error::UnknownObject);

  auto res = book->simulate_trade(price_up, delta);
  if (!res) return R::reject(res.error);

  const TradeOutcome& t = res.value;
  TradeRecord rec{book_id, price_up, t.old_mid, t.new_mid,
                  t.bids_filled, t.asks_filled, t.base_bought, t.quote_earned};
  (void)log_.append(rec);
  return R::success(rec);
}

// ---------------- incentives ----------------

Result<AccrueRecord> Protocol::accrue_rewards(ObjectId vault_id, const TreasuryCap& cap) {
  Vault* v = find_(vaults_, vault_id);
  if (!v) return Result<AccrueRecord>::reject(Error::UnknownObject);

  auto res = incentive_.accrue(*v, token_, cap);
  // an accrue on an empty vault is a no-op and emits nothing
  if (res && res.value.minted > 0) (void)log_.append(res.value);
  return res;
}

Result<ClaimRecord> Protocol::claim_rewards(ObjectId vault_id, ObjectId position_id, Address caller,
                                            const TreasuryCap& cap) {
  Vault* v = find_(vaults_, vault_id);
  SharePosition* pos = find_(positions_, position_id);
  if (!v || !pos) return Result<ClaimRecord>::reject(Error::UnknownObject);

  auto res = incentive_.claim(*v, *pos, caller, token_, cap);
  if (res) (void)log_.append(res.value);
  return res;
}

// ---------------- buyback ----------------

Result<MarketCreatedRecord> Protocol::create_token_market(const TreasuryCap& cap, Amount initial_token_reserve,
                                                          Price price) {
  using R = Result<MarketCreatedRecord>;

  auto m = BuybackEngine::create_market(next_id_value_, token_, cap, initial_token_reserve, price);
  if (!m) return R::reject(m.error);

  const ObjectId id = next_id_();
  markets_.emplace(id, m.value);

  MarketCreatedRecord rec{id, m.value.token_reserve(), m.value.price_quote_per_token()};
  (void)log_.append(rec);
  return R::success(rec);
}

Result<BuybackRecord> Protocol::execute_buyback(ObjectId vault_id, ObjectId market_id, const TreasuryCap& cap) {
  Vault* v = find_(vaults_, vault_id);
  FixedPriceMarket* m = find_(markets_, market_id);
  if (!v || !m) return Result<BuybackRecord>::reject(Error::UnknownObject);

  auto res = buyback_.execute(*v, *m, token_, cap);
  if (res) (void)log_.append(res.value);
  return res;
}

// ---------------- views ----------------

const Vault* Protocol::vault(ObjectId id) const { return find_(vaults_, id); }
const SharePosition* Protocol::position(ObjectId id) const { return find_(positions_, id); }
const OrderBook* Protocol::order_book(ObjectId id) const { return find_(books_, id); }
const StrategyConfig* Protocol::strategy_config(ObjectId id) const { return find_(configs_, id); }
const FixedPriceMarket* Protocol::market(ObjectId id) const { return find_(markets_, id); }

std::vector<SharePosition> Protocol::positions_of(Address owner) const {
  std::vector<SharePosition> out;
  for (const auto& [id, p] : positions_) {
    if (p.owner == owner) out.push_back(p);
  }
  return out;
}

std::vector<SharePosition> Protocol::positions_in(ObjectId vault_id) const {
  std::vector<SharePosition> out;
  for (const auto& [id, p] : positions_) {
    if (p.vault == vault_id) out.push_back(p);
  }
  return out;
}

Result<Amount> Protocol::pending_rewards(ObjectId vault_id, ObjectId position_id) const {
  const Vault* v = find_(vaults_, vault_id);
  const SharePosition* pos = find_(positions_, position_id);
  if (!v || !pos) return Result<Amount>::reject(Error::UnknownObject);
  return IncentiveAccumulator::pending(*v, *pos);
}

} // namespace dgrid
