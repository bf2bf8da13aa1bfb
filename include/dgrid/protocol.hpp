#pragma once
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "dgrid/book.hpp"
#include "dgrid/buyback.hpp"
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/incentive.hpp"
#include "dgrid/strategy.hpp"
#include "dgrid/token.hpp"
#include "dgrid/vault.hpp"

namespace dgrid {

struct ProtocolParams {
  Amount emission_per_accrue{100'000'000'000};  // 100 GRID
  Bps    lp_share_bps{6000};
  Bps    burn_share_bps{5000};
  TokenMetadata token{};
};

// Throws std::invalid_argument on out-of-range parameters.
void validate(const ProtocolParams& p);

// Arena of every protocol entity, addressed by object id. Each public
// operation is one atomic transition: it either applies completely and
// appends a record to events(), or is rejected and changes nothing.
// Operations on one Protocol must be serialised by the caller.
class Protocol {
public:
  explicit Protocol(ProtocolParams p = {});

  Protocol(const Protocol&) = delete;
  Protocol& operator=(const Protocol&) = delete;
  Protocol(Protocol&&) = default;
  Protocol& operator=(Protocol&&) = default;

  // The mint/burn capability; available exactly once.
  std::optional<TreasuryCap> take_treasury_cap();

  // ---- vault ledger ----
  ObjectId create_vault();
  Result<DepositRecord> deposit(ObjectId vault, Address caller, Amount base_amount, Amount quote_amount);
  Result<WithdrawRecord> withdraw(ObjectId vault, ObjectId position, Address caller);

  // ---- strategy / order book ----
  Result<StrategyConfigRecord> create_strategy_config(Bps spread_bps, Amount order_size,
                                                      uint32_t num_orders_per_side, Address keeper);
  ObjectId create_order_book(Price initial_mid);
  Result<RebalanceRecord> rebalance(ObjectId vault, ObjectId config, ObjectId book, Address caller);
  Result<SettleRecord> settle(ObjectId vault, ObjectId book);
  Result<TradeRecord> simulate_trade(ObjectId book, bool price_up, Price delta);

  // ---- incentives ----
  Result<AccrueRecord> accrue_rewards(ObjectId vault, const TreasuryCap& cap);
  Result<ClaimRecord> claim_rewards(ObjectId vault, ObjectId position, Address caller, const TreasuryCap& cap);

  // ---- buyback ----
  Result<MarketCreatedRecord> create_token_market(const TreasuryCap& cap, Amount initial_token_reserve,
                                                  Price price);
  Result<BuybackRecord> execute_buyback(ObjectId vault, ObjectId market, const TreasuryCap& cap);

  // ---- views ----
  const Vault* vault(ObjectId id) const;
  const SharePosition* position(ObjectId id) const;
  const OrderBook* order_book(ObjectId id) const;
  const StrategyConfig* strategy_config(ObjectId id) const;
  const FixedPriceMarket* market(ObjectId id) const;

  std::vector<SharePosition> positions_of(Address owner) const;
  std::vector<SharePosition> positions_in(ObjectId vault) const;
  Result<Amount> pending_rewards(ObjectId vault, ObjectId position) const;

  const TokenIssuer& token() const noexcept { return token_; }
  const ProtocolParams& params() const noexcept { return params_; }

  EventLog& events() noexcept { return log_; }
  const EventLog& events() const noexcept { return log_; }

private:
  Protocol(ProtocolParams p, std::pair<TokenIssuer, TreasuryCap> issued);

  ObjectId next_id_() noexcept { return next_id_value_++; }

  template <class Map>
  static auto* find_(Map& m, ObjectId id) {
    auto it = m.find(id);
    return (it == m.end()) ? nullptr : &it->second;
  }

  ProtocolParams params_{};

  // object ids sit above the range used for user addresses
  static constexpr ObjectId kIssuerId = ObjectId{1} << 56;
  ObjectId next_id_value_{kIssuerId + 1};

  std::unordered_map<ObjectId, Vault> vaults_;
  std::unordered_map<ObjectId, SharePosition> positions_;
  std::unordered_map<ObjectId, OrderBook> books_;
  std::unordered_map<ObjectId, StrategyConfig> configs_;
  std::unordered_map<ObjectId, FixedPriceMarket> markets_;

  TokenIssuer token_;
  std::optional<TreasuryCap> cap_;

  IncentiveAccumulator incentive_;
  BuybackEngine buyback_;

  EventLog log_;
};

} // namespace dgrid
