#pragma once
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/types.hpp"

namespace dgrid {

// A depositor's claim on one vault. One per deposit; never merged.
struct SharePosition {
  ObjectId    id{};
  ObjectId    vault{};
  Address     owner{};
  Shares      shares{};
  RewardIndex reward_debt{};
};

struct DepositOutcome {
  SharePosition position;
  DepositRecord record;
};

class StrategyController;
class IncentiveAccumulator;
class BuybackEngine;

// Pooled base/quote ledger for one asset pair. Shares are a pro-rata claim on
// the unlocked part of the pool.
//
// Invariants: locked_base <= base_balance, locked_quote <= quote_balance,
// reward_per_share never decreases.
class Vault {
public:
  explicit Vault(ObjectId id) : id_(id) {}

  ObjectId id() const noexcept { return id_; }
  Address custody_address() const noexcept { return static_cast<Address>(id_); }

  Amount base_balance() const noexcept { return base_balance_; }
  Amount quote_balance() const noexcept { return quote_balance_; }
  Shares total_shares() const noexcept { return total_shares_; }
  Amount locked_base() const noexcept { return locked_base_; }
  Amount locked_quote() const noexcept { return locked_quote_; }
  Amount available_base() const noexcept { return base_balance_ - locked_base_; }
  Amount available_quote() const noexcept { return quote_balance_ - locked_quote_; }
  Amount accrued_fee_quote() const noexcept { return accrued_fee_quote_; }
  const RewardIndex& reward_per_share() const noexcept { return reward_per_share_; }
  Amount reward_pool_balance() const noexcept { return reward_pool_balance_; }

  // First deposit mints base + quote shares; later deposits mint
  // (base + quote) * total_shares / (base_balance + quote_balance).
  Result<DepositOutcome> deposit(Address depositor, Amount base_amount, Amount quote_amount,
                                 ObjectId position_id);

  // Pays out the position's share of the available (unlocked) pool and burns
  // all of its shares. The caller destroys the position on success.
  Result<WithdrawRecord> withdraw(const SharePosition& position);

private:
  friend class StrategyController;
  friend class IncentiveAccumulator;
  friend class BuybackEngine;

  // Callers keep amount <= the locked counter; it is not rechecked here.
  void lock_base(Amount amount) noexcept { locked_base_ += amount; }
  void unlock_base(Amount amount) noexcept { locked_base_ -= amount; }
  void lock_quote(Amount amount) noexcept { locked_quote_ += amount; }
  void unlock_quote(Amount amount) noexcept { locked_quote_ -= amount; }

  void add_fee_quote(Amount amount) noexcept { accrued_fee_quote_ += amount; }
  Result<Amount> take_fees(Amount amount);
  void return_quote(Amount amount) noexcept { quote_balance_ += amount; }

  void set_reward_per_share(const RewardIndex& rps) { reward_per_share_ = rps; }
  static void set_share_reward_debt(SharePosition& position, const RewardIndex& debt) {
    position.reward_debt = debt;
  }
  void add_reward_pool(Amount amount) noexcept { reward_pool_balance_ += amount; }
  void deduct_reward_pool(Amount amount) noexcept { reward_pool_balance_ -= amount; }

  ObjectId id_{};

  Amount base_balance_{0};
  Amount quote_balance_{0};
  Shares total_shares_{0};

  Amount locked_base_{0};
  Amount locked_quote_{0};

  Amount accrued_fee_quote_{0};

  RewardIndex reward_per_share_{0};
  Amount reward_pool_balance_{0};
};

} // namespace dgrid
