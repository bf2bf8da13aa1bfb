#pragma once
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/token.hpp"
#include "dgrid/vault.hpp"

namespace dgrid {

// Reward-per-share emission: each accrue mints a fixed emission and spreads it
// over the current shares through the vault's accumulator, so a position's
// pending reward is shares * reward_per_share / 1e12 - reward_debt.
class IncentiveAccumulator {
public:
  explicit IncentiveAccumulator(Amount emission_per_accrue) : emission_(emission_per_accrue) {}

  Amount emission_per_accrue() const noexcept { return emission_; }

  // No-op (minted == 0) on a vault without shares.
  Result<AccrueRecord> accrue(Vault& vault, TokenIssuer& token, const TreasuryCap& cap) const;

  static Result<Amount> pending(const Vault& vault, const SharePosition& position);

  // Pays the pending reward to the claimant and snapshots the position's debt
  // to the current accumulator.
  Result<ClaimRecord> claim(Vault& vault, SharePosition& position, Address claimant,
                            TokenIssuer& token, const TreasuryCap& cap) const;

private:
  Amount emission_{};
};

} // namespace dgrid
