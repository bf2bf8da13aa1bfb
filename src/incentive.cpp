#include "dgrid/incentive.hpp"

#include <limits>

#include "dgrid/wide_math.hpp"

namespace dgrid {

Result<AccrueRecord> IncentiveAccumulator::accrue(Vault& vault, TokenIssuer& token,
                                                  const TreasuryCap& cap) const {
  using R = Result<AccrueRecord>;

  AccrueRecord rec{};
  rec.vault = vault.id();
  rec.reward_per_share = vault.reward_per_share();
  if (vault.total_shares() == 0) return R::success(rec);

  if (!token.authorizes(cap)) return R::reject(Error::InvalidTreasury);

  const auto increase = mul_div_index(emission_, kRewardPrecision, vault.total_shares());
  if (!increase) return R::reject(Error::ArithmeticOverflow);
  if (*increase > std::numeric_limits<RewardIndex>::max() - vault.reward_per_share()) {
    return R::reject(Error::ArithmeticOverflow);
  }
  if (emission_ > std::numeric_limits<Amount>::max() - vault.reward_pool_balance()) {
    return R::reject(Error::ArithmeticOverflow);
  }

  // emission lands in the vault's custody as the reward pool
  auto minted = token.mint_to(cap, vault.custody_address(), emission_);
  if (!minted) return R::reject(minted.error);

  vault.set_reward_per_share(vault.reward_per_share() + *increase);
  vault.add_reward_pool(minted.value);

  rec.minted = minted.value;
  rec.reward_per_share = vault.reward_per_share();
  return R::success(rec);
}

Result<Amount> IncentiveAccumulator::pending(const Vault& vault, const SharePosition& position) {
  if (position.vault != vault.id()) return Result<Amount>::reject(Error::VaultMismatch);

  const RewardIndex accrued = accrued_for(position.shares, vault.reward_per_share());
  if (accrued <= position.reward_debt) return Result<Amount>::success(0);

  const RewardIndex owed = accrued - position.reward_debt;
  if (owed > RewardIndex(std::numeric_limits<Amount>::max())) {
    return Result<Amount>::reject(Error::ArithmeticOverflow);
  }
  return Result<Amount>::success(static_cast<Amount>(owed));
}

Result<ClaimRecord> IncentiveAccumulator::claim(Vault& vault, SharePosition& position, Address claimant,
                                                TokenIssuer& token, const TreasuryCap& cap) const {
  using R = Result<ClaimRecord>;

  const auto owed = pending(vault, position);
  if (!owed) return R::reject(owed.error);
  if (claimant != position.owner) return R::reject(Error::NotOwner);
  if (owed.value == 0) return R::reject(Error::NothingToClaim);
  if (owed.value > vault.reward_pool_balance()) return R::reject(Error::InsufficientRewardPool);

  auto paid = token.mint_to(cap, claimant, owed.value);
  if (!paid) return R::reject(paid.error);

  Vault::set_share_reward_debt(position, debt_for(position.shares, vault.reward_per_share()));
  vault.deduct_reward_pool(paid.value);

  ClaimRecord rec{};
  rec.vault = vault.id();
  rec.claimant = claimant;
  rec.position = position.id;
  rec.amount = paid.value;
  return R::success(rec);
}

} // namespace dgrid
