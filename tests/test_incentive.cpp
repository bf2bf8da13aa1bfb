#include <gtest/gtest.h>

#include <vector>

#include "dgrid/incentive.hpp"
#include "dgrid/wide_math.hpp"

namespace {

constexpr dgrid::Amount kEmission = 100'000'000'000ULL;

struct Fixture {
  std::pair<dgrid::TokenIssuer, dgrid::TreasuryCap> issued = dgrid::TokenIssuer::create(1000);
  dgrid::TokenIssuer& token = issued.first;
  dgrid::TreasuryCap& cap = issued.second;
  dgrid::IncentiveAccumulator acc{kEmission};
  dgrid::Vault vault{1};
};

} // namespace

TEST(Incentive, AccrueSpreadsEmissionOverShares) {
  Fixture f;
  auto d = f.vault.deposit(5, 5'000'000'000ULL, 5'000'000'000ULL, 100);
  ASSERT_TRUE(d.ok());

  auto r = f.acc.accrue(f.vault, f.token, f.cap);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value.minted, kEmission);
  EXPECT_EQ(r.value.reward_per_share, dgrid::RewardIndex(10'000'000'000'000ULL));
  EXPECT_EQ(f.vault.reward_per_share(), dgrid::RewardIndex(10'000'000'000'000ULL));
  EXPECT_EQ(f.vault.reward_pool_balance(), kEmission);
  EXPECT_EQ(f.token.balance_of(f.vault.custody_address()), kEmission);

  auto p = dgrid::IncentiveAccumulator::pending(f.vault, d.value.position);
  ASSERT_TRUE(p.ok());
  EXPECT_EQ(p.value, kEmission);
}

TEST(Incentive, AccrueOnEmptyVaultIsNoOp) {
  Fixture f;
  auto r = f.acc.accrue(f.vault, f.token, f.cap);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value.minted, 0u);
  EXPECT_EQ(f.vault.reward_per_share(), dgrid::RewardIndex(0));
  EXPECT_EQ(f.token.total_supply(), 0u);
}

TEST(Incentive, AccrueWithForeignCapRejected) {
  Fixture f;
  auto other = dgrid::TokenIssuer::create(2000);
  ASSERT_TRUE(f.vault.deposit(5, 10, 10, 100).ok());

  auto r = f.acc.accrue(f.vault, f.token, other.second);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error, dgrid::Error::InvalidTreasury);
  EXPECT_EQ(f.vault.reward_per_share(), dgrid::RewardIndex(0));
  EXPECT_EQ(f.token.total_supply(), 0u);
}

TEST(Incentive, ClaimPaysPendingAndResetsDebt) {
  Fixture f;
  auto d = f.vault.deposit(5, 5'000'000'000ULL, 5'000'000'000ULL, 100);
  ASSERT_TRUE(d.ok());
  auto pos = d.value.position;
  ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());

  auto c = f.acc.claim(f.vault, pos, 5, f.token, f.cap);
  ASSERT_TRUE(c.ok());
  EXPECT_EQ(c.value.amount, kEmission);
  EXPECT_EQ(c.value.claimant, 5u);
  EXPECT_EQ(f.token.balance_of(5), kEmission);
  EXPECT_EQ(f.vault.reward_pool_balance(), 0u);

  EXPECT_EQ(dgrid::IncentiveAccumulator::pending(f.vault, pos).value, 0u);

  auto again = f.acc.claim(f.vault, pos, 5, f.token, f.cap);
  EXPECT_FALSE(again.ok());
  EXPECT_EQ(again.error, dgrid::Error::NothingToClaim);
}

TEST(Incentive, ClaimByNonOwnerRejected) {
  Fixture f;
  auto d = f.vault.deposit(5, 5'000'000'000ULL, 5'000'000'000ULL, 100);
  ASSERT_TRUE(d.ok());
  auto pos = d.value.position;
  ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());

  auto c = f.acc.claim(f.vault, pos, 6, f.token, f.cap);
  EXPECT_FALSE(c.ok());
  EXPECT_EQ(c.error, dgrid::Error::NotOwner);
  EXPECT_EQ(f.vault.reward_pool_balance(), kEmission);
  EXPECT_EQ(f.token.balance_of(6), 0u);
}

TEST(Incentive, ClaimBeyondRewardPoolRejected) {
  Fixture f;
  auto d = f.vault.deposit(5, 5'000'000'000ULL, 5'000'000'000ULL, 100);
  ASSERT_TRUE(d.ok());
  ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());

  dgrid::SharePosition inflated = d.value.position;
  inflated.shares *= 2;
  auto c = f.acc.claim(f.vault, inflated, 5, f.token, f.cap);
  EXPECT_FALSE(c.ok());
  EXPECT_EQ(c.error, dgrid::Error::InsufficientRewardPool);
}

TEST(Incentive, PendingForPositionOfOtherVaultRejected) {
  Fixture f;
  dgrid::Vault other{2};
  auto d = other.deposit(5, 10, 10, 100);
  ASSERT_TRUE(d.ok());
  EXPECT_EQ(dgrid::IncentiveAccumulator::pending(f.vault, d.value.position).error,
            dgrid::Error::VaultMismatch);
}

TEST(Incentive, LateDepositorEarnsOnlyLaterEmissions) {
  Fixture f;
  auto a = f.vault.deposit(1, 10'000'000'000ULL, 0, 100);
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());

  auto b = f.vault.deposit(2, 10'000'000'000ULL, 0, 101);
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(b.value.position.shares, 10'000'000'000ULL);
  EXPECT_EQ(dgrid::IncentiveAccumulator::pending(f.vault, b.value.position).value, 0u);

  ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());
  EXPECT_EQ(dgrid::IncentiveAccumulator::pending(f.vault, a.value.position).value, 150'000'000'000ULL);
  EXPECT_EQ(dgrid::IncentiveAccumulator::pending(f.vault, b.value.position).value, 50'000'000'000ULL);
}

TEST(Incentive, RewardIndexMonotoneAndClaimsBoundedByEmissions) {
  Fixture f;
  auto a = f.vault.deposit(1, 3'000'000'000ULL, 0, 100);
  auto b = f.vault.deposit(2, 0, 7'000'000'001ULL, 101);
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  auto pa = a.value.position;
  auto pb = b.value.position;

  dgrid::RewardIndex last = f.vault.reward_per_share();
  dgrid::Amount emitted = 0;
  dgrid::Amount claimed = 0;

  for (int round = 0; round < 5; ++round) {
    auto r = f.acc.accrue(f.vault, f.token, f.cap);
    ASSERT_TRUE(r.ok());
    emitted += r.value.minted;
    EXPECT_GE(f.vault.reward_per_share(), last);
    last = f.vault.reward_per_share();

    auto& pos = (round % 2 == 0) ? pa : pb;
    auto c = f.acc.claim(f.vault, pos, pos.owner, f.token, f.cap);
    ASSERT_TRUE(c.ok());
    claimed += c.value.amount;
    EXPECT_LE(claimed, emitted);
  }

  for (auto* pos : {&pa, &pb}) {
    auto c = f.acc.claim(f.vault, *pos, pos->owner, f.token, f.cap);
    if (c.ok()) claimed += c.value.amount;
  }
  EXPECT_LE(claimed, emitted);
  EXPECT_EQ(emitted - claimed, f.vault.reward_pool_balance());
}

TEST(Incentive, DebtSnapshotRoundsUp) {
  EXPECT_EQ(dgrid::accrued_for(3, dgrid::RewardIndex(1)), dgrid::RewardIndex(0));
  EXPECT_EQ(dgrid::debt_for(3, dgrid::RewardIndex(1)), dgrid::RewardIndex(1));
  EXPECT_EQ(dgrid::debt_for(10'000'000'000ULL, dgrid::RewardIndex(10'000'000'000'000ULL)),
            dgrid::RewardIndex(100'000'000'000ULL));
}

TEST(Incentive, PendingNeverExceedsPoolWithInterleavedDeposits) {
  Fixture f;
  const dgrid::Amount deposits[][2] = {
      {1'000'000'000ULL, 3'700'000'000ULL}, {2'300'000'000ULL, 10'000'000'000ULL},
      {9'100'000'007ULL, 1'000'000'003ULL}, {4'444'444'444ULL, 5'555'555'555ULL},
      {1'234'567'891ULL, 7'654'321'019ULL}, {6'666'666'667ULL, 2'000'000'001ULL}};

  std::vector<dgrid::SharePosition> positions;
  dgrid::ObjectId next = 100;
  for (const auto& d : deposits) {
    auto r = f.vault.deposit(static_cast<dgrid::Address>(next), d[0], d[1], next);
    ++next;
    ASSERT_TRUE(r.ok());
    positions.push_back(r.value.position);
    ASSERT_TRUE(f.acc.accrue(f.vault, f.token, f.cap).ok());

    dgrid::Amount owed = 0;
    for (const auto& p : positions) owed += dgrid::IncentiveAccumulator::pending(f.vault, p).value;
    EXPECT_LE(owed, f.vault.reward_pool_balance());
  }

  for (auto& p : positions) {
    auto c = f.acc.claim(f.vault, p, p.owner, f.token, f.cap);
    ASSERT_TRUE(c.ok()) << dgrid::to_string(c.error);
  }
}

TEST(Incentive, SmallEmissionRoundingStaysWithinPool) {
  auto issued = dgrid::TokenIssuer::create(1000);
  dgrid::IncentiveAccumulator acc{7};
  dgrid::Vault v{1};

  std::vector<dgrid::SharePosition> positions;
  const dgrid::Amount sizes[] = {3, 11, 5, 17, 2, 29, 13};
  dgrid::ObjectId next = 100;
  for (dgrid::Amount s : sizes) {
    auto r = v.deposit(1, s, 0, next++);
    ASSERT_TRUE(r.ok());
    positions.push_back(r.value.position);
    ASSERT_TRUE(acc.accrue(v, issued.first, issued.second).ok());

    dgrid::Amount owed = 0;
    for (const auto& p : positions) owed += dgrid::IncentiveAccumulator::pending(v, p).value;
    EXPECT_LE(owed, v.reward_pool_balance());
  }
}
