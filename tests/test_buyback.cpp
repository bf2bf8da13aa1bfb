#include <gtest/gtest.h>

#include "dgrid/buyback.hpp"
#include "dgrid/strategy.hpp"

namespace {

constexpr dgrid::Amount kReserve = 1'000'000'000'000'000ULL;
constexpr dgrid::Price kTokenPrice = 100'000'000ULL;  // 0.1 quote per token

// Books `amount` of quote as accrued fee through a filled ask at price 1.
void accrue_fees(dgrid::Vault& v, dgrid::Amount amount) {
  dgrid::OrderBook ob{50, 1'000'000'000ULL};
  ob.place(dgrid::Side::Ask, 1'000'000'000ULL, amount, v.id());
  ASSERT_TRUE(ob.simulate_trade(true, 0).ok());
  ASSERT_TRUE(dgrid::StrategyController::settle(v, ob).ok());
}

struct Fixture {
  std::pair<dgrid::TokenIssuer, dgrid::TreasuryCap> issued = dgrid::TokenIssuer::create(1000);
  dgrid::TokenIssuer& token = issued.first;
  dgrid::TreasuryCap& cap = issued.second;
  dgrid::BuybackEngine engine{};
  dgrid::Vault vault{1};
  dgrid::FixedPriceMarket market;

  explicit Fixture(dgrid::Amount reserve = kReserve) {
    auto m = dgrid::BuybackEngine::create_market(2, token, cap, reserve, kTokenPrice);
    EXPECT_TRUE(m.ok());
    market = m.value;
  }
};

} // namespace

TEST(Buyback, CreateMarketMintsReserve) {
  Fixture f;
  EXPECT_EQ(f.market.id(), 2u);
  EXPECT_EQ(f.market.token_reserve(), kReserve);
  EXPECT_EQ(f.market.quote_reserve(), 0u);
  EXPECT_EQ(f.token.total_supply(), kReserve);
}

TEST(Buyback, CreateMarketValidation) {
  auto issued = dgrid::TokenIssuer::create(1000);
  auto other = dgrid::TokenIssuer::create(2000);

  EXPECT_EQ(dgrid::BuybackEngine::create_market(2, issued.first, issued.second, 10, 0).error,
            dgrid::Error::InvalidConfig);
  EXPECT_EQ(dgrid::BuybackEngine::create_market(2, issued.first, other.second, 10, kTokenPrice).error,
            dgrid::Error::InvalidTreasury);
  EXPECT_EQ(issued.first.total_supply(), 0u);
}

TEST(Buyback, QuoteBuyUsesFixedPrice) {
  Fixture f;
  EXPECT_EQ(f.market.quote_buy(400'000'000ULL).value, 4'000'000'000ULL);
  EXPECT_EQ(f.market.quote_buy(0).error, dgrid::Error::ZeroAmount);
}

TEST(Buyback, SplitsFeesBuysAndBurns) {
  Fixture f;
  ASSERT_TRUE(f.vault.deposit(5, 1'000'000'000ULL, 1'000'000'000ULL, 100).ok());
  accrue_fees(f.vault, 1'000'000'000ULL);
  ASSERT_EQ(f.vault.accrued_fee_quote(), 1'000'000'000ULL);

  auto r = f.engine.execute(f.vault, f.market, f.token, f.cap);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value.total_fees, 1'000'000'000ULL);
  EXPECT_EQ(r.value.lp_portion, 600'000'000ULL);
  EXPECT_EQ(r.value.buyback_portion, 400'000'000ULL);
  EXPECT_EQ(r.value.quote_spent, 400'000'000ULL);
  EXPECT_EQ(r.value.tokens_bought, 4'000'000'000ULL);
  EXPECT_EQ(r.value.tokens_burned, 2'000'000'000ULL);
  EXPECT_EQ(r.value.tokens_to_rewards, 2'000'000'000ULL);

  EXPECT_EQ(f.vault.accrued_fee_quote(), 0u);
  EXPECT_EQ(f.vault.quote_balance(), 1'600'000'000ULL);
  EXPECT_EQ(f.vault.reward_pool_balance(), 2'000'000'000ULL);
  EXPECT_EQ(f.token.balance_of(f.vault.custody_address()), 2'000'000'000ULL);

  EXPECT_EQ(f.market.quote_reserve(), 400'000'000ULL);
  EXPECT_EQ(f.market.token_reserve(), kReserve - 4'000'000'000ULL);
  EXPECT_EQ(f.market.price_quote_per_token(), kTokenPrice);

  EXPECT_EQ(f.token.total_burned(), 2'000'000'000ULL);
  EXPECT_EQ(f.token.total_supply(), kReserve - 2'000'000'000ULL);
}

TEST(Buyback, BurnsHalfOfFourMillionTokens) {
  Fixture f;
  accrue_fees(f.vault, 1'000'000ULL);

  auto r = f.engine.execute(f.vault, f.market, f.token, f.cap);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value.buyback_portion, 400'000ULL);
  EXPECT_EQ(r.value.tokens_bought, 4'000'000ULL);
  EXPECT_EQ(r.value.tokens_burned, 2'000'000ULL);
  EXPECT_EQ(r.value.tokens_to_rewards, 2'000'000ULL);
}

TEST(Buyback, ConservesQuoteAndTokens) {
  Fixture f;
  accrue_fees(f.vault, 1'234'567ULL);

  auto r = f.engine.execute(f.vault, f.market, f.token, f.cap);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value.lp_portion + r.value.buyback_portion, r.value.total_fees);
  EXPECT_EQ(r.value.quote_spent, r.value.buyback_portion);
  EXPECT_EQ(r.value.tokens_bought, r.value.quote_spent * 1'000'000'000ULL / kTokenPrice);
  EXPECT_EQ(r.value.tokens_burned + r.value.tokens_to_rewards, r.value.tokens_bought);
}

TEST(Buyback, NoFeesRejected) {
  Fixture f;
  auto r = f.engine.execute(f.vault, f.market, f.token, f.cap);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error, dgrid::Error::NoFeesAccrued);
}

TEST(Buyback, ForeignCapRejected) {
  Fixture f;
  auto other = dgrid::TokenIssuer::create(2000);
  accrue_fees(f.vault, 1'000'000ULL);

  auto r = f.engine.execute(f.vault, f.market, f.token, other.second);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error, dgrid::Error::InvalidTreasury);
  EXPECT_EQ(f.vault.accrued_fee_quote(), 1'000'000ULL);
}

TEST(Buyback, ShallowReserveRejectedWithoutSideEffects) {
  Fixture f{1'000'000'000ULL};
  accrue_fees(f.vault, 1'000'000'000ULL);

  auto r = f.engine.execute(f.vault, f.market, f.token, f.cap);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error, dgrid::Error::InsufficientReserve);

  EXPECT_EQ(f.vault.accrued_fee_quote(), 1'000'000'000ULL);
  EXPECT_EQ(f.vault.quote_balance(), 0u);
  EXPECT_EQ(f.market.token_reserve(), 1'000'000'000ULL);
  EXPECT_EQ(f.token.total_burned(), 0u);
}

TEST(Buyback, ReturnedFeesRaiseShareValue) {
  Fixture f;
  ASSERT_TRUE(f.vault.deposit(5, 1, 0, 100).ok());
  accrue_fees(f.vault, 1'000'000ULL);
  ASSERT_TRUE(f.engine.execute(f.vault, f.market, f.token, f.cap).ok());
  EXPECT_EQ(f.vault.quote_balance(), 600'000ULL);

  // one share now backs 600001 units, so a 1-unit deposit mints nothing
  auto d = f.vault.deposit(6, 1, 0, 101);
  EXPECT_FALSE(d.ok());
  EXPECT_EQ(d.error, dgrid::Error::ZeroShares);
  EXPECT_EQ(f.vault.total_shares(), 1u);
}
