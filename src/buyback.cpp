#include "dgrid/buyback.hpp"

#include <limits>

#include "dgrid/wide_math.hpp"

namespace dgrid {

namespace {

constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

} // namespace

Result<Amount> FixedPriceMarket::quote_buy(Amount quote_in) const {
  if (quote_in == 0) return Result<Amount>::reject(Error::ZeroAmount);

  const auto token_out = mul_div(quote_in, kScale, price_);
  if (!token_out) return Result<Amount>::reject(Error::ArithmeticOverflow);
  if (*token_out > token_reserve_) return Result<Amount>::reject(Error::InsufficientReserve);
  if (quote_in > kMaxAmount - quote_reserve_) return Result<Amount>::reject(Error::ArithmeticOverflow);
  return Result<Amount>::success(*token_out);
}

Result<Amount> FixedPriceMarket::buy(Amount quote_in) {
  auto out = quote_buy(quote_in);
  if (!out) return out;
  quote_reserve_ += quote_in;
  token_reserve_ -= out.value;
  return out;
}

Result<FixedPriceMarket> BuybackEngine::create_market(ObjectId id, TokenIssuer& token, const TreasuryCap& cap,
                                                      Amount initial_token_reserve, Price price) {
  if (price == 0) return Result<FixedPriceMarket>::reject(Error::InvalidConfig);

  auto seeded = token.mint(cap, initial_token_reserve);
  if (!seeded) return Result<FixedPriceMarket>::reject(seeded.error);

  return Result<FixedPriceMarket>::success(FixedPriceMarket(id, seeded.value, price));
}

Result<BuybackRecord> BuybackEngine::execute(Vault& vault, FixedPriceMarket& market, TokenIssuer& token,
                                             const TreasuryCap& cap) const {
  using R = Result<BuybackRecord>;

  const Amount total = vault.accrued_fee_quote();
  if (total == 0) return R::reject(Error::NoFeesAccrued);
  if (!token.authorizes(cap)) return R::reject(Error::InvalidTreasury);

  BuybackRecord rec{};
  rec.vault = vault.id();
  rec.market = market.id();
  rec.total_fees = total;
  rec.lp_portion = bps_of(total, p_.lp_share_bps);
  rec.buyback_portion = total - rec.lp_portion;

  // Validate every leg before touching any state.
  if (rec.lp_portion > kMaxAmount - vault.quote_balance()) return R::reject(Error::ArithmeticOverflow);

  const auto preview = market.quote_buy(rec.buyback_portion);
  if (!preview) return R::reject(preview.error);

  const Amount burned = bps_of(preview.value, p_.burn_share_bps);
  const Amount to_rewards = preview.value - burned;
  if (to_rewards > kMaxAmount - vault.reward_pool_balance()) return R::reject(Error::ArithmeticOverflow);

  auto fees = vault.take_fees(total);
  if (!fees) return R::reject(fees.error);
  vault.return_quote(rec.lp_portion);

  auto bought = market.buy(rec.buyback_portion);
  if (!bought) return R::reject(bought.error);  // unreachable: quote_buy passed above

  auto burn = token.burn(cap, burned);
  if (!burn) return R::reject(burn.error);  // unreachable: the burned tokens are part of supply

  token.credit(vault.custody_address(), to_rewards);
  vault.add_reward_pool(to_rewards);

  rec.quote_spent = rec.buyback_portion;
  rec.tokens_bought = bought.value;
  rec.tokens_burned = burn.value;
  rec.tokens_to_rewards = to_rewards;
  return R::success(rec);
}

} // namespace dgrid
