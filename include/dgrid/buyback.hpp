#pragma once
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/token.hpp"
#include "dgrid/vault.hpp"

namespace dgrid {

// Token/quote exchange at a constant price with a finite token reserve.
class FixedPriceMarket {
public:
  FixedPriceMarket() = default;

  ObjectId id() const noexcept { return id_; }
  Amount token_reserve() const noexcept { return token_reserve_; }
  Amount quote_reserve() const noexcept { return quote_reserve_; }
  Price price_quote_per_token() const noexcept { return price_; }

  // token_out = quote_in * 1e9 / price, without touching the reserves.
  Result<Amount> quote_buy(Amount quote_in) const;

  // Moves quote_in into the quote reserve and token_out out of the token
  // reserve. The price never moves.
  Result<Amount> buy(Amount quote_in);

private:
  friend class BuybackEngine;
  FixedPriceMarket(ObjectId id, Amount token_reserve, Price price)
    : id_(id), token_reserve_(token_reserve), price_(price) {}

  ObjectId id_{};
  Amount token_reserve_{0};
  Amount quote_reserve_{0};
  Price price_{};
};

struct BuybackParams {
  Bps lp_share_bps{6000};    // fee share returned to LPs
  Bps burn_share_bps{5000};  // share of bought tokens burned
};

// Splits accrued vault fees, buys the incentive token with the buyback part,
// burns a share of it and adds the rest to the vault's reward pool.
class BuybackEngine {
public:
  explicit BuybackEngine(BuybackParams p = {}) : p_(p) {}

  const BuybackParams& params() const noexcept { return p_; }

  // Seeds a new market with freshly minted tokens.
  static Result<FixedPriceMarket> create_market(ObjectId id, TokenIssuer& token, const TreasuryCap& cap,
                                                Amount initial_token_reserve, Price price);

  Result<BuybackRecord> execute(Vault& vault, FixedPriceMarket& market, TokenIssuer& token,
                                const TreasuryCap& cap) const;

private:
  BuybackParams p_{};
};

} // namespace dgrid
