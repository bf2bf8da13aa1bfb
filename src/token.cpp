#include "dgrid/token.hpp"

#include <limits>

namespace dgrid {

std::pair<TokenIssuer, TreasuryCap> TokenIssuer::create(ObjectId id, TokenMetadata meta) {
  return {TokenIssuer(id, std::move(meta)), TreasuryCap(id)};
}

Result<Amount> TokenIssuer::mint(const TreasuryCap& cap, Amount amount) {
  if (!authorizes(cap)) return Result<Amount>::reject(Error::InvalidTreasury);
  if (amount > std::numeric_limits<Amount>::max() - total_supply_ ||
      amount > std::numeric_limits<Amount>::max() - minted_) {
    return Result<Amount>::reject(Error::ArithmeticOverflow);
  }
  total_supply_ += amount;
  minted_ += amount;
  return Result<Amount>::success(amount);
}

Result<Amount> TokenIssuer::mint_to(const TreasuryCap& cap, Address to, Amount amount) {
  auto minted = mint(cap, amount);
  if (!minted) return minted;
  credit(to, minted.value);
  return minted;
}

Result<Amount> TokenIssuer::burn(const TreasuryCap& cap, Amount amount) {
  if (!authorizes(cap)) return Result<Amount>::reject(Error::InvalidTreasury);
  if (amount > total_supply_) return Result<Amount>::reject(Error::InsufficientBalance);
  total_supply_ -= amount;
  burned_ += amount;
  return Result<Amount>::success(amount);
}

void TokenIssuer::credit(Address to, Amount amount) {
  if (amount == 0) return;
  balances_[to] += amount;
}

Amount TokenIssuer::balance_of(Address who) const noexcept {
  auto it = balances_.find(who);
  return (it == balances_.end()) ? Amount{0} : it->second;
}

} // namespace dgrid
