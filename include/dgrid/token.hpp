#pragma once
#include <string>
#include <unordered_map>
#include <utility>

#include "dgrid/error.hpp"
#include "dgrid/types.hpp"

namespace dgrid {

struct TokenMetadata {
  std::string symbol{"GRID"};
  uint8_t     decimals{9};
};

class TokenIssuer;

// Mint/burn authority for one issuer. Move-only: holding it is the permission.
class TreasuryCap {
public:
  TreasuryCap(TreasuryCap&&) noexcept = default;
  TreasuryCap& operator=(TreasuryCap&&) noexcept = default;
  TreasuryCap(const TreasuryCap&) = delete;
  TreasuryCap& operator=(const TreasuryCap&) = delete;

  ObjectId issuer() const noexcept { return issuer_; }

private:
  friend class TokenIssuer;
  explicit TreasuryCap(ObjectId issuer) noexcept : issuer_(issuer) {}

  ObjectId issuer_{};
};

// Supply tracking and per-address balances of the incentive token. Tokens
// returned by mint() are "in hand" (e.g. a market reserve) until credit()
// places them at an address or burn() destroys them.
class TokenIssuer {
public:
  static std::pair<TokenIssuer, TreasuryCap> create(ObjectId id, TokenMetadata meta = {});

  ObjectId id() const noexcept { return id_; }
  const TokenMetadata& metadata() const noexcept { return meta_; }

  bool authorizes(const TreasuryCap& cap) const noexcept { return cap.issuer() == id_; }

  Result<Amount> mint(const TreasuryCap& cap, Amount amount);
  Result<Amount> mint_to(const TreasuryCap& cap, Address to, Amount amount);
  Result<Amount> burn(const TreasuryCap& cap, Amount amount);

  // Moves in-hand tokens to an address; supply is unchanged.
  void credit(Address to, Amount amount);

  Amount balance_of(Address who) const noexcept;
  Amount total_supply() const noexcept { return total_supply_; }
  Amount total_minted() const noexcept { return minted_; }
  Amount total_burned() const noexcept { return burned_; }

private:
  TokenIssuer(ObjectId id, TokenMetadata meta) : id_(id), meta_(std::move(meta)) {}

  ObjectId id_{};
  TokenMetadata meta_{};

  Amount total_supply_{0};
  Amount minted_{0};
  Amount burned_{0};
  std::unordered_map<Address, Amount> balances_;
};

} // namespace dgrid
