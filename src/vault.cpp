#include "dgrid/vault.hpp"

#include <limits>
#include <utility>

#include "dgrid/wide_math.hpp"

namespace dgrid {

namespace {

constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

bool add_overflows(uint64_t a, uint64_t b) noexcept {
  return b > kMaxAmount - a;
}

} // namespace

Result<DepositOutcome> Vault::deposit(Address depositor, Amount base_amount, Amount quote_amount,
                                      ObjectId position_id) {
  using R = Result<DepositOutcome>;

  if (base_amount == 0 && quote_amount == 0) return R::reject(Error::ZeroDeposit);
  if (add_overflows(base_balance_, base_amount) || add_overflows(quote_balance_, quote_amount)) {
    return R::reject(Error::ArithmeticOverflow);
  }

  const Wide value = Wide(base_amount) + Wide(quote_amount);
  Wide minted = value;
  if (total_shares_ != 0) {
    const Wide pool = Wide(base_balance_) + Wide(quote_balance_);
    if (pool == 0) return R::reject(Error::ArithmeticOverflow);
    minted = value * Wide(total_shares_) / pool;
  }

  if (minted == 0) return R::reject(Error::ZeroShares);
  if (minted > Wide(kMaxAmount - total_shares_)) return R::reject(Error::ArithmeticOverflow);

  const Shares shares = static_cast<Shares>(minted);

  base_balance_ += base_amount;
  quote_balance_ += quote_amount;
  total_shares_ += shares;

  DepositOutcome out{};
  out.position.id = position_id;
  out.position.vault = id_;
  out.position.owner = depositor;
  out.position.shares = shares;
  out.position.reward_debt = debt_for(shares, reward_per_share_);

  out.record.vault = id_;
  out.record.depositor = depositor;
  out.record.position = position_id;
  out.record.base_amount = base_amount;
  out.record.quote_amount = quote_amount;
  out.record.shares_minted = shares;
  out.record.total_shares = total_shares_;
  return R::success(std::move(out));
}

Result<WithdrawRecord> Vault::withdraw(const SharePosition& position) {
  using R = Result<WithdrawRecord>;

  if (position.vault != id_) return R::reject(Error::VaultMismatch);
  if (position.shares == 0 || position.shares > total_shares_) {
    return R::reject(Error::InsufficientBalance);
  }

  const Amount avail_base = available_base();
  const Amount avail_quote = available_quote();

  const auto base_out = mul_div(position.shares, avail_base, total_shares_);
  const auto quote_out = mul_div(position.shares, avail_quote, total_shares_);
  if (!base_out || !quote_out) return R::reject(Error::ArithmeticOverflow);

  // rounding guard
  if (*base_out > avail_base || *quote_out > avail_quote) {
    return R::reject(Error::InsufficientBalance);
  }

  base_balance_ -= *base_out;
  quote_balance_ -= *quote_out;
  total_shares_ -= position.shares;

  WithdrawRecord rec{};
  rec.vault = id_;
  rec.withdrawer = position.owner;
  rec.position = position.id;
  rec.base_out = *base_out;
  rec.quote_out = *quote_out;
  rec.shares_burned = position.shares;
  rec.total_shares = total_shares_;
  return R::success(rec);
}

Result<Amount> Vault::take_fees(Amount amount) {
  if (amount > accrued_fee_quote_) return Result<Amount>::reject(Error::InsufficientFees);
  accrued_fee_quote_ -= amount;
  return Result<Amount>::success(amount);
}

} // namespace dgrid
