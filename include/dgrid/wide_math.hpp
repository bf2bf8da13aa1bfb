#pragma once
#include <limits>
#include <optional>

#include <boost/multiprecision/cpp_int.hpp>

#include "dgrid/types.hpp"

namespace dgrid {

// Double-width (or wider) intermediate for every multiply-then-divide.
using Wide = boost::multiprecision::uint256_t;

// floor(a * b / d) in 256-bit arithmetic. nullopt when d == 0 or the
// quotient does not fit 64 bits.
inline std::optional<uint64_t> mul_div(uint64_t a, uint64_t b, uint64_t d) {
  if (d == 0) return std::nullopt;
  const Wide q = Wide(a) * Wide(b) / Wide(d);
  if (q > Wide(std::numeric_limits<uint64_t>::max())) return std::nullopt;
  return static_cast<uint64_t>(q);
}

// Same as mul_div, 128-bit accumulator result.
inline std::optional<RewardIndex> mul_div_index(uint64_t a, uint64_t b, uint64_t d) {
  if (d == 0) return std::nullopt;
  const Wide q = Wide(a) * Wide(b) / Wide(d);
  if (q > Wide(std::numeric_limits<RewardIndex>::max())) return std::nullopt;
  return static_cast<RewardIndex>(q);
}

// shares * index / kRewardPrecision, the accrued-reward form used for debt
// snapshots and pending computation.
inline RewardIndex accrued_for(Shares shares, const RewardIndex& index) {
  return static_cast<RewardIndex>(Wide(shares) * Wide(index) / Wide(kRewardPrecision));
}

// Debt snapshot, rounded up: accrued_for - debt_for summed over positions
// never exceeds what was emitted.
inline RewardIndex debt_for(Shares shares, const RewardIndex& index) {
  const Wide num = Wide(shares) * Wide(index);
  const Wide p(kRewardPrecision);
  return static_cast<RewardIndex>((num + p - 1) / p);
}

inline uint64_t bps_of(uint64_t amount, Bps bps) {
  return static_cast<uint64_t>(Wide(amount) * Wide(bps) / Wide(kBpsDenominator));
}

} // namespace dgrid
