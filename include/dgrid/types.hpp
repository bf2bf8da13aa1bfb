#pragma once
#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>

namespace dgrid {

using Amount   = uint64_t;  // scaled by kScale
using Price    = uint64_t;  // quote per base, scaled by kScale
using Shares   = uint64_t;
using Bps      = uint64_t;
using OrderId  = uint64_t;
using ObjectId = uint64_t;  // vaults, positions, books, configs, markets
using Address  = uint64_t;  // caller identity / custody address

// reward_per_share and reward_debt, scaled by kRewardPrecision
using RewardIndex = boost::multiprecision::uint128_t;

inline constexpr uint64_t kScale           = 1'000'000'000ULL;
inline constexpr uint64_t kRewardPrecision = 1'000'000'000'000ULL;
inline constexpr Bps      kBpsDenominator  = 10'000;

enum class Side : uint8_t { Bid = 0, Ask = 1 };

} // namespace dgrid
