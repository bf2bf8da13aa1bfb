#include "dgrid/error.hpp"

namespace dgrid {

std::string_view to_string(Error e) noexcept {
  switch (e) {
    case Error::None:                   return "None";
    case Error::ZeroDeposit:            return "ZeroDeposit";
    case Error::ZeroShares:             return "ZeroShares";
    case Error::ZeroAmount:             return "ZeroAmount";
    case Error::InvalidConfig:          return "InvalidConfig";
    case Error::NotKeeper:              return "NotKeeper";
    case Error::NotOwner:               return "NotOwner";
    case Error::InvalidTreasury:        return "InvalidTreasury";
    case Error::VaultMismatch:          return "VaultMismatch";
    case Error::UnknownObject:          return "UnknownObject";
    case Error::InsufficientBalance:    return "InsufficientBalance";
    case Error::InsufficientFees:       return "InsufficientFees";
    case Error::InsufficientReserve:    return "InsufficientReserve";
    case Error::InsufficientRewardPool: return "InsufficientRewardPool";
    case Error::NothingToClaim:         return "NothingToClaim";
    case Error::NoFeesAccrued:          return "NoFeesAccrued";
    case Error::ArithmeticOverflow:     return "ArithmeticOverflow";
  }
  return "Unknown";
}

std::string_view to_string(ErrorCategory c) noexcept {
  switch (c) {
    case ErrorCategory::None:          return "None";
    case ErrorCategory::Validation:    return "Validation";
    case ErrorCategory::Authorization: return "Authorization";
    case ErrorCategory::Consistency:   return "Consistency";
    case ErrorCategory::Insufficiency: return "Insufficiency";
    case ErrorCategory::Arithmetic:    return "Arithmetic";
  }
  return "Unknown";
}

ErrorCategory category(Error e) noexcept {
  switch (e) {
    case Error::None:
      return ErrorCategory::None;
    case Error::ZeroDeposit:
    case Error::ZeroShares:
    case Error::ZeroAmount:
    case Error::InvalidConfig:
      return ErrorCategory::Validation;
    case Error::NotKeeper:
    case Error::NotOwner:
    case Error::InvalidTreasury:
      return ErrorCategory::Authorization;
    case Error::VaultMismatch:
    case Error::UnknownObject:
      return ErrorCategory::Consistency;
    case Error::InsufficientBalance:
    case Error::InsufficientFees:
    case Error::InsufficientReserve:
    case Error::InsufficientRewardPool:
    case Error::NothingToClaim:
    case Error::NoFeesAccrued:
      return ErrorCategory::Insufficiency;
    case Error::ArithmeticOverflow:
      return ErrorCategory::Arithmetic;
  }
  return ErrorCategory::None;
}

} // namespace dgrid
