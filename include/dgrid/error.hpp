#pragma once
#include <cstdint>
#include <string_view>
#include <utility>

namespace dgrid {

enum class Status : uint8_t { Ok = 0, Rejected = 1 };

enum class Error : uint8_t {
  None = 0,

  // validation
  ZeroDeposit,
  ZeroShares,
  ZeroAmount,
  InvalidConfig,

  // authorization
  NotKeeper,
  NotOwner,
  InvalidTreasury,

  // consistency
  VaultMismatch,
  UnknownObject,

  // insufficiency
  InsufficientBalance,
  InsufficientFees,
  InsufficientReserve,
  InsufficientRewardPool,
  NothingToClaim,
  NoFeesAccrued,

  ArithmeticOverflow
};

enum class ErrorCategory : uint8_t { None, Validation, Authorization, Consistency, Insufficiency, Arithmetic };

std::string_view to_string(Error e) noexcept;
std::string_view to_string(ErrorCategory c) noexcept;
ErrorCategory category(Error e) noexcept;

// Outcome of one atomic operation: either Ok with a value, or Rejected with
// the reason. A rejected operation has changed nothing.
template <class T>
struct Result {
  Status status{Status::Ok};
  Error  error{Error::None};
  T      value{};

  bool ok() const noexcept { return status == Status::Ok; }
  explicit operator bool() const noexcept { return ok(); }

  static Result success(T v) {
    Result r{};
    r.value = std::move(v);
    return r;
  }

  static Result reject(Error e) {
    Result r{};
    r.status = Status::Rejected;
    r.error = e;
    return r;
  }
};

} // namespace dgrid
