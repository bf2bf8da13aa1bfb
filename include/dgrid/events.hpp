#pragma once
#include <cstddef>
#include <functional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "dgrid/types.hpp"

namespace dgrid {

struct VaultCreatedRecord {
  ObjectId vault{};
};

struct DepositRecord {
  ObjectId vault{};
  Address  depositor{};
  ObjectId position{};
  Amount   base_amount{};
  Amount   quote_amount{};
  Shares   shares_minted{};
  Shares   total_shares{};
};

struct WithdrawRecord {
  ObjectId vault{};
  Address  withdrawer{};
  ObjectId position{};
  Amount   base_out{};
  Amount   quote_out{};
  Shares   shares_burned{};
  Shares   total_shares{};
};

struct StrategyConfigRecord {
  ObjectId config{};
  Bps      spread_bps{};
  Amount   order_size{};
  uint32_t num_orders_per_side{};
  Address  keeper{};
};

struct RebalanceRecord {
  ObjectId vault{};
  ObjectId book{};
  Price    mid_price{};
  Price    bid_price{};
  Price    ask_price{};
  uint32_t orders_placed{};
  uint32_t bids_placed{};
  uint32_t asks_placed{};
  uint32_t orders_cancelled{};
};

struct SettleRecord {
  ObjectId vault{};
  ObjectId book{};
  Amount   base_returned{};
  Amount   quote_earned{};
  Amount   base_unlocked{};
  Amount   quote_unlocked{};
};

struct OrderBookCreatedRecord {
  ObjectId book{};
  Price    mid_price{};
};

struct TradeRecord {
  ObjectId book{};
  bool     price_up{};
  Price    old_mid{};
  Price    new_mid{};
  uint32_t bids_filled{};
  uint32_t asks_filled{};
  Amount   base_bought{};
  Amount   quote_earned{};
};

struct AccrueRecord {
  ObjectId    vault{};
  Amount      minted{};
  RewardIndex reward_per_share{};
};

struct ClaimRecord {
  ObjectId vault{};
  Address  claimant{};
  ObjectId position{};
  Amount   amount{};
};

struct MarketCreatedRecord {
  ObjectId market{};
  Amount   token_reserve{};
  Price    price{};
};

struct BuybackRecord {
  ObjectId vault{};
  ObjectId market{};
  Amount   total_fees{};
  Amount   lp_portion{};
  Amount   buyback_portion{};
  Amount   quote_spent{};
  Amount   tokens_bought{};
  Amount   tokens_burned{};
  Amount   tokens_to_rewards{};
};

using Record = std::variant<VaultCreatedRecord, DepositRecord, WithdrawRecord, StrategyConfigRecord,
                            RebalanceRecord, SettleRecord, OrderBookCreatedRecord, TradeRecord,
                            AccrueRecord, ClaimRecord, MarketCreatedRecord, BuybackRecord>;

enum class RecordType : uint8_t {
  VaultCreated, Deposit, Withdraw, StrategyConfig, Rebalance, Settle,
  OrderBookCreated, Trade, Accrue, Claim, MarketCreated, Buyback
};

inline RecordType type_of(const Record& r) noexcept {
  return static_cast<RecordType>(r.index()); // relies on variant order above
}

std::string_view to_string(RecordType t) noexcept;

struct LoggedRecord {
  uint64_t seq{};
  Record   record;
};

// Append-only output of every successful operation.
class EventLog {
public:
  using Observer = std::function<void(const LoggedRecord&)>;

  uint64_t append(Record r);
  void subscribe(Observer obs) { observers_.push_back(std::move(obs)); }

  const std::vector<LoggedRecord>& entries() const noexcept { return entries_; }
  std::vector<LoggedRecord> since(uint64_t seq) const;
  std::size_t size() const noexcept { return entries_.size(); }

private:
  std::vector<LoggedRecord> entries_;
  std::vector<Observer> observers_;
  uint64_t next_seq_{1};
};

} // namespace dgrid
