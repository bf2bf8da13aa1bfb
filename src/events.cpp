#include "dgrid/events.hpp"

#include <algorithm>

namespace dgrid {

std::string_view to_string(RecordType t) noexcept {
  switch (t) {
    case RecordType::VaultCreated:     return "VaultCreated";
    case RecordType::Deposit:          return "Deposit";
    case RecordType::Withdraw:         return "Withdraw";
    case RecordType::StrategyConfig:   return "StrategyConfig";
    case RecordType::Rebalance:        return "Rebalance";
    case RecordType::Settle:           return "Settle";
    case RecordType::OrderBookCreated: return "OrderBookCreated";
    case RecordType::Trade:            return "Trade";
    case RecordType::Accrue:           return "Accrue";
    case RecordType::Claim:            return "Claim";
    case RecordType::MarketCreated:    return "MarketCreated";
    case RecordType::Buyback:          return "Buyback";
  }
  return "Unknown";
}

uint64_t EventLog::append(Record r) {
  const uint64_t seq = next_seq_++;
  entries_.push_back(LoggedRecord{seq, std::move(r)});
  for (auto& obs : observers_) obs(entries_.back());
  return seq;
}

std::vector<LoggedRecord> EventLog::since(uint64_t seq) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [seq](const LoggedRecord& e) { return e.seq > seq; });
  return std::vector<LoggedRecord>(it, entries_.end());
}

} // namespace dgrid
