#include "dgrid/json_codec.hpp"

#include <stdexcept>
#include <string>

namespace dgrid {

namespace {

std::string index_str(const RewardIndex& v) { return v.str(); }

json fields(const VaultCreatedRecord& r) { return {{"vault", r.vault}}; }

json fields(const DepositRecord& r) {
  return {{"vault", r.vault},           {"depositor", r.depositor},
          {"position", r.position},     {"base_amount", r.base_amount},
          {"quote_amount", r.quote_amount}, {"shares_minted", r.shares_minted},
          {"total_shares", r.total_shares}};
}

json fields(const WithdrawRecord& r) {
  return {{"vault", r.vault},         {"withdrawer", r.withdrawer},
          {"position", r.position},   {"base_out", r.base_out},
          {"quote_out", r.quote_out}, {"shares_burned", r.shares_burned},
          {"total_shares", r.total_shares}};
}

json fields(const StrategyConfigRecord& r) {
  return {{"config", r.config},
          {"spread_bps", r.spread_bps},
          {"order_size", r.order_size},
          {"num_orders_per_side", r.num_orders_per_side},
          {"keeper", r.keeper}};
}

json fields(const RebalanceRecord& r) {
  return {{"vault", r.vault},
          {"book", r.book},
          {"mid_price", r.mid_price},
          {"bid_price", r.bid_price},
          {"ask_price", r.ask_price},
          {"orders_placed", r.orders_placed},
          {"bids_placed", r.bids_placed},
          {"asks_placed", r.asks_placed},
          {"orders_cancelled", r.orders_cancelled}};
}

json fields(const SettleRecord& r) {
  return {{"vault", r.vault},
          {"book", r.book},
          {"base_returned", r.base_returned},
          {"quote_earned", r.quote_earned},
          {"base_unlocked", r.base_unlocked},
          {"quote_unlocked", r.quote_unlocked}};
}

json fields(const OrderBookCreatedRecord& r) { return {{"book", r.book}, {"mid_price", r.mid_price}}; }

json fields(const TradeRecord& r) {
  return {{"book", r.book},
          {"price_up", r.price_up},
          {"old_mid", r.old_mid},
          {"new_mid", r.new_mid},
          {"bids_filled", r.bids_filled},
          {"asks_filled", r.asks_filled},
          {"base_bought", r.base_bought},
          {"quote_earned", r.quote_earned}};
}

json fields(const AccrueRecord& r) {
  return {{"vault", r.vault}, {"minted", r.minted}, {"reward_per_share", index_str(r.reward_per_share)}};
}

json fields(const ClaimRecord& r) {
  return {{"vault", r.vault}, {"claimant", r.claimant}, {"position", r.position}, {"amount", r.amount}};
}

json fields(const MarketCreatedRecord& r) {
  return {{"market", r.market}, {"token_reserve", r.token_reserve}, {"price", r.price}};
}

json fields(const BuybackRecord& r) {
  return {{"vault", r.vault},
          {"market", r.market},
          {"total_fees", r.total_fees},
          {"lp_portion", r.lp_portion},
          {"buyback_portion", r.buyback_portion},
          {"quote_spent", r.quote_spent},
          {"tokens_bought", r.tokens_bought},
          {"tokens_burned", r.tokens_burned},
          {"tokens_to_rewards", r.tokens_to_rewards}};
}

} // namespace

void to_json(json& j, const Record& r) {
  j = std::visit([](const auto& x) { return fields(x); }, r);
  j["type"] = std::string(to_string(type_of(r)));
}

void to_json(json& j, const LoggedRecord& e) {
  to_json(j, e.record);
  j["seq"] = e.seq;
}

void to_json(json& j, const Vault& v) {
  j = json{{"id", v.id()},
           {"base_balance", v.base_balance()},
           {"quote_balance", v.quote_balance()},
           {"total_shares", v.total_shares()},
           {"locked_base", v.locked_base()},
           {"locked_quote", v.locked_quote()},
           {"accrued_fee_quote", v.accrued_fee_quote()},
           {"reward_per_share", index_str(v.reward_per_share())},
           {"reward_pool_balance", v.reward_pool_balance()}};
}

void to_json(json& j, const SharePosition& p) {
  j = json{{"id", p.id},
           {"vault", p.vault},
           {"owner", p.owner},
           {"shares", p.shares},
           {"reward_debt", index_str(p.reward_debt)}};
}

void to_json(json& j, const FixedPriceMarket& m) {
  j = json{{"id", m.id()},
           {"token_reserve", m.token_reserve()},
           {"quote_reserve", m.quote_reserve()},
           {"price_quote_per_token", m.price_quote_per_token()}};
}

void to_json(json& j, const LevelSummary& l) {
  j = json{{"price", l.price}, {"size", l.total_size}, {"orders", l.order_count}};
}

json book_to_json(const OrderBook& b, std::size_t levels) {
  const auto pending = b.pending_fills();
  return {{"id", b.id()},
          {"mid_price", b.mid_price()},
          {"bids", b.depth(Side::Bid, levels)},
          {"asks", b.depth(Side::Ask, levels)},
          {"pending_fill_base", pending.base},
          {"pending_fill_quote", pending.quote}};
}

json rejection_to_json(Error e) {
  return {{"ok", false},
          {"error", std::string(to_string(e))},
          {"category", std::string(to_string(category(e)))}};
}

uint64_t amount_from_json(const json& v) {
  if (v.is_number_unsigned()) return v.get<uint64_t>();
  if (v.is_number_integer()) {
    const auto x = v.get<int64_t>();
    if (x < 0) throw std::runtime_error("negative amount: " + v.dump());
    return static_cast<uint64_t>(x);
  }
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
      throw std::runtime_error("invalid amount string: " + s);
    }
    try {
      return std::stoull(s);
    } catch (const std::out_of_range&) {
      throw std::runtime_error("amount out of range: " + s);
    }
  }
  throw std::runtime_error("amount must be a number or a decimal string: " + v.dump());
}

} // namespace dgrid
