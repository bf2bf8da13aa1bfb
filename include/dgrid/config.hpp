#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "dgrid/protocol.hpp"

namespace dgrid {

// Objects the gateway creates at startup: one vault with its order book,
// strategy config and token market.
struct BootstrapConfig {
  Price    initial_mid{10'000'000'000};  // 10 quote per base
  Bps      spread_bps{50};
  Amount   order_size{1'000'000'000};
  uint32_t num_orders_per_side{2};
  Address  keeper{1};
  Amount   market_token_reserve{1'000'000'000'000'000};
  Price    market_price{100'000'000};    // 0.1 quote per token
};

inline constexpr std::size_t kMaxBookLevels = 200;

struct GatewayConfig {
  std::string host{"0.0.0.0"};
  int         port{8080};
  std::size_t book_levels{10};
  ProtocolParams  protocol{};
  BootstrapConfig bootstrap{};
};

// Missing keys keep their defaults. Throws std::runtime_error on malformed
// input or out-of-range values.
GatewayConfig parse_gateway_config(std::string_view text);
GatewayConfig load_gateway_config(const std::string& path);

} // namespace dgrid
