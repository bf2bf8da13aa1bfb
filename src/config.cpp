#include "dgrid/config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "dgrid/json_codec.hpp"

namespace dgrid {

namespace {

template <class T>
void read_amount(const json& obj, const char* key, T& out) {
  if (!obj.contains(key)) return;
  const uint64_t v = amount_from_json(obj.at(key));
  if (v > std::numeric_limits<T>::max()) {
    throw std::runtime_error(std::string("value out of range for ") + key);
  }
  out = static_cast<T>(v);
}

void read_protocol(const json& j, ProtocolParams& p) {
  read_amount(j, "emission_per_accrue", p.emission_per_accrue);
  read_amount(j, "lp_share_bps", p.lp_share_bps);
  read_amount(j, "burn_share_bps", p.burn_share_bps);
  if (j.contains("token")) {
    const json& t = j.at("token");
    p.token.symbol = t.value("symbol", p.token.symbol);
    read_amount(t, "decimals", p.token.decimals);
  }
}

void read_bootstrap(const json& j, BootstrapConfig& b) {
  read_amount(j, "initial_mid", b.initial_mid);
  read_amount(j, "spread_bps", b.spread_bps);
  read_amount(j, "order_size", b.order_size);
  read_amount(j, "num_orders_per_side", b.num_orders_per_side);
  read_amount(j, "keeper", b.keeper);
  read_amount(j, "market_token_reserve", b.market_token_reserve);
  read_amount(j, "market_price", b.market_price);
}

} // namespace

GatewayConfig parse_gateway_config(std::string_view text) {
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("config parse error: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config root must be an object");

  GatewayConfig cfg{};
  try {
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    read_amount(j, "book_levels", cfg.book_levels);
    if (j.contains("protocol")) read_protocol(j.at("protocol"), cfg.protocol);
    if (j.contains("bootstrap")) read_bootstrap(j.at("bootstrap"), cfg.bootstrap);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("config type error: ") + e.what());
  }

  if (cfg.port <= 0 || cfg.port > 65535) throw std::runtime_error("port must be in 1..65535");
  if (cfg.book_levels == 0 || cfg.book_levels > kMaxBookLevels) {
    throw std::runtime_error("book_levels must be in 1..200");
  }
  if (cfg.bootstrap.initial_mid == 0) throw std::runtime_error("bootstrap.initial_mid must be > 0");

  try {
    validate(cfg.protocol);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("protocol: ") + e.what());
  }
  return cfg;
}

GatewayConfig load_gateway_config(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("cannot open config file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_gateway_config(ss.str());
}

} // namespace dgrid
