#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "httplib.h"

#include "dgrid/config.hpp"
#include "dgrid/json_codec.hpp"
#include "dgrid/log.hpp"
#include "dgrid/protocol.hpp"

namespace {

using dgrid::json;

// Ids of the objects created at startup.
struct Deployment {
  dgrid::ObjectId vault{};
  dgrid::ObjectId book{};
  dgrid::ObjectId config{};
  dgrid::ObjectId market{};
};

// Protocol plus its treasury cap. Every handler holds `mu` for the whole
// operation, so each request is one atomic transition.
struct LiveProtocol {
  std::mutex mu;
  dgrid::Protocol proto;
  dgrid::TreasuryCap cap;
  Deployment dep{};

  LiveProtocol(dgrid::Protocol p, dgrid::TreasuryCap c) : proto(std::move(p)), cap(std::move(c)) {}
};

void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

void send_json(httplib::Response& res, const json& body, int status = 200) {
  set_no_cache(res);
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

json parse_body(const httplib::Request& req) {
  if (req.body.empty()) return json::object();
  json j = json::parse(req.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) throw std::runtime_error("request body must be a JSON object");
  return j;
}

uint64_t required(const json& body, const char* key) {
  if (!body.contains(key)) throw std::runtime_error(std::string("missing field: ") + key);
  return dgrid::amount_from_json(body.at(key));
}

template <class T>
void send_result(httplib::Response& res, const dgrid::Result<T>& r) {
  if (!r) {
    send_json(res, dgrid::rejection_to_json(r.error), 422);
    return;
  }
  send_json(res, json{{"ok", true}, {"record", dgrid::Record(r.value)}});
}

// Runs `fn` under the protocol lock; malformed requests become 400s.
template <class Fn>
void guarded(LiveProtocol& live, httplib::Response& res, Fn&& fn) {
  try {
    std::lock_guard<std::mutex> lk(live.mu);
    fn();
  } catch (const std::exception& e) {
    dgrid::log::warn(std::string("bad request: ") + e.what());
    send_json(res, json{{"ok", false}, {"error", "BadRequest"}, {"message", e.what()}}, 400);
  }
}

Deployment bootstrap(dgrid::Protocol& proto, const dgrid::TreasuryCap& cap, const dgrid::BootstrapConfig& b) {
  Deployment d{};
  d.vault = proto.create_vault();
  d.book = proto.create_order_book(b.initial_mid);

  auto cfg = proto.create_strategy_config(b.spread_bps, b.order_size, b.num_orders_per_side, b.keeper);
  if (!cfg) throw std::runtime_error(std::string("strategy config: ") + std::string(dgrid::to_string(cfg.error)));
  d.config = cfg.value.config;

  auto m = proto.create_token_market(cap, b.market_token_reserve, b.market_price);
  if (!m) throw std::runtime_error(std::string("token market: ") + std::string(dgrid::to_string(m.error)));
  d.market = m.value.market;
  return d;
}

} // namespace

int main(int argc, char** argv) {
  // args: [config.json]
  dgrid::GatewayConfig gcfg{};
  try {
    if (argc > 1) {
      gcfg = dgrid::load_gateway_config(argv[1]);
      dgrid::log::info(std::string("loaded config ") + argv[1]);
    }
  } catch (const std::exception& e) {
    dgrid::log::error(e.what());
    return EXIT_FAILURE;
  }

  dgrid::Protocol proto{gcfg.protocol};
  auto cap = proto.take_treasury_cap();
  if (!cap) {
    dgrid::log::error("treasury cap unavailable");
    return EXIT_FAILURE;
  }
  LiveProtocol live{std::move(proto), std::move(*cap)};

  live.proto.events().subscribe([](const dgrid::LoggedRecord& e) {
    dgrid::log::info(json(e).dump());
  });

  try {
    live.dep = bootstrap(live.proto, live.cap, gcfg.bootstrap);
  } catch (const std::exception& e) {
    dgrid::log::error(std::string("bootstrap failed: ") + e.what());
    return EXIT_FAILURE;
  }

  httplib::Server svr;

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  // ---- views ----
  svr.Get("/api/vault", [&](const httplib::Request&, httplib::Response& res) {
    guarded(live, res, [&] {
      const dgrid::Vault* v = live.proto.vault(live.dep.vault);
      json body = *v;
      body["positions"] = live.proto.positions_in(live.dep.vault);
      send_json(res, body);
    });
  });

  svr.Get("/api/book", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      std::size_t levels = gcfg.book_levels;
      if (req.has_param("levels")) {
        const auto v = dgrid::amount_from_json(json(req.get_param_value("levels")));
        if (v > 0 && v <= dgrid::kMaxBookLevels) levels = static_cast<std::size_t>(v);
      }
      send_json(res, dgrid::book_to_json(*live.proto.order_book(live.dep.book), levels));
    });
  });

  svr.Get("/api/market", [&](const httplib::Request&, httplib::Response& res) {
    guarded(live, res, [&] {
      json body = *live.proto.market(live.dep.market);
      const auto& tok = live.proto.token();
      body["token"] = json{{"symbol", tok.metadata().symbol},
                           {"decimals", tok.metadata().decimals},
                           {"total_supply", tok.total_supply()},
                           {"total_minted", tok.total_minted()},
                           {"total_burned", tok.total_burned()}};
      send_json(res, body);
    });
  });

  svr.Get("/api/events", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      uint64_t since = 0;
      if (req.has_param("since")) since = dgrid::amount_from_json(json(req.get_param_value("since")));
      send_json(res, json{{"events", live.proto.events().since(since)}});
    });
  });

  // ---- operations ----
  svr.Post("/api/deposit", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      const json body = parse_body(req);
      send_result(res, live.proto.deposit(live.dep.vault, required(body, "caller"),
                                          required(body, "base"), required(body, "quote")));
    });
  });

  svr.Post("/api/withdraw", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      const json body = parse_body(req);
      send_result(res, live.proto.withdraw(live.dep.vault, required(body, "position"), required(body, "caller")));
    });
  });

  svr.Post("/api/rebalance", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      const json body = parse_body(req);
      send_result(res, live.proto.rebalance(live.dep.vault, live.dep.config, live.dep.book,
                                            required(body, "caller")));
    });
  });

  svr.Post("/api/settle", [&](const httplib::Request&, httplib::Response& res) {
    guarded(live, res, [&] { send_result(res, live.proto.settle(live.dep.vault, live.dep.book)); });
  });

  svr.Post("/api/simulate_trade", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      const json body = parse_body(req);
      const bool up = body.value("up", true);
      send_result(res, live.proto.simulate_trade(live.dep.book, up, required(body, "delta")));
    });
  });

  svr.Post("/api/accrue", [&](const httplib::Request&, httplib::Response& res) {
    guarded(live, res, [&] { send_result(res, live.proto.accrue_rewards(live.dep.vault, live.cap)); });
  });

  svr.Post("/api/claim", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(live, res, [&] {
      const json body = parse_body(req);
      send_result(res, live.proto.claim_rewards(live.dep.vault, required(body, "position"),
                                                required(body, "caller"), live.cap));
    });
  });

  svr.Post("/api/buyback", [&](const httplib::Request&, httplib::Response& res) {
    guarded(live, res, [&] {
      send_result(res, live.proto.execute_buyback(live.dep.vault, live.dep.market, live.cap));
    });
  });

  dgrid::log::info("deepgrid gateway listening on http://" + gcfg.host + ":" + std::to_string(gcfg.port) + "/");
  dgrid::log::info("Type 'exit' (or 'quit') then press Enter to stop cleanly.");

  const bool served = svr.listen(gcfg.host, gcfg.port);
  if (!served) dgrid::log::error("failed to bind " + gcfg.host + ":" + std::to_string(gcfg.port));

  // the reader may still be blocked on stdin
  if (stdin_thread.joinable()) stdin_thread.detach();
  return served ? EXIT_SUCCESS : EXIT_FAILURE;
}
