#pragma once
#include <cstddef>

#include <nlohmann/json.hpp>

#include "dgrid/book.hpp"
#include "dgrid/buyback.hpp"
#include "dgrid/error.hpp"
#include "dgrid/events.hpp"
#include "dgrid/vault.hpp"

namespace dgrid {

using json = nlohmann::json;

// {"type": "<RecordType>", <fields>}. The 128-bit accumulator is written as a
// decimal string, every other amount as a number.
void to_json(json& j, const Record& r);
void to_json(json& j, const LoggedRecord& e);

void to_json(json& j, const Vault& v);
void to_json(json& j, const SharePosition& p);
void to_json(json& j, const FixedPriceMarket& m);
void to_json(json& j, const LevelSummary& l);

json book_to_json(const OrderBook& b, std::size_t levels);
json rejection_to_json(Error e);

// Accepts a JSON unsigned number or a decimal string. Throws std::runtime_error.
uint64_t amount_from_json(const json& v);

} // namespace dgrid
