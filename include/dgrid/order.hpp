#pragma once
#include "dgrid/types.hpp"

namespace dgrid {

struct Order {
  OrderId  id{};
  Side     side{Side::Bid};
  Price    price{};
  Amount   size{};    // base units
  ObjectId owner{};   // vault that placed it
  Amount   filled{};  // either 0 or size; partial fills are not modelled
};

inline constexpr bool is_filled(const Order& o) noexcept {
  return o.size > 0 && o.filled == o.size;
}

} // namespace dgrid
