#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: buy rbtc.
// Swapper-triggered purchase for one schedule.
namespace dca::schema {

template <uint16_t Version>
struct buy_rbtc;

template <>
struct buy_rbtc<1> final {
  uint16_t version{1};
  address_t buyer{};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
};

using buy_rbtc_t = buy_rbtc<1>;

}  // namespace dca::schema
