#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: set purchase period.
// Changes the minimum time between purchases.
namespace dca::schema {

template <uint16_t Version>
struct set_purchase_period;

template <>
struct set_purchase_period<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
  duration_seconds_t purchase_period{};
};

using set_purchase_period_t = set_purchase_period<1>;

}  // namespace dca::schema
