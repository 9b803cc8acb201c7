#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: set min purchase period.
// Owner-only change of the global minimum purchase period.
namespace dca::schema {

template <uint16_t Version>
struct set_min_purchase_period;

template <>
struct set_min_purchase_period<1> final {
  uint16_t version{1};
  duration_seconds_t min_purchase_period{};
};

using set_min_purchase_period_t = set_min_purchase_period<1>;

}  // namespace dca::schema
