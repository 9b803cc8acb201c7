#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: update dca schedule.
// Zero-valued fields leave the corresponding schedule value unchanged.
namespace dca::schema {

template <uint16_t Version>
struct update_dca_schedule;

template <>
struct update_dca_schedule<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
  amount_t deposit_amount{};
  amount_t purchase_amount{};
  duration_seconds_t purchase_period{};
};

using update_dca_schedule_t = update_dca_schedule<1>;

}  // namespace dca::schema
