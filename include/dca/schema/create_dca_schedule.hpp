#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: create dca schedule.
// Opens a schedule funded with deposit_amount.
namespace dca::schema {

template <uint16_t Version>
struct create_dca_schedule;

template <>
struct create_dca_schedule<1> final {
  uint16_t version{1};
  address_t token{};
  amount_t deposit_amount{};
  amount_t purchase_amount{};
  duration_seconds_t purchase_period{};
  lending_protocol_index_t lending_protocol_index{};
};

using create_dca_schedule_t = create_dca_schedule<1>;

}  // namespace dca::schema
