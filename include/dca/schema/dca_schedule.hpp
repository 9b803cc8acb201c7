#pragma once
#include <dca/schema/primitives.hpp>
#include <vector>

// Schema type: dca schedule.
// One recurring purchase plan of an owner for one token. The schedule_id is
// fixed at creation; the list position of a schedule is not.
namespace dca::schema {

template <uint16_t Version>
struct dca_schedule;

template <>
struct dca_schedule<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t token{};
  amount_t token_balance{};
  amount_t purchase_amount{};
  duration_seconds_t purchase_period{};
  timestamp_seconds_t last_purchase_timestamp{};
  hash32_t schedule_id{};
  lending_protocol_index_t lending_protocol_index{};
};

using dca_schedule_t = dca_schedule<1>;
using dca_schedule_list_t = std::vector<dca_schedule_t>;

}  // namespace dca::schema
