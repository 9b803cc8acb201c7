#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: delete dca schedule.
// Removes a schedule and returns its remaining balance to the owner.
namespace dca::schema {

template <uint16_t Version>
struct delete_dca_schedule;

template <>
struct delete_dca_schedule<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
};

using delete_dca_schedule_t = delete_dca_schedule<1>;

}  // namespace dca::schema
