#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: set purchase amount.
// Changes the amount spent per purchase.
namespace dca::schema {

template <uint16_t Version>
struct set_purchase_amount;

template <>
struct set_purchase_amount<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
  amount_t purchase_amount{};
};

using set_purchase_amount_t = set_purchase_amount<1>;

}  // namespace dca::schema
