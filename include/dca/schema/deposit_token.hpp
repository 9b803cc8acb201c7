#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: deposit token.
// Adds funds to an existing schedule.
namespace dca::schema {

template <uint16_t Version>
struct deposit_token;

template <>
struct deposit_token<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
  amount_t amount{};
};

using deposit_token_t = deposit_token<1>;

}  // namespace dca::schema
