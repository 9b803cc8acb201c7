#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: withdraw token.
// Returns part of a schedule balance to its owner.
namespace dca::schema {

template <uint16_t Version>
struct withdraw_token;

template <>
struct withdraw_token<1> final {
  uint16_t version{1};
  address_t token{};
  uint64_t schedule_index{};
  hash32_t schedule_id{};
  amount_t amount{};
};

using withdraw_token_t = withdraw_token<1>;

}  // namespace dca::schema
