#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: withdraw interest.
// Withdraws the lending interest earned on the caller's locked principal.
namespace dca::schema {

template <uint16_t Version>
struct withdraw_interest;

template <>
struct withdraw_interest<1> final {
  uint16_t version{1};
  address_t token{};
  lending_protocol_index_t lending_protocol_index{};
};

using withdraw_interest_t = withdraw_interest<1>;

}  // namespace dca::schema
