#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: withdraw rbtc.
// Withdraws the rBTC accumulated for the caller by one token handler.
namespace dca::schema {

template <uint16_t Version>
struct withdraw_rbtc;

template <>
struct withdraw_rbtc<1> final {
  uint16_t version{1};
  address_t token{};
  lending_protocol_index_t lending_protocol_index{};
};

using withdraw_rbtc_t = withdraw_rbtc<1>;

}  // namespace dca::schema
