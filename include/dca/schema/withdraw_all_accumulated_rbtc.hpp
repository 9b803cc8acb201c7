#pragma once
#include <dca/schema/primitives.hpp>
#include <vector>

// Schema type: withdraw all accumulated rbtc.
// Withdraws accumulated rBTC from every (token, lending protocol) handler.
// Combinations without a handler or without a balance are skipped.
namespace dca::schema {

template <uint16_t Version>
struct withdraw_all_accumulated_rbtc;

template <>
struct withdraw_all_accumulated_rbtc<1> final {
  uint16_t version{1};
  std::vector<address_t> tokens;
  std::vector<lending_protocol_index_t> lending_protocol_indexes;
};

using withdraw_all_accumulated_rbtc_t = withdraw_all_accumulated_rbtc<1>;

}  // namespace dca::schema
