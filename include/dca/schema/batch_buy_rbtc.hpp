#pragma once
#include <dca/schema/primitives.hpp>
#include <vector>

// Schema type: batch buy rbtc.
// Swapper-triggered purchases sharing one token and lending protocol.
// The parallel arrays must have equal, non-zero length.
namespace dca::schema {

template <uint16_t Version>
struct batch_buy_rbtc;

template <>
struct batch_buy_rbtc<1> final {
  uint16_t version{1};
  std::vector<address_t> buyers;
  address_t token{};
  std::vector<uint64_t> schedule_indexes;
  std::vector<hash32_t> schedule_ids;
  std::vector<amount_t> purchase_amounts;
  lending_protocol_index_t lending_protocol_index{};
};

using batch_buy_rbtc_t = batch_buy_rbtc<1>;

}  // namespace dca::schema
