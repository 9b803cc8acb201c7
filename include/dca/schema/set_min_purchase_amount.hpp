#pragma once
#include <dca/schema/primitives.hpp>
#include <optional>

// Schema type: set min purchase amount.
// Owner-only change of the minimum purchase amount; without a token the
// global default changes.
namespace dca::schema {

template <uint16_t Version>
struct set_min_purchase_amount;

template <>
struct set_min_purchase_amount<1> final {
  uint16_t version{1};
  std::optional<address_t> token{};
  amount_t min_purchase_amount{};
};

using set_min_purchase_amount_t = set_min_purchase_amount<1>;

}  // namespace dca::schema
