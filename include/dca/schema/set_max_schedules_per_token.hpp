#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: set max schedules per token.
// Owner-only change of the per (owner, token) schedule cap.
namespace dca::schema {

template <uint16_t Version>
struct set_max_schedules_per_token;

template <>
struct set_max_schedules_per_token<1> final {
  uint16_t version{1};
  uint32_t max_schedules_per_token{};
};

using set_max_schedules_per_token_t = set_max_schedules_per_token<1>;

}  // namespace dca::schema
