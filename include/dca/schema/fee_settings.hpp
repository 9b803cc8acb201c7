#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: fee settings.
// Rates are expressed over kFeePercentageDivisor (100 = 1%). Purchases at or
// below the lower bound pay max_fee_rate, at or above the upper bound
// min_fee_rate, and the rate is linear in between.
namespace dca::schema {

inline constexpr uint64_t kFeePercentageDivisor = 10'000;

template <uint16_t Version>
struct fee_settings;

template <>
struct fee_settings<1> final {
  uint16_t version{1};
  uint64_t min_fee_rate{100};
  uint64_t max_fee_rate{200};
  amount_t purchase_lower_bound{
      amount_t{100} * amount_t{1'000'000'000'000'000'000ull}};
  amount_t purchase_upper_bound{
      amount_t{1'000} * amount_t{1'000'000'000'000'000'000ull}};
  address_t fee_collector{};
};

using fee_settings_t = fee_settings<1>;

}  // namespace dca::schema
