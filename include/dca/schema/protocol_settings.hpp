#pragma once
#include <dca/schema/primitives.hpp>
#include <map>

// Schema type: protocol settings.
// Owner-managed limits applied when schedules are created or changed.
namespace dca::schema {

inline constexpr duration_seconds_t kDefaultMinPurchasePeriod = 86'400;
inline constexpr uint32_t kDefaultMaxSchedulesPerToken = 10;

template <uint16_t Version>
struct protocol_settings;

template <>
struct protocol_settings<1> final {
  uint16_t version{1};
  duration_seconds_t min_purchase_period{kDefaultMinPurchasePeriod};
  uint32_t max_schedules_per_token{kDefaultMaxSchedulesPerToken};
  amount_t default_min_purchase_amount{
      amount_t{25} * amount_t{1'000'000'000'000'000'000ull}};
  std::map<address_t, amount_t> token_min_purchase_amounts;

  /// Per-token override when present, otherwise the global default.
  const amount_t& min_purchase_amount(const address_t& token) const {
    auto it = token_min_purchase_amounts.find(token);
    if (it == std::end(token_min_purchase_amounts)) {
      return default_min_purchase_amount;
    }
    return it->second;
  }
};

using protocol_settings_t = protocol_settings<1>;

}  // namespace dca::schema
