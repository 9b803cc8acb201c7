#pragma once

#include <dca/schema/fee_settings.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/transaction_event.hpp>
#include <dca/schema/transaction_result.hpp>
#include <functional>
#include <mutex>
#include <vector>

namespace dca::fees {

/// Aggregated result of charging fees over a batch of purchase amounts.
struct fee_breakdown_t final {
  dca::schema::amount_t aggregated_fee{};
  std::vector<dca::schema::amount_t> net_amounts;
  dca::schema::amount_t total_net{};
};

/// Receives one event per configuration value that changed.
using fee_observer_t =
    std::function<void(const dca::schema::transaction_event_t&)>;

/// Purchase fee model: a rate interpolated linearly from max_fee_rate at the
/// purchase lower bound down to min_fee_rate at the upper bound.
///
/// The effective rate fee/amount never increases with the amount and always
/// lies in [min_fee_rate, max_fee_rate].
class fee_calculator final {
 public:
  /// Terminates through common::critical when `settings` has inverted rates
  /// or bounds.
  fee_calculator(const dca::schema::address_t& owner,
                 dca::schema::fee_settings_t settings);

  dca::schema::amount_t calculate_fee(
      const dca::schema::amount_t& purchase_amount) const;

  /// Per-entry fees computed exactly as calculate_fee does.
  fee_breakdown_t calculate_fees_and_net_amounts(
      const std::vector<dca::schema::amount_t>& purchase_amounts) const;

  dca::schema::transaction_result_t set_min_fee_rate(
      const dca::schema::address_t& caller,
      uint64_t min_fee_rate);
  dca::schema::transaction_result_t set_max_fee_rate(
      const dca::schema::address_t& caller,
      uint64_t max_fee_rate);
  dca::schema::transaction_result_t set_purchase_lower_bound(
      const dca::schema::address_t& caller,
      const dca::schema::amount_t& lower_bound);
  dca::schema::transaction_result_t set_purchase_upper_bound(
      const dca::schema::address_t& caller,
      const dca::schema::amount_t& upper_bound);
  dca::schema::transaction_result_t set_fee_rate_params(
      const dca::schema::address_t& caller,
      uint64_t min_fee_rate,
      uint64_t max_fee_rate,
      const dca::schema::amount_t& lower_bound,
      const dca::schema::amount_t& upper_bound);
  dca::schema::transaction_result_t set_fee_collector(
      const dca::schema::address_t& caller,
      const dca::schema::address_t& fee_collector);

  dca::schema::fee_settings_t settings() const;
  void set_observer(fee_observer_t observer);

 private:
  /// Fields a setter writes; each one gets a change event on success.
  enum field : uint32_t {
    min_fee_rate_field = 1u << 0,
    max_fee_rate_field = 1u << 1,
    lower_bound_field = 1u << 2,
    upper_bound_field = 1u << 3,
    fee_collector_field = 1u << 4,
  };

  dca::schema::transaction_result_t apply(
      const dca::schema::address_t& caller,
      uint32_t fields,
      const std::function<void(dca::schema::fee_settings_t&)>& mutate);

  mutable std::mutex mutex_;
  dca::schema::address_t owner_;
  dca::schema::fee_settings_t settings_;
  fee_observer_t observer_;
};

/// Fee for one amount under `settings`, without locking.
dca::schema::amount_t calculate_fee(const dca::schema::fee_settings_t& settings,
                                    const dca::schema::amount_t& amount);

}  // namespace dca::fees
