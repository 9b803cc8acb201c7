#include <dca/common/critical.hpp>
#include <dca/common/results.hpp>
#include <dca/fees/fee_calculator.hpp>
#include <spdlog/spdlog.h>

namespace dca::fees {

namespace {

constexpr auto kCodespace = std::string_view{"dca.fees"};

bool rates_inverted(const dca::schema::fee_settings_t& settings) {
  return settings.min_fee_rate > settings.max_fee_rate;
}

bool bounds_inverted(const dca::schema::fee_settings_t& settings) {
  return settings.purchase_lower_bound >= settings.purchase_upper_bound;
}

}  // namespace

dca::schema::amount_t calculate_fee(const dca::schema::fee_settings_t& settings,
                                    const dca::schema::amount_t& amount) {
  const auto min_rate = dca::schema::amount_t{settings.min_fee_rate};
  const auto max_rate = dca::schema::amount_t{settings.max_fee_rate};
  const auto divisor =
      dca::schema::amount_t{dca::schema::kFeePercentageDivisor};
  const auto& lower = settings.purchase_lower_bound;
  const auto& upper = settings.purchase_upper_bound;

  if (min_rate == max_rate || amount >= upper) {
    return amount * min_rate / divisor;
  }
  if (amount <= lower) {
    return amount * max_rate / divisor;
  }

  // Strictly between the bounds: interpolate the rate, rounding down the
  // discount so the rate never drops below the line.
  auto rate =
      max_rate - ((amount - lower) * (max_rate - min_rate)) / (upper - lower);
  return amount * rate / divisor;
}

fee_calculator::fee_calculator(const dca::schema::address_t& owner,
                               dca::schema::fee_settings_t settings)
    : owner_{owner}, settings_{std::move(settings)} {
  if (rates_inverted(settings_)) {
    dca::common::critical("fee settings: min fee rate exceeds max fee rate");
  }
  if (bounds_inverted(settings_)) {
    dca::common::critical(
        "fee settings: purchase lower bound must be below upper bound");
  }
}

dca::schema::amount_t fee_calculator::calculate_fee(
    const dca::schema::amount_t& purchase_amount) const {
  auto lock = std::scoped_lock{mutex_};
  return dca::fees::calculate_fee(settings_, purchase_amount);
}

fee_breakdown_t fee_calculator::calculate_fees_and_net_amounts(
    const std::vector<dca::schema::amount_t>& purchase_amounts) const {
  auto lock = std::scoped_lock{mutex_};
  auto breakdown = fee_breakdown_t{};
  breakdown.net_amounts.reserve(purchase_amounts.size());
  for (const auto& amount : purchase_amounts) {
    auto fee = dca::fees::calculate_fee(settings_, amount);
    breakdown.aggregated_fee += fee;
    breakdown.net_amounts.push_back(amount - fee);
    breakdown.total_net += amount - fee;
  }
  return breakdown;
}

dca::schema::transaction_result_t fee_calculator::set_min_fee_rate(
    const dca::schema::address_t& caller,
    const uint64_t min_fee_rate) {
  return apply(caller, min_fee_rate_field, [&](auto& candidate) {
    candidate.min_fee_rate = min_fee_rate;
  });
}

dca::schema::transaction_result_t fee_calculator::set_max_fee_rate(
    const dca::schema::address_t& caller,
    const uint64_t max_fee_rate) {
  return apply(caller, max_fee_rate_field, [&](auto& candidate) {
    candidate.max_fee_rate = max_fee_rate;
  });
}

dca::schema::transaction_result_t fee_calculator::set_purchase_lower_bound(
    const dca::schema::address_t& caller,
    const dca::schema::amount_t& lower_bound) {
  return apply(caller, lower_bound_field, [&](auto& candidate) {
    candidate.purchase_lower_bound = lower_bound;
  });
}

dca::schema::transaction_result_t fee_calculator::set_purchase_upper_bound(
    const dca::schema::address_t& caller,
    const dca::schema::amount_t& upper_bound) {
  return apply(caller, upper_bound_field, [&](auto& candidate) {
    candidate.purchase_upper_bound = upper_bound;
  });
}

dca::schema::transaction_result_t fee_calculator::set_fee_rate_params(
    const dca::schema::address_t& caller,
    const uint64_t min_fee_rate,
    const uint64_t max_fee_rate,
    const dca::schema::amount_t& lower_bound,
    const dca::schema::amount_t& upper_bound) {
  return apply(caller,
               min_fee_rate_field | max_fee_rate_field | lower_bound_field |
                   upper_bound_field,
               [&](auto& candidate) {
                 candidate.min_fee_rate = min_fee_rate;
                 candidate.max_fee_rate = max_fee_rate;
                 candidate.purchase_lower_bound = lower_bound;
                 candidate.purchase_upper_bound = upper_bound;
               });
}

dca::schema::transaction_result_t fee_calculator::set_fee_collector(
    const dca::schema::address_t& caller,
    const dca::schema::address_t& fee_collector) {
  return apply(caller, fee_collector_field, [&](auto& candidate) {
    candidate.fee_collector = fee_collector;
  });
}

dca::schema::fee_settings_t fee_calculator::settings() const {
  auto lock = std::scoped_lock{mutex_};
  return settings_;
}

void fee_calculator::set_observer(fee_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  observer_ = std::move(observer);
}

dca::schema::transaction_result_t fee_calculator::apply(
    const dca::schema::address_t& caller,
    const uint32_t fields,
    const std::function<void(dca::schema::fee_settings_t&)>& mutate) {
  auto observer = fee_observer_t{};
  auto result = dca::common::make_success();
  auto candidate = dca::schema::fee_settings_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (caller != owner_) {
      return dca::common::make_failure(dca::schema::error_code::not_owner,
                                       kCodespace,
                                       "only the owner may change fees");
    }
    candidate = settings_;
    mutate(candidate);
    if (rates_inverted(candidate)) {
      return dca::common::make_failure(
          dca::schema::error_code::fee_rates_inverted, kCodespace,
          "min fee rate must not exceed max fee rate");
    }
    if (bounds_inverted(candidate)) {
      return dca::common::make_failure(
          dca::schema::error_code::fee_purchase_bounds_inverted, kCodespace,
          "purchase lower bound must be below purchase upper bound");
    }

    if ((fields & min_fee_rate_field) != 0) {
      result.events.push_back(
          dca::common::event_builder{"MinFeeRateSet"}
              .attribute("fee_rate", std::to_string(candidate.min_fee_rate))
              .build());
    }
    if ((fields & max_fee_rate_field) != 0) {
      result.events.push_back(
          dca::common::event_builder{"MaxFeeRateSet"}
              .attribute("fee_rate", std::to_string(candidate.max_fee_rate))
              .build());
    }
    if ((fields & lower_bound_field) != 0) {
      result.events.push_back(
          dca::common::event_builder{"PurchaseLowerBoundSet"}
              .attribute("bound", candidate.purchase_lower_bound.str())
              .build());
    }
    if ((fields & upper_bound_field) != 0) {
      result.events.push_back(
          dca::common::event_builder{"PurchaseUpperBoundSet"}
              .attribute("bound", candidate.purchase_upper_bound.str())
              .build());
    }
    if ((fields & fee_collector_field) != 0) {
      result.events.push_back(
          dca::common::event_builder{"FeeCollectorSet"}
              .indexed("fee_collector",
                       dca::schema::to_hex(candidate.fee_collector))
              .build());
    }

    settings_ = candidate;
    observer = observer_;
  }

  spdlog::info("fee settings updated: rates [{}, {}], bounds [{}, {}]",
               candidate.min_fee_rate, candidate.max_fee_rate,
               candidate.purchase_lower_bound.str(),
               candidate.purchase_upper_bound.str());
  if (observer) {
    for (const auto& event : result.events) {
      observer(event);
    }
  }
  return result;
}

}  // namespace dca::fees
