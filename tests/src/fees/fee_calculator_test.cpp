#include <dca/fees/fee_calculator.hpp>
#include <dca/schema/error_code.hpp>
#include <dca/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using dca::schema::amount_t;
using dca::testing::ether;
using dca::testing::make_address;

dca::fees::fee_calculator make_calculator() {
  return dca::fees::fee_calculator{make_address(0xA0),
                                   dca::schema::fee_settings_t{}};
}

}  // namespace

TEST(fee_calculator, interpolates_between_bounds) {
  auto calculator = make_calculator();
  EXPECT_EQ(calculator.calculate_fee(ether(550)),
            amount_t{8'250'000'000'000'000'000ull});
}

TEST(fee_calculator, charges_max_rate_at_or_below_lower_bound) {
  auto calculator = make_calculator();
  EXPECT_EQ(calculator.calculate_fee(ether(50)), ether(1));
  EXPECT_EQ(calculator.calculate_fee(ether(100)), ether(2));
  EXPECT_EQ(calculator.calculate_fee(amount_t{0}), amount_t{0});
}

TEST(fee_calculator, charges_min_rate_at_or_above_upper_bound) {
  auto calculator = make_calculator();
  EXPECT_EQ(calculator.calculate_fee(ether(1000)), ether(10));
  EXPECT_EQ(calculator.calculate_fee(ether(2000)), ether(20));
}

TEST(fee_calculator, effective_rate_is_bounded_and_non_increasing) {
  auto calculator = make_calculator();
  const auto settings = calculator.settings();
  auto previous_rate = amount_t{settings.max_fee_rate};
  for (uint64_t whole = 10; whole <= 1500; whole += 10) {
    auto amount = ether(whole);
    auto fee = calculator.calculate_fee(amount);
    auto rate = fee * dca::schema::kFeePercentageDivisor / amount;
    EXPECT_GE(rate, amount_t{settings.min_fee_rate}) << whole;
    EXPECT_LE(rate, amount_t{settings.max_fee_rate}) << whole;
    EXPECT_LE(rate, previous_rate) << whole;
    previous_rate = rate;
  }
}

TEST(fee_calculator, flat_rate_when_min_equals_max) {
  auto settings = dca::schema::fee_settings_t{};
  settings.min_fee_rate = 150;
  settings.max_fee_rate = 150;
  EXPECT_EQ(dca::fees::calculate_fee(settings, ether(10)),
            amount_t{150'000'000'000'000'000ull});
  EXPECT_EQ(dca::fees::calculate_fee(settings, ether(550)),
            amount_t{8'250'000'000'000'000'000ull});
}

TEST(fee_calculator, batch_matches_single_fees) {
  auto calculator = make_calculator();
  auto amounts = std::vector<amount_t>{ether(50), ether(550), ether(2000)};
  auto breakdown = calculator.calculate_fees_and_net_amounts(amounts);

  ASSERT_EQ(breakdown.net_amounts.size(), amounts.size());
  auto expected_fee = amount_t{};
  for (std::size_t i = 0; i < amounts.size(); ++i) {
    auto fee = calculator.calculate_fee(amounts[i]);
    expected_fee += fee;
    EXPECT_EQ(breakdown.net_amounts[i], amounts[i] - fee);
  }
  EXPECT_EQ(breakdown.aggregated_fee, expected_fee);
  EXPECT_EQ(breakdown.total_net, ether(2600) - expected_fee);
}

TEST(fee_calculator, setters_are_owner_only) {
  auto calculator = make_calculator();
  auto result = calculator.set_min_fee_rate(make_address(0x01), 50);
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(dca::schema::error_code::not_owner));
  EXPECT_EQ(result.log, "NotOwner");
  EXPECT_EQ(calculator.settings().min_fee_rate, 100u);
}

TEST(fee_calculator, rejects_inverted_configuration) {
  auto calculator = make_calculator();
  auto owner = make_address(0xA0);

  auto rates = calculator.set_min_fee_rate(owner, 300);
  EXPECT_EQ(rates.code, static_cast<uint32_t>(
                            dca::schema::error_code::fee_rates_inverted));

  auto bounds = calculator.set_purchase_lower_bound(owner, ether(1000));
  EXPECT_EQ(bounds.code,
            static_cast<uint32_t>(
                dca::schema::error_code::fee_purchase_bounds_inverted));

  auto settings = calculator.settings();
  EXPECT_EQ(settings.min_fee_rate, 100u);
  EXPECT_EQ(settings.purchase_lower_bound, ether(100));
}

TEST(fee_calculator, emits_one_event_per_written_value) {
  auto calculator = make_calculator();
  auto observed = std::vector<std::string>{};
  calculator.set_observer([&](const dca::schema::transaction_event_t& event) {
    observed.push_back(event.type);
  });

  // Lower bound keeps its current value and is still reported.
  auto result = calculator.set_fee_rate_params(make_address(0xA0), 50, 300,
                                               ether(100), ether(2000));
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(result.events.size(), 4u);
  EXPECT_EQ(result.events[0].type, "MinFeeRateSet");
  EXPECT_EQ(result.events[0].attribute("fee_rate"), "50");
  EXPECT_EQ(result.events[1].type, "MaxFeeRateSet");
  EXPECT_EQ(result.events[2].type, "PurchaseLowerBoundSet");
  EXPECT_EQ(result.events[2].attribute("bound"), ether(100).str());
  EXPECT_EQ(result.events[3].type, "PurchaseUpperBoundSet");
  EXPECT_EQ(observed, (std::vector<std::string>{"MinFeeRateSet",
                                                "MaxFeeRateSet",
                                                "PurchaseLowerBoundSet",
                                                "PurchaseUpperBoundSet"}));

  auto collector = calculator.set_fee_collector(make_address(0xA0),
                                                make_address(0xFC));
  ASSERT_EQ(collector.events.size(), 1u);
  EXPECT_EQ(collector.events[0].type, "FeeCollectorSet");
  EXPECT_EQ(calculator.settings().fee_collector, make_address(0xFC));
}

TEST(fee_calculator, setter_with_unchanged_value_still_notifies) {
  auto calculator = make_calculator();
  auto observed = std::vector<std::string>{};
  calculator.set_observer([&](const dca::schema::transaction_event_t& event) {
    observed.push_back(event.type);
  });
  auto owner = make_address(0xA0);
  auto current = calculator.settings();

  auto min_rate = calculator.set_min_fee_rate(owner, current.min_fee_rate);
  ASSERT_EQ(min_rate.code, 0u);
  ASSERT_EQ(min_rate.events.size(), 1u);
  EXPECT_EQ(min_rate.events[0].type, "MinFeeRateSet");
  EXPECT_EQ(min_rate.events[0].attribute("fee_rate"),
            std::to_string(current.min_fee_rate));

  auto collector = calculator.set_fee_collector(owner, current.fee_collector);
  ASSERT_EQ(collector.code, 0u);
  ASSERT_EQ(collector.events.size(), 1u);
  EXPECT_EQ(collector.events[0].type, "FeeCollectorSet");

  EXPECT_EQ(observed,
            (std::vector<std::string>{"MinFeeRateSet", "FeeCollectorSet"}));

  auto rejected = calculator.set_min_fee_rate(make_address(0x01),
                                              current.min_fee_rate);
  EXPECT_NE(rejected.code, 0u);
  EXPECT_TRUE(rejected.events.empty());
  EXPECT_EQ(observed.size(), 2u);
}
