#pragma once

#include <dca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Stable numeric codes returned in transaction_result_t::code. Zero is
// success; the string form is the name reported in transaction_result_t::log.
namespace dca::schema {

enum class error_code : uint32_t {
  ok = 0,
  inexistent_schedule_index = 1,
  schedule_id_and_index_mismatch = 2,
  cannot_buy_if_purchase_period_has_not_elapsed = 3,
  schedule_balance_not_enough_for_purchase = 4,
  schedule_balance_not_enough_for_withdrawal = 5,
  purchase_amount_must_be_greater_than_minimum = 6,
  purchase_amount_must_be_lower_than_half_of_balance = 7,
  purchase_period_must_be_greater_than_minimum = 8,
  deposit_amount_must_be_greater_than_zero = 9,
  withdrawal_amount_must_be_greater_than_zero = 10,
  max_schedules_reached = 11,
  token_not_accepted = 12,
  token_does_not_yield_interest = 13,
  no_accumulated_rbtc_to_withdraw = 14,
  empty_batch_purchase_arrays = 20,
  batch_purchase_arrays_length_mismatch = 21,
  purchase_amount_mismatch = 22,
  unauthorized_swapper = 30,
  not_owner = 31,
  fee_rates_inverted = 40,
  fee_purchase_bounds_inverted = 41,
  reentrant_call = 50,
  external_call_failed = 51,
};

inline constexpr auto kErrorCodeMappings = std::array{
    enum_mapping_t<error_code>{"Ok", error_code::ok},
    enum_mapping_t<error_code>{"InexistentScheduleIndex",
                               error_code::inexistent_schedule_index},
    enum_mapping_t<error_code>{"ScheduleIdAndIndexMismatch",
                               error_code::schedule_id_and_index_mismatch},
    enum_mapping_t<error_code>{
        "CannotBuyIfPurchasePeriodHasNotElapsed",
        error_code::cannot_buy_if_purchase_period_has_not_elapsed},
    enum_mapping_t<error_code>{
        "ScheduleBalanceNotEnoughForPurchase",
        error_code::schedule_balance_not_enough_for_purchase},
    enum_mapping_t<error_code>{
        "ScheduleBalanceNotEnoughForWithdrawal",
        error_code::schedule_balance_not_enough_for_withdrawal},
    enum_mapping_t<error_code>{
        "PurchaseAmountMustBeGreaterThanMinimum",
        error_code::purchase_amount_must_be_greater_than_minimum},
    enum_mapping_t<error_code>{
        "PurchaseAmountMustBeLowerThanHalfOfBalance",
        error_code::purchase_amount_must_be_lower_than_half_of_balance},
    enum_mapping_t<error_code>{
        "PurchasePeriodMustBeGreaterThanMinimum",
        error_code::purchase_period_must_be_greater_than_minimum},
    enum_mapping_t<error_code>{
        "DepositAmountMustBeGreaterThanZero",
        error_code::deposit_amount_must_be_greater_than_zero},
    enum_mapping_t<error_code>{
        "WithdrawalAmountMustBeGreaterThanZero",
        error_code::withdrawal_amount_must_be_greater_than_zero},
    enum_mapping_t<error_code>{"MaxSchedulesReached",
                               error_code::max_schedules_reached},
    enum_mapping_t<error_code>{"TokenNotAccepted",
                               error_code::token_not_accepted},
    enum_mapping_t<error_code>{"TokenDoesNotYieldInterest",
                               error_code::token_does_not_yield_interest},
    enum_mapping_t<error_code>{"NoAccumulatedRbtcToWithdraw",
                               error_code::no_accumulated_rbtc_to_withdraw},
    enum_mapping_t<error_code>{"EmptyBatchPurchaseArrays",
                               error_code::empty_batch_purchase_arrays},
    enum_mapping_t<error_code>{
        "BatchPurchaseArraysLengthMismatch",
        error_code::batch_purchase_arrays_length_mismatch},
    enum_mapping_t<error_code>{"PurchaseAmountMismatch",
                               error_code::purchase_amount_mismatch},
    enum_mapping_t<error_code>{"UnauthorizedSwapper",
                               error_code::unauthorized_swapper},
    enum_mapping_t<error_code>{"NotOwner", error_code::not_owner},
    enum_mapping_t<error_code>{"FeeRatesInverted",
                               error_code::fee_rates_inverted},
    enum_mapping_t<error_code>{"FeePurchaseBoundsInverted",
                               error_code::fee_purchase_bounds_inverted},
    enum_mapping_t<error_code>{"ReentrantCall", error_code::reentrant_call},
    enum_mapping_t<error_code>{"ExternalCallFailed",
                               error_code::external_call_failed},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace dca::schema
