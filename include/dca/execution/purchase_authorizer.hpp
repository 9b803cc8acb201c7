#pragma once

#include <dca/execution/schedule_store.hpp>
#include <dca/execution/types.hpp>
#include <dca/schema/dca_schedule.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/schedule_status.hpp>
#include <dca/schema/transaction_event.hpp>
#include <dca/schema/transaction_result.hpp>
#include <vector>

namespace dca::execution {

/// What a successful authorization lets the caller spend.
struct purchase_authorization_t final {
  dca::schema::amount_t purchase_amount{};
  dca::schema::lending_protocol_index_t lending_protocol_index{};
  dca::schema::hash32_t schedule_id{};
  dca::schema::timestamp_seconds_t last_purchase_timestamp{};
};

/// Purchase eligibility state machine of a schedule.
///
/// authorize_purchase checks identity, elapsed period and balance, then
/// debits the purchase amount and advances the timestamp of the schedule.
/// It only touches the schedule table: moving funds and swapping is left to
/// the caller, so a batch can authorize every entry before any external
/// call is made.
class purchase_authorizer final {
 public:
  purchase_authorizer(encoder_t& encoder, schedule_store& store);

  static dca::schema::purchase_eligibility_t classify(
      const dca::schema::dca_schedule_t& schedule,
      dca::schema::timestamp_seconds_t now);

  /// `now` for a first purchase. Otherwise the latest period boundary
  /// `last + k * period` that does not exceed `now`, keeping the schedule on
  /// its original phase after missed periods.
  static dca::schema::timestamp_seconds_t next_purchase_timestamp(
      dca::schema::timestamp_seconds_t last_purchase_timestamp,
      dca::schema::duration_seconds_t purchase_period,
      dca::schema::timestamp_seconds_t now);

  dca::schema::transaction_result_t authorize_purchase(
      const dca::schema::address_t& buyer,
      const dca::schema::address_t& token,
      uint64_t schedule_index,
      const dca::schema::hash32_t& schedule_id,
      dca::schema::timestamp_seconds_t now,
      purchase_authorization_t& authorization,
      std::vector<dca::schema::transaction_event_t>& events);

 private:
  encoder_t& encoder_;
  schedule_store& store_;
};

}  // namespace dca::execution
