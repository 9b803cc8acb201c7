#include <dca/common/results.hpp>
#include <dca/execution/purchase_authorizer.hpp>
#include <spdlog/spdlog.h>
#include <tuple>

namespace dca::execution {

namespace {

constexpr auto kCodespace = std::string_view{"dca.purchase"};

}  // namespace

purchase_authorizer::purchase_authorizer(encoder_t& encoder,
                                         schedule_store& store)
    : encoder_{encoder}, store_{store} {}

dca::schema::purchase_eligibility_t purchase_authorizer::classify(
    const dca::schema::dca_schedule_t& schedule,
    const dca::schema::timestamp_seconds_t now) {
  auto eligibility = dca::schema::purchase_eligibility_t{};
  eligibility.depleted = schedule.purchase_amount > schedule.token_balance;

  const auto last = schedule.last_purchase_timestamp;
  if (last == 0) {
    eligibility.status = dca::schema::schedule_status_t::never_purchased;
    return eligibility;
  }
  if (now < last) {
    // Clock behind the recorded purchase: wait out the gap and a full period.
    eligibility.status = dca::schema::schedule_status_t::cooling_down;
    eligibility.remaining_wait = (last - now) + schedule.purchase_period;
    return eligibility;
  }
  const auto elapsed = now - last;
  if (elapsed < schedule.purchase_period) {
    eligibility.status = dca::schema::schedule_status_t::cooling_down;
    eligibility.remaining_wait = schedule.purchase_period - elapsed;
    return eligibility;
  }
  eligibility.status = dca::schema::schedule_status_t::due;
  return eligibility;
}

dca::schema::timestamp_seconds_t purchase_authorizer::next_purchase_timestamp(
    const dca::schema::timestamp_seconds_t last_purchase_timestamp,
    const dca::schema::duration_seconds_t purchase_period,
    const dca::schema::timestamp_seconds_t now) {
  if (last_purchase_timestamp == 0 || purchase_period == 0 ||
      now < last_purchase_timestamp) {
    return now;
  }
  const auto periods_elapsed =
      (now - last_purchase_timestamp) / purchase_period;
  return last_purchase_timestamp + (periods_elapsed * purchase_period);
}

dca::schema::transaction_result_t purchase_authorizer::authorize_purchase(
    const dca::schema::address_t& buyer,
    const dca::schema::address_t& token,
    const uint64_t schedule_index,
    const dca::schema::hash32_t& schedule_id,
    const dca::schema::timestamp_seconds_t now,
    purchase_authorization_t& authorization,
    std::vector<dca::schema::transaction_event_t>& events) {
  auto identity =
      store_.validate_identity(buyer, token, schedule_index, schedule_id);
  if (dca::common::failed(identity)) {
    return identity;
  }

  auto& schedule = store_.mutable_schedule(buyer, token, schedule_index);
  auto eligibility = classify(schedule, now);
  if (eligibility.status == dca::schema::schedule_status_t::cooling_down) {
    return dca::common::make_failure(
        dca::schema::error_code::cannot_buy_if_purchase_period_has_not_elapsed,
        kCodespace,
        "purchase period has not elapsed, " +
            std::to_string(eligibility.remaining_wait) + "s remaining",
        encoder_.encode(eligibility.remaining_wait));
  }
  if (eligibility.depleted) {
    return dca::common::make_failure(
        dca::schema::error_code::schedule_balance_not_enough_for_purchase,
        kCodespace,
        "schedule balance " + schedule.token_balance.str() +
            " is below the purchase amount",
        encoder_.encode(std::tuple{
            schedule_index, schedule.schedule_id, token,
            dca::schema::to_amount_bytes(schedule.token_balance)}));
  }

  schedule.token_balance -= schedule.purchase_amount;
  events.push_back(
      dca::common::event_builder{"ScheduleBalanceUpdated"}
          .indexed("owner", dca::schema::to_hex(buyer))
          .indexed("token", dca::schema::to_hex(token))
          .indexed("schedule_id", dca::schema::to_hex(schedule.schedule_id))
          .attribute("schedule_index", std::to_string(schedule_index))
          .attribute("token_balance", schedule.token_balance.str())
          .build());

  schedule.last_purchase_timestamp = next_purchase_timestamp(
      schedule.last_purchase_timestamp, schedule.purchase_period, now);
  events.push_back(
      dca::common::event_builder{"LastPurchaseTimestampUpdated"}
          .indexed("owner", dca::schema::to_hex(buyer))
          .indexed("token", dca::schema::to_hex(token))
          .indexed("schedule_id", dca::schema::to_hex(schedule.schedule_id))
          .attribute("last_purchase_timestamp",
                     std::to_string(schedule.last_purchase_timestamp))
          .build());

  authorization = purchase_authorization_t{
      .purchase_amount = schedule.purchase_amount,
      .lending_protocol_index = schedule.lending_protocol_index,
      .schedule_id = schedule.schedule_id,
      .last_purchase_timestamp = schedule.last_purchase_timestamp};

  spdlog::debug("authorized purchase of {} for schedule {} of {}",
                schedule.purchase_amount.str(),
                dca::schema::to_hex(schedule.schedule_id),
                dca::schema::to_hex(buyer));
  return dca::common::make_success();
}

}  // namespace dca::execution
