#pragma once

#include <dca/execution/purchase_authorizer.hpp>
#include <dca/execution/reentrancy_guard.hpp>
#include <dca/execution/schedule_store.hpp>
#include <dca/execution/types.hpp>
#include <dca/handlers/purchase_executor.hpp>
#include <dca/handlers/role_admin.hpp>
#include <dca/schema/execution_context.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/protocol_settings.hpp>
#include <dca/schema/query_result.hpp>
#include <dca/schema/schedule_status.hpp>
#include <dca/schema/transaction.hpp>
#include <dca/schema/transaction_event.hpp>
#include <dca/schema/transaction_result.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace dca::execution {

/// Public entry points of the DCA protocol.
///
/// Each mutating call is one transaction: it holds the manager's lock, fails
/// with ReentrantCall when entered again from a collaborator callback, and
/// either commits every schedule change with its events or rolls all of
/// them back. A collaborator that throws aborts the transaction with
/// ExternalCallFailed.
class schedule_manager final {
 public:
  /// Loads persisted schedules, users and settings from `storage`.
  schedule_manager(encoder_t& encoder,
                   storage_t& storage,
                   dca::handlers::role_admin& role_admin,
                   const dca::schema::address_t& owner);

  schedule_manager(const schedule_manager&) = delete;
  schedule_manager& operator=(const schedule_manager&) = delete;

  dca::schema::transaction_result_t execute(
      const dca::schema::execution_context_t& context,
      const dca::schema::transaction_payload_t& payload);

  dca::schema::transaction_result_t create_dca_schedule(
      const dca::schema::execution_context_t& context,
      const dca::schema::create_dca_schedule_t& operation);
  dca::schema::transaction_result_t update_dca_schedule(
      const dca::schema::execution_context_t& context,
      const dca::schema::update_dca_schedule_t& operation);
  dca::schema::transaction_result_t delete_dca_schedule(
      const dca::schema::execution_context_t& context,
      const dca::schema::delete_dca_schedule_t& operation);
  dca::schema::transaction_result_t deposit_token(
      const dca::schema::execution_context_t& context,
      const dca::schema::deposit_token_t& operation);
  dca::schema::transaction_result_t withdraw_token(
      const dca::schema::execution_context_t& context,
      const dca::schema::withdraw_token_t& operation);
  dca::schema::transaction_result_t set_purchase_amount(
      const dca::schema::execution_context_t& context,
      const dca::schema::set_purchase_amount_t& operation);
  dca::schema::transaction_result_t set_purchase_period(
      const dca::schema::execution_context_t& context,
      const dca::schema::set_purchase_period_t& operation);

  /// Swapper only.
  dca::schema::transaction_result_t buy_rbtc(
      const dca::schema::execution_context_t& context,
      const dca::schema::buy_rbtc_t& operation);

  /// Swapper only. Every entry is authorized and its amount checked against
  /// the declared one before the executor is called once for the batch.
  dca::schema::transaction_result_t batch_buy_rbtc(
      const dca::schema::execution_context_t& context,
      const dca::schema::batch_buy_rbtc_t& operation);

  dca::schema::transaction_result_t withdraw_rbtc_from_token_handler(
      const dca::schema::execution_context_t& context,
      const dca::schema::withdraw_rbtc_t& operation);

  /// Visits every (token, lending protocol) pair, skipping pairs without a
  /// handler or without rBTC to withdraw.
  dca::schema::transaction_result_t withdraw_all_accumulated_rbtc(
      const dca::schema::execution_context_t& context,
      const dca::schema::withdraw_all_accumulated_rbtc_t& operation);

  dca::schema::transaction_result_t withdraw_interest_from_token_handler(
      const dca::schema::execution_context_t& context,
      const dca::schema::withdraw_interest_t& operation);
  dca::schema::transaction_result_t withdraw_all_accumulated_interest(
      const dca::schema::execution_context_t& context,
      const dca::schema::withdraw_all_accumulated_interest_t& operation);

  dca::schema::transaction_result_t set_min_purchase_period(
      const dca::schema::execution_context_t& context,
      const dca::schema::set_min_purchase_period_t& operation);
  dca::schema::transaction_result_t set_max_schedules_per_token(
      const dca::schema::execution_context_t& context,
      const dca::schema::set_max_schedules_per_token_t& operation);
  dca::schema::transaction_result_t set_min_purchase_amount(
      const dca::schema::execution_context_t& context,
      const dca::schema::set_min_purchase_amount_t& operation);
  dca::schema::transaction_result_t set_default_min_purchase_amount(
      const dca::schema::execution_context_t& context,
      const dca::schema::amount_t& min_purchase_amount);

  /// SCALE-encoded schedule, InexistentScheduleIndex when out of range.
  dca::schema::query_result_t get_schedule(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;
  dca::schema::query_result_t schedule_token_balance(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;
  dca::schema::query_result_t schedule_purchase_amount(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;
  dca::schema::query_result_t schedule_purchase_period(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;
  dca::schema::query_result_t schedule_id(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;

  std::optional<dca::schema::dca_schedule_t> find_schedule(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;
  dca::schema::dca_schedule_list_t my_dca_schedules(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token) const;
  std::optional<dca::schema::purchase_eligibility_t> purchase_eligibility(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index,
      dca::schema::timestamp_seconds_t now) const;

  std::vector<dca::schema::address_t> users() const;
  uint64_t all_time_user_count() const;

  dca::schema::protocol_settings_t settings() const;
  dca::schema::duration_seconds_t min_purchase_period() const;
  uint32_t max_schedules_per_token() const;
  dca::schema::amount_t min_purchase_amount(
      const dca::schema::address_t& token) const;

  std::vector<dca::schema::transaction_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;
  uint64_t event_count() const;

 private:
  using transaction_body_t = std::function<dca::schema::transaction_result_t(
      std::vector<dca::schema::transaction_event_t>&)>;

  dca::schema::transaction_result_t run_transaction(
      std::string_view operation,
      const transaction_body_t& body);

  dca::schema::query_result_t query_schedule(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index,
      const std::function<dca::schema::bytes_t(
          const dca::schema::dca_schedule_t&)>& project) const;

  std::shared_ptr<dca::handlers::purchase_executor> resolve_handler(
      const dca::schema::address_t& token,
      dca::schema::lending_protocol_index_t lending_protocol_index) const;

  dca::schema::transaction_result_t validate_purchase_period(
      dca::schema::duration_seconds_t purchase_period) const;
  dca::schema::transaction_result_t validate_purchase_amount(
      const dca::schema::address_t& token,
      const dca::schema::amount_t& purchase_amount,
      const dca::schema::amount_t& token_balance) const;
  dca::schema::transaction_result_t require_owner(
      const dca::schema::address_t& caller) const;

  dca::schema::amount_t locked_principal(
      const dca::schema::address_t& user,
      const dca::schema::address_t& token,
      dca::schema::lending_protocol_index_t lending_protocol_index) const;

  encoder_t& encoder_;
  dca::handlers::role_admin& role_admin_;
  dca::schema::address_t owner_;
  reentrancy_guard guard_;
  schedule_store store_;
  purchase_authorizer authorizer_;
};

}  // namespace dca::execution
