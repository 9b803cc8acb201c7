#pragma once
#include <dca/schema/batch_buy_rbtc.hpp>
#include <dca/schema/buy_rbtc.hpp>
#include <dca/schema/create_dca_schedule.hpp>
#include <dca/schema/delete_dca_schedule.hpp>
#include <dca/schema/deposit_token.hpp>
#include <dca/schema/set_max_schedules_per_token.hpp>
#include <dca/schema/set_min_purchase_amount.hpp>
#include <dca/schema/set_min_purchase_period.hpp>
#include <dca/schema/set_purchase_amount.hpp>
#include <dca/schema/set_purchase_period.hpp>
#include <dca/schema/update_dca_schedule.hpp>
#include <dca/schema/withdraw_all_accumulated_interest.hpp>
#include <dca/schema/withdraw_all_accumulated_rbtc.hpp>
#include <dca/schema/withdraw_interest.hpp>
#include <dca/schema/withdraw_rbtc.hpp>
#include <dca/schema/withdraw_token.hpp>
#include <variant>

namespace dca::schema {

using transaction_payload_t = std::variant<batch_buy_rbtc_t,
                                           buy_rbtc_t,
                                           create_dca_schedule_t,
                                           delete_dca_schedule_t,
                                           deposit_token_t,
                                           set_max_schedules_per_token_t,
                                           set_min_purchase_amount_t,
                                           set_min_purchase_period_t,
                                           set_purchase_amount_t,
                                           set_purchase_period_t,
                                           update_dca_schedule_t,
                                           withdraw_all_accumulated_interest_t,
                                           withdraw_all_accumulated_rbtc_t,
                                           withdraw_interest_t,
                                           withdraw_rbtc_t,
                                           withdraw_token_t>;

}  // namespace dca::schema
