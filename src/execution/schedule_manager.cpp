#include <dca/common/results.hpp>
#include <dca/execution/schedule_manager.hpp>
#include <dca/handlers/lending_adapter.hpp>
#include <spdlog/spdlog.h>
#include <tuple>

using namespace dca::schema;

namespace dca::execution {

namespace {

constexpr auto kCodespace = std::string_view{"dca.manager"};

dca::common::event_builder schedule_event(std::string type,
                                          const address_t& owner,
                                          const address_t& token,
                                          const hash32_t& schedule_id) {
  auto builder = dca::common::event_builder{std::move(type)};
  builder.indexed("owner", to_hex(owner))
      .indexed("token", to_hex(token))
      .indexed("schedule_id", to_hex(schedule_id));
  return builder;
}

transaction_result_t token_not_accepted(
    const address_t& token,
    const lending_protocol_index_t lending_protocol_index) {
  return dca::common::make_failure(
      error_code::token_not_accepted, kCodespace,
      "token " + to_hex(token) + " is not accepted for lending protocol " +
          std::to_string(lending_protocol_index));
}

}  // namespace

schedule_manager::schedule_manager(encoder_t& encoder,
                                   storage_t& storage,
                                   dca::handlers::role_admin& role_admin,
                                   const address_t& owner)
    : encoder_{encoder},
      role_admin_{role_admin},
      owner_{owner},
      store_{encoder, storage},
      authorizer_{encoder, store_} {
  store_.load();
}

transaction_result_t schedule_manager::execute(
    const execution_context_t& context,
    const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [&](const create_dca_schedule_t& operation) {
            return create_dca_schedule(context, operation);
          },
          [&](const update_dca_schedule_t& operation) {
            return update_dca_schedule(context, operation);
          },
          [&](const delete_dca_schedule_t& operation) {
            return delete_dca_schedule(context, operation);
          },
          [&](const deposit_token_t& operation) {
            return deposit_token(context, operation);
          },
          [&](const withdraw_token_t& operation) {
            return withdraw_token(context, operation);
          },
          [&](const set_purchase_amount_t& operation) {
            return set_purchase_amount(context, operation);
          },
          [&](const set_purchase_period_t& operation) {
            return set_purchase_period(context, operation);
          },
          [&](const buy_rbtc_t& operation) {
            return buy_rbtc(context, operation);
          },
          [&](const batch_buy_rbtc_t& operation) {
            return batch_buy_rbtc(context, operation);
          },
          [&](const withdraw_rbtc_t& operation) {
            return withdraw_rbtc_from_token_handler(context, operation);
          },
          [&](const withdraw_all_accumulated_rbtc_t& operation) {
            return withdraw_all_accumulated_rbtc(context, operation);
          },
          [&](const withdraw_interest_t& operation) {
            return withdraw_interest_from_token_handler(context, operation);
          },
          [&](const withdraw_all_accumulated_interest_t& operation) {
            return withdraw_all_accumulated_interest(context, operation);
          },
          [&](const set_min_purchase_period_t& operation) {
            return set_min_purchase_period(context, operation);
          },
          [&](const set_max_schedules_per_token_t& operation) {
            return set_max_schedules_per_token(context, operation);
          },
          [&](const set_min_purchase_amount_t& operation) {
            return set_min_purchase_amount(context, operation);
          }},
      payload);
}

transaction_result_t schedule_manager::create_dca_schedule(
    const execution_context_t& context,
    const create_dca_schedule_t& operation) {
  return run_transaction("create_dca_schedule", [&](auto& events) {
    const auto& caller = context.caller;
    if (operation.deposit_amount == 0) {
      return dca::common::make_failure(
          error_code::deposit_amount_must_be_greater_than_zero, kCodespace,
          "deposit amount must be greater than zero");
    }
    auto handler =
        resolve_handler(operation.token, operation.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                operation.lending_protocol_index);
    }
    const auto max_schedules = store_.settings().max_schedules_per_token;
    if (store_.schedules(caller, operation.token).size() >= max_schedules) {
      return dca::common::make_failure(
          error_code::max_schedules_reached, kCodespace,
          "at most " + std::to_string(max_schedules) +
              " schedules per token",
          encoder_.encode(max_schedules));
    }
    auto validation = validate_purchase_period(operation.purchase_period);
    if (dca::common::failed(validation)) {
      return validation;
    }
    validation = validate_purchase_amount(
        operation.token, operation.purchase_amount, operation.deposit_amount);
    if (dca::common::failed(validation)) {
      return validation;
    }

    store_.register_user(caller);
    const auto schedule_index =
        static_cast<uint64_t>(store_.schedules(caller, operation.token).size());
    const auto& schedule = store_.append(dca_schedule_t{
        .owner = caller,
        .token = operation.token,
        .token_balance = operation.deposit_amount,
        .purchase_amount = operation.purchase_amount,
        .purchase_period = operation.purchase_period,
        .last_purchase_timestamp = 0,
        .schedule_id = store_.derive_schedule_id(caller, operation.token,
                                                 context.timestamp),
        .lending_protocol_index = operation.lending_protocol_index});
    const auto schedule_id = schedule.schedule_id;

    handler->deposit_token(caller, operation.deposit_amount);

    events.push_back(
        schedule_event("DcaScheduleCreated", caller, operation.token,
                       schedule_id)
            .attribute("schedule_index", std::to_string(schedule_index))
            .attribute("deposit_amount", operation.deposit_amount.str())
            .attribute("purchase_amount", operation.purchase_amount.str())
            .attribute("purchase_period",
                       std::to_string(operation.purchase_period))
            .attribute("lending_protocol_index",
                       std::to_string(operation.lending_protocol_index))
            .build());
    spdlog::info("schedule {} created for {} at index {}", to_hex(schedule_id),
                 to_hex(caller), schedule_index);
    return dca::common::make_success(
        encoder_.encode(std::tuple{schedule_index, schedule_id}));
  });
}

transaction_result_t schedule_manager::update_dca_schedule(
    const execution_context_t& context,
    const update_dca_schedule_t& operation) {
  return run_transaction("update_dca_schedule", [&](auto& events) {
    const auto& caller = context.caller;
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }

    // A zero field leaves the current value unchanged.
    auto current =
        *store_.find(caller, operation.token, operation.schedule_index);
    auto token_balance = current.token_balance + operation.deposit_amount;
    auto purchase_amount = operation.purchase_amount == 0
                               ? current.purchase_amount
                               : operation.purchase_amount;
    auto purchase_period = operation.purchase_period == 0
                               ? current.purchase_period
                               : operation.purchase_period;

    auto handler = std::shared_ptr<dca::handlers::purchase_executor>{};
    if (operation.deposit_amount > 0) {
      handler =
          resolve_handler(operation.token, current.lending_protocol_index);
      if (!handler) {
        return token_not_accepted(operation.token,
                                  current.lending_protocol_index);
      }
    }
    if (operation.purchase_period != 0) {
      auto validation = validate_purchase_period(purchase_period);
      if (dca::common::failed(validation)) {
        return validation;
      }
    }
    if (operation.deposit_amount > 0 || operation.purchase_amount > 0) {
      auto validation =
          validate_purchase_amount(operation.token, purchase_amount,
                                   token_balance);
      if (dca::common::failed(validation)) {
        return validation;
      }
    }

    auto& schedule = store_.mutable_schedule(caller, operation.token,
                                             operation.schedule_index);
    schedule.token_balance = token_balance;
    schedule.purchase_amount = purchase_amount;
    schedule.purchase_period = purchase_period;

    if (handler) {
      handler->deposit_token(caller, operation.deposit_amount);
      events.push_back(schedule_event("TokenDeposited", caller,
                                      operation.token, operation.schedule_id)
                           .attribute("amount", operation.deposit_amount.str())
                           .build());
      events.push_back(
          schedule_event("ScheduleBalanceUpdated", caller, operation.token,
                         operation.schedule_id)
              .attribute("schedule_index",
                         std::to_string(operation.schedule_index))
              .attribute("token_balance", token_balance.str())
              .build());
    }

    events.push_back(
        schedule_event("DcaScheduleUpdated", caller, operation.token,
                       operation.schedule_id)
            .attribute("schedule_index",
                       std::to_string(operation.schedule_index))
            .attribute("token_balance", token_balance.str())
            .attribute("purchase_amount", purchase_amount.str())
            .attribute("purchase_period", std::to_string(purchase_period))
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::delete_dca_schedule(
    const execution_context_t& context,
    const delete_dca_schedule_t& operation) {
  return run_transaction("delete_dca_schedule", [&](auto& events) {
    const auto& caller = context.caller;
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }

    const auto lending_protocol_index =
        store_.find(caller, operation.token, operation.schedule_index)
            ->lending_protocol_index;
    auto handler = resolve_handler(operation.token, lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token, lending_protocol_index);
    }

    auto removed =
        store_.remove(caller, operation.token, operation.schedule_index);
    if (removed.token_balance > 0) {
      handler->withdraw_token(caller, removed.token_balance);
    }

    events.push_back(
        schedule_event("DcaScheduleDeleted", caller, operation.token,
                       operation.schedule_id)
            .attribute("schedule_index",
                       std::to_string(operation.schedule_index))
            .attribute("refunded_amount", removed.token_balance.str())
            .build());
    spdlog::info("schedule {} of {} deleted, {} refunded",
                 to_hex(operation.schedule_id), to_hex(caller),
                 removed.token_balance.str());
    return dca::common::make_success(
        encoder_.encode(to_amount_bytes(removed.token_balance)));
  });
}

transaction_result_t schedule_manager::deposit_token(
    const execution_context_t& context,
    const deposit_token_t& operation) {
  return run_transaction("deposit_token", [&](auto& events) {
    const auto& caller = context.caller;
    if (operation.amount == 0) {
      return dca::common::make_failure(
          error_code::deposit_amount_must_be_greater_than_zero, kCodespace,
          "deposit amount must be greater than zero");
    }
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }

    auto& schedule = store_.mutable_schedule(caller, operation.token,
                                             operation.schedule_index);
    auto handler =
        resolve_handler(operation.token, schedule.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                schedule.lending_protocol_index);
    }
    schedule.token_balance += operation.amount;
    const auto token_balance = schedule.token_balance;

    handler->deposit_token(caller, operation.amount);

    events.push_back(schedule_event("TokenDeposited", caller, operation.token,
                                    operation.schedule_id)
                         .attribute("amount", operation.amount.str())
                         .build());
    events.push_back(
        schedule_event("ScheduleBalanceUpdated", caller, operation.token,
                       operation.schedule_id)
            .attribute("schedule_index",
                       std::to_string(operation.schedule_index))
            .attribute("token_balance", token_balance.str())
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::withdraw_token(
    const execution_context_t& context,
    const withdraw_token_t& operation) {
  return run_transaction("withdraw_token", [&](auto& events) {
    const auto& caller = context.caller;
    if (operation.amount == 0) {
      return dca::common::make_failure(
          error_code::withdrawal_amount_must_be_greater_than_zero, kCodespace,
          "withdrawal amount must be greater than zero");
    }
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }

    auto& schedule = store_.mutable_schedule(caller, operation.token,
                                             operation.schedule_index);
    if (operation.amount > schedule.token_balance) {
      return dca::common::make_failure(
          error_code::schedule_balance_not_enough_for_withdrawal, kCodespace,
          "schedule balance " + schedule.token_balance.str() +
              " is below the withdrawal amount",
          encoder_.encode(to_amount_bytes(schedule.token_balance)));
    }
    auto handler =
        resolve_handler(operation.token, schedule.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                schedule.lending_protocol_index);
    }
    schedule.token_balance -= operation.amount;
    const auto token_balance = schedule.token_balance;

    handler->withdraw_token(caller, operation.amount);

    events.push_back(schedule_event("TokenWithdrawn", caller, operation.token,
                                    operation.schedule_id)
                         .attribute("amount", operation.amount.str())
                         .build());
    events.push_back(
        schedule_event("ScheduleBalanceUpdated", caller, operation.token,
                       operation.schedule_id)
            .attribute("schedule_index",
                       std::to_string(operation.schedule_index))
            .attribute("token_balance", token_balance.str())
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::set_purchase_amount(
    const execution_context_t& context,
    const set_purchase_amount_t& operation) {
  return run_transaction("set_purchase_amount", [&](auto& events) {
    const auto& caller = context.caller;
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }
    auto& schedule = store_.mutable_schedule(caller, operation.token,
                                             operation.schedule_index);
    auto validation = validate_purchase_amount(
        operation.token, operation.purchase_amount, schedule.token_balance);
    if (dca::common::failed(validation)) {
      return validation;
    }
    schedule.purchase_amount = operation.purchase_amount;

    events.push_back(
        schedule_event("PurchaseAmountSet", caller, operation.token,
                       operation.schedule_id)
            .attribute("purchase_amount", operation.purchase_amount.str())
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::set_purchase_period(
    const execution_context_t& context,
    const set_purchase_period_t& operation) {
  return run_transaction("set_purchase_period", [&](auto& events) {
    const auto& caller = context.caller;
    auto identity =
        store_.validate_identity(caller, operation.token,
                                 operation.schedule_index,
                                 operation.schedule_id);
    if (dca::common::failed(identity)) {
      return identity;
    }
    auto validation = validate_purchase_period(operation.purchase_period);
    if (dca::common::failed(validation)) {
      return validation;
    }
    store_
        .mutable_schedule(caller, operation.token, operation.schedule_index)
        .purchase_period = operation.purchase_period;

    events.push_back(
        schedule_event("PurchasePeriodSet", caller, operation.token,
                       operation.schedule_id)
            .attribute("purchase_period",
                       std::to_string(operation.purchase_period))
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::buy_rbtc(
    const execution_context_t& context,
    const buy_rbtc_t& operation) {
  return run_transaction("buy_rbtc", [&](auto& events) {
    if (!role_admin_.has_role(role_id_t::swapper, context.caller)) {
      return dca::common::make_failure(error_code::unauthorized_swapper,
                                       kCodespace,
                                       "caller does not hold the swapper role");
    }

    auto authorization = purchase_authorization_t{};
    auto authorized = authorizer_.authorize_purchase(
        operation.buyer, operation.token, operation.schedule_index,
        operation.schedule_id, context.timestamp, authorization, events);
    if (dca::common::failed(authorized)) {
      return authorized;
    }

    auto handler = resolve_handler(operation.token,
                                   authorization.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                authorization.lending_protocol_index);
    }
    auto purchased = handler->buy_rbtc(operation.buyer, operation.schedule_id,
                                       authorization.purchase_amount);

    events.push_back(
        schedule_event("RbtcBought", operation.buyer, operation.token,
                       operation.schedule_id)
            .attribute("purchase_amount", authorization.purchase_amount.str())
            .attribute("rbtc_amount", purchased.str())
            .build());
    spdlog::info("bought {} rBTC for {} with {}", purchased.str(),
                 to_hex(operation.buyer), authorization.purchase_amount.str());
    return dca::common::make_success(
        encoder_.encode(to_amount_bytes(purchased)));
  });
}

transaction_result_t schedule_manager::batch_buy_rbtc(
    const execution_context_t& context,
    const batch_buy_rbtc_t& operation) {
  return run_transaction("batch_buy_rbtc", [&](auto& events) {
    if (!role_admin_.has_role(role_id_t::swapper, context.caller)) {
      return dca::common::make_failure(error_code::unauthorized_swapper,
                                       kCodespace,
                                       "caller does not hold the swapper role");
    }
    const auto count = operation.buyers.size();
    if (count == 0) {
      return dca::common::make_failure(error_code::empty_batch_purchase_arrays,
                                       kCodespace, "batch purchase is empty");
    }
    if (operation.schedule_indexes.size() != count ||
        operation.schedule_ids.size() != count ||
        operation.purchase_amounts.size() != count) {
      return dca::common::make_failure(
          error_code::batch_purchase_arrays_length_mismatch, kCodespace,
          "batch purchase arrays differ in length");
    }

    auto handler =
        resolve_handler(operation.token, operation.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                operation.lending_protocol_index);
    }

    auto total = amount_t{};
    for (std::size_t i = 0; i < count; ++i) {
      auto authorization = purchase_authorization_t{};
      auto authorized = authorizer_.authorize_purchase(
          operation.buyers[i], operation.token, operation.schedule_indexes[i],
          operation.schedule_ids[i], context.timestamp, authorization, events);
      if (dca::common::failed(authorized)) {
        authorized.info = "batch entry " + std::to_string(i) + ": " +
                          authorized.info;
        return authorized;
      }
      if (authorization.purchase_amount != operation.purchase_amounts[i]) {
        return dca::common::make_failure(
            error_code::purchase_amount_mismatch, kCodespace,
            "batch entry " + std::to_string(i) + " declares " +
                operation.purchase_amounts[i].str() + " but schedule buys " +
                authorization.purchase_amount.str(),
            encoder_.encode(std::tuple{
                static_cast<uint64_t>(i),
                to_amount_bytes(operation.purchase_amounts[i]),
                to_amount_bytes(authorization.purchase_amount)}));
      }
      total += authorization.purchase_amount;
    }

    handler->batch_buy_rbtc(operation.buyers, operation.schedule_ids,
                            operation.purchase_amounts);

    events.push_back(
        dca::common::event_builder{"BatchRbtcBought"}
            .indexed("token", to_hex(operation.token))
            .attribute("lending_protocol_index",
                       std::to_string(operation.lending_protocol_index))
            .attribute("purchase_count", std::to_string(count))
            .attribute("total_purchase_amount", total.str())
            .build());
    spdlog::info("batch of {} purchases executed for token {}, total {}",
                 count, to_hex(operation.token), total.str());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::withdraw_rbtc_from_token_handler(
    const execution_context_t& context,
    const withdraw_rbtc_t& operation) {
  return run_transaction("withdraw_rbtc", [&](auto& events) {
    auto handler =
        resolve_handler(operation.token, operation.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                operation.lending_protocol_index);
    }
    auto balance = handler->accumulated_rbtc_balance(context.caller);
    if (balance == 0) {
      return dca::common::make_failure(
          error_code::no_accumulated_rbtc_to_withdraw, kCodespace,
          "no accumulated rBTC to withdraw");
    }
    handler->withdraw_accumulated_rbtc(context.caller);

    events.push_back(
        dca::common::event_builder{"RbtcWithdrawn"}
            .indexed("user", to_hex(context.caller))
            .indexed("token", to_hex(operation.token))
            .attribute("lending_protocol_index",
                       std::to_string(operation.lending_protocol_index))
            .attribute("amount", balance.str())
            .build());
    return dca::common::make_success(encoder_.encode(to_amount_bytes(balance)));
  });
}

transaction_result_t schedule_manager::withdraw_all_accumulated_rbtc(
    const execution_context_t& context,
    const withdraw_all_accumulated_rbtc_t& operation) {
  return run_transaction("withdraw_all_accumulated_rbtc", [&](auto& events) {
    auto total = amount_t{};
    for (const auto& token : operation.tokens) {
      for (const auto lending_protocol_index :
           operation.lending_protocol_indexes) {
        auto handler = resolve_handler(token, lending_protocol_index);
        if (!handler) {
          continue;
        }
        auto balance = handler->accumulated_rbtc_balance(context.caller);
        if (balance == 0) {
          continue;
        }
        handler->withdraw_accumulated_rbtc(context.caller);
        total += balance;
        events.push_back(
            dca::common::event_builder{"RbtcWithdrawn"}
                .indexed("user", to_hex(context.caller))
                .indexed("token", to_hex(token))
                .attribute("lending_protocol_index",
                           std::to_string(lending_protocol_index))
                .attribute("amount", balance.str())
                .build());
      }
    }
    return dca::common::make_success(encoder_.encode(to_amount_bytes(total)));
  });
}

transaction_result_t schedule_manager::withdraw_interest_from_token_handler(
    const execution_context_t& context,
    const withdraw_interest_t& operation) {
  return run_transaction("withdraw_interest", [&](auto& events) {
    auto handler =
        resolve_handler(operation.token, operation.lending_protocol_index);
    if (!handler) {
      return token_not_accepted(operation.token,
                                operation.lending_protocol_index);
    }
    auto adapter =
        std::dynamic_pointer_cast<dca::handlers::lending_adapter>(handler);
    if (role_admin_.lending_protocol_name(operation.lending_protocol_index)
            .empty() ||
        !adapter) {
      return dca::common::make_failure(
          error_code::token_does_not_yield_interest, kCodespace,
          "lending protocol " +
              std::to_string(operation.lending_protocol_index) +
              " does not yield interest");
    }

    auto principal = locked_principal(context.caller, operation.token,
                                      operation.lending_protocol_index);
    auto interest = adapter->accrued_interest(context.caller, principal);
    adapter->withdraw_interest(context.caller, principal);

    events.push_back(
        dca::common::event_builder{"InterestWithdrawn"}
            .indexed("user", to_hex(context.caller))
            .indexed("token", to_hex(operation.token))
            .attribute("lending_protocol_index",
                       std::to_string(operation.lending_protocol_index))
            .attribute("locked_principal", principal.str())
            .attribute("amount", interest.str())
            .build());
    return dca::common::make_success(
        encoder_.encode(to_amount_bytes(interest)));
  });
}

transaction_result_t schedule_manager::withdraw_all_accumulated_interest(
    const execution_context_t& context,
    const withdraw_all_accumulated_interest_t& operation) {
  return run_transaction(
      "withdraw_all_accumulated_interest", [&](auto& events) {
        auto total = amount_t{};
        for (const auto& token : operation.tokens) {
          for (const auto lending_protocol_index :
               operation.lending_protocol_indexes) {
            if (role_admin_.lending_protocol_name(lending_protocol_index)
                    .empty()) {
              continue;
            }
            auto adapter =
                std::dynamic_pointer_cast<dca::handlers::lending_adapter>(
                    resolve_handler(token, lending_protocol_index));
            if (!adapter) {
              continue;
            }
            auto principal =
                locked_principal(context.caller, token, lending_protocol_index);
            auto interest =
                adapter->accrued_interest(context.caller, principal);
            if (interest == 0) {
              continue;
            }
            adapter->withdraw_interest(context.caller, principal);
            total += interest;
            events.push_back(
                dca::common::event_builder{"InterestWithdrawn"}
                    .indexed("user", to_hex(context.caller))
                    .indexed("token", to_hex(token))
                    .attribute("lending_protocol_index",
                               std::to_string(lending_protocol_index))
                    .attribute("locked_principal", principal.str())
                    .attribute("amount", interest.str())
                    .build());
          }
        }
        return dca::common::make_success(
            encoder_.encode(to_amount_bytes(total)));
      });
}

transaction_result_t schedule_manager::set_min_purchase_period(
    const execution_context_t& context,
    const set_min_purchase_period_t& operation) {
  return run_transaction("set_min_purchase_period", [&](auto& events) {
    auto authorized = require_owner(context.caller);
    if (dca::common::failed(authorized)) {
      return authorized;
    }
    store_.mutable_settings().min_purchase_period =
        operation.min_purchase_period;
    events.push_back(
        dca::common::event_builder{"MinPurchasePeriodSet"}
            .attribute("min_purchase_period",
                       std::to_string(operation.min_purchase_period))
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::set_max_schedules_per_token(
    const execution_context_t& context,
    const set_max_schedules_per_token_t& operation) {
  return run_transaction("set_max_schedules_per_token", [&](auto& events) {
    auto authorized = require_owner(context.caller);
    if (dca::common::failed(authorized)) {
      return authorized;
    }
    store_.mutable_settings().max_schedules_per_token =
        operation.max_schedules_per_token;
    events.push_back(
        dca::common::event_builder{"MaxSchedulesPerTokenSet"}
            .attribute("max_schedules_per_token",
                       std::to_string(operation.max_schedules_per_token))
            .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::set_min_purchase_amount(
    const execution_context_t& context,
    const set_min_purchase_amount_t& operation) {
  return run_transaction("set_min_purchase_amount", [&](auto& events) {
    auto authorized = require_owner(context.caller);
    if (dca::common::failed(authorized)) {
      return authorized;
    }
    auto& settings = store_.mutable_settings();
    auto event = dca::common::event_builder{"MinPurchaseAmountSet"};
    if (operation.token) {
      settings.token_min_purchase_amounts[*operation.token] =
          operation.min_purchase_amount;
      event.indexed("token", to_hex(*operation.token));
    } else {
      settings.default_min_purchase_amount = operation.min_purchase_amount;
    }
    events.push_back(event
                         .attribute("min_purchase_amount",
                                    operation.min_purchase_amount.str())
                         .build());
    return dca::common::make_success();
  });
}

transaction_result_t schedule_manager::set_default_min_purchase_amount(
    const execution_context_t& context,
    const amount_t& min_purchase_amount) {
  return set_min_purchase_amount(
      context, set_min_purchase_amount_t{.token = std::nullopt,
                                         .min_purchase_amount =
                                             min_purchase_amount});
}

query_result_t schedule_manager::get_schedule(const address_t& owner,
                                              const address_t& token,
                                              const uint64_t schedule_index)
    const {
  return query_schedule(owner, token, schedule_index,
                        [this](const dca_schedule_t& schedule) {
                          return encoder_.encode(schedule);
                        });
}

query_result_t schedule_manager::schedule_token_balance(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index) const {
  return query_schedule(owner, token, schedule_index,
                        [this](const dca_schedule_t& schedule) {
                          return encoder_.encode(
                              to_amount_bytes(schedule.token_balance));
                        });
}

query_result_t schedule_manager::schedule_purchase_amount(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index) const {
  return query_schedule(owner, token, schedule_index,
                        [this](const dca_schedule_t& schedule) {
                          return encoder_.encode(
                              to_amount_bytes(schedule.purchase_amount));
                        });
}

query_result_t schedule_manager::schedule_purchase_period(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index) const {
  return query_schedule(owner, token, schedule_index,
                        [this](const dca_schedule_t& schedule) {
                          return encoder_.encode(schedule.purchase_period);
                        });
}

query_result_t schedule_manager::schedule_id(const address_t& owner,
                                             const address_t& token,
                                             const uint64_t schedule_index)
    const {
  return query_schedule(owner, token, schedule_index,
                        [this](const dca_schedule_t& schedule) {
                          return encoder_.encode(schedule.schedule_id);
                        });
}

std::optional<dca_schedule_t> schedule_manager::find_schedule(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index) const {
  auto lock = guard_.read_lock();
  return store_.find(owner, token, schedule_index);
}

dca_schedule_list_t schedule_manager::my_dca_schedules(
    const address_t& owner,
    const address_t& token) const {
  auto lock = guard_.read_lock();
  return store_.schedules(owner, token);
}

std::optional<purchase_eligibility_t> schedule_manager::purchase_eligibility(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index,
    const timestamp_seconds_t now) const {
  auto lock = guard_.read_lock();
  auto schedule = store_.find(owner, token, schedule_index);
  if (!schedule) {
    return std::nullopt;
  }
  return purchase_authorizer::classify(*schedule, now);
}

std::vector<address_t> schedule_manager::users() const {
  auto lock = guard_.read_lock();
  return store_.users();
}

uint64_t schedule_manager::all_time_user_count() const {
  auto lock = guard_.read_lock();
  return store_.users().size();
}

protocol_settings_t schedule_manager::settings() const {
  auto lock = guard_.read_lock();
  return store_.settings();
}

duration_seconds_t schedule_manager::min_purchase_period() const {
  return settings().min_purchase_period;
}

uint32_t schedule_manager::max_schedules_per_token() const {
  return settings().max_schedules_per_token;
}

amount_t schedule_manager::min_purchase_amount(const address_t& token) const {
  return settings().min_purchase_amount(token);
}

std::vector<transaction_event_t> schedule_manager::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto lock = guard_.read_lock();
  return store_.events(from_sequence, to_sequence);
}

uint64_t schedule_manager::event_count() const {
  auto lock = guard_.read_lock();
  return store_.event_count();
}

transaction_result_t schedule_manager::run_transaction(
    const std::string_view operation,
    const transaction_body_t& body) {
  if (guard_.entered_by_current_thread()) {
    spdlog::warn("{} rejected: reentrant call", operation);
    return dca::common::make_failure(
        error_code::reentrant_call, kCodespace,
        std::string{operation} + " called while another call is in progress");
  }

  auto scope = reentrancy_guard::scope{guard_};
  auto events = std::vector<transaction_event_t>{};
  auto result = transaction_result_t{};
  try {
    result = body(events);
  } catch (const std::exception& e) {
    store_.rollback();
    spdlog::error("{} aborted, external call failed: {}", operation, e.what());
    return dca::common::make_failure(error_code::external_call_failed,
                                     kCodespace, e.what());
  } catch (...) {
    // Not a std::exception: undo the partial state and let it propagate.
    store_.rollback();
    spdlog::error("{} aborted by a non-standard exception", operation);
    throw;
  }

  if (dca::common::failed(result)) {
    store_.rollback();
    spdlog::debug("{} failed: {} ({})", operation, result.log, result.info);
    return result;
  }

  store_.commit(events);
  result.events = std::move(events);
  return result;
}

query_result_t schedule_manager::query_schedule(
    const address_t& owner,
    const address_t& token,
    const uint64_t schedule_index,
    const std::function<bytes_t(const dca_schedule_t&)>& project) const {
  auto lock = guard_.read_lock();
  auto schedule = store_.find(owner, token, schedule_index);
  if (!schedule) {
    return dca::common::make_query_failure(
        error_code::inexistent_schedule_index, kCodespace,
        "schedule index " + std::to_string(schedule_index) + " out of range");
  }
  auto result = query_result_t{};
  result.value = project(*schedule);
  return result;
}

std::shared_ptr<dca::handlers::purchase_executor>
schedule_manager::resolve_handler(
    const address_t& token,
    const lending_protocol_index_t lending_protocol_index) const {
  return role_admin_.token_handler(token, lending_protocol_index);
}

transaction_result_t schedule_manager::validate_purchase_period(
    const duration_seconds_t purchase_period) const {
  const auto min_period = store_.settings().min_purchase_period;
  if (purchase_period < min_period) {
    return dca::common::make_failure(
        error_code::purchase_period_must_be_greater_than_minimum, kCodespace,
        "purchase period must be at least " + std::to_string(min_period) +
            "s",
        encoder_.encode(min_period));
  }
  return dca::common::make_success();
}

transaction_result_t schedule_manager::validate_purchase_amount(
    const address_t& token,
    const amount_t& purchase_amount,
    const amount_t& token_balance) const {
  if (purchase_amount > token_balance / 2) {
    return dca::common::make_failure(
        error_code::purchase_amount_must_be_lower_than_half_of_balance,
        kCodespace,
        "purchase amount must not exceed half of the balance " +
            token_balance.str(),
        encoder_.encode(to_amount_bytes(token_balance / 2)));
  }
  const auto& min_amount = store_.settings().min_purchase_amount(token);
  if (purchase_amount < min_amount) {
    return dca::common::make_failure(
        error_code::purchase_amount_must_be_greater_than_minimum, kCodespace,
        "purchase amount must be at least " + min_amount.str(),
        encoder_.encode(to_amount_bytes(min_amount)));
  }
  return dca::common::make_success();
}

transaction_result_t schedule_manager::require_owner(
    const address_t& caller) const {
  if (caller != owner_) {
    return dca::common::make_failure(error_code::not_owner, kCodespace,
                                     "caller is not the owner");
  }
  return dca::common::make_success();
}

amount_t schedule_manager::locked_principal(
    const address_t& user,
    const address_t& token,
    const lending_protocol_index_t lending_protocol_index) const {
  auto principal = amount_t{};
  for (const auto& schedule : store_.schedules(user, token)) {
    if (schedule.lending_protocol_index == lending_protocol_index) {
      principal += schedule.token_balance;
    }
  }
  return principal;
}

}  // namespace dca::execution
