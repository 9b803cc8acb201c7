#pragma once

#include <dca/schema/primitives.hpp>

namespace dca::handlers {

/// Custody of one stablecoin for one lending venue.
///
/// Implementations move exactly the requested amount and throw on failure;
/// a throw aborts the enclosing schedule_manager transaction.
class token_handler {
 public:
  virtual ~token_handler() = default;

  virtual void deposit_token(const dca::schema::address_t& user,
                             const dca::schema::amount_t& amount) = 0;
  virtual void withdraw_token(const dca::schema::address_t& user,
                              const dca::schema::amount_t& amount) = 0;
};

}  // namespace dca::handlers
