#pragma once

#include <dca/handlers/token_handler.hpp>
#include <dca/schema/primitives.hpp>

namespace dca::handlers {

/// Token handler whose idle balance earns interest in a lending protocol.
/// Interest is attributed to a user in proportion to the principal the
/// user's schedules keep locked.
class lending_adapter : public virtual token_handler {
 public:
  virtual dca::schema::amount_t accrued_interest(
      const dca::schema::address_t& user,
      const dca::schema::amount_t& locked_principal) const = 0;
  virtual void withdraw_interest(
      const dca::schema::address_t& user,
      const dca::schema::amount_t& locked_principal) = 0;
};

}  // namespace dca::handlers
