#pragma once

#include <dca/handlers/purchase_executor.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/role_id.hpp>
#include <memory>
#include <string>

namespace dca::handlers {

/// Permission and handler registry consulted by the schedule manager.
class role_admin {
 public:
  virtual ~role_admin() = default;

  virtual bool has_role(dca::schema::role_id_t role,
                        const dca::schema::address_t& account) const = 0;

  /// Handler serving (token, lending protocol index); nullptr when the pair
  /// is not accepted.
  virtual std::shared_ptr<purchase_executor> token_handler(
      const dca::schema::address_t& token,
      dca::schema::lending_protocol_index_t lending_protocol_index) const = 0;

  /// Registered lending protocol name; empty means the index does not lend.
  virtual std::string lending_protocol_name(
      dca::schema::lending_protocol_index_t lending_protocol_index) const = 0;
};

}  // namespace dca::handlers
