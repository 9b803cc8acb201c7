#pragma once

#include <dca/handlers/role_admin.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/role_id.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>

namespace dca::handlers {

/// In-process role_admin: role assignments, lending protocol names and the
/// token handler registry.
///
/// The owner may grant and revoke any role. Accounts holding the admin role
/// maintain the lending protocol and token handler registries.
class operations_admin final : public role_admin {
 public:
  explicit operations_admin(const dca::schema::address_t& owner);

  bool grant_role(const dca::schema::address_t& caller,
                  dca::schema::role_id_t role,
                  const dca::schema::address_t& account);
  bool revoke_role(const dca::schema::address_t& caller,
                   dca::schema::role_id_t role,
                   const dca::schema::address_t& account);

  bool add_or_update_lending_protocol(
      const dca::schema::address_t& caller,
      dca::schema::lending_protocol_index_t lending_protocol_index,
      std::string name);

  bool assign_or_update_token_handler(
      const dca::schema::address_t& caller,
      const dca::schema::address_t& token,
      dca::schema::lending_protocol_index_t lending_protocol_index,
      std::shared_ptr<purchase_executor> handler);

  bool has_role(dca::schema::role_id_t role,
                const dca::schema::address_t& account) const override;
  std::shared_ptr<purchase_executor> token_handler(
      const dca::schema::address_t& token,
      dca::schema::lending_protocol_index_t lending_protocol_index)
      const override;
  std::string lending_protocol_name(dca::schema::lending_protocol_index_t
                                        lending_protocol_index) const override;

 private:
  bool is_admin(const dca::schema::address_t& caller) const;

  mutable std::mutex mutex_;
  dca::schema::address_t owner_;
  std::set<std::tuple<dca::schema::role_id_t, dca::schema::address_t>> roles_;
  std::map<dca::schema::lending_protocol_index_t, std::string>
      lending_protocols_;
  std::map<std::tuple<dca::schema::address_t,
                      dca::schema::lending_protocol_index_t>,
           std::shared_ptr<purchase_executor>>
      token_handlers_;
};

}  // namespace dca::handlers
