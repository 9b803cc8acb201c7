#include <dca/handlers/operations_admin.hpp>
#include <spdlog/spdlog.h>

namespace dca::handlers {

operations_admin::operations_admin(const dca::schema::address_t& owner)
    : owner_{owner} {}

bool operations_admin::grant_role(const dca::schema::address_t& caller,
                                  const dca::schema::role_id_t role,
                                  const dca::schema::address_t& account) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != owner_) {
    spdlog::warn("grant_role rejected: caller is not the owner");
    return false;
  }
  roles_.insert(std::tuple{role, account});
  spdlog::info("granted role {} to {}", dca::schema::to_string(role),
               dca::schema::to_hex(account));
  return true;
}

bool operations_admin::revoke_role(const dca::schema::address_t& caller,
                                   const dca::schema::role_id_t role,
                                   const dca::schema::address_t& account) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != owner_) {
    spdlog::warn("revoke_role rejected: caller is not the owner");
    return false;
  }
  roles_.erase(std::tuple{role, account});
  spdlog::info("revoked role {} from {}", dca::schema::to_string(role),
               dca::schema::to_hex(account));
  return true;
}

bool operations_admin::add_or_update_lending_protocol(
    const dca::schema::address_t& caller,
    const dca::schema::lending_protocol_index_t lending_protocol_index,
    std::string name) {
  auto lock = std::scoped_lock{mutex_};
  if (!is_admin(caller)) {
    spdlog::warn("add_or_update_lending_protocol rejected: not an admin");
    return false;
  }
  spdlog::info("lending protocol {} registered as '{}'",
               lending_protocol_index, name);
  lending_protocols_[lending_protocol_index] = std::move(name);
  return true;
}

bool operations_admin::assign_or_update_token_handler(
    const dca::schema::address_t& caller,
    const dca::schema::address_t& token,
    const dca::schema::lending_protocol_index_t lending_protocol_index,
    std::shared_ptr<purchase_executor> handler) {
  auto lock = std::scoped_lock{mutex_};
  if (!is_admin(caller)) {
    spdlog::warn("assign_or_update_token_handler rejected: not an admin");
    return false;
  }
  auto key = std::tuple{token, lending_protocol_index};
  if (!handler) {
    token_handlers_.erase(key);
    return true;
  }
  token_handlers_[key] = std::move(handler);
  spdlog::info("token handler assigned for token {} lending protocol {}",
               dca::schema::to_hex(token), lending_protocol_index);
  return true;
}

bool operations_admin::has_role(const dca::schema::role_id_t role,
                                const dca::schema::address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return roles_.contains(std::tuple{role, account});
}

std::shared_ptr<purchase_executor> operations_admin::token_handler(
    const dca::schema::address_t& token,
    const dca::schema::lending_protocol_index_t lending_protocol_index) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = token_handlers_.find(std::tuple{token, lending_protocol_index});
  if (it == std::end(token_handlers_)) {
    return nullptr;
  }
  return it->second;
}

std::string operations_admin::lending_protocol_name(
    const dca::schema::lending_protocol_index_t lending_protocol_index) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = lending_protocols_.find(lending_protocol_index);
  if (it == std::end(lending_protocols_)) {
    return {};
  }
  return it->second;
}

bool operations_admin::is_admin(const dca::schema::address_t& caller) const {
  return caller == owner_ ||
         roles_.contains(std::tuple{dca::schema::role_id_t::admin, caller});
}

}  // namespace dca::handlers
