#pragma once

#include <dca/handlers/token_handler.hpp>
#include <dca/schema/primitives.hpp>
#include <vector>

namespace dca::handlers {

/// Token handler that also swaps deposited funds for rBTC and keeps the
/// purchased rBTC until its owner withdraws it.
class purchase_executor : public virtual token_handler {
 public:
  /// Withdraw `amount` of the buyer's funds, charge the fee and swap.
  /// Returns the rBTC credited to the buyer.
  virtual dca::schema::amount_t buy_rbtc(
      const dca::schema::address_t& buyer,
      const dca::schema::hash32_t& schedule_id,
      const dca::schema::amount_t& amount) = 0;

  /// Same as buy_rbtc for every entry, executed as one aggregated swap.
  virtual void batch_buy_rbtc(
      const std::vector<dca::schema::address_t>& buyers,
      const std::vector<dca::schema::hash32_t>& schedule_ids,
      const std::vector<dca::schema::amount_t>& amounts) = 0;

  virtual dca::schema::amount_t accumulated_rbtc_balance(
      const dca::schema::address_t& user) const = 0;
  virtual void withdraw_accumulated_rbtc(
      const dca::schema::address_t& user) = 0;
};

}  // namespace dca::handlers
