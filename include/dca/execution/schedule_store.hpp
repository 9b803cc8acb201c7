#pragma once

#include <dca/execution/types.hpp>
#include <dca/schema/dca_schedule.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/protocol_settings.hpp>
#include <dca/schema/transaction_event.hpp>
#include <dca/schema/transaction_result.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <vector>

namespace dca::execution {

/// Authoritative schedule table: owner -> token -> unordered list.
///
/// Deleting swap-removes (the last schedule takes the deleted slot), so an
/// index only identifies a schedule together with its schedule_id.
///
/// Every mutation inside a transaction is journaled. commit() persists the
/// touched lists, the user registry, the settings and the transaction's
/// events in a single write batch; rollback() restores the state the table
/// had when the transaction began.
class schedule_store final {
 public:
  schedule_store(encoder_t& encoder, storage_t& storage);

  /// Rebuild the in-memory table from storage.
  void load();

  const dca::schema::dca_schedule_list_t& schedules(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token) const;

  std::optional<dca::schema::dca_schedule_t> find(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index) const;

  /// InexistentScheduleIndex when the index is out of bounds, then
  /// ScheduleIdAndIndexMismatch when the slot holds another schedule.
  dca::schema::transaction_result_t validate_identity(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index,
      const dca::schema::hash32_t& schedule_id) const;

  /// Identifier for the next schedule appended to (owner, token).
  dca::schema::hash32_t derive_schedule_id(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      dca::schema::timestamp_seconds_t created_at) const;

  const dca::schema::dca_schedule_t& append(
      dca::schema::dca_schedule_t schedule);

  /// Precondition: validate_identity succeeded for the index.
  dca::schema::dca_schedule_t& mutable_schedule(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token,
      uint64_t schedule_index);

  /// Swap-remove; returns the removed schedule.
  dca::schema::dca_schedule_t remove(const dca::schema::address_t& owner,
                                     const dca::schema::address_t& token,
                                     uint64_t schedule_index);

  /// Record a first-time user; false when already known.
  bool register_user(const dca::schema::address_t& user);
  const std::vector<dca::schema::address_t>& users() const;

  const dca::schema::protocol_settings_t& settings() const;
  dca::schema::protocol_settings_t& mutable_settings();

  void commit(const std::vector<dca::schema::transaction_event_t>& events);
  void rollback();

  /// Persisted events with sequence numbers in [from_sequence, to_sequence).
  std::vector<dca::schema::transaction_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;
  uint64_t event_count() const;

 private:
  using list_key_t =
      std::tuple<dca::schema::address_t, dca::schema::address_t>;

  dca::schema::dca_schedule_list_t& mutable_list(
      const dca::schema::address_t& owner,
      const dca::schema::address_t& token);
  void clear_journal();

  encoder_t& encoder_;
  storage_t& storage_;
  std::map<dca::schema::address_t,
           std::map<dca::schema::address_t, dca::schema::dca_schedule_list_t>>
      schedules_;
  std::vector<dca::schema::address_t> users_;
  std::set<dca::schema::address_t> registered_users_;
  dca::schema::protocol_settings_t settings_;
  uint64_t event_sequence_{};

  std::map<list_key_t, dca::schema::dca_schedule_list_t> schedule_journal_;
  std::optional<std::vector<dca::schema::address_t>> users_journal_;
  std::optional<dca::schema::protocol_settings_t> settings_journal_;
};

}  // namespace dca::execution
