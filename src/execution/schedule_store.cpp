#include <dca/blake3/hash.hpp>
#include <dca/common/results.hpp>
#include <dca/execution/schedule_store.hpp>
#include <dca/schema/key/builder.hpp>
#include <dca/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace dca::execution {

namespace {

constexpr auto kCodespace = std::string_view{"dca.schedule"};

}  // namespace

schedule_store::schedule_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void schedule_store::load() {
  schedules_.clear();
  users_.clear();
  registered_users_.clear();
  clear_journal();

  auto prefix =
      dca::schema::key::make_prefix_key(encoder_,
                                        dca::schema::key::kScheduleKeyPrefix);
  auto schedule_count = std::size_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(dca::schema::make_bytes_view(prefix))) {
    auto list = encoder_.decode<dca::schema::dca_schedule_list_t>(
        dca::schema::make_bytes_view(value));
    if (list.empty()) {
      continue;
    }
    schedule_count += list.size();
    const auto owner = list.front().owner;
    const auto token = list.front().token;
    schedules_[owner][token] = std::move(list);
  }

  auto users_key =
      dca::schema::key::make_prefix_key(encoder_, dca::schema::key::kUsersKey);
  if (auto users = storage_.get<std::vector<dca::schema::address_t>>(
          encoder_, dca::schema::make_bytes_view(users_key))) {
    users_ = std::move(*users);
    registered_users_.insert(std::begin(users_), std::end(users_));
  }

  auto settings_key = dca::schema::key::make_prefix_key(
      encoder_, dca::schema::key::kSettingsKey);
  if (auto settings = storage_.get<dca::schema::protocol_settings_t>(
          encoder_, dca::schema::make_bytes_view(settings_key))) {
    settings_ = std::move(*settings);
  }

  auto sequence_key = dca::schema::key::make_prefix_key(
      encoder_, dca::schema::key::kEventSeqKey);
  event_sequence_ =
      storage_
          .get<uint64_t>(encoder_, dca::schema::make_bytes_view(sequence_key))
          .value_or(0);

  spdlog::info("loaded {} schedules of {} users, {} events", schedule_count,
               users_.size(), event_sequence_);
}

const dca::schema::dca_schedule_list_t& schedule_store::schedules(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token) const {
  static const auto kEmpty = dca::schema::dca_schedule_list_t{};
  auto owner_it = schedules_.find(owner);
  if (owner_it == std::end(schedules_)) {
    return kEmpty;
  }
  auto token_it = owner_it->second.find(token);
  if (token_it == std::end(owner_it->second)) {
    return kEmpty;
  }
  return token_it->second;
}

std::optional<dca::schema::dca_schedule_t> schedule_store::find(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token,
    const uint64_t schedule_index) const {
  const auto& list = schedules(owner, token);
  if (schedule_index >= list.size()) {
    return std::nullopt;
  }
  return list[schedule_index];
}

dca::schema::transaction_result_t schedule_store::validate_identity(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token,
    const uint64_t schedule_index,
    const dca::schema::hash32_t& schedule_id) const {
  const auto& list = schedules(owner, token);
  if (schedule_index >= list.size()) {
    return dca::common::make_failure(
        dca::schema::error_code::inexistent_schedule_index, kCodespace,
        "schedule index " + std::to_string(schedule_index) + " out of range",
        encoder_.encode(schedule_index));
  }
  if (list[schedule_index].schedule_id != schedule_id) {
    return dca::common::make_failure(
        dca::schema::error_code::schedule_id_and_index_mismatch, kCodespace,
        "schedule at index " + std::to_string(schedule_index) +
            " has a different id",
        encoder_.encode(std::tuple{schedule_index, schedule_id}));
  }
  return dca::common::make_success();
}

dca::schema::hash32_t schedule_store::derive_schedule_id(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token,
    const dca::schema::timestamp_seconds_t created_at) const {
  const auto& list = schedules(owner, token);
  auto b = dca::schema::key::builder{};
  b.write(owner);
  b.write(token);
  b.write(created_at);
  b.write(static_cast<uint64_t>(list.size()));
  auto id = dca::blake3::hash(dca::schema::make_bytes_view(b.data));

  // A swap-remove can leave a live schedule created at the same second and
  // position; chain the digest with a counter until the id is unused.
  auto in_use = [&](const dca::schema::hash32_t& candidate) {
    return std::ranges::any_of(list, [&](const auto& schedule) {
      return schedule.schedule_id == candidate;
    });
  };
  for (uint64_t collision = 1; in_use(id); ++collision) {
    auto rehash = dca::schema::key::builder{};
    rehash.write(id);
    rehash.write(collision);
    id = dca::blake3::hash(dca::schema::make_bytes_view(rehash.data));
  }
  return id;
}

const dca::schema::dca_schedule_t& schedule_store::append(
    dca::schema::dca_schedule_t schedule) {
  auto& list = mutable_list(schedule.owner, schedule.token);
  list.push_back(std::move(schedule));
  return list.back();
}

dca::schema::dca_schedule_t& schedule_store::mutable_schedule(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token,
    const uint64_t schedule_index) {
  return mutable_list(owner, token).at(schedule_index);
}

dca::schema::dca_schedule_t schedule_store::remove(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token,
    const uint64_t schedule_index) {
  auto& list = mutable_list(owner, token);
  auto removed = list.at(schedule_index);
  if (schedule_index + 1 != list.size()) {
    list[schedule_index] = std::move(list.back());
  }
  list.pop_back();
  return removed;
}

bool schedule_store::register_user(const dca::schema::address_t& user) {
  if (registered_users_.contains(user)) {
    return false;
  }
  if (!users_journal_) {
    users_journal_ = users_;
  }
  users_.push_back(user);
  registered_users_.insert(user);
  return true;
}

const std::vector<dca::schema::address_t>& schedule_store::users() const {
  return users_;
}

const dca::schema::protocol_settings_t& schedule_store::settings() const {
  return settings_;
}

dca::schema::protocol_settings_t& schedule_store::mutable_settings() {
  if (!settings_journal_) {
    settings_journal_ = settings_;
  }
  return settings_;
}

void schedule_store::commit(
    const std::vector<dca::schema::transaction_event_t>& events) {
  auto writes = dca::storage::write_set{};

  for (const auto& [list_key, snapshot] : schedule_journal_) {
    const auto& [owner, token] = list_key;
    auto key = dca::schema::key::make_schedule_list_key(encoder_, owner, token);
    const auto& list = schedules(owner, token);
    if (list.empty()) {
      writes.deletes.push_back(std::move(key));
      auto owner_it = schedules_.find(owner);
      if (owner_it != std::end(schedules_)) {
        owner_it->second.erase(token);
        if (owner_it->second.empty()) {
          schedules_.erase(owner_it);
        }
      }
      continue;
    }
    writes.puts.emplace_back(std::move(key), encoder_.encode(list));
  }

  if (users_journal_) {
    writes.puts.emplace_back(
        dca::schema::key::make_prefix_key(encoder_,
                                          dca::schema::key::kUsersKey),
        encoder_.encode(users_));
  }
  if (settings_journal_) {
    writes.puts.emplace_back(
        dca::schema::key::make_prefix_key(encoder_,
                                          dca::schema::key::kSettingsKey),
        encoder_.encode(settings_));
  }

  if (!events.empty()) {
    for (const auto& event : events) {
      writes.puts.emplace_back(
          dca::schema::key::make_event_key(encoder_, event_sequence_++),
          encoder_.encode(event));
    }
    writes.puts.emplace_back(
        dca::schema::key::make_prefix_key(encoder_,
                                          dca::schema::key::kEventSeqKey),
        encoder_.encode(event_sequence_));
  }

  storage_.apply(writes);
  clear_journal();
}

void schedule_store::rollback() {
  for (auto& [list_key, snapshot] : schedule_journal_) {
    const auto& [owner, token] = list_key;
    if (snapshot.empty()) {
      auto owner_it = schedules_.find(owner);
      if (owner_it != std::end(schedules_)) {
        owner_it->second.erase(token);
        if (owner_it->second.empty()) {
          schedules_.erase(owner_it);
        }
      }
      continue;
    }
    schedules_[owner][token] = std::move(snapshot);
  }

  if (users_journal_) {
    users_ = std::move(*users_journal_);
    registered_users_.clear();
    registered_users_.insert(std::begin(users_), std::end(users_));
  }
  if (settings_journal_) {
    settings_ = std::move(*settings_journal_);
  }

  if (!schedule_journal_.empty()) {
    spdlog::debug("rolled back {} schedule lists", schedule_journal_.size());
  }
  clear_journal();
}

std::vector<dca::schema::transaction_event_t> schedule_store::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto out = std::vector<dca::schema::transaction_event_t>{};
  const auto end = std::min(to_sequence, event_sequence_);
  for (auto sequence = from_sequence; sequence < end; ++sequence) {
    auto key = dca::schema::key::make_event_key(encoder_, sequence);
    auto event = storage_.get<dca::schema::transaction_event_t>(
        encoder_, dca::schema::make_bytes_view(key));
    if (event) {
      out.push_back(std::move(*event));
    }
  }
  return out;
}

uint64_t schedule_store::event_count() const {
  return event_sequence_;
}

dca::schema::dca_schedule_list_t& schedule_store::mutable_list(
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token) {
  auto& list = schedules_[owner][token];
  auto key = list_key_t{owner, token};
  if (!schedule_journal_.contains(key)) {
    schedule_journal_.emplace(std::move(key), list);
  }
  return list;
}

void schedule_store::clear_journal() {
  schedule_journal_.clear();
  users_journal_.reset();
  settings_journal_.reset();
}

}  // namespace dca::execution
