#pragma once

#include <dca/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for schedule lists, the user
// registry, protocol settings and the event log.
namespace dca::schema::key {

inline constexpr std::string_view kScheduleKeyPrefix{"DCA|STATE|SCHEDULES|"};
inline constexpr std::string_view kUsersKey{"DCA|STATE|USERS"};
inline constexpr std::string_view kSettingsKey{"DCA|STATE|SETTINGS"};
inline constexpr std::string_view kEventSeqKey{"DCA|STATE|EVENT_SEQ"};
inline constexpr std::string_view kEventPrefix{"DCA|EVENT|"};

template <typename Encoder, typename T>
dca::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                       std::string_view prefix,
                                       const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // the encoding of tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
dca::schema::bytes_t make_prefix_key(Encoder& encoder,
                                     std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
dca::schema::bytes_t make_schedule_list_key(
    Encoder& encoder,
    const dca::schema::address_t& owner,
    const dca::schema::address_t& token) {
  return make_prefixed_key(encoder, kScheduleKeyPrefix,
                           std::tuple{owner, token});
}

template <typename Encoder>
dca::schema::bytes_t make_event_key(Encoder& encoder, const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

}  // namespace dca::schema::key
