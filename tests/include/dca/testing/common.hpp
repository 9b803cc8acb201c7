#pragma once

#include <dca/schema/execution_context.hpp>
#include <dca/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace dca::testing {

inline dca::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = dca::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline dca::schema::address_t make_address(const uint8_t seed) {
  auto out = dca::schema::address_t{};
  out[0] = seed;
  out[19] = seed;
  return out;
}

/// `whole` units of an 18-decimal token.
inline dca::schema::amount_t ether(const uint64_t whole) {
  return dca::schema::amount_t{whole} *
         dca::schema::amount_t{1'000'000'000'000'000'000ull};
}

inline dca::schema::execution_context_t make_context(
    const dca::schema::address_t& caller,
    const dca::schema::timestamp_seconds_t timestamp) {
  return dca::schema::execution_context_t{.caller = caller,
                                          .timestamp = timestamp};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace dca::testing
