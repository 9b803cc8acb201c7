#pragma once

#include <dca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Operator roles resolved through the role admin: admins manage the
// registries, swappers are the only callers allowed to trigger purchases.
namespace dca::schema {

enum class role_id_t : uint8_t { admin = 0, swapper = 1 };

inline constexpr auto kRoleIdMappings = std::array{
    enum_mapping_t<role_id_t>{"admin", role_id_t::admin},
    enum_mapping_t<role_id_t>{"swapper", role_id_t::swapper},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace dca::schema
