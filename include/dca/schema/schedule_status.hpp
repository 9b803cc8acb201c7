#pragma once

#include <dca/schema/enum_string.hpp>
#include <dca/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: schedule status.
// Purchase timing state of a schedule. Depletion is reported separately in
// purchase_eligibility_t because it does not depend on timing.
namespace dca::schema {

enum class schedule_status_t : uint8_t {
  never_purchased = 0,
  due = 1,
  cooling_down = 2
};

inline constexpr auto kScheduleStatusMappings = std::array{
    enum_mapping_t<schedule_status_t>{"never_purchased",
                                      schedule_status_t::never_purchased},
    enum_mapping_t<schedule_status_t>{"due", schedule_status_t::due},
    enum_mapping_t<schedule_status_t>{"cooling_down",
                                      schedule_status_t::cooling_down},
};

template <>
inline std::optional<schedule_status_t> try_from_string<schedule_status_t>(
    const std::string_view value) {
  return from_string(value, kScheduleStatusMappings);
}

inline constexpr std::string_view to_string(const schedule_status_t value) {
  return to_string(value, kScheduleStatusMappings).value_or("unknown");
}

struct purchase_eligibility_t final {
  schedule_status_t status{schedule_status_t::never_purchased};
  duration_seconds_t remaining_wait{};
  bool depleted{};

  bool purchasable() const {
    return status != schedule_status_t::cooling_down && !depleted;
  }
};

}  // namespace dca::schema
