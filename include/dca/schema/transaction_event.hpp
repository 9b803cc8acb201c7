#pragma once

#include <dca/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Fact emitted by a committed transaction: schedule created, balance
// updated, purchase executed, setting changed.
namespace dca::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  /// Value of the first attribute named `key`, empty when absent.
  std::string attribute(const std::string_view key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
    return {};
  }
};

using transaction_event_t = transaction_event<1>;

}  // namespace dca::schema
