#pragma once

#include <dca/schema/primitives.hpp>
#include <dca/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace dca::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one entry point call. `code` is an error_code value (0 on
/// success), `log` its name, `info` a readable detail and `data` the
/// SCALE-encoded values reported by the failure or returned on success.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace dca::schema
