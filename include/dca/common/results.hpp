#pragma once

#include <dca/schema/error_code.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/query_result.hpp>
#include <dca/schema/transaction_event.hpp>
#include <dca/schema/transaction_result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace dca::common {

dca::schema::transaction_result_t make_success(
    dca::schema::bytes_t data = {});

/// Failure result: `log` carries the error name, `data` the SCALE-encoded
/// values the failure reports.
dca::schema::transaction_result_t make_failure(
    dca::schema::error_code code,
    std::string_view codespace,
    std::string info,
    dca::schema::bytes_t data = {});

dca::schema::query_result_t make_query_failure(dca::schema::error_code code,
                                               std::string_view codespace,
                                               std::string info);

inline bool failed(const dca::schema::transaction_result_t& result) {
  return result.code != 0;
}

inline dca::schema::error_code error_of(
    const dca::schema::transaction_result_t& result) {
  return static_cast<dca::schema::error_code>(result.code);
}

class event_builder final {
 public:
  explicit event_builder(std::string type);

  /// Attribute consumers filter on (owner, token, schedule id).
  event_builder& indexed(std::string key, std::string value);
  event_builder& attribute(std::string key, std::string value);

  dca::schema::transaction_event_t build();

 private:
  dca::schema::transaction_event_t event_;
};

}  // namespace dca::common
