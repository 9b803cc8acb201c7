#include <dca/common/results.hpp>

namespace dca::common {

dca::schema::transaction_result_t make_success(dca::schema::bytes_t data) {
  auto result = dca::schema::transaction_result_t{};
  result.data = std::move(data);
  return result;
}

dca::schema::transaction_result_t make_failure(
    const dca::schema::error_code code,
    const std::string_view codespace,
    std::string info,
    dca::schema::bytes_t data) {
  auto result = dca::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{dca::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  result.data = std::move(data);
  return result;
}

dca::schema::query_result_t make_query_failure(
    const dca::schema::error_code code,
    const std::string_view codespace,
    std::string info) {
  auto result = dca::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{dca::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

event_builder::event_builder(std::string type) {
  event_.type = std::move(type);
}

event_builder& event_builder::indexed(std::string key, std::string value) {
  event_.attributes.push_back(dca::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true});
  return *this;
}

event_builder& event_builder::attribute(std::string key, std::string value) {
  event_.attributes.push_back(dca::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = false});
  return *this;
}

dca::schema::transaction_event_t event_builder::build() {
  return std::move(event_);
}

}  // namespace dca::common
