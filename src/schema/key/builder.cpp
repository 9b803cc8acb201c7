#include <algorithm>
#include <dca/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace dca::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const dca::schema::address_t& address) {
  return write(std::span(address.data(), address.size()));
}

builder& builder::write(const dca::schema::hash32_t& hash) {
  return write(std::span(hash.data(), hash.size()));
}
