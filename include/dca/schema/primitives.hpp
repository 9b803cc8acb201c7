#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dca::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;
using lending_protocol_index_t = uint64_t;
/// Fixed-width little endian form of amount_t used on the wire.
using amount_bytes_t = std::array<uint8_t, 32>;

bytes_view_t make_bytes_view(const bytes_t& bytes);

std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();

/// Parse a base-10 unsigned integer that fits in 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::string to_hex(const address_t& address);

}  // namespace dca::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
