#include <dca/schema/encoding/scale/protocol_settings.hpp>
#include <tuple>
#include <vector>

namespace dca::schema {

void encode(const protocol_settings<1>& o, ::scale::Encoder& encoder) {
  // Overrides travel as a sorted list of (token, amount) pairs.
  auto overrides = std::vector<std::tuple<address_t, amount_bytes_t>>{};
  overrides.reserve(o.token_min_purchase_amounts.size());
  for (const auto& [token, amount] : o.token_min_purchase_amounts) {
    overrides.emplace_back(token, to_amount_bytes(amount));
  }

  encode(o.version, encoder);
  encode(o.min_purchase_period, encoder);
  encode(o.max_schedules_per_token, encoder);
  encode(to_amount_bytes(o.default_min_purchase_amount), encoder);
  encode(overrides, encoder);
}

void decode(protocol_settings<1>& o, ::scale::Decoder& decoder) {
  auto default_min_purchase_amount = amount_bytes_t{};
  auto overrides = std::vector<std::tuple<address_t, amount_bytes_t>>{};

  decode(o.version, decoder);
  decode(o.min_purchase_period, decoder);
  decode(o.max_schedules_per_token, decoder);
  decode(default_min_purchase_amount, decoder);
  decode(overrides, decoder);

  o.default_min_purchase_amount =
      from_amount_bytes(default_min_purchase_amount);
  o.token_min_purchase_amounts.clear();
  for (const auto& [token, amount] : overrides) {
    o.token_min_purchase_amounts[token] = from_amount_bytes(amount);
  }
}

}  // namespace dca::schema
