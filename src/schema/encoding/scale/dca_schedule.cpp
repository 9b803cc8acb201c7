#include <dca/schema/encoding/scale/dca_schedule.hpp>

namespace dca::schema {

void encode(const dca_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.token, encoder);
  encode(to_amount_bytes(o.token_balance), encoder);
  encode(to_amount_bytes(o.purchase_amount), encoder);
  encode(o.purchase_period, encoder);
  encode(o.last_purchase_timestamp, encoder);
  encode(o.schedule_id, encoder);
  encode(o.lending_protocol_index, encoder);
}

void decode(dca_schedule<1>& o, ::scale::Decoder& decoder) {
  auto token_balance = amount_bytes_t{};
  auto purchase_amount = amount_bytes_t{};
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.token, decoder);
  decode(token_balance, decoder);
  decode(purchase_amount, decoder);
  decode(o.purchase_period, decoder);
  decode(o.last_purchase_timestamp, decoder);
  decode(o.schedule_id, decoder);
  decode(o.lending_protocol_index, decoder);
  o.token_balance = from_amount_bytes(token_balance);
  o.purchase_amount = from_amount_bytes(purchase_amount);
}

}  // namespace dca::schema
