#include <dca/schema/error_code.hpp>
#include <dca/schema/primitives.hpp>
#include <dca/schema/role_id.hpp>
#include <dca/schema/schedule_status.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>

TEST(primitives, parses_addresses_with_optional_prefix) {
  auto address =
      dca::schema::try_make_address("0x00112233445566778899aabbccddeeff00112233");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ((*address)[0], 0x00);
  EXPECT_EQ((*address)[19], 0x33);
  EXPECT_EQ(dca::schema::to_hex(*address),
            "00112233445566778899aabbccddeeff00112233");

  EXPECT_FALSE(dca::schema::try_make_address("0x0011").has_value());
  EXPECT_FALSE(dca::schema::try_make_address(
                   "zz112233445566778899aabbccddeeff00112233")
                   .has_value());
}

TEST(primitives, parses_decimal_amounts_up_to_256_bits) {
  auto amount = dca::schema::try_make_amount("550000000000000000000");
  ASSERT_TRUE(amount.has_value());
  EXPECT_EQ(amount->str(), "550000000000000000000");

  auto max = std::numeric_limits<dca::schema::amount_t>::max();
  EXPECT_EQ(dca::schema::try_make_amount(max.str()), max);

  auto too_large = max.str();
  too_large.back() = '6';
  EXPECT_FALSE(dca::schema::try_make_amount(too_large).has_value());
  EXPECT_FALSE(dca::schema::try_make_amount("").has_value());
  EXPECT_FALSE(dca::schema::try_make_amount("12a").has_value());
}

TEST(primitives, amount_bytes_are_little_endian) {
  auto bytes = dca::schema::to_amount_bytes(dca::schema::amount_t{0x0102});
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[31], 0x00);

  auto max = std::numeric_limits<dca::schema::amount_t>::max();
  EXPECT_EQ(dca::schema::from_amount_bytes(dca::schema::to_amount_bytes(max)),
            max);
}

TEST(primitives, enum_names_round_trip) {
  EXPECT_EQ(dca::schema::to_string(
                dca::schema::error_code::schedule_id_and_index_mismatch),
            "ScheduleIdAndIndexMismatch");
  EXPECT_EQ(dca::schema::try_from_string<dca::schema::error_code>(
                "UnauthorizedSwapper"),
            dca::schema::error_code::unauthorized_swapper);
  EXPECT_EQ(dca::schema::try_from_string<dca::schema::role_id_t>("swapper"),
            dca::schema::role_id_t::swapper);
  EXPECT_EQ(dca::schema::to_string(dca::schema::schedule_status_t::due),
            "due");
  EXPECT_FALSE(
      dca::schema::try_from_string<dca::schema::role_id_t>("root").has_value());
}
