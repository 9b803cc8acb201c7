#include <dca/fees/fee_calculator.hpp>
#include <dca/handlers/operations_admin.hpp>
#include <dca/testing/common.hpp>
#include <dca/testing/mock_handlers.hpp>
#include <gtest/gtest.h>

#include <memory>

namespace {

using dca::schema::role_id_t;
using dca::testing::make_address;

const auto kOwner = make_address(0xA0);
const auto kAdmin = make_address(0xA1);
const auto kStranger = make_address(0x05);
const auto kToken = make_address(0xD0);

}  // namespace

TEST(operations_admin, only_owner_assigns_roles) {
  auto admin = dca::handlers::operations_admin{kOwner};
  EXPECT_FALSE(admin.grant_role(kStranger, role_id_t::swapper, kStranger));
  EXPECT_FALSE(admin.has_role(role_id_t::swapper, kStranger));

  EXPECT_TRUE(admin.grant_role(kOwner, role_id_t::swapper, kStranger));
  EXPECT_TRUE(admin.has_role(role_id_t::swapper, kStranger));
  EXPECT_FALSE(admin.has_role(role_id_t::admin, kStranger));

  EXPECT_TRUE(admin.revoke_role(kOwner, role_id_t::swapper, kStranger));
  EXPECT_FALSE(admin.has_role(role_id_t::swapper, kStranger));
}

TEST(operations_admin, admins_maintain_registries) {
  auto admin = dca::handlers::operations_admin{kOwner};
  auto fees = dca::fees::fee_calculator{kOwner, dca::schema::fee_settings_t{}};
  auto handler = std::make_shared<dca::testing::mock_executor>(fees);

  EXPECT_FALSE(admin.add_or_update_lending_protocol(kAdmin, 1, "tropykus"));
  EXPECT_FALSE(admin.assign_or_update_token_handler(kAdmin, kToken, 1,
                                                    handler));

  ASSERT_TRUE(admin.grant_role(kOwner, role_id_t::admin, kAdmin));
  EXPECT_TRUE(admin.add_or_update_lending_protocol(kAdmin, 1, "tropykus"));
  EXPECT_TRUE(admin.assign_or_update_token_handler(kAdmin, kToken, 1,
                                                   handler));

  EXPECT_EQ(admin.lending_protocol_name(1), "tropykus");
  EXPECT_TRUE(admin.lending_protocol_name(2).empty());
  EXPECT_EQ(admin.token_handler(kToken, 1), handler);
  EXPECT_EQ(admin.token_handler(kToken, 2), nullptr);
  EXPECT_EQ(admin.token_handler(make_address(0xD1), 1), nullptr);

  EXPECT_TRUE(admin.assign_or_update_token_handler(kAdmin, kToken, 1,
                                                   nullptr));
  EXPECT_EQ(admin.token_handler(kToken, 1), nullptr);
}
