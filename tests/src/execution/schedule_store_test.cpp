#include <dca/common/results.hpp>
#include <dca/execution/schedule_store.hpp>
#include <dca/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using dca::schema::dca_schedule_t;
using dca::testing::ether;
using dca::testing::make_address;

const auto kOwner = make_address(0x01);
const auto kToken = make_address(0xD0);

dca_schedule_t make_schedule(dca::execution::schedule_store& store,
                             const uint64_t created_at,
                             const uint64_t balance_whole) {
  return dca_schedule_t{
      .owner = kOwner,
      .token = kToken,
      .token_balance = ether(balance_whole),
      .purchase_amount = ether(50),
      .purchase_period = 86'400,
      .last_purchase_timestamp = 0,
      .schedule_id = store.derive_schedule_id(kOwner, kToken, created_at),
      .lending_protocol_index = 1};
}

class schedule_store_test : public ::testing::Test {
 protected:
  schedule_store_test()
      : db_path_{dca::testing::make_db_path("dca_schedule_store")},
        storage_{dca::storage::make_storage<dca::storage::rocksdb_storage_tag>(
            db_path_)},
        store_{encoder_, storage_} {}

  ~schedule_store_test() override { dca::testing::remove_path(db_path_); }

  std::string db_path_;
  dca::execution::encoder_t encoder_;
  dca::execution::storage_t storage_;
  dca::execution::schedule_store store_;
};

}  // namespace

TEST_F(schedule_store_test, schedule_id_depends_on_position_and_time) {
  auto first = store_.derive_schedule_id(kOwner, kToken, 1'000);
  EXPECT_EQ(first, store_.derive_schedule_id(kOwner, kToken, 1'000));
  EXPECT_NE(first, store_.derive_schedule_id(kOwner, kToken, 1'001));
  EXPECT_NE(first, store_.derive_schedule_id(make_address(0x02), kToken,
                                             1'000));

  store_.append(make_schedule(store_, 1'000, 500));
  EXPECT_NE(first, store_.derive_schedule_id(kOwner, kToken, 1'000));
}

TEST_F(schedule_store_test, remove_moves_last_schedule_into_the_gap) {
  auto a = store_.append(make_schedule(store_, 1'000, 100)).schedule_id;
  auto b = store_.append(make_schedule(store_, 1'000, 200)).schedule_id;
  auto c = store_.append(make_schedule(store_, 1'000, 300)).schedule_id;

  auto removed = store_.remove(kOwner, kToken, 0);
  EXPECT_EQ(removed.schedule_id, a);

  const auto& list = store_.schedules(kOwner, kToken);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].schedule_id, c);
  EXPECT_EQ(list[1].schedule_id, b);

  auto stale = store_.validate_identity(kOwner, kToken, 0, a);
  EXPECT_EQ(dca::common::error_of(stale),
            dca::schema::error_code::schedule_id_and_index_mismatch);
}

TEST_F(schedule_store_test, schedule_id_is_unique_after_swap_remove) {
  store_.append(make_schedule(store_, 1'000, 100));
  store_.append(make_schedule(store_, 1'000, 200));
  auto c = store_.append(make_schedule(store_, 1'000, 300)).schedule_id;
  store_.remove(kOwner, kToken, 0);

  // Same second and same list size as `c` at its creation.
  auto d = store_.append(make_schedule(store_, 1'000, 400)).schedule_id;
  EXPECT_NE(d, c);

  const auto& list = store_.schedules(kOwner, kToken);
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].schedule_id, c);
  EXPECT_EQ(list[2].schedule_id, d);
  EXPECT_NE(list[0].schedule_id, list[1].schedule_id);
  EXPECT_NE(list[1].schedule_id, list[2].schedule_id);

  auto stale = store_.validate_identity(kOwner, kToken, 2, c);
  EXPECT_EQ(dca::common::error_of(stale),
            dca::schema::error_code::schedule_id_and_index_mismatch);
}

TEST_F(schedule_store_test, index_is_checked_before_id) {
  store_.append(make_schedule(store_, 1'000, 100));
  auto result = store_.validate_identity(kOwner, kToken, 5,
                                         dca::testing::make_hash(9));
  EXPECT_EQ(dca::common::error_of(result),
            dca::schema::error_code::inexistent_schedule_index);
  EXPECT_EQ(result.log, "InexistentScheduleIndex");
}

TEST_F(schedule_store_test, rollback_restores_lists_users_and_settings) {
  store_.append(make_schedule(store_, 1'000, 100));
  store_.register_user(kOwner);
  store_.commit({});

  store_.mutable_schedule(kOwner, kToken, 0).token_balance = ether(1);
  store_.append(make_schedule(store_, 2'000, 300));
  store_.append(dca_schedule_t{.owner = make_address(0x02), .token = kToken});
  EXPECT_TRUE(store_.register_user(make_address(0x02)));
  store_.mutable_settings().max_schedules_per_token = 3;

  store_.rollback();

  const auto& list = store_.schedules(kOwner, kToken);
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].token_balance, ether(100));
  EXPECT_TRUE(store_.schedules(make_address(0x02), kToken).empty());
  EXPECT_EQ(store_.users().size(), 1u);
  EXPECT_TRUE(store_.register_user(make_address(0x02)));
  EXPECT_EQ(store_.settings().max_schedules_per_token,
            dca::schema::kDefaultMaxSchedulesPerToken);
}

TEST_F(schedule_store_test, committed_state_survives_reload) {
  auto id = store_.append(make_schedule(store_, 1'000, 100)).schedule_id;
  store_.append(make_schedule(store_, 1'000, 200));
  store_.register_user(kOwner);
  store_.mutable_settings().token_min_purchase_amounts[kToken] = ether(10);
  auto event = dca::common::event_builder{"DcaScheduleCreated"}
                   .indexed("owner", dca::schema::to_hex(kOwner))
                   .build();
  store_.commit({event});

  store_.remove(kOwner, kToken, 1);
  store_.commit({});

  auto reloaded = dca::execution::schedule_store{encoder_, storage_};
  reloaded.load();
  const auto& list = reloaded.schedules(kOwner, kToken);
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].schedule_id, id);
  EXPECT_EQ(list[0].token_balance, ether(100));
  ASSERT_EQ(reloaded.users().size(), 1u);
  EXPECT_EQ(reloaded.users()[0], kOwner);
  EXPECT_EQ(reloaded.settings().min_purchase_amount(kToken), ether(10));
  ASSERT_EQ(reloaded.event_count(), 1u);
  auto events = reloaded.events(0, 10);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "DcaScheduleCreated");
  EXPECT_EQ(events[0].attribute("owner"), dca::schema::to_hex(kOwner));
}

TEST_F(schedule_store_test, emptied_list_is_deleted_from_storage) {
  store_.append(make_schedule(store_, 1'000, 100));
  store_.commit({});
  store_.remove(kOwner, kToken, 0);
  store_.commit({});

  auto reloaded = dca::execution::schedule_store{encoder_, storage_};
  reloaded.load();
  EXPECT_TRUE(reloaded.schedules(kOwner, kToken).empty());
  EXPECT_FALSE(reloaded.find(kOwner, kToken, 0).has_value());
}
