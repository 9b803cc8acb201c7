#include <dca/schema/encoding/scale/encoder.hpp>
#include <dca/schema/key/engine_keys.hpp>
#include <dca/storage/rocksdb/storage.hpp>
#include <dca/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using storage_t = dca::storage::storage<dca::storage::rocksdb_storage_tag>;
using encoder_t = dca::schema::encoding::scale_encoder_t;

}  // namespace

TEST(storage_types, write_set_defaults_are_empty) {
  auto writes = dca::storage::write_set{};
  EXPECT_TRUE(writes.empty());
  writes.deletes.push_back({1});
  EXPECT_FALSE(writes.empty());
}

TEST(storage_types, put_get_and_prefix_listing) {
  auto db = dca::testing::make_db_path("dca_storage_prefix");
  {
    auto storage =
        dca::storage::make_storage<dca::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto owner = dca::testing::make_address(1);

    auto first = dca::schema::key::make_schedule_list_key(
        encoder, owner, dca::testing::make_address(0xD0));
    auto second = dca::schema::key::make_schedule_list_key(
        encoder, owner, dca::testing::make_address(0xD1));
    auto users = dca::schema::key::make_prefix_key(
        encoder, dca::schema::key::kUsersKey);

    storage.put(encoder, dca::schema::make_bytes_view(first), uint64_t{1});
    storage.put(encoder, dca::schema::make_bytes_view(second), uint64_t{2});
    storage.put(encoder, dca::schema::make_bytes_view(users), uint64_t{3});

    auto value =
        storage.get<uint64_t>(encoder, dca::schema::make_bytes_view(second));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 2u);

    auto prefix = dca::schema::key::make_prefix_key(
        encoder, dca::schema::key::kScheduleKeyPrefix);
    auto entries =
        storage.list_by_prefix(dca::schema::make_bytes_view(prefix));
    EXPECT_EQ(entries.size(), 2u);
  }
  dca::testing::remove_path(db);
}

TEST(storage_types, apply_writes_puts_and_deletes_together) {
  auto db = dca::testing::make_db_path("dca_storage_apply");
  {
    auto storage =
        dca::storage::make_storage<dca::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto stale = dca::schema::key::make_event_key(encoder, 0);
    auto fresh = dca::schema::key::make_event_key(encoder, 1);
    storage.put(encoder, dca::schema::make_bytes_view(stale), uint64_t{7});

    auto writes = dca::storage::write_set{};
    writes.deletes.push_back(stale);
    writes.puts.emplace_back(fresh, encoder.encode(uint64_t{9}));
    storage.apply(writes);

    EXPECT_FALSE(
        storage.get<uint64_t>(encoder, dca::schema::make_bytes_view(stale))
            .has_value());
    EXPECT_EQ(
        storage.get<uint64_t>(encoder, dca::schema::make_bytes_view(fresh)),
        9u);
  }
  dca::testing::remove_path(db);
}
