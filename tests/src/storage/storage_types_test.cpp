#include <gtest/gtest.h>
#include <lockbox/schema/key/engine_keys.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <lockbox/testing/common.hpp>
#include <lockbox/testing/engine_fixture.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = lockbox::storage::committed_state{};
  EXPECT_EQ(committed.sequence, 0u);
  EXPECT_EQ(committed.state_root, make_zero_hash());

  auto entry = lockbox::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, commit_writes_rows_and_checkpoint_together) {
  auto db = make_db_path("lockbox_storage_commit");
  {
    auto storage =
        lockbox::storage::make_storage<lockbox::storage::rocksdb_storage_tag>(db);
    auto encoder = scale_encoder_t{};
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto alice = make_account(0x10);
    auto record = deposit_record_t{.amount = units(3),
                                   .created_at = kGenesisTime,
                                   .lock_until = kGenesisTime + kShortLockDuration};
    auto key = lockbox::schema::key::make_deposits_key(encoder, alice);
    auto rows = std::vector<lockbox::storage::key_value_entry_t>{
        {key, encoder.encode(std::vector{record})}};
    storage.commit(rows, lockbox::storage::committed_state{
                             .sequence = 9, .state_root = make_account(0x44)});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sequence, 9u);
    EXPECT_EQ(loaded->state_root, make_account(0x44));

    auto records =
        storage.get<std::vector<deposit_record_t>>(encoder, view_of(key));
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(records.value(), std::vector{record});
  }
  remove_path(db);
}

TEST(storage_types, missing_key_reads_as_nullopt) {
  auto db = make_db_path("lockbox_storage_missing");
  {
    auto storage =
        lockbox::storage::make_storage<lockbox::storage::rocksdb_storage_tag>(db);
    auto encoder = scale_encoder_t{};
    auto key = lockbox::schema::key::make_total_locked_key(encoder);
    EXPECT_FALSE(storage.get<amount_t>(encoder, view_of(key)).has_value());

    storage.put(encoder, view_of(key), units(12));
    EXPECT_EQ(storage.get<amount_t>(encoder, view_of(key)), units(12));
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_stays_inside_its_keyspace) {
  auto db = make_db_path("lockbox_storage_prefix");
  {
    auto storage =
        lockbox::storage::make_storage<lockbox::storage::rocksdb_storage_tag>(db);
    auto encoder = scale_encoder_t{};
    namespace key = lockbox::schema::key;

    auto alice = make_account(0x10);
    auto bob = make_account(0x20);
    storage.put(encoder, view_of(key::make_lifetime_key(encoder, alice)),
                units(1));
    storage.put(encoder, view_of(key::make_lifetime_key(encoder, bob)),
                units(2));
    storage.put(encoder, view_of(key::make_roles_key(encoder, alice)),
                std::vector{role_id_t::big_depositor});
    storage.put(encoder, view_of(key::make_event_sequence_key(encoder)),
                uint64_t{3});

    auto prefix = key::make_prefix_key(encoder, key::kLifetimeKeyPrefix);
    auto rows = storage.list_by_prefix(view_of(prefix));
    ASSERT_EQ(rows.size(), 2u);

    auto owners = std::vector<account_id_t>{};
    for (const auto& [row_key, row_value] : rows) {
      auto owner =
          key::parse_account_key(encoder, key::kLifetimeKeyPrefix, view_of(row_key));
      ASSERT_TRUE(owner.has_value());
      owners.push_back(owner.value());
      EXPECT_FALSE(key::parse_account_key(encoder, key::kRolesKeyPrefix,
                                          view_of(row_key))
                       .has_value());
    }
    std::sort(std::begin(owners), std::end(owners));
    EXPECT_EQ(owners, (std::vector{alice, bob}));
  }
  remove_path(db);
}
