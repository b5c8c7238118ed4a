#include <registrar/schema/key/engine_keys.hpp>
#include <registrar/storage/rocksdb/overlay.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <registrar/storage/storage.hpp>
#include <registrar/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace {

using registrar::schema::bytes_view_t;
using registrar::testing::make_db_path;
using registrar::testing::make_hash;
using registrar::testing::remove_path;
using encoder_t = registrar::testing::scale_encoder_t;

bytes_view_t view(const registrar::schema::bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = registrar::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, registrar::schema::make_zero_hash());

  auto entry = registrar::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = make_db_path("registrar_storage_committed");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = registrar::storage::committed_state{.height = 42,
                                                     .state_root = make_hash(10)};
    storage.save_committed_state(state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, state.height);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  remove_path(db);
}

TEST(storage_types, committed_state_survives_reopen) {
  auto db = make_db_path("registrar_storage_reopen");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    storage.save_committed_state(registrar::storage::committed_state{
        .height = 7, .state_root = make_hash(3)});
  }
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 7);
  }
  remove_path(db);
}

TEST(storage_types, write_batch_applies_puts_and_deletes) {
  auto db = make_db_path("registrar_storage_batch");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto a = registrar::schema::make_bytes(std::string_view{"A|one"});
    auto b = registrar::schema::make_bytes(std::string_view{"A|two"});
    storage.put(encoder, view(a), uint64_t{1});

    storage.write_batch({{a, std::nullopt}, {b, encoder.encode(uint64_t{2})}});

    EXPECT_FALSE(storage.load(view(a)).has_value());
    auto value = storage.get<uint64_t>(encoder, view(b));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 2u);
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_selects_keyspace_in_key_order) {
  auto db = make_db_path("registrar_storage_prefix");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto a_prefix = registrar::schema::make_bytes(std::string_view{"A|"});
    auto a2 = registrar::schema::make_bytes(std::string_view{"A|two"});
    auto a1 = registrar::schema::make_bytes(std::string_view{"A|one"});
    auto b1 = registrar::schema::make_bytes(std::string_view{"B|one"});
    storage.put(encoder, view(a2), uint64_t{2});
    storage.put(encoder, view(a1), uint64_t{1});
    storage.put(encoder, view(b1), uint64_t{9});

    auto rows = storage.list_by_prefix(view(a_prefix));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, a1);
    EXPECT_EQ(rows[1].first, a2);
    EXPECT_EQ(encoder.decode<uint64_t>(view(rows[1].second)), 2u);
  }
  remove_path(db);
}

TEST(storage_types, history_keys_iterate_in_block_order) {
  auto db = make_db_path("registrar_storage_history_order");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    // 256 would sort before 1 with a little-endian suffix.
    for (const auto height : {uint64_t{256}, uint64_t{1}, uint64_t{2}}) {
      auto key = registrar::schema::key::make_history_key(encoder, height, 0);
      storage.put(encoder, view(key), height);
    }
    auto prefix = registrar::schema::key::make_prefix_key(
        encoder, registrar::schema::key::kHistoryPrefix);
    auto rows = storage.list_by_prefix(view(prefix));
    ASSERT_EQ(rows.size(), 3u);
    auto first = registrar::schema::key::parse_history_key(encoder, view(rows[0].first));
    auto last = registrar::schema::key::parse_history_key(encoder, view(rows[2].first));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(first->first, 1u);
    EXPECT_EQ(last->first, 256u);
  }
  remove_path(db);
}

TEST(storage_overlay, reads_see_staged_writes_before_commit) {
  auto db = make_db_path("registrar_overlay_staged");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = registrar::schema::make_bytes(std::string_view{"K|x"});
    storage.put(encoder, view(key), uint64_t{1});

    auto state = registrar::storage::overlay{encoder, storage};
    EXPECT_EQ(state.get<uint64_t>(view(key)), std::optional<uint64_t>{1});
    state.put(view(key), uint64_t{5});
    EXPECT_EQ(state.get<uint64_t>(view(key)), std::optional<uint64_t>{5});
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)),
              std::optional<uint64_t>{1});

    state.erase(view(key));
    EXPECT_FALSE(state.contains(view(key)));
    EXPECT_TRUE(storage.load(view(key)).has_value());
    EXPECT_EQ(state.pending_writes(), 1u);
  }
  remove_path(db);
}

TEST(storage_overlay, commit_applies_and_discard_drops) {
  auto db = make_db_path("registrar_overlay_commit");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto kept = registrar::schema::make_bytes(std::string_view{"K|kept"});
    auto dropped = registrar::schema::make_bytes(std::string_view{"K|dropped"});

    auto state = registrar::storage::overlay{encoder, storage};
    state.put(view(dropped), uint64_t{1});
    state.discard();
    EXPECT_EQ(state.pending_writes(), 0u);
    EXPECT_FALSE(state.contains(view(dropped)));

    state.put(view(kept), uint64_t{2});
    state.commit();
    EXPECT_EQ(state.pending_writes(), 0u);
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(kept)),
              std::optional<uint64_t>{2});
    EXPECT_FALSE(storage.load(view(dropped)).has_value());
  }
  remove_path(db);
}

TEST(storage_overlay, nested_commit_folds_into_parent_only) {
  auto db = make_db_path("registrar_overlay_nested");
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto kept = registrar::schema::make_bytes(std::string_view{"K|kept"});
    auto erased = registrar::schema::make_bytes(std::string_view{"K|erased"});
    storage.put(encoder, view(erased), uint64_t{7});

    auto block = registrar::storage::overlay{encoder, storage};
    {
      auto tx = registrar::storage::overlay{block};
      tx.put(view(kept), uint64_t{3});
      tx.erase(view(erased));
      EXPECT_FALSE(tx.contains(view(erased)));
      tx.commit();
    }
    {
      auto tx = registrar::storage::overlay{block};
      EXPECT_EQ(tx.get<uint64_t>(view(kept)), std::optional<uint64_t>{3});
      tx.put(view(kept), uint64_t{4});
      tx.discard();
    }
    EXPECT_EQ(block.pending_writes(), 2u);
    EXPECT_EQ(block.get<uint64_t>(view(kept)), std::optional<uint64_t>{3});
    EXPECT_FALSE(storage.load(view(kept)).has_value());
    EXPECT_TRUE(storage.load(view(erased)).has_value());

    storage.commit_block(block.take_writes(),
                         registrar::storage::committed_state{
                             .height = 5, .state_root = make_hash(0x05)});
    EXPECT_EQ(block.pending_writes(), 0u);
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(kept)),
              std::optional<uint64_t>{3});
    EXPECT_FALSE(storage.load(view(erased)).has_value());
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 5);
    EXPECT_EQ(committed->state_root, make_hash(0x05));
  }
  remove_path(db);
}
