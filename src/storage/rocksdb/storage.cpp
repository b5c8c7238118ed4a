#include <registrar/common/critical.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <tuple>
#include <utility>
#include <vector>

namespace registrar::storage {

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;

constexpr auto kCommittedStateKey = std::string_view{"SYS|APP|COMMITTED_STATE"};

void require_database(const storage<rocksdb_storage_tag>& store) {
  if (!store.database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    registrar::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<registrar::schema::bytes_t> storage<rocksdb_storage_tag>::load(
    const registrar::schema::bytes_view_t& key) const {
  require_database(*this);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    registrar::common::critical("Failed to get value from RocksDB");
  }
  return registrar::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<write_entry_t>& entries) const {
  require_database(*this);
  if (entries.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice = detail::to_slice(
        registrar::schema::bytes_view_t{key.data(), key.size()});
    auto status = ROCKSDB_NAMESPACE::Status{};
    if (value) {
      status = batch.Put(key_slice,
                         detail::to_slice(registrar::schema::bytes_view_t{
                             value->data(), value->size()}));
    } else {
      status = batch.Delete(key_slice);
    }
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB write: {}", status.ToString());
      registrar::common::critical("Failed to stage RocksDB write");
    }
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    registrar::common::critical("Failed to commit RocksDB batch");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = load(registrar::schema::make_bytes_view(kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, registrar::schema::hash32_t>>(
          registrar::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    registrar::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  auto encoder = encoder_t{};
  put(encoder, registrar::schema::make_bytes_view(kCommittedStateKey),
      std::tuple{state.height, state.state_root});
}

void storage<rocksdb_storage_tag>::commit_block(
    std::vector<write_entry_t> entries,
    const committed_state& state) const {
  auto encoder = encoder_t{};
  entries.emplace_back(
      registrar::schema::make_bytes(kCommittedStateKey),
      encoder.encode(std::tuple{state.height, state.state_root}));
  write_batch(entries);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const registrar::schema::bytes_view_t& prefix) const {
  require_database(*this);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    registrar::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace registrar::storage
