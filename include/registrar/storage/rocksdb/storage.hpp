#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <registrar/common/critical.hpp>
#include <registrar/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace registrar::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const registrar::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline registrar::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const registrar::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const registrar::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<registrar::schema::bytes_t> load(
      const registrar::schema::bytes_view_t& key) const;
  void write_batch(const std::vector<write_entry_t>& entries) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void commit_block(std::vector<write_entry_t> entries,
                    const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const registrar::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const registrar::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      registrar::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const registrar::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(registrar::schema::bytes_view_t{encoded_value.data(),
                                                       encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    registrar::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace registrar::storage
