#pragma once
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace registrar::storage {

/// Write set layered over committed storage or over another overlay.
///
/// Reads see staged writes first and fall through to the parent overlay, then
/// to RocksDB. A root overlay applies its whole set as one `WriteBatch` on
/// `commit`; a nested overlay folds its writes into the parent instead.
/// `discard` drops the set, leaving everything below untouched.
class overlay final {
 public:
  using encoder_t = registrar::schema::encoding::encoder<
      registrar::schema::encoding::scale_encoder_tag>;

  overlay(encoder_t& encoder, storage<rocksdb_storage_tag>& store);
  explicit overlay(overlay& parent);

  overlay(const overlay&) = delete;
  overlay& operator=(const overlay&) = delete;
  overlay(overlay&&) = delete;
  overlay& operator=(overlay&&) = delete;

  template <typename T>
  std::optional<T> get(const registrar::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const registrar::schema::bytes_view_t& key, const T& value);

  void erase(const registrar::schema::bytes_view_t& key);

  bool contains(const registrar::schema::bytes_view_t& key) const;

  void commit();
  void discard();

  /// Hand over the staged writes in key order and clear the set.
  std::vector<write_entry_t> take_writes();
  std::size_t pending_writes() const;

  encoder_t& encoder() const;

 private:
  std::optional<registrar::schema::bytes_t> load(
      const registrar::schema::bytes_view_t& key) const;

  encoder_t& encoder_;
  storage<rocksdb_storage_tag>& storage_;
  overlay* parent_{nullptr};
  std::map<registrar::schema::bytes_t,
           std::optional<registrar::schema::bytes_t>>
      writes_;
};

template <typename T>
std::optional<T> overlay::get(
    const registrar::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder_.decode<T>(
      registrar::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T>
void overlay::put(const registrar::schema::bytes_view_t& key, const T& value) {
  writes_.insert_or_assign(registrar::schema::make_bytes(key),
                           encoder_.encode(value));
}

}  // namespace registrar::storage
