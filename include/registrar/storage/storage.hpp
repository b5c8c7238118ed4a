#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace registrar::storage {

using key_value_entry_t =
    std::pair<registrar::schema::bytes_t, registrar::schema::bytes_t>;

/// One staged mutation. An empty value deletes the key.
using write_entry_t = std::pair<registrar::schema::bytes_t,
                                std::optional<registrar::schema::bytes_t>>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  registrar::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const registrar::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const registrar::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<registrar::schema::bytes_t> load(
      const registrar::schema::bytes_view_t& key) const;

  /// Apply every entry in one atomic write.
  void write_batch(const std::vector<write_entry_t>& entries) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Apply a block's writes and its checkpoint in one atomic write.
  void commit_block(std::vector<write_entry_t> entries,
                    const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const registrar::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace registrar::storage
