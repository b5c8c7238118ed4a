#include <registrar/storage/rocksdb/overlay.hpp>

#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace registrar::storage {

overlay::overlay(encoder_t& encoder, storage<rocksdb_storage_tag>& store)
    : encoder_{encoder}, storage_{store} {}

overlay::overlay(overlay& parent)
    : encoder_{parent.encoder_}, storage_{parent.storage_}, parent_{&parent} {}

std::optional<registrar::schema::bytes_t> overlay::load(
    const registrar::schema::bytes_view_t& key) const {
  auto staged = writes_.find(registrar::schema::make_bytes(key));
  if (staged != std::end(writes_)) {
    return staged->second;
  }
  if (parent_ != nullptr) {
    return parent_->load(key);
  }
  return storage_.load(key);
}

void overlay::erase(const registrar::schema::bytes_view_t& key) {
  writes_.insert_or_assign(registrar::schema::make_bytes(key), std::nullopt);
}

bool overlay::contains(const registrar::schema::bytes_view_t& key) const {
  return load(key).has_value();
}

void overlay::commit() {
  if (writes_.empty()) {
    return;
  }
  if (parent_ != nullptr) {
    for (auto& [key, value] : writes_) {
      parent_->writes_.insert_or_assign(key, std::move(value));
    }
    writes_.clear();
    return;
  }
  auto entries = take_writes();
  storage_.write_batch(entries);
  spdlog::trace("Committed overlay with {} write(s)", entries.size());
}

std::vector<write_entry_t> overlay::take_writes() {
  auto entries = std::vector<write_entry_t>{};
  entries.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    entries.emplace_back(key, std::move(value));
  }
  writes_.clear();
  return entries;
}

void overlay::discard() {
  writes_.clear();
}

std::size_t overlay::pending_writes() const {
  return writes_.size();
}

overlay::encoder_t& overlay::encoder() const {
  return encoder_;
}

}  // namespace registrar::storage
