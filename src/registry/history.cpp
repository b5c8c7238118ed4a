#include <registrar/registry/registry.hpp>
#include <registrar/schema/key/engine_keys.hpp>

using namespace registrar::schema;

namespace registrar::registry {

std::vector<transfer_history_entry_t> registry::get_transfer_history(
    const signer_id_t& owner) const {
  return load_history(owner);
}

std::vector<transfer_history_entry_t> registry::load_history(
    const signer_id_t& owner) const {
  auto key = key::make_transfer_history_key(state_.encoder(), owner);
  auto history = state_.get<std::vector<transfer_history_entry_t>>(
      bytes_view_t{key.data(), key.size()});
  return history.value_or(std::vector<transfer_history_entry_t>{});
}

void registry::store_history(
    const signer_id_t& owner,
    const std::vector<transfer_history_entry_t>& history) {
  auto key = key::make_transfer_history_key(state_.encoder(), owner);
  state_.put(bytes_view_t{key.data(), key.size()}, history);
}

void registry::erase_history(const signer_id_t& owner) {
  auto key = key::make_transfer_history_key(state_.encoder(), owner);
  state_.erase(bytes_view_t{key.data(), key.size()});
}

}  // namespace registrar::registry
