#pragma once

#include <boost/endian/conversion.hpp>
#include <registrar/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Registry workflow: canonical key prefixes and key codecs for identity,
// transfer, nonce and transaction history state.
namespace registrar::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kIdentityKeyPrefix{"SYS|STATE|IDENTITY|"};
inline constexpr std::string_view kPendingTransferKeyPrefix{
    "SYS|STATE|PENDING_TRANSFER|"};
inline constexpr std::string_view kTransferHistoryKeyPrefix{
    "SYS|STATE|TRANSFER_HISTORY|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline constexpr std::array<std::string_view, 5> kEngineKeyspaces{
    kNonceKeyPrefix,
    kIdentityKeyPrefix,
    kPendingTransferKeyPrefix,
    kTransferHistoryKeyPrefix,
    kHistoryPrefix};

template <typename Encoder, typename T>
registrar::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
registrar::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
registrar::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const registrar::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
registrar::schema::bytes_t make_identity_key(
    Encoder& encoder,
    const registrar::schema::signer_id_t& owner) {
  return make_prefixed_key(encoder, kIdentityKeyPrefix, owner);
}

template <typename Encoder>
registrar::schema::bytes_t make_pending_transfer_key(
    Encoder& encoder,
    const registrar::schema::signer_id_t& owner) {
  return make_prefixed_key(encoder, kPendingTransferKeyPrefix, owner);
}

template <typename Encoder>
registrar::schema::bytes_t make_transfer_history_key(
    Encoder& encoder,
    const registrar::schema::signer_id_t& owner) {
  return make_prefixed_key(encoder, kTransferHistoryKeyPrefix, owner);
}

// History rows are ranged by height, so the suffix is big endian rather than
// SCALE (little endian) to keep RocksDB iteration in block order.
template <typename Encoder>
registrar::schema::bytes_t make_history_key(Encoder& encoder,
                                            uint64_t height,
                                            uint32_t index) {
  auto key = make_prefix_key(encoder, kHistoryPrefix);
  auto big_height = boost::endian::native_to_big(height);
  auto big_index = boost::endian::native_to_big(index);
  auto suffix = std::array<uint8_t, sizeof(big_height) + sizeof(big_index)>{};
  std::memcpy(suffix.data(), &big_height, sizeof(big_height));
  std::memcpy(suffix.data() + sizeof(big_height), &big_index,
              sizeof(big_index));
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const registrar::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kHistoryPrefix);
  if (key.size() != prefix.size() + sizeof(uint64_t) + sizeof(uint32_t) ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto height = uint64_t{};
  auto index = uint32_t{};
  std::memcpy(&height, key.data() + prefix.size(), sizeof(height));
  std::memcpy(&index, key.data() + prefix.size() + sizeof(height),
              sizeof(index));
  return std::pair<uint64_t, uint32_t>{boost::endian::big_to_native(height),
                                       boost::endian::big_to_native(index)};
}

}  // namespace registrar::schema::key
