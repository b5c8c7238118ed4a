#pragma once

#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace registrar::testing {

using scale_encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;

inline registrar::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = registrar::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline registrar::schema::signer_id_t make_named_signer(const uint8_t seed) {
  auto named = registrar::schema::named_signer_t{};
  named[0] = seed;
  return registrar::schema::signer_id_t{named};
}

inline registrar::schema::signer_id_t make_ed25519_signer(const uint8_t seed) {
  auto signer = registrar::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return registrar::schema::signer_id_t{signer};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = uint64_t{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(++sequence));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace registrar::testing
