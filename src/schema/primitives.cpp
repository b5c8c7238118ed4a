#include <registrar/common/critical.hpp>
#include <registrar/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace registrar::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kBase64Invalid = uint8_t{0xFF};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.starts_with("0x") || input.starts_with("0X")) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

constexpr std::array<uint8_t, 256> make_base64_lookup() {
  auto table = std::array<uint8_t, 256>{};
  table.fill(kBase64Invalid);
  for (std::size_t i = 0; i < kBase64Alphabet.size(); ++i) {
    table[static_cast<unsigned char>(kBase64Alphabet[i])] =
        static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kBase64Lookup = make_base64_lookup();

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    registrar::common::critical("make_hash32 expected exactly 32 bytes, got {}",
                                bytes.size());
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    registrar::common::critical("make_hash32 expected 64 hex digits");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHexDigits[(value >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  auto digits = strip_hex_prefix(hex);
  if ((digits.size() % 2) != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(digits.size() / 2);
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    auto high = hex_value(digits[i]);
    auto low = hex_value(digits[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    registrar::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t i = 0; i < bytes.size(); i += 3) {
    auto remaining = bytes.size() - i;
    auto value = static_cast<uint32_t>(bytes[i]) << 16u;
    if (remaining > 1) {
      value |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
    }
    if (remaining > 2) {
      value |= static_cast<uint32_t>(bytes[i + 2]);
    }
    out.push_back(kBase64Alphabet[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Alphabet[(value >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Alphabet[(value >> 6u) & 0x3Fu]
                                : '=');
    out.push_back(remaining > 2 ? kBase64Alphabet[value & 0x3Fu] : '=');
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (std::size_t i = 0; i < compact.size(); i += 4) {
    auto is_last = (i + 4) == compact.size();
    auto padding = std::size_t{0};
    auto value = uint32_t{0};
    for (std::size_t j = 0; j < 4; ++j) {
      auto ch = compact[i + j];
      if (ch == '=') {
        // Padding is only legal in the final two positions of the last group.
        if (!is_last || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding != 0) {
        return std::nullopt;
      }
      auto decoded = kBase64Lookup[static_cast<unsigned char>(ch)];
      if (decoded == kBase64Invalid) {
        return std::nullopt;
      }
      value = (value << 6u) | decoded;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded) {
    registrar::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::string to_string(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   return "ed25519:" + to_hex(value.public_key);
                 },
                 [](const secp256k1_signer_id& value) {
                   return "secp256k1:" + to_hex(value.public_key);
                 },
                 [](const named_signer_t& value) {
                   return "named:" + to_hex(value);
                 }},
      signer);
}

}  // namespace registrar::schema
