#include <gtest/gtest.h>
#include <registrar/blake3/hash.hpp>
#include <registrar/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = registrar::schema::bytes_t(32, 0xAB);
  auto hash = registrar::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = registrar::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_digits) {
  EXPECT_FALSE(registrar::schema::try_make_hash32("abcd").has_value());
  EXPECT_FALSE(registrar::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_TRUE(registrar::schema::try_make_hash32(std::string(64, 'F')).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = registrar::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_encoding_is_lowercase_and_accepts_prefix) {
  auto bytes = registrar::schema::bytes_t{0x00, 0xAB, 0x7F};
  EXPECT_EQ(registrar::schema::to_hex(
                registrar::schema::bytes_view_t{bytes.data(), bytes.size()}),
            "00ab7f");
  EXPECT_EQ(registrar::schema::from_hex("0X00AB7f"), bytes);
  EXPECT_FALSE(registrar::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(registrar::schema::try_from_hex("zz").has_value());
}

TEST(primitives, base64_matches_reference_vectors) {
  EXPECT_EQ(registrar::schema::to_base64(
                registrar::schema::make_bytes(std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(registrar::schema::to_base64(
                registrar::schema::make_bytes(std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(registrar::schema::to_base64(
                registrar::schema::make_bytes(std::string_view{"foobar"})),
            "Zm9vYmFy");
  EXPECT_EQ(registrar::schema::from_base64("Zm9v\nYmE="),
            registrar::schema::make_bytes(std::string_view{"fooba"}));
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(registrar::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(registrar::schema::try_from_base64("Zg=a").has_value());
  EXPECT_FALSE(registrar::schema::try_from_base64("Z===").has_value());
}

TEST(primitives, signer_rendering_names_the_kind) {
  auto named = registrar::schema::named_signer_t{};
  named[0] = 0x42;
  auto rendered = registrar::schema::to_string(registrar::schema::signer_id_t{named});
  EXPECT_EQ(rendered.rfind("named:42", 0), 0u);

  auto ed = registrar::schema::ed25519_signer_id{};
  EXPECT_EQ(registrar::schema::to_string(registrar::schema::signer_id_t{ed})
                .rfind("ed25519:", 0),
            0u);
}

TEST(blake3_hash, matches_reference_digest) {
  auto digest = registrar::blake3::hash(std::string_view{});
  EXPECT_EQ(registrar::schema::to_hex(
                registrar::schema::bytes_view_t{digest.data(), digest.size()}),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");

  auto text = std::string_view{"registrar"};
  auto bytes = registrar::schema::make_bytes(text);
  EXPECT_EQ(registrar::blake3::hash(text),
            registrar::blake3::hash(
                registrar::schema::bytes_view_t{bytes.data(), bytes.size()}));
}
