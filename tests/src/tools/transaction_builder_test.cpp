#include <gtest/gtest.h>
#include <registrar/config/node_options.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef REGISTRAR_TRANSACTION_BUILDER_PATH
#define REGISTRAR_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;

constexpr auto kOwnerHex =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
constexpr auto kRecipientHex =
    "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

registrar::schema::transaction_t decode_transaction(const std::string& base64) {
  auto bytes = registrar::schema::from_base64(base64);
  return encoder_t{}.decode<registrar::schema::transaction_t>(
      registrar::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace

TEST(transaction_builder, builds_create_did_with_default_chain_id) {
  auto builder = std::string{REGISTRAR_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto output = run_builder(
      builder, "transaction --payload create_did --did did:stx:alice "
               "--nonce 4 --signer " +
                   std::string{kOwnerHex});
  auto tx = decode_transaction(output);
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.nonce, 4u);
  EXPECT_EQ(tx.chain_id, registrar::config::default_chain_id());
  EXPECT_EQ(tx.signer,
            registrar::schema::signer_id_t{
                registrar::schema::make_hash32(std::string_view{kOwnerHex})});
  ASSERT_TRUE(std::holds_alternative<registrar::schema::create_did_t>(tx.payload));
  EXPECT_EQ(std::get<registrar::schema::create_did_t>(tx.payload).did,
            "did:stx:alice");
  EXPECT_TRUE(
      std::holds_alternative<registrar::schema::ed25519_signature_t>(tx.signature));
}

TEST(transaction_builder, builds_transfer_payloads_with_typed_signers) {
  auto builder = std::string{REGISTRAR_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto initiate = decode_transaction(run_builder(
      builder, "tx --payload initiate_transfer --signer named:" +
                   std::string{kOwnerHex} + " --new-owner ed25519:" +
                   std::string{kRecipientHex}));
  ASSERT_TRUE(std::holds_alternative<registrar::schema::initiate_transfer_t>(
      initiate.payload));
  auto new_owner =
      std::get<registrar::schema::initiate_transfer_t>(initiate.payload).new_owner;
  ASSERT_TRUE(
      std::holds_alternative<registrar::schema::ed25519_signer_id>(new_owner));
  EXPECT_EQ(std::get<registrar::schema::ed25519_signer_id>(new_owner).public_key[0],
            0xBB);

  auto deactivate = decode_transaction(run_builder(
      builder, "tx --payload deactivate_did --reason lost --signer " +
                   std::string{kOwnerHex} + " --signature-kind secp256k1"));
  ASSERT_TRUE(std::holds_alternative<registrar::schema::deactivate_did_t>(
      deactivate.payload));
  EXPECT_EQ(std::get<registrar::schema::deactivate_did_t>(deactivate.payload).reason,
            std::optional<std::string>{"lost"});
  EXPECT_TRUE(std::holds_alternative<registrar::schema::secp256k1_signature_t>(
      deactivate.signature));
}

TEST(transaction_builder, query_key_matches_query_contract) {
  auto builder = std::string{REGISTRAR_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto encoder = encoder_t{};
  auto owner = registrar::schema::signer_id_t{
      registrar::schema::make_hash32(std::string_view{kOwnerHex})};

  auto identity = run_builder(
      builder, "query-key --path /identity/did --owner " + std::string{kOwnerHex});
  EXPECT_EQ(identity, registrar::schema::to_base64(encoder.encode(owner)));

  auto verify = run_builder(builder,
                            "query-key --path /credential/verify --owner " +
                                std::string{kOwnerHex} + " --credential kyc");
  EXPECT_EQ(verify, registrar::schema::to_base64(
                        encoder.encode(std::tuple{owner, std::string{"kyc"}})));

  auto history = run_builder(
      builder, "query-key --path /history/range --from-height 2 --to-height 9");
  EXPECT_EQ(history, registrar::schema::to_base64(
                         encoder.encode(std::tuple{uint64_t{2}, uint64_t{9}})));

  EXPECT_TRUE(run_builder(builder, "query-key --path /engine/info").empty());
}

TEST(transaction_builder, chain_id_prints_default_as_hex) {
  auto builder = std::string{REGISTRAR_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto chain_id = registrar::config::default_chain_id();
  EXPECT_EQ(run_builder(builder, "chain-id"),
            registrar::schema::to_hex(registrar::schema::bytes_view_t{
                chain_id.data(), chain_id.size()}));
}

TEST(transaction_builder, rejects_unknown_options) {
  auto builder = std::string{REGISTRAR_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto [exit_code, output] =
      run_capture(shell_quote(builder) + " transaction --no-such-flag 2>&1");
  EXPECT_NE(exit_code, 0);
  EXPECT_FALSE(output.empty());
}
