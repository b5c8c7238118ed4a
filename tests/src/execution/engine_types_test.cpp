#include <registrar/execution/engine.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = registrar::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_EQ(tx.gas_wanted, 0);
  EXPECT_EQ(tx.gas_used, 0);
  EXPECT_TRUE(tx.events.empty());

  auto block = registrar::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());
  EXPECT_EQ(block.state_root, registrar::schema::make_zero_hash());

  auto commit = registrar::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = registrar::schema::app_info_t{};
  EXPECT_EQ(info.data, "registrar");
  EXPECT_EQ(info.version, "0.1.0");

  auto replay = registrar::schema::replay_result_t{};
  EXPECT_FALSE(replay.ok);
  EXPECT_EQ(replay.tx_count, 0u);
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = registrar::execution::signature_verifier_t{
      [](const registrar::schema::bytes_view_t&,
         const registrar::schema::signer_id_t&,
         const registrar::schema::signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}

TEST(engine_types, error_codes_have_stable_numbers_and_names) {
  using registrar::schema::transaction_error_code;
  EXPECT_EQ(registrar::schema::to_code(transaction_error_code::invalid_nonce), 4u);
  EXPECT_EQ(registrar::schema::to_code(transaction_error_code::unauthorized),
            100u);
  EXPECT_EQ(registrar::schema::to_code(
                transaction_error_code::invalid_credential_format),
            112u);
  EXPECT_EQ(registrar::schema::to_string(transaction_error_code::history_full),
            "history_full");
}

TEST(engine_types, signing_payload_excludes_signature) {
  auto tx = registrar::schema::transaction_t{
      .version = 1,
      .chain_id = {},
      .nonce = 1,
      .signer = registrar::schema::signer_id_t{registrar::schema::named_signer_t{}},
      .payload = registrar::schema::create_did_t{.did = "did:stx:a"},
      .signature = registrar::schema::ed25519_signature_t{}};
  auto unsigned_payload = registrar::execution::make_signing_payload(tx);
  auto signature = registrar::schema::ed25519_signature_t{};
  signature.fill(0xAB);
  tx.signature = signature;
  EXPECT_EQ(registrar::execution::make_signing_payload(tx), unsigned_payload);
  tx.nonce = 2;
  EXPECT_NE(registrar::execution::make_signing_payload(tx), unsigned_payload);
}
