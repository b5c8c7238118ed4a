#include <gtest/gtest.h>
#include <registrar/registry/limits.hpp>
#include <registrar/testing/registry_fixture.hpp>

#include <optional>
#include <string>
#include <vector>

using registrar::schema::transaction_error_code;
using registrar::testing::at;
using registrar::testing::make_named_signer;

TEST(lifecycle, deactivate_then_reactivate_round_trip) {
  auto fixture = registrar::testing::registry_fixture{"registrar_lifecycle_cycle"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  ASSERT_EQ(registry.create_did(at(alice, 1), "did:stx:alice"),
            transaction_error_code::ok);
  EXPECT_TRUE(registry.is_did_active(alice));

  EXPECT_EQ(registry.deactivate_did(at(alice, 7), std::string{"lost key"}),
            transaction_error_code::ok);
  auto record = registry.get_did(alice);
  EXPECT_FALSE(record->is_active);
  EXPECT_EQ(record->revocation_reason, std::optional<std::string>{"lost key"});
  EXPECT_EQ(record->updated_at, 7u);
  EXPECT_FALSE(registry.is_did_active(alice));

  EXPECT_EQ(registry.reactivate_did(at(alice, 9)), transaction_error_code::ok);
  record = registry.get_did(alice);
  EXPECT_TRUE(record->is_active);
  EXPECT_FALSE(record->revocation_reason.has_value());
  EXPECT_EQ(record->updated_at, 9u);
  EXPECT_TRUE(registry.is_did_active(alice));
}

TEST(lifecycle, repeated_transitions_report_already_deactivated) {
  auto fixture = registrar::testing::registry_fixture{"registrar_lifecycle_repeat"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  ASSERT_EQ(registry.create_did(at(alice, 1), "did:stx:alice"),
            transaction_error_code::ok);
  EXPECT_EQ(registry.reactivate_did(at(alice, 2)),
            transaction_error_code::already_deactivated);
  ASSERT_EQ(registry.deactivate_did(at(alice, 3), std::nullopt),
            transaction_error_code::ok);
  EXPECT_EQ(registry.deactivate_did(at(alice, 4), std::string{"again"}),
            transaction_error_code::already_deactivated);
  EXPECT_EQ(registry.get_did(alice)->updated_at, 3u);
}

TEST(lifecycle, missing_record_reports_not_found) {
  auto fixture = registrar::testing::registry_fixture{"registrar_lifecycle_missing"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  EXPECT_EQ(registry.deactivate_did(at(alice, 1), std::nullopt),
            transaction_error_code::not_found);
  EXPECT_EQ(registry.reactivate_did(at(alice, 1)),
            transaction_error_code::not_found);
  EXPECT_FALSE(registry.is_did_active(alice));
}

TEST(lifecycle, reason_longer_than_limit_is_rejected) {
  auto fixture = registrar::testing::registry_fixture{"registrar_lifecycle_reason"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  ASSERT_EQ(registry.create_did(at(alice, 1), "did:stx:alice"),
            transaction_error_code::ok);
  EXPECT_EQ(
      registry.deactivate_did(
          at(alice, 2),
          std::string(registrar::registry::kMaxRevocationReasonLength + 1, 'r')),
      transaction_error_code::invalid_payload);
  EXPECT_TRUE(registry.is_did_active(alice));
  EXPECT_EQ(
      registry.deactivate_did(
          at(alice, 2),
          std::string(registrar::registry::kMaxRevocationReasonLength, 'r')),
      transaction_error_code::ok);
}

TEST(lifecycle, empty_reason_is_stored_as_given) {
  auto fixture = registrar::testing::registry_fixture{"registrar_lifecycle_empty"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  ASSERT_EQ(registry.create_did(at(alice, 1), "did:stx:alice"),
            transaction_error_code::ok);
  ASSERT_EQ(registry.deactivate_did(at(alice, 2), std::string{}),
            transaction_error_code::ok);
  EXPECT_EQ(registry.get_did(alice)->revocation_reason,
            std::optional<std::string>{""});
}

TEST(lifecycle, reactivation_restores_credential_adds_and_keeps_existing) {
  auto fixture =
      registrar::testing::registry_fixture{"registrar_lifecycle_credentials"};
  auto& registry = fixture.registry();
  auto alice = make_named_signer(0x11);

  ASSERT_EQ(registry.create_did(at(alice, 1), "did:stx:alice"),
            transaction_error_code::ok);
  ASSERT_EQ(registry.add_credential(at(alice, 2), "kyc"),
            transaction_error_code::ok);
  ASSERT_EQ(registry.add_credential(at(alice, 3), "aml"),
            transaction_error_code::ok);

  ASSERT_EQ(registry.deactivate_did(at(alice, 4), std::string{"audit"}),
            transaction_error_code::ok);
  EXPECT_EQ(registry.add_credential(at(alice, 5), "accredited"),
            transaction_error_code::deactivated);
  EXPECT_EQ(registry.get_did(alice)->credentials,
            (std::vector<std::string>{"kyc", "aml"}));

  ASSERT_EQ(registry.reactivate_did(at(alice, 6)), transaction_error_code::ok);
  EXPECT_EQ(registry.get_did(alice)->credentials,
            (std::vector<std::string>{"kyc", "aml"}));
  EXPECT_EQ(registry.add_credential(at(alice, 7), "accredited"),
            transaction_error_code::ok);

  auto record = registry.get_did(alice);
  EXPECT_EQ(record->credentials,
            (std::vector<std::string>{"kyc", "aml", "accredited"}));
  EXPECT_EQ(record->updated_at, 7u);
  EXPECT_TRUE(registry.verify_credential(alice, "kyc"));
  EXPECT_TRUE(registry.verify_credential(alice, "accredited"));
}
