#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: transaction error code.
// Registry workflow: stable numeric ABCI codes. 1..7 are envelope validation
// failures raised by the engine; 100..112 are registry outcomes.
namespace registrar::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  invalid_payload = 7,
  unauthorized = 100,
  already_exists = 101,
  not_found = 102,
  max_credentials = 103,
  already_deactivated = 104,
  deactivated = 105,
  transfer_in_progress = 106,
  no_pending_transfer = 107,
  transfer_expired = 108,
  self_transfer = 109,
  history_full = 110,
  invalid_did_format = 111,
  invalid_credential_format = 112,
};

inline constexpr auto kTransactionErrorCodeMappings =
    enum_mappings_t<transaction_error_code, 21>{
        std::pair<std::string_view, transaction_error_code>{
            "ok", transaction_error_code::ok},
        {"invalid_transaction", transaction_error_code::invalid_transaction},
        {"unsupported_transaction_version",
         transaction_error_code::unsupported_transaction_version},
        {"invalid_chain_id", transaction_error_code::invalid_chain_id},
        {"invalid_nonce", transaction_error_code::invalid_nonce},
        {"invalid_signature_type",
         transaction_error_code::invalid_signature_type},
        {"signature_verification_failed",
         transaction_error_code::signature_verification_failed},
        {"invalid_payload", transaction_error_code::invalid_payload},
        {"unauthorized", transaction_error_code::unauthorized},
        {"already_exists", transaction_error_code::already_exists},
        {"not_found", transaction_error_code::not_found},
        {"max_credentials", transaction_error_code::max_credentials},
        {"already_deactivated", transaction_error_code::already_deactivated},
        {"deactivated", transaction_error_code::deactivated},
        {"transfer_in_progress", transaction_error_code::transfer_in_progress},
        {"no_pending_transfer", transaction_error_code::no_pending_transfer},
        {"transfer_expired", transaction_error_code::transfer_expired},
        {"self_transfer", transaction_error_code::self_transfer},
        {"history_full", transaction_error_code::history_full},
        {"invalid_did_format", transaction_error_code::invalid_did_format},
        {"invalid_credential_format",
         transaction_error_code::invalid_credential_format}};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace registrar::schema
