#pragma once

#include <registrar/schema/primitives.hpp>
#include <registrar/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Registry workflow: outcome of admitting or executing one registrar
// transaction. `code` is a `transaction_error_code` value; `log` carries its
// name and `codespace` names the stage that failed (empty on success).
// Successful registry operations carry one `registrar.<op>` event.
namespace registrar::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  // Error code name; empty on success.
  std::string log;
  std::string info;
  int64_t gas_wanted{};
  int64_t gas_used{};
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace registrar::schema
