#pragma once

#include <cstdint>

// Schema type: query error code.
// Registry workflow: read-path failures. Missing registry data is not an
// error; these codes only cover malformed requests.
namespace registrar::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace registrar::schema
