#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace registrar::registry {

inline constexpr auto kDidMethodPrefix = std::string_view{"did:stx:"};
inline constexpr std::size_t kMaxDidLength = 100;
inline constexpr std::size_t kMaxCredentialLength = 200;
inline constexpr std::size_t kMaxCredentials = 10;
inline constexpr std::size_t kMaxRevocationReasonLength = 100;
inline constexpr std::size_t kMaxTransferHistory = 10;

/// Blocks a pending transfer stays acceptable after initiation (~24h).
inline constexpr uint64_t kTransferWindow = 144;

}  // namespace registrar::registry
