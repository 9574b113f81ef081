#pragma once

// carver/types.hpp - Core value types for the carver content-addressed
// placement engine.
//
// DETERMINISM GUARANTEES:
//   - Address and Hash32 are plain fixed-size byte arrays. Equality, ordering
//     and hashing depend only on the bytes.
//   - Byte payloads (runtime code, init code) are carried as std::string and
//     borrowed as std::string_view. They are binary-safe; no terminator or
//     encoding is assumed.
//
// MEMORY OWNERSHIP:
//   - All types here are value types. No borrowed references escape the
//     public API.

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace carver {

constexpr std::size_t kAddressSize = 20;
constexpr std::size_t kHashSize = 32;

// ---------------------------------------------------------------------------
// Address: 20-byte handle. Used both for derived artifact handles and for
// the engine's own identity.
// ---------------------------------------------------------------------------
struct Address {
  std::array<uint8_t, kAddressSize> bytes{};

  bool is_zero() const;
  std::string hex() const;  // "0x" + 40 lowercase hex chars

  // Accepts 40 hex chars with optional "0x" prefix.
  static bool from_hex(std::string_view text, Address& out);

  friend bool operator==(const Address& a, const Address& b) { return a.bytes == b.bytes; }
  friend bool operator!=(const Address& a, const Address& b) { return a.bytes != b.bytes; }
  friend bool operator<(const Address& a, const Address& b) { return a.bytes < b.bytes; }
};

// ---------------------------------------------------------------------------
// Hash32: 32-byte digest or salt.
// ---------------------------------------------------------------------------
struct Hash32 {
  std::array<uint8_t, kHashSize> bytes{};

  bool is_zero() const;
  std::string hex() const;  // 64 lowercase hex chars, no prefix

  static bool from_hex(std::string_view text, Hash32& out);

  friend bool operator==(const Hash32& a, const Hash32& b) { return a.bytes == b.bytes; }
  friend bool operator!=(const Hash32& a, const Hash32& b) { return a.bytes != b.bytes; }
};

// The fixed salt every carve uses. Not caller-suppliable.
inline constexpr Hash32 kZeroSalt{};

enum class ErrorCode {
  none,
  deployment_failed,
  config_invalid,
  json_parse_error,
  json_duplicate_key,
  invalid_hex,
};

std::string to_string(ErrorCode code);

// Why a carve failed. Recorded in events and the audit log only; callers of
// carve() always see ErrorCode::deployment_failed.
enum class FailureReason {
  none,
  empty_code,
  forbidden_first_byte,
  code_too_large,
  address_collision,
  bootstrap_rejected,
  address_mismatch,
  size_mismatch,
  ledger_io,
};

std::string to_string(FailureReason reason);

// ---------------------------------------------------------------------------
// HostRules: platform constraints on stored artifacts. They come from the
// host, not from the engine, so both sides receive them by injection.
// ---------------------------------------------------------------------------
struct HostRules {
  std::size_t max_code_size{24576};
  uint8_t forbidden_first_byte{0xEF};
  bool enforce_forbidden_first_byte{true};
};

// Result of a carve. error_code is deployment_failed for every failure kind.
struct CarveResult {
  bool ok{false};
  Address address;
  ErrorCode error_code{ErrorCode::none};
};

}  // namespace carver

template <>
struct std::hash<carver::Address> {
  std::size_t operator()(const carver::Address& a) const noexcept {
    // Addresses are already uniformly distributed hash output.
    std::size_t h = 0;
    for (std::size_t i = 0; i < sizeof(std::size_t) && i < carver::kAddressSize; ++i) {
      h = (h << 8) | a.bytes[i];
    }
    return h;
  }
};
