#pragma once

// carver/version.hpp - Explicit version manifest for every format surface.
//
// PURPOSE:
//   Prevent silent drift of derived addresses and on-disk formats. Every
//   component that writes a versioned format stamps the matching constant.
//
// INVARIANT:
//   All version constants are compile-time. A change to any input of the
//   address derivation (hash primitive, bootstrap prefix, domain byte,
//   salt) MUST bump DERIVATION_VERSION: every previously derived address
//   becomes unreachable under the new rule.

#include <cstdint>
#include <string>

namespace carver {
namespace version {

// Increment when the public engine API changes incompatibly.
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// Version 1 = BLAKE3-256, 11-byte bootstrap prefix 600b380380600b3d393df3,
// 0xff domain byte, all-zero salt, low 20 bytes of the outer digest.
constexpr uint32_t DERIVATION_VERSION = 1;

// Version 1 = <root>/artifacts/AB/CD/<40-hex> single-file artifacts with a
// one-line JSON header.
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// Version 1 = hash-chained NDJSON CarveRecord lines.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t engine_abi{ENGINE_ABI_VERSION};
  uint32_t derivation{DERIVATION_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string bootstrap_prefix;  // hex
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// Never throws. On mismatch, ok=false with a structured error.
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  uint32_t required_abi{ENGINE_ABI_VERSION};
  uint32_t actual_abi{ENGINE_ABI_VERSION};
};

CompatibilityResult check_compatibility(uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace carver
