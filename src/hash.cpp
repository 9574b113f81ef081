#include "carver/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3-256 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Every address the engine or a ledger derives goes through
//      hash_bytes(). Swapping the primitive changes every handle, so it
//      must be accompanied by a DERIVATION_VERSION bump (version.hpp).
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x").

#include <array>
#include <utility>

extern "C" {
#include <blake3.h>
}

namespace carver {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// Decode a single hex character to its nibble value.
// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

}  // namespace

std::string to_hex(const uint8_t* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string to_hex(std::string_view bytes) {
  return to_hex(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

bool from_hex(std::string_view text, std::string* out) {
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  if (text.size() % 2 != 0) return false;
  std::string decoded;
  decoded.resize(text.size() / 2);
  for (std::size_t i = 0; i < decoded.size(); ++i) {
    const uint8_t hi = hex_nibble(text[i * 2]);
    const uint8_t lo = hex_nibble(text[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return false;
    decoded[i] = static_cast<char>((hi << 4) | lo);
  }
  if (out) *out = std::move(decoded);
  return true;
}

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  info.blake3_available = true;
  return info;
}

Hash32 hash_bytes(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  Hash32 out;
  static_assert(BLAKE3_OUT_LEN == kHashSize, "BLAKE3 output must be 32 bytes");
  blake3_hasher_finalize(&hasher, out.bytes.data(), out.bytes.size());
  return out;
}

std::string blake3_hex(std::string_view payload) {
  return hash_bytes(payload).hex();
}

}  // namespace carver
