#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "carver/types.hpp"

namespace carver {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing. BLAKE3 is the engine's only hash primitive: every
// derived address depends on it.
Hash32 hash_bytes(std::string_view payload);
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Hex encoding for byte payloads. Lowercase, no prefix.
std::string to_hex(std::string_view bytes);
std::string to_hex(const uint8_t* data, std::size_t len);

// Decode hex text into raw bytes. An optional "0x"/"0X" prefix is accepted.
// Returns false on odd length or any non-hex character; *out is untouched
// on failure.
bool from_hex(std::string_view text, std::string* out);

}  // namespace carver
