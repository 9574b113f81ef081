#pragma once

// carver/derivation.hpp - Content-derived address computation.
//
// DESIGN INVARIANTS:
//   1. Pure functions. No I/O, no global state, no failure path.
//   2. Placement rule (shared by the engine and every ledger):
//        address = low20( H( 0xff || deployer(20) || salt(32) || H(init_code) ) )
//      with H = BLAKE3-256. The preimage is always exactly 85 bytes.
//   3. address_of() is defined for every input length including zero.
//      Predicting an address never implies the bytes are deployable.

#include <string_view>

#include "carver/types.hpp"

namespace carver {

constexpr uint8_t kPlacementDomainByte = 0xff;
constexpr std::size_t kPlacementPreimageSize = 1 + kAddressSize + kHashSize + kHashSize;

// The host placement rule over an already-hashed init code.
Address derive_address(const Address& deployer, const Hash32& salt, const Hash32& init_code_hash);

// The address the engine identified by engine_identity would carve
// runtime_code to: placement rule over bootstrap_prefix || runtime_code
// with the zero salt.
Address address_of(std::string_view runtime_code, const Address& engine_identity);

// Identity an engine obtains when its own init code is placed through a
// deterministic factory. Any host running the same factory at the same
// address derives the same engine identity.
Address anchor_identity(const Address& factory, const Hash32& salt, std::string_view engine_init_code);

}  // namespace carver
