#include "carver/derivation.hpp"

#include <algorithm>
#include <array>

#include "carver/bootstrap.hpp"
#include "carver/hash.hpp"

namespace carver {

Address derive_address(const Address& deployer, const Hash32& salt, const Hash32& init_code_hash) {
  // MICRO_OPT: fixed-size stack buffer; the preimage never allocates.
  std::array<uint8_t, kPlacementPreimageSize> buffer{};
  auto it = buffer.begin();
  *it++ = kPlacementDomainByte;
  it = std::copy(deployer.bytes.begin(), deployer.bytes.end(), it);
  it = std::copy(salt.bytes.begin(), salt.bytes.end(), it);
  std::copy(init_code_hash.bytes.begin(), init_code_hash.bytes.end(), it);

  const Hash32 h2 = hash_bytes(
      std::string_view(reinterpret_cast<const char*>(buffer.data()), buffer.size()));

  // Low-order 20 bytes of the digest.
  Address out;
  std::copy(h2.bytes.end() - kAddressSize, h2.bytes.end(), out.bytes.begin());
  return out;
}

Address address_of(std::string_view runtime_code, const Address& engine_identity) {
  const Hash32 h1 = hash_bytes(compose_init_code(runtime_code));
  return derive_address(engine_identity, kZeroSalt, h1);
}

Address anchor_identity(const Address& factory, const Hash32& salt, std::string_view engine_init_code) {
  return derive_address(factory, salt, hash_bytes(engine_init_code));
}

}  // namespace carver
