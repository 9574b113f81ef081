#pragma once

// carver/bootstrap.hpp - The fixed initialization prefix and the minimal
// interpreter the modeled host uses to execute it.
//
// DESIGN INVARIANTS:
//   1. kBootstrapPrefix never changes. It is hashed into every derived
//      address; altering a single byte moves every handle (DERIVATION_VERSION).
//   2. run_init_code(kBootstrapPrefix || X) returns exactly X and has no
//      other effect, for every X (including empty X).
//   3. The interpreter is total: it never throws and never reads outside the
//      init code. Anything outside the supported opcode set is rejected.
//
// Prefix layout (11 bytes):
//   0x00  60 0b   PUSH1 0x0b       ; prefix length
//   0x02  38      CODESIZE
//   0x03  03      SUB              ; remaining = codesize - 11
//   0x04  80      DUP1
//   0x05  60 0b   PUSH1 0x0b       ; source offset
//   0x07  3d      RETURNDATASIZE   ; 0, destination offset
//   0x08  39      CODECOPY         ; memory[0..remaining) = code[11..]
//   0x09  3d      RETURNDATASIZE   ; 0, return offset
//   0x0a  f3      RETURN           ; return memory[0..remaining)

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace carver {

constexpr std::size_t kBootstrapPrefixSize = 11;

// Upper bound on interpreter memory expansion.
constexpr std::size_t kMaxInitCodeMemory = std::size_t{1} << 20;

// Largest runtime code the prefix can return. The prefix copies the suffix to
// memory offset 0, so the suffix needs exactly its own size in memory.
// HostRules::max_code_size may not exceed this.
constexpr std::size_t kMaxSupportedCodeSize = kMaxInitCodeMemory;

inline constexpr std::array<uint8_t, kBootstrapPrefixSize> kBootstrapPrefix{
    0x60, 0x0b, 0x38, 0x03, 0x80, 0x60, 0x0b, 0x3d, 0x39, 0x3d, 0xf3};

// The prefix as a byte string view.
std::string_view bootstrap_prefix();

// prefix || runtime_code
std::string compose_init_code(std::string_view runtime_code);

struct BootstrapOutcome {
  bool ok{false};
  std::string returned;  // bytes the init code returned (the artifact)
  std::string error;     // empty if ok
};

// Interpret init_code and return what it returns.
// Supported opcodes: STOP, SUB, CODESIZE, CODECOPY, RETURNDATASIZE, DUP1,
// PUSH1, RETURN. Running off the end behaves as STOP (empty return).
BootstrapOutcome run_init_code(std::string_view init_code);

// One instruction per line, "<offset> <mnemonic>[ <immediate>]".
std::string disassemble(std::string_view code);

}  // namespace carver
