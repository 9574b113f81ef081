#include "carver/bootstrap.hpp"

#include <cstdio>
#include <vector>

namespace carver {

namespace {

enum Opcode : uint8_t {
  OP_STOP = 0x00,
  OP_SUB = 0x03,
  OP_CODESIZE = 0x38,
  OP_CODECOPY = 0x39,
  OP_RETURNDATASIZE = 0x3d,
  OP_PUSH1 = 0x60,
  OP_DUP1 = 0x80,
  OP_RETURN = 0xf3,
};

constexpr std::size_t kMaxStack = 1024;
constexpr uint64_t kMaxMemory = kMaxInitCodeMemory;

const char* mnemonic(uint8_t op) {
  switch (op) {
    case OP_STOP: return "STOP";
    case OP_SUB: return "SUB";
    case OP_CODESIZE: return "CODESIZE";
    case OP_CODECOPY: return "CODECOPY";
    case OP_RETURNDATASIZE: return "RETURNDATASIZE";
    case OP_PUSH1: return "PUSH1";
    case OP_DUP1: return "DUP1";
    case OP_RETURN: return "RETURN";
    default: return nullptr;
  }
}

struct Machine {
  std::vector<uint64_t> stack;
  std::string memory;
  std::string error;

  bool push(uint64_t v) {
    if (stack.size() >= kMaxStack) {
      error = "stack_overflow";
      return false;
    }
    stack.push_back(v);
    return true;
  }

  bool pop(uint64_t& v) {
    if (stack.empty()) {
      error = "stack_underflow";
      return false;
    }
    v = stack.back();
    stack.pop_back();
    return true;
  }

  // Grow memory to cover [offset, offset + size). Zero-size touches nothing.
  bool expand(uint64_t offset, uint64_t size) {
    if (size == 0) return true;
    if (offset > kMaxMemory || size > kMaxMemory - offset) {
      error = "memory_limit";
      return false;
    }
    const uint64_t end = offset + size;
    if (memory.size() < end) memory.resize(static_cast<std::size_t>(end), '\0');
    return true;
  }
};

}  // namespace

std::string_view bootstrap_prefix() {
  return std::string_view(reinterpret_cast<const char*>(kBootstrapPrefix.data()),
                          kBootstrapPrefix.size());
}

std::string compose_init_code(std::string_view runtime_code) {
  std::string out;
  out.reserve(kBootstrapPrefixSize + runtime_code.size());
  out.append(bootstrap_prefix());
  out.append(runtime_code);
  return out;
}

BootstrapOutcome run_init_code(std::string_view init_code) {
  BootstrapOutcome outcome;
  Machine m;

  std::size_t pc = 0;
  while (pc < init_code.size()) {
    const uint8_t op = static_cast<uint8_t>(init_code[pc]);
    uint64_t a = 0, b = 0, c = 0;
    switch (op) {
      case OP_STOP:
        outcome.ok = true;
        return outcome;

      case OP_SUB:
        if (!m.pop(a) || !m.pop(b)) break;
        // Underflow wraps; the resulting oversized copy fails in expand().
        if (!m.push(a - b)) break;
        ++pc;
        continue;

      case OP_CODESIZE:
        if (!m.push(init_code.size())) break;
        ++pc;
        continue;

      case OP_RETURNDATASIZE:
        // No sub-calls are possible, so return data is always empty.
        if (!m.push(0)) break;
        ++pc;
        continue;

      case OP_DUP1:
        if (m.stack.empty()) {
          m.error = "stack_underflow";
          break;
        }
        if (!m.push(m.stack.back())) break;
        ++pc;
        continue;

      case OP_PUSH1:
        // Truncated immediate reads as zero.
        a = pc + 1 < init_code.size() ? static_cast<uint8_t>(init_code[pc + 1]) : 0;
        if (!m.push(a)) break;
        pc += 2;
        continue;

      case OP_CODECOPY: {
        if (!m.pop(a) || !m.pop(b) || !m.pop(c)) break;  // dest, offset, size
        if (!m.expand(a, c)) break;
        for (uint64_t i = 0; i < c; ++i) {
          const uint64_t src = b + i;
          // Bytes past the end of code read as zero.
          m.memory[static_cast<std::size_t>(a + i)] =
              (src >= b && src < init_code.size()) ? init_code[static_cast<std::size_t>(src)] : '\0';
        }
        ++pc;
        continue;
      }

      case OP_RETURN:
        if (!m.pop(a) || !m.pop(b)) break;  // offset, size
        if (!m.expand(a, b)) break;
        if (b > 0) outcome.returned = m.memory.substr(static_cast<std::size_t>(a), static_cast<std::size_t>(b));
        outcome.ok = true;
        return outcome;

      default: {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "unsupported_opcode_0x%02x_at_%zu", op, pc);
        m.error = buf;
        break;
      }
    }
    // Every successful instruction continues; reaching here means failure.
    outcome.ok = false;
    outcome.returned.clear();
    outcome.error = m.error.empty() ? "bootstrap_failed" : m.error;
    return outcome;
  }

  outcome.ok = true;
  return outcome;
}

std::string disassemble(std::string_view code) {
  std::string out;
  char buf[64];
  std::size_t pc = 0;
  while (pc < code.size()) {
    const uint8_t op = static_cast<uint8_t>(code[pc]);
    const char* name = mnemonic(op);
    if (!name) {
      std::snprintf(buf, sizeof(buf), "%04zx INVALID(0x%02x)\n", pc, op);
      out += buf;
      ++pc;
      continue;
    }
    if (op == OP_PUSH1) {
      const unsigned imm = pc + 1 < code.size() ? static_cast<uint8_t>(code[pc + 1]) : 0;
      std::snprintf(buf, sizeof(buf), "%04zx %s 0x%02x\n", pc, name, imm);
      pc += 2;
    } else {
      std::snprintf(buf, sizeof(buf), "%04zx %s\n", pc, name);
      ++pc;
    }
    out += buf;
  }
  return out;
}

}  // namespace carver
