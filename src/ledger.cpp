#include "carver/ledger.hpp"

#include <utility>

#include "carver/bootstrap.hpp"
#include "carver/derivation.hpp"
#include "carver/hash.hpp"

namespace carver {

HostPreparation prepare_placement(std::string_view init_code, const Address& caller,
                                  const Hash32& salt, const HostRules& rules) {
  HostPreparation prep;

  BootstrapOutcome run = run_init_code(init_code);
  if (!run.ok) {
    prep.reason = FailureReason::bootstrap_rejected;
    return prep;
  }

  // Host rules apply to the returned code, not to the init code.
  if (run.returned.size() > rules.max_code_size) {
    prep.reason = FailureReason::code_too_large;
    return prep;
  }
  if (rules.enforce_forbidden_first_byte && !run.returned.empty() &&
      static_cast<uint8_t>(run.returned[0]) == rules.forbidden_first_byte) {
    prep.reason = FailureReason::forbidden_first_byte;
    return prep;
  }

  prep.address = derive_address(caller, salt, hash_bytes(init_code));
  prep.code = std::move(run.returned);
  prep.ok = true;
  return prep;
}

// ---------------------------------------------------------------------------
// MemoryLedger
// ---------------------------------------------------------------------------

MemoryLedger::MemoryLedger(HostRules rules) : rules_(rules) {}

PlacementResult MemoryLedger::place(std::string_view init_code, const Address& caller,
                                    const Hash32& salt, const CommitGuard& guard) {
  PlacementResult result;

  // Executing init code is pure; do it outside the lock.
  HostPreparation prep = prepare_placement(init_code, caller, salt, rules_);
  if (!prep.ok) {
    result.reason = prep.reason;
    return result;
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (artifacts_.count(prep.address) != 0) {
    result.reason = FailureReason::address_collision;
    return result;
  }

  const PendingArtifact pending{prep.address, prep.code.size()};
  if (guard) {
    const FailureReason verdict = guard(pending);
    if (verdict != FailureReason::none) {
      result.reason = verdict;
      return result;
    }
  }

  artifacts_.emplace(prep.address, std::move(prep.code));
  result.ok = true;
  result.address = pending.address;
  result.code_size = pending.code_size;
  return result;
}

std::size_t MemoryLedger::size_of(const Address& address) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = artifacts_.find(address);
  return it == artifacts_.end() ? 0 : it->second.size();
}

std::string MemoryLedger::read_code(const Address& address) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = artifacts_.find(address);
  return it == artifacts_.end() ? std::string() : it->second;
}

bool MemoryLedger::contains(const Address& address) const {
  std::lock_guard<std::mutex> lk(mu_);
  return artifacts_.count(address) != 0;
}

std::size_t MemoryLedger::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return artifacts_.size();
}

bool MemoryLedger::preload(const Address& address, std::string code) {
  std::lock_guard<std::mutex> lk(mu_);
  return artifacts_.emplace(address, std::move(code)).second;
}

}  // namespace carver
