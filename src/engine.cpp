#include "carver/engine.hpp"

#include <utility>

#include "carver/audit.hpp"
#include "carver/bootstrap.hpp"
#include "carver/derivation.hpp"
#include "carver/hash.hpp"
#include "carver/observability.hpp"

namespace carver {

CarveEngine::CarveEngine(const Address& identity, std::shared_ptr<IPlacementLedger> ledger)
    : ledger_(std::move(ledger)) {
  config_.engine_identity = identity;
  config_.rules = ledger_->rules();
}

CarveEngine::CarveEngine(const EngineConfig& config, std::shared_ptr<IPlacementLedger> ledger)
    : config_(config), ledger_(std::move(ledger)) {}

FailureReason CarveEngine::check_local(std::string_view runtime_code) const {
  if (runtime_code.empty()) return FailureReason::empty_code;
  const HostRules& rules = config_.rules;
  if (rules.enforce_forbidden_first_byte &&
      static_cast<uint8_t>(runtime_code.front()) == rules.forbidden_first_byte) {
    return FailureReason::forbidden_first_byte;
  }
  if (runtime_code.size() > rules.max_code_size || runtime_code.size() > kMaxSupportedCodeSize) {
    return FailureReason::code_too_large;
  }
  return FailureReason::none;
}

CarveResult CarveEngine::carve(std::string_view runtime_code) {
  CarveEvent ev;
  ev.operation = "carve";
  ev.engine_identity = identity().hex();
  ev.code_size = runtime_code.size();

  CarveResult result;
  FailureReason reason = FailureReason::none;
  const Address predicted = carver::address_of(runtime_code, identity());
  {
    ScopeTimer timer(ev.duration_ns);
    ev.code_hash = blake3_hex(runtime_code);

    reason = check_local(runtime_code);
    if (reason == FailureReason::none) {
      const std::string init_code = compose_init_code(runtime_code);
      const std::size_t expected_size = runtime_code.size();

      // Runs under the ledger lock, before the artifact is visible.
      const CommitGuard guard = [&predicted, expected_size](const PendingArtifact& p) {
        if (p.address.is_zero() || p.address != predicted) return FailureReason::address_mismatch;
        if (p.code_size == 0 || p.code_size != expected_size) return FailureReason::size_mismatch;
        return FailureReason::none;
      };

      const PlacementResult placed = ledger_->place(init_code, identity(), kZeroSalt, guard);
      if (placed.ok) {
        result.ok = true;
        result.address = placed.address;
      } else {
        reason = placed.reason == FailureReason::none ? FailureReason::ledger_io : placed.reason;
      }
    }
  }

  if (!result.ok) result.error_code = ErrorCode::deployment_failed;

  ev.address = predicted.hex();
  ev.ok = result.ok;
  ev.error_code = result.ok ? "" : to_string(result.error_code);
  ev.failure_reason = reason;
  emit_carve_event(ev);

  CarveRecord record;
  record.engine_identity = ev.engine_identity;
  record.address = ev.address;
  record.code_hash = ev.code_hash;
  record.code_size = ev.code_size;
  record.ok = ev.ok;
  record.error_code = ev.error_code;
  record.failure_reason = result.ok ? "" : to_string(reason);
  record.ledger_backend = ledger_->backend_id();
  record.duration_ns = ev.duration_ns;
  if (!global_audit_log().append(record)) {
    global_engine_stats().audit_failures.fetch_add(1, std::memory_order_relaxed);
  }

  return result;
}

Address CarveEngine::address_of(std::string_view runtime_code) const {
  global_engine_stats().record_derivation();
  return carver::address_of(runtime_code, identity());
}

bool CarveEngine::is_carved(const Address& candidate) const {
  CarveEvent ev;
  ev.operation = "verify";
  ev.engine_identity = identity().hex();
  ev.address = candidate.hex();

  bool carved = false;
  {
    ScopeTimer timer(ev.duration_ns);
    // An unoccupied address reads as empty, and empty re-derives to
    // address_of(""). That address answers true whether or not it is
    // occupied.
    const std::string observed = ledger_->read_code(candidate);
    ev.code_size = observed.size();
    carved = carver::address_of(observed, identity()) == candidate;
  }

  ev.ok = carved;
  emit_carve_event(ev);
  return carved;
}

std::shared_ptr<IPlacementLedger> make_ledger(const EngineConfig& config) {
  if (config.ledger_root.empty() || config.ledger_root == kMemoryLedgerRoot) {
    return std::make_shared<MemoryLedger>(config.rules);
  }
  return std::make_shared<FileLedger>(config.ledger_root, config.rules, config.compression);
}

}  // namespace carver
