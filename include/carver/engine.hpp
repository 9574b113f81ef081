#pragma once

// carver/engine.hpp - The carving engine: turns runtime code into a
// permanent artifact at a content-derived address.
//
// DESIGN INVARIANTS:
//   1. Stateless: the engine holds its identity, host rules and a ledger
//      handle. Every artifact lives in the ledger.
//   2. Prediction: address_of(X) never touches the ledger, and a successful
//      carve(X) lands exactly at address_of(X).
//   3. All-or-nothing: a carve either stores X byte-for-byte at address_of(X)
//      or leaves the ledger unchanged. The address and size checks run as
//      the ledger's commit guard, so a rejected artifact is never visible.
//   4. Uniform failure: every failure kind surfaces to the caller as
//      ErrorCode::deployment_failed. The detailed FailureReason goes to the
//      event stream and the audit log only.
//   5. Verification never fails: is_carved() answers false for anything it
//      cannot positively confirm.
//
// EXTENSION_POINT: batch_carve
//   A batch API would call place() once per payload and report per-item
//   results; it must not share a guard across payloads.

#include <memory>
#include <string>
#include <string_view>

#include "carver/config.hpp"
#include "carver/ledger.hpp"
#include "carver/types.hpp"

namespace carver {

class CarveEngine {
 public:
  // Rules are the ledger's; the engine checks them locally first so that a
  // payload the host would refuse never reaches place().
  CarveEngine(const Address& identity, std::shared_ptr<IPlacementLedger> ledger);

  // Identity from config; rules from config.rules.
  CarveEngine(const EngineConfig& config, std::shared_ptr<IPlacementLedger> ledger);

  CarveEngine(const CarveEngine&) = delete;
  CarveEngine& operator=(const CarveEngine&) = delete;

  // Store runtime_code permanently at address_of(runtime_code).
  // Thread-safe. Never throws.
  CarveResult carve(std::string_view runtime_code);

  // Pure prediction. Defined for every input, including empty input and
  // inputs carve() would refuse.
  Address address_of(std::string_view runtime_code) const;

  // True iff the bytes observed at candidate re-derive to candidate under
  // this engine's identity. Never fails.
  bool is_carved(const Address& candidate) const;

  const Address& identity() const { return config_.engine_identity; }
  const HostRules& rules() const { return config_.rules; }
  const EngineConfig& config() const { return config_; }
  IPlacementLedger& ledger() const { return *ledger_; }

 private:
  FailureReason check_local(std::string_view runtime_code) const;

  EngineConfig config_;
  std::shared_ptr<IPlacementLedger> ledger_;
};

// MemoryLedger when config.ledger_root is empty, FileLedger otherwise.
std::shared_ptr<IPlacementLedger> make_ledger(const EngineConfig& config);

}  // namespace carver
