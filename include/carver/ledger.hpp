#pragma once

// carver/ledger.hpp - Placement ledger interface and implementations.
//
// The ledger models the host: it executes init code, enforces the host's
// artifact rules, derives the placement address and stores the artifact
// create-once. The engine owns no persistent state; everything lives here.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Create-once: place() at an occupied address is refused and never
//      alters the stored bytes.
//   2. All-or-nothing: a refused place() (host rule, collision, guard
//      rejection, I/O failure) leaves the ledger exactly as it was.
//   3. The guard runs at the ledger's serialization point, after the address
//      is known and before the artifact becomes visible. Concurrent place()
//      calls for the same address: exactly one can win.
//   4. There is no remove(). Artifacts are permanent.
//
// EXTENSION_POINT: remote_ledger
//   A ledger backed by a real execution host implements the same interface:
//   place() maps to a create-with-salt transaction whose post-deploy checks
//   run inside the transaction, so a failed guard reverts it.

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "carver/types.hpp"

namespace carver {

// Where the command-line tool keeps artifacts unless told otherwise.
inline constexpr const char kDefaultLedgerRoot[] = ".carver/ledger/v1";
// A ledger_root naming the in-memory ledger explicitly.
inline constexpr const char kMemoryLedgerRoot[] = ":memory:";

// What the ledger is about to commit.
struct PendingArtifact {
  Address address;
  std::size_t code_size{0};
};

// Returns FailureReason::none to let the commit proceed. Anything else
// aborts the placement with that reason. Called with the ledger's lock
// held: a guard must not call back into the ledger.
using CommitGuard = std::function<FailureReason(const PendingArtifact&)>;

struct PlacementResult {
  bool ok{false};
  Address address;
  std::size_t code_size{0};
  FailureReason reason{FailureReason::none};
};

// ---------------------------------------------------------------------------
// IPlacementLedger - abstract placement collaborator
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class IPlacementLedger {
 public:
  virtual ~IPlacementLedger() = default;

  // Execute init_code on behalf of caller, apply host rules to the returned
  // code, derive the address from (caller, salt, H(init_code)) and commit
  // the returned code there if the address is free and guard accepts.
  virtual PlacementResult place(std::string_view init_code, const Address& caller,
                                const Hash32& salt, const CommitGuard& guard) = 0;

  // Byte length of the artifact at address, 0 if unoccupied.
  virtual std::size_t size_of(const Address& address) const = 0;

  // Artifact bytes at address, empty if unoccupied.
  virtual std::string read_code(const Address& address) const = 0;

  virtual bool contains(const Address& address) const = 0;

  // Number of stored artifacts.
  virtual std::size_t size() const = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;

  virtual const HostRules& rules() const = 0;
};

// Host-side half of place(): run the init code, apply the rules, derive the
// address. Shared by every ledger implementation. On failure, reason is set
// and address is zero.
struct HostPreparation {
  bool ok{false};
  Address address;
  std::string code;
  FailureReason reason{FailureReason::none};
};

HostPreparation prepare_placement(std::string_view init_code, const Address& caller,
                                  const Hash32& salt, const HostRules& rules);

// ---------------------------------------------------------------------------
// MemoryLedger - in-process ledger
// ---------------------------------------------------------------------------
class MemoryLedger : public IPlacementLedger {
 public:
  explicit MemoryLedger(HostRules rules = {});

  PlacementResult place(std::string_view init_code, const Address& caller,
                        const Hash32& salt, const CommitGuard& guard) override;
  std::size_t size_of(const Address& address) const override;
  std::string read_code(const Address& address) const override;
  bool contains(const Address& address) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "memory"; }
  const HostRules& rules() const override { return rules_; }

  // Store code at address without running init code or deriving anything.
  // Models artifacts the host placed through some other mechanism (genesis
  // allocation, a different factory). Refused if address is occupied.
  bool preload(const Address& address, std::string code);

 private:
  HostRules rules_;
  mutable std::mutex mu_;
  std::map<Address, std::string> artifacts_;
};

// ---------------------------------------------------------------------------
// FileLedger - local filesystem ledger
// ---------------------------------------------------------------------------
// One file per artifact, sharded by address:
//   <root>/artifacts/AB/CD/<40-hex-address>
// The file is a single-line JSON header followed by '\n' and the stored
// blob. Header fields: address, encoding, format_version, code_size, stored_size,
// stored_blob_hash, created_at.
//
// Create-once across processes: the artifact is written to a temp file and
// hard-linked into place; link() fails if the target exists, so exactly one
// writer wins and no reader ever sees a partial file.
//
// Reads verify stored_blob_hash and code_size. Any integrity failure reads
// as empty (fail-closed) but the address stays occupied.
class FileLedger : public IPlacementLedger {
 public:
  explicit FileLedger(std::string root = kDefaultLedgerRoot, HostRules rules = {},
                      std::string compression = "off");

  PlacementResult place(std::string_view init_code, const Address& caller,
                        const Hash32& salt, const CommitGuard& guard) override;
  std::size_t size_of(const Address& address) const override;
  std::string read_code(const Address& address) const override;
  bool contains(const Address& address) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }
  const HostRules& rules() const override { return rules_; }

  const std::string& root() const { return root_; }
  std::string artifact_path(const Address& address) const;

 private:
  std::string root_;
  HostRules rules_;
  std::string compression_;  // "off" or "zstd"
  mutable std::mutex mu_;
};

}  // namespace carver
