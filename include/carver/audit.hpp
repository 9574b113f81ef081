#pragma once

// carver/audit.hpp - Append-only audit log of carve attempts.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence.
//   3. CHAINED: each entry carries the BLAKE3 of the previous entry's line,
//      so a removed or edited line breaks the chain.
//   4. FAIL-SAFE: a write failure never changes the carve outcome; it only
//      increments failure_count().
//   5. PROVENANCE: every entry records the derivation version and the
//      engine identity, so a reader can re-derive the address.

#include <cstdint>
#include <memory>
#include <string>

namespace carver {

// ---------------------------------------------------------------------------
// CarveRecord - one carve attempt
// ---------------------------------------------------------------------------
struct CarveRecord {
  uint64_t    sequence{0};                // assigned by append()
  std::string previous_digest;            // assigned by append()
  std::string engine_identity;            // 0x-hex
  std::string address;                    // 0x-hex predicted address
  std::string code_hash;                  // BLAKE3 of the runtime code
  uint64_t    code_size{0};
  bool        ok{false};
  std::string error_code;                 // "deployment_failed" or empty
  std::string failure_reason;             // diagnostic detail, empty if ok
  std::string ledger_backend;
  uint32_t    derivation_version{0};      // assigned by append()
  uint32_t    audit_log_version{0};       // assigned by append()
  uint64_t    duration_ns{0};
  uint64_t    timestamp_unix_ms{0};       // assigned by append()
};

// Compact single-line JSON (NDJSON).
std::string carve_record_to_json(const CarveRecord& r);

// Verify the hash chain of an audit log file. Returns the number of valid
// entries, or -1 if the chain or sequence is broken or an entry carries an
// audit_log_version other than AUDIT_LOG_VERSION.
long long verify_audit_chain(const std::string& path);

// ---------------------------------------------------------------------------
// ImmutableAuditLog - append-only NDJSON log writer
// ---------------------------------------------------------------------------
// Thread-safe: appends and reopen() are serialized by an internal mutex.
class ImmutableAuditLog {
 public:
  // Empty path disables the log; append() then succeeds without writing.
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, previous_digest, the version stamps and timestamp in
  // place. Returns false on write error (the entry was NOT written).
  // Never throws.
  bool append(CarveRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  bool enabled() const;

  // Closes the current file and continues the chain of the log at `path`.
  // Counters restart at zero. Empty path disables the log.
  void reopen(const std::string& path);

  std::string path() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Process-wide audit log. Path from set_audit_log_path() if called before
// first use, else CARVER_AUDIT_LOG, else disabled. The instance lives for
// the whole process; set_audit_log_path() reopens it in place, so the
// returned reference stays valid.
ImmutableAuditLog& global_audit_log();
void set_audit_log_path(const std::string& path);

}  // namespace carver
