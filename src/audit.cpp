#include "carver/audit.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

#include "carver/hash.hpp"
#include "carver/jsonlite.hpp"
#include "carver/version.hpp"

namespace carver {

namespace {
const std::string kGenesisDigest(64, '0');
}  // namespace

std::string carve_record_to_json(const CarveRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"engine_identity\":\"" << r.engine_identity << "\""
    << ",\"address\":\"" << r.address << "\""
    << ",\"code_hash\":\"" << r.code_hash << "\""
    << ",\"code_size\":" << r.code_size
    << ",\"ok\":" << (r.ok ? "true" : "false")
    << ",\"error_code\":\"" << jsonlite::escape(r.error_code) << "\""
    << ",\"failure_reason\":\"" << jsonlite::escape(r.failure_reason) << "\""
    << ",\"ledger_backend\":\"" << jsonlite::escape(r.ledger_backend) << "\""
    << ",\"derivation_version\":" << r.derivation_version
    << ",\"audit_log_version\":" << r.audit_log_version
    << ",\"duration_ns\":" << r.duration_ns
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << "}";
  return o.str();
}

long long verify_audit_chain(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) return -1;

  std::string prev = kGenesisDigest;
  unsigned long long expected_seq = 1;
  long long count = 0;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) return -1;
    if (jsonlite::get_string(obj, "prev") != prev) return -1;
    if (jsonlite::get_u64(obj, "seq", 0) != expected_seq) return -1;
    if (jsonlite::get_u64(obj, "audit_log_version", 0) != version::AUDIT_LOG_VERSION) return -1;
    prev = blake3_hex(line);
    ++expected_seq;
    ++count;
  }
  return count;
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  std::string path;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};

  // Caller holds mu.
  void close_locked() {
    if (file) {
      std::fclose(file);
      file = nullptr;
    }
  }

  // Caller holds mu. Resumes the chain from an existing log so sequence
  // numbers never repeat.
  void open_locked(const std::string& p) {
    close_locked();
    path = p;
    seq = 0;
    entry_count = 0;
    failure_count = 0;
    last_digest = kGenesisDigest;
    if (path.empty()) return;

    {
      std::ifstream ifs(path);
      std::string line;
      while (std::getline(ifs, line)) {
        if (line.empty()) continue;
        std::optional<jsonlite::JsonError> err;
        const auto obj = jsonlite::parse(line, &err);
        if (err) continue;
        seq = jsonlite::get_u64(obj, "seq", seq);
        last_digest = blake3_hex(line);
      }
    }
    file = std::fopen(path.c_str(), "a");
  }
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->open_locked(path);
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_) impl_->close_locked();
}

void ImmutableAuditLog::reopen(const std::string& path) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->open_locked(path);
}

std::string ImmutableAuditLog::path() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->path;
}

bool ImmutableAuditLog::enabled() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->file != nullptr;
}

bool ImmutableAuditLog::append(CarveRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (!impl_->file) {
    if (impl_->path.empty()) return true;  // not configured: non-fatal skip
    ++impl_->failure_count;
    return false;
  }

  // Seek to end before writing to guarantee append-only even if the file
  // position was moved externally.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  using SC = std::chrono::system_clock;
  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.derivation_version = version::DERIVATION_VERSION;
  record.audit_log_version = version::AUDIT_LOG_VERSION;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());

  const std::string line = carve_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size() &&
      std::fflush(impl_->file) == 0;

  if (!written) {
    ++impl_->failure_count;
    return false;
  }

  // The chain only advances once the line is durably appended.
  impl_->seq = record.sequence;
  impl_->last_digest = blake3_hex(line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

// ---------------------------------------------------------------------------
// Global singleton
// ---------------------------------------------------------------------------

namespace {
std::mutex g_audit_log_init_mu;
std::unique_ptr<ImmutableAuditLog> g_audit_log_instance;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (g_audit_log_instance) {
    // In-flight appends finish on the old file before the switch.
    g_audit_log_instance->reopen(path);
  } else {
    g_audit_log_instance = std::make_unique<ImmutableAuditLog>(path);
  }
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (!g_audit_log_instance) {
    std::string path;
    const char* env = std::getenv("CARVER_AUDIT_LOG");
    if (env && env[0]) path = env;
    g_audit_log_instance = std::make_unique<ImmutableAuditLog>(path);
  }
  return *g_audit_log_instance;
}

}  // namespace carver
