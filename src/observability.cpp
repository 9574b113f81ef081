#include "carver/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "carver/jsonlite.hpp"

namespace carver {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) using hardware BSR/CLZ.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

std::string carve_event_to_json(const CarveEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"operation\":\"";
  line += ev.operation;
  line += "\",\"engine_identity\":\"";
  line += ev.engine_identity;
  line += "\",\"address\":\"";
  line += ev.address;
  line += "\",\"code_hash\":\"";
  line += ev.code_hash;
  line += "\",\"code_size\":";
  line += std::to_string(ev.code_size);
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += jsonlite::escape(ev.error_code);
  line += "\",\"failure_reason\":\"";
  line += to_string(ev.failure_reason);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of bucket i. Bucket 0 covers [0,1)us.
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_us\":";
  append_fixed(out, "%.2f", percentile(0.50));
  out += ",\"p95_us\":";
  append_fixed(out, "%.2f", percentile(0.95));
  out += ",\"p99_us\":";
  append_fixed(out, "%.2f", percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const CarveEvent& ev) {
  if (ev.operation == "verify") {
    verifications.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok) verifications_positive.fetch_add(1, std::memory_order_relaxed);
  } else {
    carves_total.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok) {
      carves_ok.fetch_add(1, std::memory_order_relaxed);
      bytes_carved.fetch_add(ev.code_size, std::memory_order_relaxed);
    } else {
      carves_failed.fetch_add(1, std::memory_order_relaxed);
      if (ev.failure_reason == FailureReason::address_collision) {
        collisions.fetch_add(1, std::memory_order_relaxed);
      }
      std::lock_guard<std::mutex> lk(failure_mu_);
      ++failures_by_reason_[to_string(ev.failure_reason)];
    }
    carve_latency.record(ev.duration_ns);
  }

  // MICRO_OPT: O(1) circular overwrite once the ring is full.
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::map<std::string, uint64_t> EngineStats::failure_breakdown() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_by_reason_;
}

std::vector<CarveEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<CarveEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void EngineStats::reset() {
  carves_total.store(0, std::memory_order_relaxed);
  carves_ok.store(0, std::memory_order_relaxed);
  carves_failed.store(0, std::memory_order_relaxed);
  collisions.store(0, std::memory_order_relaxed);
  verifications.store(0, std::memory_order_relaxed);
  verifications_positive.store(0, std::memory_order_relaxed);
  derivations.store(0, std::memory_order_relaxed);
  bytes_carved.store(0, std::memory_order_relaxed);
  audit_failures.store(0, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failures_by_reason_.clear();
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"carves\":{\"total\":";
  out += std::to_string(carves_total.load(std::memory_order_relaxed));
  out += ",\"ok\":";
  out += std::to_string(carves_ok.load(std::memory_order_relaxed));
  out += ",\"failed\":";
  out += std::to_string(carves_failed.load(std::memory_order_relaxed));
  out += ",\"collisions\":";
  out += std::to_string(collisions.load(std::memory_order_relaxed));
  out += ",\"bytes\":";
  out += std::to_string(bytes_carved.load(std::memory_order_relaxed));
  out += "},\"verifications\":{\"total\":";
  out += std::to_string(verifications.load(std::memory_order_relaxed));
  out += ",\"positive\":";
  out += std::to_string(verifications_positive.load(std::memory_order_relaxed));
  out += "},\"derivations\":";
  out += std::to_string(derivations.load(std::memory_order_relaxed));
  out += ",\"audit_failures\":";
  out += std::to_string(audit_failures.load(std::memory_order_relaxed));

  out += ",\"failure_reasons\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [reason, n] : failures_by_reason_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + reason + "\":" + std::to_string(n);
    }
  }
  out += "},\"latency\":";
  out += carve_latency.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<CarveEventHook> g_event_hook{nullptr};
std::mutex g_event_log_mu;
std::string g_event_log_path;
bool g_event_log_path_set = false;
}  // namespace

void set_carve_event_hook(CarveEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  g_event_log_path = path;
  g_event_log_path_set = true;
}

void emit_carve_event(const CarveEvent& ev) {
  global_engine_stats().record(ev);

  CarveEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // JSONL sink. Activation: CARVER_EVENT_LOG=/path/to/events.jsonl
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  std::string path = g_event_log_path;
  if (!g_event_log_path_set) {
    const char* env = std::getenv("CARVER_EVENT_LOG");
    if (env && env[0]) path = env;
  }
  if (path.empty()) return;

  const std::string line = carve_event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace carver
