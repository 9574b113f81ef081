#pragma once

// carver/observability.hpp - Structured engine observability layer.
//
// DESIGN:
//   CarveEvent is the canonical observable unit. Every carve() and
//   is_carved() call emits one CarveEvent, which is:
//     - recorded in the process-wide EngineStats (always),
//     - forwarded to a registered hook if one is set, otherwise
//     - appended as one JSON line to CARVER_EVENT_LOG if that is set.
//
// Invariant: event emission never changes a carve outcome and never throws.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Register a hook with set_carve_event_hook() that converts events into
//   spans. Attributes must stay metadata-only: addresses, code hashes and
//   sizes, never the code itself.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "carver/types.hpp"

namespace carver {

// ---------------------------------------------------------------------------
// CarveEvent - per-operation observable unit
// ---------------------------------------------------------------------------
struct CarveEvent {
  std::string operation;        // "carve" | "verify"
  std::string engine_identity;  // 0x-hex
  std::string address;          // 0x-hex; derived (carve) or queried (verify)
  std::string code_hash;        // BLAKE3 of the runtime code (carve only)
  size_t code_size{0};          // runtime code bytes (carve) / observed bytes (verify)
  uint64_t duration_ns{0};
  bool ok{false};               // carve succeeded / verification positive
  std::string error_code;       // empty if ok (carve only)
  FailureReason failure_reason{FailureReason::none};
};

std::string carve_event_to_json(const CarveEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds. 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  // MICRO_DOCUMENTED: aligned to separate cache lines so bucket updates and
  // the count/sum counters do not false-share under concurrent carves.
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure breakdown and the recent
// events ring use mutexes.
class EngineStats {
 public:
  void record(const CarveEvent& ev);
  void record_derivation() { derivations.fetch_add(1, std::memory_order_relaxed); }
  std::string to_json() const;
  void reset();

  alignas(64) std::atomic<uint64_t> carves_total{0};
  alignas(64) std::atomic<uint64_t> carves_ok{0};
  alignas(64) std::atomic<uint64_t> carves_failed{0};
  alignas(64) std::atomic<uint64_t> collisions{0};
  alignas(64) std::atomic<uint64_t> verifications{0};
  alignas(64) std::atomic<uint64_t> verifications_positive{0};
  alignas(64) std::atomic<uint64_t> derivations{0};
  alignas(64) std::atomic<uint64_t> bytes_carved{0};
  alignas(64) std::atomic<uint64_t> audit_failures{0};

  LatencyHistogram carve_latency;

  std::map<std::string, uint64_t> failure_breakdown() const;

  // Ring buffer of the most recent events.
  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<CarveEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_by_reason_;

  mutable std::mutex ring_mu_;
  std::vector<CarveEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

EngineStats& global_engine_stats();

// Emit an event (non-blocking, fire-and-forget).
void emit_carve_event(const CarveEvent& ev);

using CarveEventHook = void (*)(const CarveEvent&);
void set_carve_event_hook(CarveEventHook hook);

// Overrides CARVER_EVENT_LOG. Empty string disables the JSONL sink.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace carver
