#pragma once

// remedy/observability.hpp: Attempt-level observability.
//
// DESIGN:
//   AttemptEvent is the observable unit. Every attempt made by a
//   RepairLoopController emits exactly one AttemptEvent, which is:
//     - recorded into the process-wide EngineStats (always),
//     - forwarded to a registered hook when one is set, otherwise
//     - appended as one JSONL line to the file named by REMEDY_EVENT_LOG.
//   Events carry digests and metadata only, never artifact text or output.
//
// Invariant: emission never throws and takes no lock.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "remedy/types.hpp"

namespace remedy {

struct AttemptEvent {
  std::string problem_id;
  int attempt{0};
  std::string artifact_digest;
  std::string outcome;       // "accepted" | "rejected" | "timeout" | "cancelled" | "exec_failed"
  std::string failure_kind;  // empty when accepted
  std::string repair_action;
  bool repair_degraded{false};
  std::uint64_t duration_ns{0};  // execution + verification
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if nothing was recorded.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic.
class EngineStats {
 public:
  static constexpr std::size_t kFailureTags = 6;

  void record_attempt(const AttemptEvent& ev);
  void record_loop(TerminalState state);
  void record_failure(FailureTag tag);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> attempts{0};
  alignas(64) std::atomic<std::uint64_t> accepted_attempts{0};
  alignas(64) std::atomic<std::uint64_t> timeouts{0};
  alignas(64) std::atomic<std::uint64_t> degraded_repairs{0};

  std::atomic<std::uint64_t> loops_succeeded{0};
  std::atomic<std::uint64_t> loops_exhausted{0};
  std::atomic<std::uint64_t> loops_cancelled{0};
  std::atomic<std::uint64_t> loops_faulted{0};

  std::array<std::atomic<std::uint64_t>, kFailureTags> failures_by_tag{};

  LatencyHistogram latency_histogram;
};

EngineStats& global_engine_stats();

// Serialize one event as a single-line JSON object (no trailing newline).
std::string attempt_event_to_json(const AttemptEvent& ev);

// Record, then hook or JSONL sink.
void emit_attempt_event(const AttemptEvent& ev);

using AttemptEventHook = void (*)(const AttemptEvent&);
void set_attempt_event_hook(AttemptEventHook hook);

// Human-readable progress lines: "[remedy:<component>] <message>" on stderr.
// Suppressed unless REMEDY_VERBOSE=1 or set_verbose(true).
void set_verbose(bool on);
bool verbose_enabled();
void log_line(const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace remedy
