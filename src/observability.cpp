#include "remedy/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

#include "remedy/jsonlite.hpp"

namespace remedy {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

int initial_verbose() {
  const char* v = std::getenv("REMEDY_VERBOSE");
  return (v && std::strcmp(v, "1") == 0) ? 1 : 0;
}

std::atomic<int> g_verbose{initial_verbose()};
std::atomic<AttemptEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i) us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  append_fixed(out, "%.3f", mean_us() / 1000.0);
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_failure(FailureTag tag) {
  const auto i = static_cast<std::size_t>(tag);
  if (i < kFailureTags) failures_by_tag[i].fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_loop(TerminalState state) {
  switch (state) {
    case TerminalState::succeeded: loops_succeeded.fetch_add(1, std::memory_order_relaxed); break;
    case TerminalState::exhausted: loops_exhausted.fetch_add(1, std::memory_order_relaxed); break;
    case TerminalState::cancelled: loops_cancelled.fetch_add(1, std::memory_order_relaxed); break;
    case TerminalState::faulted: loops_faulted.fetch_add(1, std::memory_order_relaxed); break;
  }
}

void EngineStats::record_attempt(const AttemptEvent& ev) {
  attempts.fetch_add(1, std::memory_order_relaxed);
  if (ev.outcome == "accepted") accepted_attempts.fetch_add(1, std::memory_order_relaxed);
  if (ev.outcome == "timeout") timeouts.fetch_add(1, std::memory_order_relaxed);
  if (ev.repair_degraded) degraded_repairs.fetch_add(1, std::memory_order_relaxed);
  latency_histogram.record(ev.duration_ns);
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"attempts\":";
  out += std::to_string(attempts.load(std::memory_order_relaxed));
  out += ",\"accepted_attempts\":";
  out += std::to_string(accepted_attempts.load(std::memory_order_relaxed));
  out += ",\"timeouts\":";
  out += std::to_string(timeouts.load(std::memory_order_relaxed));
  out += ",\"degraded_repairs\":";
  out += std::to_string(degraded_repairs.load(std::memory_order_relaxed));

  out += ",\"loops\":{\"succeeded\":";
  out += std::to_string(loops_succeeded.load(std::memory_order_relaxed));
  out += ",\"exhausted\":";
  out += std::to_string(loops_exhausted.load(std::memory_order_relaxed));
  out += ",\"cancelled\":";
  out += std::to_string(loops_cancelled.load(std::memory_order_relaxed));
  out += ",\"faulted\":";
  out += std::to_string(loops_faulted.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"failures\":{";
  for (std::size_t i = 0; i < kFailureTags; ++i) {
    if (i) out += ',';
    out += '"';
    out += to_string(static_cast<FailureTag>(i));
    out += "\":";
    out += std::to_string(failures_by_tag[i].load(std::memory_order_relaxed));
  }
  out += "}";

  out += ",\"latency\":";
  out += latency_histogram.to_json();
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

std::string attempt_event_to_json(const AttemptEvent& ev) {
  jsonlite::Object o;
  o["problem_id"] = ev.problem_id;
  o["attempt"] = static_cast<std::uint64_t>(ev.attempt);
  o["artifact_digest"] = ev.artifact_digest;
  o["outcome"] = ev.outcome;
  o["failure_kind"] = ev.failure_kind;
  o["repair_action"] = ev.repair_action;
  o["repair_degraded"] = ev.repair_degraded;
  o["duration_ns"] = ev.duration_ns;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void set_attempt_event_hook(AttemptEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_attempt_event(const AttemptEvent& ev) {
  global_engine_stats().record_attempt(ev);

  AttemptEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("REMEDY_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = attempt_event_to_json(ev);
  line += '\n';
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void set_verbose(bool on) { g_verbose.store(on ? 1 : 0, std::memory_order_relaxed); }

bool verbose_enabled() { return g_verbose.load(std::memory_order_relaxed) != 0; }

void log_line(const std::string& component, const std::string& message) {
  if (!verbose_enabled()) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[remedy:" << component << "] " << message << "\n";
}

}  // namespace remedy
