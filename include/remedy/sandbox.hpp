#pragma once

// remedy/sandbox.hpp: Process runner and scratch-space primitives.
//
// PROCESS MODEL:
//   run_process() forks a child that becomes the leader of its own session
//   (setsid), so the child and everything it spawns share one process group.
//   The deadline and cancellation are enforced from the parent by sending
//   SIGKILL to that whole group, then reaping the child. After a normal exit
//   the group is killed as well, so background descendants never outlive the
//   call.
//
// FAILURE MODEL:
//   run_process() never throws. Pipe/fork/exec failures set error_message;
//   an exec failure is reported by the child over a close-on-exec status
//   pipe, never inferred from its output. Every other outcome is reported
//   through exit_code / timed_out / cancelled.
//
// LIMITS:
//   The deadline is wall-clock. RLIMIT_CPU is only applied when
//   cpu_limit_seconds is set; it counts CPU time of all threads, and a
//   child killed by SIGXCPU is reported as timed_out.
//
// ENVIRONMENT:
//   When inherit_env is set the child starts from the host environment with
//   secret-looking keys removed (see is_secret_key), then ProcessSpec::env is layered
//   on top. Otherwise the child sees ProcessSpec::env only.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace remedy {

// Cooperative cancellation flag shared between a scheduler and the
// executions it owns. Safe to set from any thread.
class CancelToken {
 public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }
  bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Sleep up to `d`; returns early (true) once cancelled.
  bool wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [this] { return is_cancelled(); });
  }

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

struct ProcessSpec {
  std::string command;            // bare name is resolved through PATH
  std::vector<std::string> argv;  // arguments after argv[0]
  std::map<std::string, std::string> env;
  bool inherit_env{false};
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
  std::uint64_t cpu_limit_seconds{0};     // 0 = no RLIMIT_CPU
  const CancelToken* cancel{nullptr};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool cpu_limit_exceeded{false};  // timed_out because of RLIMIT_CPU
  bool cancelled{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty only when the process never ran
  std::uint64_t duration_ns{0};
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolve a command through PATH. Names containing '/' are returned as-is
// when executable. Returns an empty string when nothing is found.
std::string resolve_executable(const std::string& name);

// True for environment keys that look like credentials.
bool is_secret_key(const std::string& key);

// Host environment minus secret-looking keys.
std::map<std::string, std::string> sanitized_host_environment();

// ---------------------------------------------------------------------------
// ScratchDir: uniquely named ephemeral directory, removed on destruction.
// ---------------------------------------------------------------------------
class ScratchDir {
 public:
  // Creates <root>/remedy-<tag>-XXXXXX. An empty root means the system
  // temp directory. Check ok() before use.
  ScratchDir(const std::string& root, const std::string& tag);
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool ok() const { return !path_.empty(); }
  const std::string& path() const { return path_; }
  const std::string& root() const { return root_; }
  const std::string& error() const { return error_; }

  // Write `content` to <path>/<name>; returns the full path or "" on failure.
  std::string write_file(const std::string& name, const std::string& content) const;

 private:
  std::string root_;
  std::string path_;
  std::string error_;
};

}  // namespace remedy
