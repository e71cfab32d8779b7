#pragma once

// remedy/scheduler.hpp: Run many independent repair loops on a worker pool.
//
// CONCURRENCY:
//   Workers claim the next problem index from an atomic counter, so each
//   problem is processed by exactly one thread and its loop stays strictly
//   sequential. Results are written to a pre-sized vector slot per problem
//   and returned in input order.
//
//   A global deadline (or cancel()) sets one shared CancelToken. In-flight
//   executions are killed; problems not yet started are reported Cancelled
//   with zero attempts.
//
//   Exceptions thrown while processing one problem are caught and reported
//   as a Faulted result; they never stop the batch.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "remedy/capability.hpp"
#include "remedy/classifier.hpp"
#include "remedy/executor.hpp"
#include "remedy/repair_loop.hpp"
#include "remedy/sandbox.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct SchedulerConfig {
  unsigned workers{9};
  double deadline_seconds{0.0};  // 0 = no global deadline
};

// Hands out credentials round-robin. Thread-safe.
class CredentialPool {
 public:
  CredentialPool() = default;
  explicit CredentialPool(std::vector<std::string> credentials)
      : credentials_(std::move(credentials)) {}

  // Empty string when the pool is empty.
  std::string next();
  std::size_t size() const { return credentials_.size(); }

 private:
  std::vector<std::string> credentials_;
  std::size_t index_{0};
  std::mutex mu_;
};

// Builds one problem's capability from the credential it was assigned.
using CapabilityFactory =
    std::function<std::shared_ptr<RepairCapability>(const std::string& credential)>;

struct BatchReport {
  std::vector<LoopResult> results;  // input order
  std::uint64_t succeeded{0};
  std::uint64_t answer_correct{0};
  std::uint64_t exhausted{0};
  std::uint64_t cancelled{0};
  std::uint64_t faulted{0};
  std::map<std::string, std::uint64_t> failures_by_kind;
  double mean_attempts{0.0};
  std::uint64_t duration_ms{0};

  // Aggregates only; per-problem results are serialized separately.
  std::string summary_json() const;

  // {"results":[...],"summary":{...},"stats":{...}}. "stats" is the
  // process-wide EngineStats at the time of the call.
  std::string to_json(bool include_history = true) const;
};

// One batch input line:
//   {"id","code","expected","problem","math_model","api_reference"}
// A numeric "expected" is kept at full double precision. A missing id
// becomes "problem-<lineno>". Throws std::runtime_error on malformed JSON.
ProblemInput parse_problem_line(const std::string& line, std::size_t lineno);

class BatchScheduler {
 public:
  BatchScheduler(SchedulerConfig config, LoopConfig loop, const CodeExecutor& executor,
                 ClassifierConfig classifier, CapabilityFactory factory,
                 std::vector<std::string> credentials = {});

  // Throws ConfigError before starting when the loop or scheduler config is invalid.
  BatchReport run(const std::vector<ProblemInput>& problems);

  // Cancel everything in flight and queued. Permanent for this scheduler.
  void cancel() { cancel_.cancel(); }
  bool cancelled() const { return cancel_.is_cancelled(); }

 private:
  LoopResult run_one(const ProblemInput& problem);

  SchedulerConfig config_;
  LoopConfig loop_;
  const CodeExecutor& executor_;
  ClassifierConfig classifier_;
  CapabilityFactory factory_;
  CredentialPool credentials_;
  CancelToken cancel_;
};

}  // namespace remedy
