#pragma once

// remedy/repair_loop.hpp: Bounded execute / verify / classify / repair loop.
//
// STATES:
//   Attempting(i) -> Succeeded   execution succeeded and the answer is
//                                correct or the ground truth is unknown
//   Attempting(i) -> Exhausted   i == max_attempts and not accepted
//   Attempting(i) -> Cancelled   the cancel token fired
//   otherwise classify, repair, Attempting(i+1) with the repaired artifact.
//
// INVARIANTS:
//   - history.size() == attempts; each attempt appends exactly one record.
//   - One problem's attempts run strictly in sequence.
//   - The controller holds no state between run() calls.

#include <string>

#include "remedy/classifier.hpp"
#include "remedy/dispatcher.hpp"
#include "remedy/executor.hpp"
#include "remedy/sandbox.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct LoopConfig {
  int max_attempts{3};
  double tolerance{0.1};
};

ConfigValidationResult validate_loop_config(const LoopConfig& config);

struct ProblemInput {
  std::string problem_id;
  CodeArtifact initial_artifact;
  std::string expected;   // ground truth text; may be empty or a sentinel
  RepairContext context;  // problem / math_model / api_reference
};

class RepairLoopController {
 public:
  RepairLoopController(LoopConfig config, const CodeExecutor& executor,
                       const RepairDispatcher& dispatcher, ClassifierConfig classifier = {});

  // Throws ConfigError before any attempt when the configuration is invalid.
  LoopResult run(const ProblemInput& problem, const CancelToken* cancel = nullptr) const;

 private:
  LoopConfig config_;
  const CodeExecutor& executor_;
  const RepairDispatcher& dispatcher_;
  ClassifierConfig classifier_;
};

std::string execution_result_to_json(const ExecutionResult& r);
std::string loop_result_to_json(const LoopResult& r, bool include_history = true);

}  // namespace remedy
