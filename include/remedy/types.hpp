#pragma once

// remedy/types.hpp: Core data structures for the verification-and-repair engine.
//
// OWNERSHIP:
//   - Every type here is a value type. All string members are value-owned.
//   - An AttemptHistory is owned by exactly one RepairLoopController::run()
//     invocation and is handed to the caller inside LoopResult.
//   - Nothing here is shared between problems; no locks are needed.
//
// LIFECYCLE:
//   CodeArtifact values are never edited. A repair produces a new artifact
//   that supersedes the previous one for the next attempt.

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace remedy {

enum class ErrorCode {
  none,
  spawn_failed,
  timeout,
  cancelled,
  scratch_unavailable,
  config_invalid,
  capability_failed,
  unknown_failure_kind,
  json_parse_error,
  json_duplicate_key,
};

std::string to_string(ErrorCode code);

// Generated program text. Opaque to the engine.
using CodeArtifact = std::string;

struct ExecutionResult {
  bool succeeded{false};
  std::string stdout_text;
  std::string stderr_text;
  // Process exit code on normal exit, 128+signal when killed by a signal,
  // -1 on timeout or cancellation, -2 when the process could not be run.
  int exit_status{0};
  bool timed_out{false};
  bool cancelled{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::uint64_t duration_ms{0};
  std::string error_code;
};

struct VerificationOutcome {
  // nullopt: expected value is not numeric, no check was possible.
  std::optional<bool> is_correct;
  std::optional<double> predicted_value;
  std::optional<double> expected_value;
  std::string status_message;

  // Unknown ground truth counts as accepted.
  bool accepted() const { return !is_correct.has_value() || *is_correct; }
};

// Which numeric-domain assumption a wrong value suggests revisiting.
enum class TypeHypothesis {
  unspecified,
  integer_domain,     // expected is integral, prediction is fractional
  continuous_domain,  // expected is fractional, prediction is integral
};

enum class FailureTag {
  incomplete_artifact,
  syntax_defect,
  import_or_dependency_defect,
  api_usage_defect,
  wrong_value,
  logic_defect,
};

// Closed failure taxonomy. `hypothesis` is only meaningful for wrong_value.
struct FailureKind {
  FailureTag tag{FailureTag::logic_defect};
  TypeHypothesis hypothesis{TypeHypothesis::unspecified};

  static FailureKind of(FailureTag t) { return FailureKind{t, TypeHypothesis::unspecified}; }
  static FailureKind wrong_value(TypeHypothesis h) { return FailureKind{FailureTag::wrong_value, h}; }

  bool operator==(const FailureKind&) const = default;
};

std::string to_string(FailureTag tag);
std::string to_string(TypeHypothesis hypothesis);
std::string to_string(const FailureKind& kind);  // e.g. "wrong_value(integer_domain)"

struct RepairResult {
  std::string rationale;
  CodeArtifact repaired_artifact;
  std::string action;     // strategy name, e.g. "repair_syntax"
  bool degraded{false};   // true when the pass-through no-op was substituted
};

struct AttemptRecord {
  int index{0};  // 1-based
  CodeArtifact artifact;
  std::string artifact_digest;
  ExecutionResult execution;
  std::optional<VerificationOutcome> verification;
  std::optional<FailureKind> failure_kind;
  std::optional<std::string> repair_rationale;
  std::string repair_action;
  bool repair_degraded{false};
};

using AttemptHistory = std::vector<AttemptRecord>;

enum class TerminalState {
  succeeded,
  exhausted,
  cancelled,
  faulted,  // the loop itself raised; only produced by BatchScheduler
};

std::string to_string(TerminalState state);

// Caller-facing result of one problem's repair loop.
struct LoopResult {
  std::string problem_id;
  bool success{false};
  bool answer_correct{false};
  CodeArtifact final_artifact;
  ExecutionResult final_execution;
  AttemptHistory history;
  int attempts{0};
  TerminalState terminal_state{TerminalState::exhausted};
  std::string error;  // set only when terminal_state == faulted
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Raised once, before any attempt, when the supplied configuration is unusable.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace remedy
