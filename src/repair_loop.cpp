#include "remedy/repair_loop.hpp"

#include <cmath>

#include "remedy/hash.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"
#include "remedy/verifier.hpp"

namespace remedy {

namespace {

std::string attempt_outcome(const ExecutionResult& exec, bool accepted) {
  if (accepted) return "accepted";
  if (exec.cancelled) return "cancelled";
  if (exec.timed_out) return "timeout";
  if (!exec.succeeded) return "exec_failed";
  return "rejected";
}

std::string mismatch_text(const VerificationOutcome& v) {
  if (!v.predicted_value || !v.expected_value) return v.status_message;
  return "Wrong answer: expected " + jsonlite::format_double(*v.expected_value) + ", got " +
         jsonlite::format_double(*v.predicted_value);
}

jsonlite::Value execution_value(const ExecutionResult& r) {
  jsonlite::Object o;
  o["succeeded"] = r.succeeded;
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;
  o["exit_status"] = r.exit_status >= 0 ? jsonlite::Value(static_cast<std::uint64_t>(r.exit_status))
                                        : jsonlite::Value(static_cast<double>(r.exit_status));
  o["timed_out"] = r.timed_out;
  o["cancelled"] = r.cancelled;
  o["stdout_truncated"] = r.stdout_truncated;
  o["stderr_truncated"] = r.stderr_truncated;
  o["duration_ms"] = r.duration_ms;
  o["error_code"] = r.error_code;
  return jsonlite::Value(std::move(o));
}

jsonlite::Value optional_number(const std::optional<double>& v) {
  return v ? jsonlite::Value(*v) : jsonlite::Value(nullptr);
}

}  // namespace

ConfigValidationResult validate_loop_config(const LoopConfig& config) {
  ConfigValidationResult r;
  if (config.max_attempts < 1) {
    r.errors.push_back("max_attempts must be >= 1");
  }
  if (!std::isfinite(config.tolerance) || config.tolerance < 0.0) {
    r.errors.push_back("tolerance must be a finite number >= 0");
  }
  r.ok = r.errors.empty();
  return r;
}

RepairLoopController::RepairLoopController(LoopConfig config, const CodeExecutor& executor,
                                           const RepairDispatcher& dispatcher,
                                           ClassifierConfig classifier)
    : config_(config), executor_(executor), dispatcher_(dispatcher),
      classifier_(std::move(classifier)) {}

LoopResult RepairLoopController::run(const ProblemInput& problem, const CancelToken* cancel) const {
  const ConfigValidationResult check = validate_loop_config(config_);
  if (!check.ok) {
    throw ConfigError(to_string(ErrorCode::config_invalid) + ": " + check.errors.front());
  }
  const auto& ecfg = executor_.config();
  if (!(ecfg.timeout_seconds > 0.0) || !std::isfinite(ecfg.timeout_seconds)) {
    throw ConfigError(to_string(ErrorCode::config_invalid) +
                      ": execution timeout must be a finite number > 0");
  }

  LoopResult result;
  result.problem_id = problem.problem_id;
  result.final_artifact = problem.initial_artifact;
  result.terminal_state = TerminalState::exhausted;

  CodeArtifact artifact = problem.initial_artifact;
  for (int i = 1; i <= config_.max_attempts; ++i) {
    if (cancel && cancel->is_cancelled()) {
      result.terminal_state = TerminalState::cancelled;
      break;
    }

    AttemptRecord rec;
    rec.index = i;
    rec.artifact = artifact;
    rec.artifact_digest = artifact_digest(artifact);

    AttemptEvent ev;
    ev.problem_id = problem.problem_id;
    ev.attempt = i;
    ev.artifact_digest = rec.artifact_digest;

    bool accepted = false;
    {
      ScopeTimer timer(ev.duration_ns);
      rec.execution = executor_.execute(artifact, cancel);
      if (rec.execution.succeeded) {
        rec.verification = verify(rec.execution.stdout_text, problem.expected, config_.tolerance);
        accepted = rec.verification->accepted();
      }
    }
    ev.outcome = attempt_outcome(rec.execution, accepted);
    result.final_artifact = artifact;
    result.final_execution = rec.execution;

    if (accepted) {
      result.success = true;
      result.answer_correct = rec.verification->is_correct.value_or(false);
      result.terminal_state = TerminalState::succeeded;
      log_line("loop", problem.problem_id + " accepted on attempt " + std::to_string(i));
      result.history.push_back(std::move(rec));
      emit_attempt_event(ev);
      break;
    }
    if (rec.execution.cancelled) {
      result.terminal_state = TerminalState::cancelled;
      result.history.push_back(std::move(rec));
      emit_attempt_event(ev);
      break;
    }

    const FailureKind kind = classify(rec.execution, rec.verification, artifact, classifier_);
    rec.failure_kind = kind;
    ev.failure_kind = to_string(kind);
    global_engine_stats().record_failure(kind.tag);
    log_line("loop", problem.problem_id + " attempt " + std::to_string(i) + ": " + ev.outcome +
                         " (" + ev.failure_kind + ")");

    if (i == config_.max_attempts) {
      result.terminal_state = TerminalState::exhausted;
      result.history.push_back(std::move(rec));
      emit_attempt_event(ev);
      break;
    }

    RepairContext ctx = problem.context;
    if (rec.execution.succeeded && rec.verification) {
      ctx.predicted = rec.verification->predicted_value;
      ctx.expected = rec.verification->expected_value;
      ctx.error_text = mismatch_text(*rec.verification);
    } else {
      ctx.error_text = rec.execution.stderr_text;
    }

    RepairResult repaired = dispatcher_.repair(kind, artifact, ctx, cancel);
    rec.repair_rationale = repaired.rationale;
    rec.repair_action = repaired.action;
    rec.repair_degraded = repaired.degraded;
    ev.repair_action = repaired.action;
    ev.repair_degraded = repaired.degraded;

    artifact = std::move(repaired.repaired_artifact);
    result.history.push_back(std::move(rec));
    emit_attempt_event(ev);
  }

  result.attempts = static_cast<int>(result.history.size());
  global_engine_stats().record_loop(result.terminal_state);
  return result;
}

std::string execution_result_to_json(const ExecutionResult& r) {
  return jsonlite::to_json(execution_value(r));
}

std::string loop_result_to_json(const LoopResult& r, bool include_history) {
  jsonlite::Object o;
  o["problem_id"] = r.problem_id;
  o["success"] = r.success;
  o["answer_correct"] = r.answer_correct;
  o["final_artifact"] = r.final_artifact;
  o["final_execution"] = execution_value(r.final_execution);
  o["attempts"] = static_cast<std::uint64_t>(r.attempts);
  o["terminal_state"] = to_string(r.terminal_state);
  if (!r.error.empty()) o["error"] = r.error;

  if (include_history) {
    jsonlite::Array history;
    for (const auto& rec : r.history) {
      jsonlite::Object h;
      h["index"] = static_cast<std::uint64_t>(rec.index);
      h["artifact"] = rec.artifact;
      h["artifact_digest"] = rec.artifact_digest;
      h["execution"] = execution_value(rec.execution);
      if (rec.verification) {
        jsonlite::Object v;
        v["is_correct"] = rec.verification->is_correct
                              ? jsonlite::Value(*rec.verification->is_correct)
                              : jsonlite::Value(nullptr);
        v["predicted_value"] = optional_number(rec.verification->predicted_value);
        v["expected_value"] = optional_number(rec.verification->expected_value);
        v["status_message"] = rec.verification->status_message;
        h["verification"] = std::move(v);
      }
      if (rec.failure_kind) h["failure_kind"] = to_string(*rec.failure_kind);
      if (rec.repair_rationale) h["repair_rationale"] = *rec.repair_rationale;
      if (!rec.repair_action.empty()) h["repair_action"] = rec.repair_action;
      h["repair_degraded"] = rec.repair_degraded;
      history.push_back(std::move(h));
    }
    o["history"] = std::move(history);
  }
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

}  // namespace remedy
