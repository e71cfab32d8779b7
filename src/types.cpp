#include "remedy/types.hpp"

namespace remedy {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::scratch_unavailable: return "scratch_unavailable";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::capability_failed: return "capability_failed";
    case ErrorCode::unknown_failure_kind: return "unknown_failure_kind";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
  }
  return "";
}

std::string to_string(FailureTag tag) {
  switch (tag) {
    case FailureTag::incomplete_artifact: return "incomplete_artifact";
    case FailureTag::syntax_defect: return "syntax_defect";
    case FailureTag::import_or_dependency_defect: return "import_or_dependency_defect";
    case FailureTag::api_usage_defect: return "api_usage_defect";
    case FailureTag::wrong_value: return "wrong_value";
    case FailureTag::logic_defect: return "logic_defect";
  }
  return "unknown";
}

std::string to_string(TypeHypothesis hypothesis) {
  switch (hypothesis) {
    case TypeHypothesis::unspecified: return "unspecified";
    case TypeHypothesis::integer_domain: return "integer_domain";
    case TypeHypothesis::continuous_domain: return "continuous_domain";
  }
  return "unspecified";
}

std::string to_string(const FailureKind& kind) {
  if (kind.tag == FailureTag::wrong_value) {
    return to_string(kind.tag) + "(" + to_string(kind.hypothesis) + ")";
  }
  return to_string(kind.tag);
}

std::string to_string(TerminalState state) {
  switch (state) {
    case TerminalState::succeeded: return "succeeded";
    case TerminalState::exhausted: return "exhausted";
    case TerminalState::cancelled: return "cancelled";
    case TerminalState::faulted: return "faulted";
  }
  return "unknown";
}

}  // namespace remedy
