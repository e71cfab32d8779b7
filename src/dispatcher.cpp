#include "remedy/dispatcher.hpp"

#include <stdexcept>

#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"

namespace remedy {

namespace {

constexpr const char* kNoRationale = "no rationale provided";

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string number_text(const std::optional<double>& v) {
  return v ? jsonlite::format_double(*v) : std::string("unknown");
}

bool looks_like_code(const std::string& body) {
  return body.find("import") != std::string::npos || body.find("def ") != std::string::npos ||
         body.find("model") != std::string::npos;
}

// Locate a fence starting at `open`; fills body and the [begin, end) span of
// the whole block. Returns false for an unterminated fence.
bool read_fence(const std::string& text, std::size_t open, std::string& body, std::size_t& end) {
  const std::size_t nl = text.find('\n', open);
  if (nl == std::string::npos) return false;
  const std::size_t close = text.find("```", nl + 1);
  if (close == std::string::npos) return false;
  body = text.substr(nl + 1, close - nl - 1);
  end = close + 3;
  return true;
}

RepairResult no_op(const CodeArtifact& original, const std::string& why) {
  RepairResult r;
  r.repaired_artifact = original;
  r.rationale = why;
  r.degraded = true;
  return r;
}

}  // namespace

std::string strategy_for(const FailureKind& kind) {
  switch (kind.tag) {
    case FailureTag::incomplete_artifact: return "repair_incomplete_code";
    case FailureTag::import_or_dependency_defect: return "repair_import_error";
    case FailureTag::api_usage_defect: return "repair_api_usage";
    case FailureTag::syntax_defect: return "repair_syntax";
    case FailureTag::wrong_value: return "repair_variable_types";
    case FailureTag::logic_defect: return "repair_logic";
  }
  return "";
}

RepairRequest build_repair_request(const FailureKind& kind, const CodeArtifact& artifact,
                                   const RepairContext& context) {
  RepairRequest req;
  req.kind = kind;
  req.strategy = strategy_for(kind);
  auto& f = req.fields;
  switch (kind.tag) {
    case FailureTag::incomplete_artifact:
    case FailureTag::import_or_dependency_defect:
      f["problem"] = context.problem;
      f["math_model"] = context.math_model;
      f["api_reference"] = context.api_reference;
      f["code"] = artifact;
      f["error"] = context.error_text;
      break;
    case FailureTag::api_usage_defect:
      f["api_reference"] = context.api_reference;
      f["code"] = artifact;
      f["error"] = context.error_text;
      break;
    case FailureTag::syntax_defect:
      f["code"] = artifact;
      f["error"] = context.error_text;
      break;
    case FailureTag::wrong_value:
      f["math_model"] = context.math_model;
      f["code"] = artifact;
      f["predicted"] = number_text(context.predicted);
      f["expected"] = number_text(context.expected);
      f["type_hypothesis"] = to_string(kind.hypothesis);
      break;
    case FailureTag::logic_defect:
      f["problem"] = context.problem;
      f["math_model"] = context.math_model;
      f["code"] = artifact;
      f["error"] = context.error_text;
      break;
  }
  return req;
}

std::optional<std::string> extract_code_block(const std::string& text, std::string* prose) {
  std::string body;
  std::size_t begin = std::string::npos;
  std::size_t end = 0;

  const std::size_t py = text.find("```python");
  if (py != std::string::npos && read_fence(text, py, body, end)) {
    begin = py;
  } else {
    std::size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
      std::size_t block_end = 0;
      if (!read_fence(text, pos, body, block_end)) break;
      if (looks_like_code(body)) {
        begin = pos;
        end = block_end;
        break;
      }
      pos = block_end;
    }
  }
  if (begin == std::string::npos) return std::nullopt;

  if (prose) {
    *prose = trim(trim(text.substr(0, begin)) + "\n" + trim(text.substr(end)));
  }
  return trim(body);
}

RepairResult normalize_repair_response(const std::string& raw, const CodeArtifact& original) {
  const std::string text = trim(raw);
  std::string rationale;
  std::string code;

  if (!text.empty() && text.front() == '{') {
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(text, &err);
    if (!err) {
      rationale = trim(jsonlite::get_string(obj, "rationale"));
      code = trim(jsonlite::get_string(obj, "code"));
      if (code.empty()) {
        return no_op(original, rationale.empty() ? "repair response carried no code" : rationale);
      }
      RepairResult r;
      r.rationale = rationale.empty() ? kNoRationale : rationale;
      r.repaired_artifact = code;
      return r;
    }
  }

  if (auto block = extract_code_block(text, &rationale)) {
    code = *block;
  } else {
    code = text;
    rationale.clear();
  }
  if (code.empty()) {
    return no_op(original, "repair response was empty");
  }
  RepairResult r;
  r.rationale = rationale.empty() ? kNoRationale : rationale;
  r.repaired_artifact = code;
  return r;
}

RepairDispatcher::RepairDispatcher(std::shared_ptr<RepairCapability> capability)
    : capability_(std::move(capability)) {
  if (!capability_) throw std::invalid_argument("RepairDispatcher: null capability");
}

RepairResult RepairDispatcher::repair(const FailureKind& kind, const CodeArtifact& artifact,
                                      const RepairContext& context,
                                      const CancelToken* cancel) const {
  const std::string strategy = strategy_for(kind);
  if (strategy.empty()) {
    log_line("dispatcher", "unrecognized failure kind; keeping artifact unchanged");
    auto r = no_op(artifact, to_string(ErrorCode::unknown_failure_kind));
    return r;
  }

  RepairRequest request = build_repair_request(kind, artifact, context);
  request.cancel = cancel;
  std::string raw;
  try {
    raw = capability_->generate_repair(request);
  } catch (const std::exception& e) {
    log_line("dispatcher", strategy + " failed: " + e.what());
    auto r = no_op(artifact, std::string("repair capability failed: ") + e.what());
    r.action = strategy;
    return r;
  }

  RepairResult r = normalize_repair_response(raw, artifact);
  r.action = strategy;
  log_line("dispatcher", strategy + (r.degraded ? " degraded" : " produced a new artifact"));
  return r;
}

}  // namespace remedy
