#include "remedy/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace remedy {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (!n.empty() && contains(haystack, lower(n))) return true;
  }
  return false;
}

bool is_integral(double v) { return std::fabs(v - std::round(v)) < 1e-9; }

}  // namespace

TypeHypothesis infer_type_hypothesis(std::optional<double> predicted, std::optional<double> expected) {
  if (!predicted || !expected) return TypeHypothesis::unspecified;
  const bool p_int = is_integral(*predicted);
  const bool e_int = is_integral(*expected);
  if (e_int && !p_int) return TypeHypothesis::integer_domain;
  if (!e_int && p_int) return TypeHypothesis::continuous_domain;
  return TypeHypothesis::unspecified;
}

FailureKind classify(const ExecutionResult& execution,
                     const std::optional<VerificationOutcome>& verification,
                     const CodeArtifact& artifact,
                     const ClassifierConfig& config) {
  const std::string error = lower(execution.stderr_text);
  const std::string code = lower(artifact);
  FailureKind kind = FailureKind::of(FailureTag::logic_defect);

  // 1. Truncated or placeholder artifact.
  if (artifact.size() < config.min_artifact_chars) {
    kind = FailureKind::of(FailureTag::incomplete_artifact);
    goto done;
  }

  // 2. Setup code missing: the model or environment object was never created.
  if (contains(error, "name") && contains(error, "is not defined") &&
      contains_any(error, config.incomplete_symbols)) {
    kind = FailureKind::of(FailureTag::incomplete_artifact);
    goto done;
  }

  // 3. Missing module, usually the wrong solver package.
  if (contains(error, "no module named")) {
    kind = FailureKind::of(FailureTag::import_or_dependency_defect);
    goto done;
  }

  // 4. Attribute error caused by another solver's API.
  if (!execution.succeeded && contains(error, "attributeerror") &&
      contains_any(code, config.api_denylist)) {
    kind = FailureKind::of(FailureTag::api_usage_defect);
    goto done;
  }

  // 5. Syntax.
  if (contains(error, "syntaxerror") || contains(error, "invalid syntax")) {
    kind = FailureKind::of(FailureTag::syntax_defect);
    goto done;
  }

  // 6. Ran cleanly, printed a number, number is wrong.
  if (execution.succeeded && verification && verification->is_correct.has_value() &&
      !*verification->is_correct && verification->predicted_value.has_value()) {
    kind = FailureKind::wrong_value(
        infer_type_hypothesis(verification->predicted_value, verification->expected_value));
    goto done;
  }

done:
  return kind;
}

}  // namespace remedy
