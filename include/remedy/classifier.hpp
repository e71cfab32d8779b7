#pragma once

// remedy/classifier.hpp: Rule-based failure classification.
//
// classify() is pure: the same inputs always give the same FailureKind.
// Rules are evaluated in a fixed priority order and the first match wins.
// All text matching is case-insensitive.

#include <optional>
#include <string>
#include <vector>

#include "remedy/types.hpp"

namespace remedy {

struct ClassifierConfig {
  // Artifacts shorter than this are treated as incomplete.
  std::size_t min_artifact_chars{200};
  // An undefined name that mentions one of these means setup code is missing.
  std::vector<std::string> incomplete_symbols{"model", "env"};
  // Artifact substrings that indicate use of the wrong solver API.
  std::vector<std::string> api_denylist{"env()", "cp.env", ".optimize()", ".objval", "grb.", "gurobipy"};
};

FailureKind classify(const ExecutionResult& execution,
                     const std::optional<VerificationOutcome>& verification,
                     const CodeArtifact& artifact,
                     const ClassifierConfig& config = {});

// Which numeric domain a wrong value suggests revisiting.
TypeHypothesis infer_type_hypothesis(std::optional<double> predicted, std::optional<double> expected);

}  // namespace remedy
