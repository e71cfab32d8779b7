#pragma once

// remedy/dispatcher.hpp: Map a FailureKind to a repair strategy.
//
// repair() never throws for capability faults: any exception raised by the
// capability becomes a degraded no-op repair that returns the artifact
// unchanged, so the loop always has an artifact for its next attempt.

#include <memory>
#include <optional>
#include <string>

#include "remedy/capability.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct RepairContext {
  std::string problem;
  std::string math_model;
  std::string api_reference;
  std::optional<double> predicted;
  std::optional<double> expected;
  std::string error_text;
};

// Strategy name used for a kind, e.g. "repair_syntax".
std::string strategy_for(const FailureKind& kind);

// Build the request carrying exactly the fields the strategy needs.
RepairRequest build_repair_request(const FailureKind& kind, const CodeArtifact& artifact,
                                   const RepairContext& context);

// First fenced code block: ```python preferred, a bare fence accepted when
// its body looks like code. Returns nullopt when there is no usable block.
// When `prose` is non-null it receives the text outside the block.
std::optional<std::string> extract_code_block(const std::string& text, std::string* prose = nullptr);

// Turn raw capability output into a RepairResult. `original` is returned
// (degraded) when no code can be recovered.
RepairResult normalize_repair_response(const std::string& raw, const CodeArtifact& original);

class RepairDispatcher {
 public:
  explicit RepairDispatcher(std::shared_ptr<RepairCapability> capability);

  // `cancel`, when set, is handed to the capability so a deadline can end a
  // slow repair call.
  RepairResult repair(const FailureKind& kind, const CodeArtifact& artifact,
                      const RepairContext& context, const CancelToken* cancel = nullptr) const;

 private:
  std::shared_ptr<RepairCapability> capability_;
};

}  // namespace remedy
