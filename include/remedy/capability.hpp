#pragma once

// remedy/capability.hpp: The external repair-generation capability.
//
// The engine never talks to a model directly. A RepairCapability turns a
// RepairRequest (strategy name plus the text fields that strategy needs)
// into raw response text. Failures are reported by throwing; the
// dispatcher converts them into a degraded no-op repair.

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "remedy/sandbox.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct RepairRequest {
  FailureKind kind;
  std::string strategy;                       // e.g. "repair_syntax"
  std::map<std::string, std::string> fields;  // exactly what the strategy needs
  // Set by the dispatcher from the owning loop. Not serialized.
  const CancelToken* cancel{nullptr};
};

// {"failure_kind":...,"fields":{...},"strategy":...}; keys sorted.
std::string request_to_json(const RepairRequest& request);

class RepairCapability {
 public:
  virtual ~RepairCapability() = default;
  // Returns raw response text. Throws on failure.
  virtual std::string generate_repair(const RepairRequest& request) = 0;
};

// Retries the wrapped capability with exponential backoff base * 2^k.
// Rethrows the last failure once max_retries further attempts have failed,
// or at once when the request's cancel token has fired; the backoff wait
// ends early on cancellation.
class RetryingRepairCapability : public RepairCapability {
 public:
  RetryingRepairCapability(std::shared_ptr<RepairCapability> inner, int max_retries = 3,
                           std::chrono::milliseconds base_backoff = std::chrono::milliseconds(1000));

  std::string generate_repair(const RepairRequest& request) override;

  int calls_made() const { return calls_made_; }

 private:
  std::shared_ptr<RepairCapability> inner_;
  int max_retries_;
  std::chrono::milliseconds base_backoff_;
  int calls_made_{0};
};

// Runs an external program per request. The request JSON is written to a
// scratch file whose path is appended as the last argument; the credential
// is passed in REMEDY_API_KEY. Stdout is the response. The program is killed
// when the request's cancel token fires. A non-zero exit, a timeout or a
// cancellation throws std::runtime_error.
class CommandRepairCapability : public RepairCapability {
 public:
  struct Options {
    std::vector<std::string> argv;  // argv[0] is the program
    std::string credential;
    double timeout_seconds{120.0};
    std::string scratch_root;
    std::size_t max_output_bytes{1u << 20};
  };

  explicit CommandRepairCapability(Options options);

  std::string generate_repair(const RepairRequest& request) override;

 private:
  Options options_;
};

// Split a command line on whitespace, honouring single and double quotes.
std::vector<std::string> split_command_line(const std::string& command);

}  // namespace remedy
