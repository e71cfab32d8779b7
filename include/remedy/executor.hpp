#pragma once

// remedy/executor.hpp: Sandboxed execution of one code artifact.
//
// Each execute() call writes the artifact into its own scratch directory,
// runs the configured interpreter on it as a fresh process group and
// returns an ExecutionResult. The scratch directory is removed on every
// exit path. execute() never throws for process-level faults.

#include <cstdint>
#include <string>
#include <vector>

#include "remedy/sandbox.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct ExecutorConfig {
  std::string interpreter{"python3"};
  std::vector<std::string> interpreter_args;  // placed before the artifact path
  double timeout_seconds{30.0};
  std::size_t max_output_bytes{1u << 20};
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_descriptors{0};
  // CPU seconds summed over all threads; 0 leaves only the wall-clock timeout.
  std::uint64_t cpu_time_limit_seconds{0};
  std::string scratch_root;  // empty = system temp directory
  std::string artifact_filename{"code.py"};
};

class CodeExecutor {
 public:
  explicit CodeExecutor(ExecutorConfig config) : config_(std::move(config)) {}

  ExecutionResult execute(const CodeArtifact& artifact,
                          const CancelToken* cancel = nullptr) const;

  const ExecutorConfig& config() const { return config_; }

 private:
  ExecutorConfig config_;
};

// Strip scratch-location noise from interpreter error output: the artifact
// path becomes `display_name`, lines still naming the scratch directory or
// temp root are dropped, as are Traceback framing lines and blank lines.
std::string clean_error_text(const std::string& raw, const std::string& artifact_path,
                             const std::string& scratch_dir, const std::string& scratch_root,
                             const std::string& display_name = "code.py");

// "30" for whole seconds, otherwise a short decimal such as "0.5".
std::string format_seconds(double seconds);

}  // namespace remedy
