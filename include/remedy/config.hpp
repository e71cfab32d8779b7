#pragma once

// remedy/config.hpp: Engine configuration.
//
// PRECEDENCE (highest first):
//   1. explicit values set by the caller (CLI flags) after loading
//   2. a JSON config file (flat object, strict jsonlite parse)
//   3. REMEDY_* environment variables
//   4. built-in defaults
//
// Recognized keys:
//   max_attempts, tolerance, execution_timeout_seconds, interpreter,
//   max_output_bytes, max_memory_bytes, max_file_descriptors, scratch_root,
//   min_artifact_chars, api_denylist, incomplete_symbols, workers,
//   deadline_seconds, cpu_time_limit_seconds
// Unknown keys are reported as warnings, never errors.

#include <string>

#include "remedy/classifier.hpp"
#include "remedy/executor.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/repair_loop.hpp"
#include "remedy/scheduler.hpp"
#include "remedy/types.hpp"

namespace remedy {

struct EngineConfig {
  LoopConfig loop;
  ExecutorConfig executor;
  ClassifierConfig classifier;
  SchedulerConfig scheduler;
};

// Defaults overlaid with REMEDY_MAX_ATTEMPTS, REMEDY_TOLERANCE,
// REMEDY_EXEC_TIMEOUT_S, REMEDY_INTERPRETER, REMEDY_WORKERS and
// REMEDY_CPU_LIMIT_S. Unparseable or out-of-range values are ignored.
void apply_env_overrides(EngineConfig& config);

// Validate a JSON config document without applying it.
ConfigValidationResult validate_config(const std::string& config_json);

// Overlay recognized keys from `obj` onto `config`. Wrong-typed values are
// left at their current setting (validate_config reports them).
void apply_config_object(const jsonlite::Object& obj, EngineConfig& config);

// Range checks on a fully assembled config.
ConfigValidationResult validate_engine_config(const EngineConfig& config);

// defaults -> env -> file. Throws ConfigError if the file cannot be read or
// fails validation. An empty path skips the file layer.
EngineConfig load_engine_config(const std::string& path);

// The effective configuration as a config-file document (`remedy config show`).
std::string engine_config_to_json(const EngineConfig& config);

}  // namespace remedy
