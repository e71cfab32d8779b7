#include "remedy/executor.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

#include "remedy/hash.hpp"
#include "remedy/observability.hpp"

namespace remedy {

namespace {

void replace_all(std::string& s, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

ExecutionResult exec_error(const std::string& message, std::uint64_t duration_ms) {
  ExecutionResult r;
  r.succeeded = false;
  r.exit_status = -2;
  r.stderr_text = "Execution error: " + message;
  r.duration_ms = duration_ms;
  r.error_code = to_string(ErrorCode::spawn_failed);
  return r;
}

}  // namespace

std::string format_seconds(double seconds) {
  if (seconds == std::floor(seconds) && seconds < 1e15) {
    return std::to_string(static_cast<long long>(seconds));
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", seconds);
  return buf;
}

std::string clean_error_text(const std::string& raw, const std::string& artifact_path,
                             const std::string& scratch_dir, const std::string& scratch_root,
                             const std::string& display_name) {
  std::string text = raw;
  replace_all(text, artifact_path, display_name);

  const std::string root_prefix = scratch_root.empty() ? std::string{} : scratch_root + "/";
  std::istringstream in(text);
  std::string line;
  std::string out;
  while (std::getline(in, line)) {
    if (is_blank(line)) continue;
    if (!scratch_dir.empty() && line.find(scratch_dir) != std::string::npos) continue;
    if (!root_prefix.empty() && line.find(root_prefix) != std::string::npos) continue;
    if (line.find("Traceback") != std::string::npos) continue;
    if (!out.empty()) out += '\n';
    out += line;
  }
  return out;
}

ExecutionResult CodeExecutor::execute(const CodeArtifact& artifact,
                                      const CancelToken* cancel) const {
  const auto started = ScopeTimer::Clock::now();
  auto elapsed_ms = [&]() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          ScopeTimer::Clock::now() - started)
                                          .count());
  };

  if (!(config_.timeout_seconds > 0.0) || !std::isfinite(config_.timeout_seconds)) {
    return exec_error("invalid timeout " + format_seconds(config_.timeout_seconds), 0);
  }

  const std::string digest = artifact_digest(artifact);
  const std::string tag = digest.substr(0, 12);

  ScratchDir scratch(config_.scratch_root, tag);
  if (!scratch.ok()) {
    auto r = exec_error("scratch directory unavailable: " + scratch.error(), elapsed_ms());
    r.error_code = to_string(ErrorCode::scratch_unavailable);
    return r;
  }
  const std::string path = scratch.write_file(config_.artifact_filename, artifact);
  if (path.empty()) {
    auto r = exec_error("cannot write artifact into " + scratch.path(), elapsed_ms());
    r.error_code = to_string(ErrorCode::scratch_unavailable);
    return r;
  }

  ProcessSpec spec;
  spec.command = config_.interpreter;
  spec.argv = config_.interpreter_args;
  spec.argv.push_back(path);
  spec.inherit_env = true;
  spec.env["PYTHONHASHSEED"] = "0";
  spec.env["PYTHONUNBUFFERED"] = "1";
  spec.cwd = scratch.path();
  spec.timeout_ms = static_cast<std::uint64_t>(std::ceil(config_.timeout_seconds * 1000.0));
  spec.max_output_bytes = config_.max_output_bytes;
  spec.max_memory_bytes = config_.max_memory_bytes;
  spec.max_file_descriptors = config_.max_file_descriptors;
  spec.cpu_limit_seconds = config_.cpu_time_limit_seconds;
  spec.cancel = cancel;

  log_line("executor", "running " + config_.interpreter + " on " + digest);
  const ProcessResult pr = run_process(spec);

  ExecutionResult r;
  r.duration_ms = pr.duration_ns / 1000000u;
  r.stdout_truncated = pr.stdout_truncated;
  r.stderr_truncated = pr.stderr_truncated;

  if (!pr.error_message.empty()) {
    return exec_error(pr.error_message, r.duration_ms);
  }

  if (pr.timed_out) {
    r.succeeded = false;
    r.timed_out = true;
    r.exit_status = -1;
    r.stderr_text = pr.cpu_limit_exceeded
                        ? "Code execution timeout after " +
                              std::to_string(config_.cpu_time_limit_seconds) + " seconds of CPU time"
                        : "Code execution timeout after " + format_seconds(config_.timeout_seconds) +
                              " seconds";
    r.error_code = to_string(ErrorCode::timeout);
    log_line("executor", r.stderr_text);
    return r;
  }
  if (pr.cancelled) {
    r.succeeded = false;
    r.cancelled = true;
    r.exit_status = -1;
    r.stdout_text = pr.stdout_text;
    r.stderr_text = "Code execution cancelled";
    r.error_code = to_string(ErrorCode::cancelled);
    return r;
  }

  r.exit_status = pr.exit_code;
  r.stdout_text = pr.stdout_text;
  if (pr.exit_code == 0) {
    r.succeeded = true;
    return r;
  }
  r.succeeded = false;
  const std::string& raw = pr.stderr_text.empty() ? pr.stdout_text : pr.stderr_text;
  r.stderr_text = clean_error_text(raw, path, scratch.path(), scratch.root(),
                                   config_.artifact_filename);
  return r;
}

}  // namespace remedy
