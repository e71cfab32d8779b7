#include "remedy/capability.hpp"

#include <cmath>
#include <stdexcept>
#include <thread>

#include "remedy/hash.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"
#include "remedy/sandbox.hpp"

namespace remedy {

std::string request_to_json(const RepairRequest& request) {
  jsonlite::Object fields;
  for (const auto& [k, v] : request.fields) fields[k] = v;
  jsonlite::Object o;
  o["failure_kind"] = to_string(request.kind);
  o["strategy"] = request.strategy;
  o["fields"] = std::move(fields);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::vector<std::string> split_command_line(const std::string& command) {
  std::vector<std::string> out;
  std::string cur;
  bool have = false;
  char quote = 0;
  for (char c : command) {
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else {
        cur += c;
      }
    } else if (c == '\'' || c == '"') {
      quote = c;
      have = true;
    } else if (c == ' ' || c == '\t' || c == '\n') {
      if (have) {
        out.push_back(cur);
        cur.clear();
        have = false;
      }
    } else {
      cur += c;
      have = true;
    }
  }
  if (have) out.push_back(cur);
  return out;
}

// ---------------------------------------------------------------------------
// RetryingRepairCapability
// ---------------------------------------------------------------------------

RetryingRepairCapability::RetryingRepairCapability(std::shared_ptr<RepairCapability> inner,
                                                   int max_retries,
                                                   std::chrono::milliseconds base_backoff)
    : inner_(std::move(inner)), max_retries_(max_retries < 0 ? 0 : max_retries),
      base_backoff_(base_backoff) {
  if (!inner_) throw std::invalid_argument("RetryingRepairCapability: null capability");
}

std::string RetryingRepairCapability::generate_repair(const RepairRequest& request) {
  for (int attempt = 0;; ++attempt) {
    ++calls_made_;
    try {
      return inner_->generate_repair(request);
    } catch (const std::exception& e) {
      const bool cancelled = request.cancel && request.cancel->is_cancelled();
      if (attempt >= max_retries_ || cancelled) throw;
      const auto wait = base_backoff_ * (1LL << attempt);
      log_line("capability", "attempt " + std::to_string(attempt + 1) + " failed: " +
                                 e.what() + "; retrying in " + std::to_string(wait.count()) + "ms");
      if (request.cancel) {
        if (request.cancel->wait_for(wait)) throw;
      } else {
        std::this_thread::sleep_for(wait);
      }
    }
  }
}

// ---------------------------------------------------------------------------
// CommandRepairCapability
// ---------------------------------------------------------------------------

CommandRepairCapability::CommandRepairCapability(Options options) : options_(std::move(options)) {
  if (options_.argv.empty() || options_.argv.front().empty()) {
    throw std::invalid_argument("CommandRepairCapability: empty command");
  }
}

std::string CommandRepairCapability::generate_repair(const RepairRequest& request) {
  const std::string payload = request_to_json(request);
  const std::string digest = request_digest(payload);

  ScratchDir scratch(options_.scratch_root, "req-" + digest.substr(0, 12));
  if (!scratch.ok()) {
    throw std::runtime_error("capability_failed: " + scratch.error());
  }
  const std::string request_path = scratch.write_file("request.json", payload);
  if (request_path.empty()) {
    throw std::runtime_error("capability_failed: cannot write request file");
  }

  ProcessSpec spec;
  spec.command = options_.argv.front();
  spec.argv.assign(options_.argv.begin() + 1, options_.argv.end());
  spec.argv.push_back(request_path);
  spec.inherit_env = true;
  spec.env["REMEDY_API_KEY"] = options_.credential;
  spec.timeout_ms = static_cast<std::uint64_t>(std::ceil(options_.timeout_seconds * 1000.0));
  spec.max_output_bytes = options_.max_output_bytes;
  spec.cancel = request.cancel;

  const ProcessResult pr = run_process(spec);
  if (!pr.error_message.empty()) {
    throw std::runtime_error("capability_failed: " + pr.error_message);
  }
  if (pr.cancelled) {
    throw std::runtime_error("capability_failed: repair command cancelled");
  }
  if (pr.timed_out) {
    throw std::runtime_error("capability_failed: repair command timed out");
  }
  if (pr.exit_code != 0) {
    std::string detail = pr.stderr_text.substr(0, 512);
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
    throw std::runtime_error("capability_failed: repair command exited " +
                             std::to_string(pr.exit_code) +
                             (detail.empty() ? std::string{} : ": " + detail));
  }
  return pr.stdout_text;
}

}  // namespace remedy
