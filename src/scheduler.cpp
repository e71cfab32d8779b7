#include "remedy/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <stdexcept>
#include <thread>

#include "remedy/dispatcher.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"

namespace remedy {

namespace {

LoopResult not_started(const ProblemInput& problem) {
  LoopResult r;
  r.problem_id = problem.problem_id;
  r.final_artifact = problem.initial_artifact;
  r.terminal_state = TerminalState::cancelled;
  r.final_execution.cancelled = true;
  r.final_execution.exit_status = -1;
  r.final_execution.error_code = to_string(ErrorCode::cancelled);
  return r;
}

}  // namespace

std::string CredentialPool::next() {
  std::lock_guard<std::mutex> lk(mu_);
  if (credentials_.empty()) return {};
  const std::string& c = credentials_[index_ % credentials_.size()];
  ++index_;
  return c;
}

std::string BatchReport::summary_json() const {
  jsonlite::Object kinds;
  for (const auto& [k, n] : failures_by_kind) kinds[k] = n;
  jsonlite::Object o;
  o["problems"] = static_cast<std::uint64_t>(results.size());
  o["succeeded"] = succeeded;
  o["answer_correct"] = answer_correct;
  o["exhausted"] = exhausted;
  o["cancelled"] = cancelled;
  o["faulted"] = faulted;
  o["failures_by_kind"] = std::move(kinds);
  o["mean_attempts"] = mean_attempts;
  o["duration_ms"] = duration_ms;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::string BatchReport::to_json(bool include_history) const {
  std::string out = "{\"results\":[";
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (i > 0) out += ',';
    out += loop_result_to_json(results[i], include_history);
  }
  out += "],\"summary\":";
  out += summary_json();
  out += ",\"stats\":";
  out += global_engine_stats().to_json();
  out += '}';
  return out;
}

ProblemInput parse_problem_line(const std::string& line, std::size_t lineno) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(line, &err);
  if (err) {
    throw std::runtime_error("line " + std::to_string(lineno) + ": " + err->code + ": " + err->message);
  }
  ProblemInput p;
  p.problem_id = jsonlite::get_string(obj, "id", "problem-" + std::to_string(lineno));
  p.initial_artifact = jsonlite::get_string(obj, "code");
  if (jsonlite::is_string(obj, "expected")) {
    p.expected = jsonlite::get_string(obj, "expected");
  } else if (jsonlite::is_number(obj, "expected")) {
    // %.17g round-trips the double, small magnitudes included.
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", jsonlite::get_double(obj, "expected"));
    p.expected = buf;
  }
  p.context.problem = jsonlite::get_string(obj, "problem");
  p.context.math_model = jsonlite::get_string(obj, "math_model");
  p.context.api_reference = jsonlite::get_string(obj, "api_reference");
  return p;
}

BatchScheduler::BatchScheduler(SchedulerConfig config, LoopConfig loop, const CodeExecutor& executor,
                               ClassifierConfig classifier, CapabilityFactory factory,
                               std::vector<std::string> credentials)
    : config_(config), loop_(loop), executor_(executor), classifier_(std::move(classifier)),
      factory_(std::move(factory)), credentials_(std::move(credentials)) {}

LoopResult BatchScheduler::run_one(const ProblemInput& problem) {
  if (cancel_.is_cancelled()) {
    global_engine_stats().record_loop(TerminalState::cancelled);
    return not_started(problem);
  }
  try {
    std::shared_ptr<RepairCapability> capability = factory_ ? factory_(credentials_.next()) : nullptr;
    RepairDispatcher dispatcher(std::move(capability));
    RepairLoopController controller(loop_, executor_, dispatcher, classifier_);
    return controller.run(problem, &cancel_);
  } catch (const std::exception& e) {
    log_line("scheduler", problem.problem_id + " faulted: " + e.what());
    global_engine_stats().record_loop(TerminalState::faulted);
    LoopResult r;
    r.problem_id = problem.problem_id;
    r.final_artifact = problem.initial_artifact;
    r.terminal_state = TerminalState::faulted;
    r.error = e.what();
    return r;
  }
}

BatchReport BatchScheduler::run(const std::vector<ProblemInput>& problems) {
  const ConfigValidationResult check = validate_loop_config(loop_);
  if (!check.ok) {
    throw ConfigError(to_string(ErrorCode::config_invalid) + ": " + check.errors.front());
  }
  if (config_.workers == 0 || !std::isfinite(config_.deadline_seconds) || config_.deadline_seconds < 0.0) {
    throw ConfigError(to_string(ErrorCode::config_invalid) + ": invalid scheduler settings");
  }

  using Clock = std::chrono::steady_clock;
  const auto t0 = Clock::now();

  BatchReport report;
  report.results.resize(problems.size());

  // Deadline watcher: sleeps until the deadline or until the batch is done.
  std::mutex done_mu;
  std::condition_variable done_cv;
  bool done = false;
  std::thread watcher;
  if (config_.deadline_seconds > 0.0) {
    const auto deadline =
        t0 + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(config_.deadline_seconds));
    watcher = std::thread([&, deadline]() {
      std::unique_lock<std::mutex> lk(done_mu);
      if (!done_cv.wait_until(lk, deadline, [&] { return done; })) {
        log_line("scheduler", "global deadline reached; cancelling remaining work");
        cancel_.cancel();
      }
    });
  }

  const std::size_t n_workers =
      std::max<std::size_t>(1, std::min<std::size_t>(config_.workers, problems.size()));
  std::atomic<std::size_t> next_job{0};
  log_line("scheduler", "running " + std::to_string(problems.size()) + " problems on " +
                            std::to_string(n_workers) + " workers");

  std::vector<std::thread> workers;
  workers.reserve(n_workers);
  for (std::size_t w = 0; w < n_workers; ++w) {
    workers.emplace_back([&]() {
      for (;;) {
        const std::size_t idx = next_job.fetch_add(1);
        if (idx >= problems.size()) break;
        report.results[idx] = run_one(problems[idx]);
      }
    });
  }
  for (auto& t : workers) t.join();

  if (watcher.joinable()) {
    {
      std::lock_guard<std::mutex> lk(done_mu);
      done = true;
    }
    done_cv.notify_all();
    watcher.join();
  }

  std::uint64_t total_attempts = 0;
  for (const auto& r : report.results) {
    total_attempts += static_cast<std::uint64_t>(r.attempts);
    if (r.answer_correct) ++report.answer_correct;
    switch (r.terminal_state) {
      case TerminalState::succeeded: ++report.succeeded; break;
      case TerminalState::exhausted: ++report.exhausted; break;
      case TerminalState::cancelled: ++report.cancelled; break;
      case TerminalState::faulted: ++report.faulted; break;
    }
    for (const auto& rec : r.history) {
      if (rec.failure_kind) ++report.failures_by_kind[to_string(rec.failure_kind->tag)];
    }
  }
  report.mean_attempts = report.results.empty()
                             ? 0.0
                             : static_cast<double>(total_attempts) / static_cast<double>(report.results.size());
  report.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count());
  return report;
}

}  // namespace remedy
