#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "remedy/capability.hpp"
#include "remedy/classifier.hpp"
#include "remedy/config.hpp"
#include "remedy/dispatcher.hpp"
#include "remedy/executor.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"
#include "remedy/repair_loop.hpp"
#include "remedy/scheduler.hpp"
#include "remedy/verifier.hpp"
#include "remedy/version.hpp"

namespace {

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("cannot read " + path);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

std::string read_optional(const std::string &path) {
  return path.empty() ? std::string{} : read_file(path);
}

// Value following `name`, or `def` when absent.
std::string flag(int argc, char **argv, const std::string &name,
                 const std::string &def = "") {
  for (int i = 1; i + 1 < argc; ++i) {
    if (name == argv[i])
      return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char **argv, const std::string &name) {
  for (int i = 1; i < argc; ++i) {
    if (name == argv[i])
      return true;
  }
  return false;
}

double to_double(const std::string &s, const std::string &what) {
  char *end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (s.empty() || *end != '\0')
    throw std::runtime_error(what + " must be a number: '" + s + "'");
  return d;
}

unsigned long long to_unsigned(const std::string &s, const std::string &what,
                               unsigned long long limit) {
  errno = 0;
  char *end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (s.empty() || *end != '\0' || s[0] == '-')
    throw std::runtime_error(what + " must be a non-negative integer: '" + s + "'");
  if (errno == ERANGE || v > limit)
    throw std::runtime_error(what + " is out of range (max " + std::to_string(limit) +
                             "): '" + s + "'");
  return v;
}

std::vector<std::string> split_csv(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty())
      out.push_back(item);
  }
  return out;
}

// Config file plus the flags shared by exec/repair/batch.
remedy::EngineConfig engine_config(int argc, char **argv) {
  remedy::EngineConfig cfg = remedy::load_engine_config(flag(argc, argv, "--config"));
  if (const auto v = flag(argc, argv, "--timeout"); !v.empty())
    cfg.executor.timeout_seconds = to_double(v, "--timeout");
  if (const auto v = flag(argc, argv, "--interpreter"); !v.empty())
    cfg.executor.interpreter = v;
  if (const auto v = flag(argc, argv, "--max-attempts"); !v.empty())
    cfg.loop.max_attempts = static_cast<int>(to_unsigned(v, "--max-attempts", INT_MAX));
  if (const auto v = flag(argc, argv, "--tolerance"); !v.empty())
    cfg.loop.tolerance = to_double(v, "--tolerance");
  if (const auto v = flag(argc, argv, "--workers"); !v.empty())
    cfg.scheduler.workers = static_cast<unsigned>(to_unsigned(v, "--workers", UINT_MAX));
  if (const auto v = flag(argc, argv, "--cpu-limit"); !v.empty())
    cfg.executor.cpu_time_limit_seconds = to_unsigned(v, "--cpu-limit", ULLONG_MAX);
  if (const auto v = flag(argc, argv, "--deadline"); !v.empty())
    cfg.scheduler.deadline_seconds = to_double(v, "--deadline");

  const auto check = remedy::validate_engine_config(cfg);
  if (!check.ok)
    throw remedy::ConfigError("config_invalid: " + check.errors.front());
  return cfg;
}

remedy::CapabilityFactory command_factory(const std::string &repair_cmd,
                                          const remedy::EngineConfig &cfg) {
  const auto argv = remedy::split_command_line(repair_cmd);
  if (argv.empty())
    throw std::runtime_error("--repair-cmd is required");
  const std::string scratch_root = cfg.executor.scratch_root;
  return [argv, scratch_root](const std::string &credential) {
    remedy::CommandRepairCapability::Options opts;
    opts.argv = argv;
    opts.credential = credential;
    opts.scratch_root = scratch_root;
    auto inner = std::make_shared<remedy::CommandRepairCapability>(std::move(opts));
    return std::make_shared<remedy::RetryingRepairCapability>(inner);
  };
}

std::string verification_to_json(const remedy::VerificationOutcome &v) {
  namespace js = remedy::jsonlite;
  js::Object o;
  o["is_correct"] = v.is_correct ? js::Value(*v.is_correct) : js::Value(nullptr);
  o["predicted_value"] =
      v.predicted_value ? js::Value(*v.predicted_value) : js::Value(nullptr);
  o["expected_value"] =
      v.expected_value ? js::Value(*v.expected_value) : js::Value(nullptr);
  o["status_message"] = v.status_message;
  return js::to_json(js::Value(std::move(o)));
}

// Inverse of execution_result_to_json for the fields classification reads.
remedy::ExecutionResult parse_execution(const std::string &s) {
  namespace js = remedy::jsonlite;
  std::optional<js::JsonError> err;
  const auto obj = js::parse(s, &err);
  if (err)
    throw std::runtime_error(err->code + ": " + err->message);
  remedy::ExecutionResult r;
  r.succeeded = js::get_bool(obj, "succeeded", false);
  r.stdout_text = js::get_string(obj, "stdout", "");
  r.stderr_text = js::get_string(obj, "stderr", "");
  r.exit_status = static_cast<int>(js::get_double(obj, "exit_status", 0.0));
  r.timed_out = js::get_bool(obj, "timed_out", false);
  r.cancelled = js::get_bool(obj, "cancelled", false);
  return r;
}

void print_usage() {
  std::cerr
      << "usage: remedy <command> [--verbose]\n"
         "  exec      --artifact FILE [--timeout S] [--cpu-limit S] [--interpreter BIN]\n"
         "  verify    --output FILE --expected X [--tolerance T]\n"
         "  classify  --artifact FILE --result FILE [--expected X]\n"
         "  repair    --artifact FILE --expected X --repair-cmd CMD [--config FILE]\n"
         "            [--problem FILE] [--model FILE] [--reference FILE] [--credential C]\n"
         "  batch     --input FILE.jsonl --repair-cmd CMD [--workers N] [--deadline S]\n"
         "            [--credentials a,b,c] [--config FILE] [--summary-only]\n"
         "  config validate --config FILE\n"
         "  config show [--config FILE]\n"
         "  version\n";
}

int run(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    print_usage();
    return 1;
  }
  if (has_flag(argc, argv, "--verbose"))
    remedy::set_verbose(true);

  if (cmd == "version") {
    std::cout << remedy::version::manifest_to_json(remedy::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "exec") {
    const auto cfg = engine_config(argc, argv);
    const remedy::CodeExecutor executor(cfg.executor);
    const auto result = executor.execute(read_file(flag(argc, argv, "--artifact")));
    std::cout << remedy::execution_result_to_json(result) << "\n";
    return result.succeeded ? 0 : 2;
  }

  if (cmd == "verify") {
    const double tolerance =
        to_double(flag(argc, argv, "--tolerance", "0.1"), "--tolerance");
    const auto outcome = remedy::verify(read_file(flag(argc, argv, "--output")),
                                        flag(argc, argv, "--expected"), tolerance);
    std::cout << verification_to_json(outcome) << "\n";
    return outcome.accepted() ? 0 : 2;
  }

  if (cmd == "classify") {
    const auto cfg = engine_config(argc, argv);
    const std::string artifact = read_file(flag(argc, argv, "--artifact"));
    const auto exec = parse_execution(read_file(flag(argc, argv, "--result")));
    std::optional<remedy::VerificationOutcome> verification;
    if (exec.succeeded && has_flag(argc, argv, "--expected")) {
      verification = remedy::verify(exec.stdout_text, flag(argc, argv, "--expected"),
                                     cfg.loop.tolerance);
    }
    const auto kind = remedy::classify(exec, verification, artifact, cfg.classifier);
    std::cout << "{\"failure_kind\":\"" << remedy::to_string(kind)
              << "\",\"strategy\":\"" << remedy::strategy_for(kind) << "\"}\n";
    return 0;
  }

  if (cmd == "repair") {
    const auto cfg = engine_config(argc, argv);
    const remedy::CodeExecutor executor(cfg.executor);
    const auto factory = command_factory(flag(argc, argv, "--repair-cmd"), cfg);
    const remedy::RepairDispatcher dispatcher(factory(flag(argc, argv, "--credential")));
    const remedy::RepairLoopController controller(cfg.loop, executor, dispatcher,
                                                  cfg.classifier);
    remedy::ProblemInput problem;
    problem.problem_id = flag(argc, argv, "--id", "cli");
    problem.initial_artifact = read_file(flag(argc, argv, "--artifact"));
    problem.expected = flag(argc, argv, "--expected");
    problem.context.problem = read_optional(flag(argc, argv, "--problem"));
    problem.context.math_model = read_optional(flag(argc, argv, "--model"));
    problem.context.api_reference = read_optional(flag(argc, argv, "--reference"));
    const auto result = controller.run(problem);
    std::cout << remedy::loop_result_to_json(result) << "\n";
    return result.success ? 0 : 2;
  }

  if (cmd == "batch") {
    const auto cfg = engine_config(argc, argv);
    std::ifstream in(flag(argc, argv, "--input"));
    if (!in)
      throw std::runtime_error("cannot read --input");
    std::vector<remedy::ProblemInput> problems;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      if (line.find_first_not_of(" \t\r") == std::string::npos)
        continue;
      problems.push_back(remedy::parse_problem_line(line, lineno));
    }

    const remedy::CodeExecutor executor(cfg.executor);
    remedy::BatchScheduler scheduler(
        cfg.scheduler, cfg.loop, executor, cfg.classifier,
        command_factory(flag(argc, argv, "--repair-cmd"), cfg),
        split_csv(flag(argc, argv, "--credentials")));
    const auto report = scheduler.run(problems);

    std::cout << report.to_json(!has_flag(argc, argv, "--summary-only")) << "\n";
    return report.faulted == 0 ? 0 : 2;
  }

  if (cmd == "config") {
    if (has_flag(argc, argv, "show")) {
      std::cout << remedy::engine_config_to_json(engine_config(argc, argv)) << "\n";
      return 0;
    }
    if (!has_flag(argc, argv, "validate")) {
      print_usage();
      return 1;
    }
    const auto r = remedy::validate_config(read_file(flag(argc, argv, "--config")));
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"errors\":[";
    for (std::size_t i = 0; i < r.errors.size(); ++i)
      std::cout << (i ? "," : "") << "\"" << remedy::jsonlite::escape(r.errors[i]) << "\"";
    std::cout << "],\"warnings\":[";
    for (std::size_t i = 0; i < r.warnings.size(); ++i)
      std::cout << (i ? "," : "") << "\"" << remedy::jsonlite::escape(r.warnings[i]) << "\"";
    std::cout << "]}\n";
    return r.ok ? 0 : 2;
  }

  print_usage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "{\"error\":\"" << remedy::jsonlite::escape(e.what()) << "\"}\n";
    return 1;
  }
}
