#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "remedy/capability.hpp"
#include "remedy/classifier.hpp"
#include "remedy/config.hpp"
#include "remedy/dispatcher.hpp"
#include "remedy/executor.hpp"
#include "remedy/hash.hpp"
#include "remedy/jsonlite.hpp"
#include "remedy/observability.hpp"
#include "remedy/repair_loop.hpp"
#include "remedy/sandbox.hpp"
#include "remedy/scheduler.hpp"
#include "remedy/verifier.hpp"
#include "remedy/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t0) {
  return std::chrono::duration<double>(Clock::now() - t0).count();
}

fs::path test_root() {
  const fs::path root = fs::temp_directory_path() / ("remedy_tests_" + std::to_string(::getpid()));
  fs::create_directories(root);
  return root;
}

bool has_python() { return !remedy::resolve_executable("python3").empty(); }

// Artifacts below the incomplete-artifact threshold are classified before
// anything else, so realistic fixtures carry a long leading comment.
std::string pad(const std::string& body) {
  return "# " + std::string(220, 'x') + "\n" + body;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

remedy::ExecutorConfig sh_executor(double timeout_seconds = 10.0) {
  remedy::ExecutorConfig cfg;
  cfg.interpreter = "/bin/sh";
  cfg.timeout_seconds = timeout_seconds;
  cfg.scratch_root = test_root().string();
  return cfg;
}

remedy::ExecutorConfig python_executor(double timeout_seconds = 20.0) {
  remedy::ExecutorConfig cfg;
  cfg.interpreter = "python3";
  cfg.timeout_seconds = timeout_seconds;
  cfg.scratch_root = test_root().string();
  return cfg;
}

std::string json_repair(const std::string& rationale, const std::string& code) {
  remedy::jsonlite::Object o;
  o["rationale"] = rationale;
  o["code"] = code;
  return remedy::jsonlite::to_json(remedy::jsonlite::Value(std::move(o)));
}

// Replays canned responses in order; the last one repeats.
class ScriptedCapability : public remedy::RepairCapability {
 public:
  explicit ScriptedCapability(std::vector<std::string> responses) : responses_(std::move(responses)) {}

  std::string generate_repair(const remedy::RepairRequest& request) override {
    std::lock_guard<std::mutex> lk(mu_);
    requests.push_back(request);
    if (responses_.empty()) throw std::runtime_error("no scripted response");
    const std::size_t i = std::min(next_++, responses_.size() - 1);
    return responses_[i];
  }

  std::vector<remedy::RepairRequest> requests;

 private:
  std::vector<std::string> responses_;
  std::size_t next_{0};
  std::mutex mu_;
};

class ThrowingCapability : public remedy::RepairCapability {
 public:
  std::string generate_repair(const remedy::RepairRequest&) override {
    ++calls;
    throw std::runtime_error("model endpoint unavailable");
  }
  int calls{0};
};

// Fails `failures` times, then answers.
class FlakyCapability : public remedy::RepairCapability {
 public:
  explicit FlakyCapability(int failures) : failures_(failures) {}
  std::string generate_repair(const remedy::RepairRequest&) override {
    ++calls;
    if (calls <= failures_) throw std::runtime_error("rate limited");
    return "ok";
  }
  int calls{0};

 private:
  int failures_;
};

remedy::FailureKind classify_text(const std::string& stderr_text, const std::string& artifact,
                                  bool succeeded = false) {
  remedy::ExecutionResult exec;
  exec.succeeded = succeeded;
  exec.exit_status = succeeded ? 0 : 1;
  exec.stderr_text = stderr_text;
  return remedy::classify(exec, std::nullopt, artifact);
}

bool process_gone(pid_t pid) {
  if (::kill(pid, 0) != 0) return errno == ESRCH;
  // A killed child that nobody reaped yet still answers kill(pid, 0).
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line)) return true;
  const auto close = line.rfind(')');
  return close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z';
}

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(remedy::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(remedy::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separated_digests() {
  const std::string payload = "print('Optimal objective: 1')";
  const auto a1 = remedy::artifact_digest(payload);
  const auto a2 = remedy::artifact_digest(payload);
  expect(a1 == a2, "artifact digest must be deterministic");
  expect(a1.size() == 64, "artifact digest must be 64 hex chars");
  expect(a1 != remedy::request_digest(payload), "artifact and request domains must differ");
  expect(a1 != remedy::blake3_hex(payload), "domain prefix must change the digest");
}

void test_json_strict_parse() {
  std::optional<remedy::jsonlite::JsonError> err;
  remedy::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  const auto obj = remedy::jsonlite::parse("{\"s\":\"caf\\u00e9\",\"n\":-2.5,\"u\":7}", &err);
  expect(!err.has_value(), "valid document parses");
  expect(remedy::jsonlite::get_string(obj, "s") == "caf\xc3\xa9", "\\u escape decodes to UTF-8");
  expect(remedy::jsonlite::get_double(obj, "n") == -2.5, "negative number parses");
  expect(remedy::jsonlite::get_u64(obj, "u") == 7, "unsigned integer parses");

  err.reset();
  remedy::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "non-object root rejected");
}

void test_json_escape_replaces_invalid_utf8() {
  namespace js = remedy::jsonlite;
  const std::string fffd = "\xEF\xBF\xBD";
  expect(js::escape("caf\xc3\xa9") == "caf\xc3\xa9", "valid UTF-8 passes through");
  expect(js::escape("a\xff" "b") == "a" + fffd + "b", "stray byte replaced");
  expect(js::escape("x\xc3") == "x" + fffd, "truncated sequence replaced");
  expect(js::escape("\xc0\xaf") == fffd + fffd, "overlong encoding replaced");
  expect(js::escape("\xed\xa0\x80") == fffd + fffd + fffd, "surrogate code point replaced");
  expect(js::escape("\xf0\x9f\x98\x80\"") == "\xf0\x9f\x98\x80\\\"", "four-byte sequence kept");
}

// ============================================================================
// Answer verifier
// ============================================================================

void test_verify_tolerance_boundary() {
  const auto at_boundary = remedy::verify("Optimal objective: 42.1", "42", 0.1);
  expect(at_boundary.is_correct.has_value() && *at_boundary.is_correct,
         "42.1 vs 42 at tolerance 0.1 is correct");
  const auto past_boundary = remedy::verify("Optimal objective: 42.11", "42", 0.1);
  expect(past_boundary.is_correct.has_value() && !*past_boundary.is_correct,
         "42.11 vs 42 at tolerance 0.1 is incorrect");
  expect(past_boundary.status_message.rfind("incorrect", 0) == 0, "status names the mismatch");
}

void test_verify_first_pattern_wins() {
  const auto v = remedy::extract_answer("Answer: 5\nObjective: 7\n");
  expect(v.has_value() && *v == 7.0, "objective label outranks answer label");
  const auto w = remedy::extract_answer("total profit: 12\nbest value: 3");
  expect(w.has_value() && *w == 12.0, "profit outranks value");
  const auto x = remedy::extract_answer("OPTIMAL OBJECTIVE: -1.5e2");
  expect(x.has_value() && *x == -150.0, "case-insensitive with sign and exponent");
}

void test_verify_unknown_ground_truth() {
  for (const char* gt : {"", "   ", "No Best Solution", "nan", "inf", "12abc"}) {
    const auto v = remedy::verify("Optimal objective: 3", gt);
    expect(!v.is_correct.has_value(), std::string("ground truth '") + gt + "' is unknown");
    expect(v.accepted(), "unknown ground truth is accepted");
  }
  const auto padded = remedy::verify("Answer: 9", "  9 \n");
  expect(padded.is_correct.has_value() && *padded.is_correct, "expected value is trimmed");
}

void test_verify_no_extractable_answer() {
  const auto v = remedy::verify("solver finished\n", "10");
  expect(v.is_correct.has_value() && !*v.is_correct, "missing answer is incorrect");
  expect(!v.predicted_value.has_value(), "no predicted value");
  expect(v.status_message == "cannot extract answer from output", "extraction status message");
}

void test_verify_long_digit_run() {
  const std::string out = "Optimal objective: " + std::string(200000, '7');
  const auto v = remedy::verify(out, "7", 0.1);
  expect(v.is_correct.has_value() && !*v.is_correct, "overflowing number is not an answer");
  expect(!v.predicted_value.has_value(), "no predicted value from an overflowing number");

  const auto w = remedy::extract_answer("Answer: " + std::string(5000, '0') + "12\n");
  expect(w.has_value() && *w == 12.0, "long run of leading zeros parses");
}

// ============================================================================
// Failure classifier
// ============================================================================

void test_classify_priority_order() {
  using remedy::FailureTag;
  const auto short_import = classify_text("ModuleNotFoundError: No module named 'coptpy'", "import coptpy");
  expect(short_import.tag == FailureTag::incomplete_artifact, "short artifact outranks missing module");

  const auto name_err = classify_text("NameError: name 'model' is not defined", pad("x = 1"));
  expect(name_err.tag == FailureTag::incomplete_artifact, "undefined model symbol is incomplete");

  const auto other_name = classify_text("NameError: name 'xyz' is not defined", pad("x = 1"));
  expect(other_name.tag == FailureTag::logic_defect, "unrelated undefined name is a logic defect");

  const auto import = classify_text("ModuleNotFoundError: No module named 'gurobipy'", pad("import gurobipy"));
  expect(import.tag == FailureTag::import_or_dependency_defect, "missing module");

  const auto api = classify_text("AttributeError: 'Model' object has no attribute 'optimize'",
                                 pad("m = Model()\nm.optimize()\n"));
  expect(api.tag == FailureTag::api_usage_defect, "wrong solver API");

  const auto attr_only = classify_text("AttributeError: 'list' object has no attribute 'foo'", pad("x = []\n"));
  expect(attr_only.tag == FailureTag::logic_defect, "attribute error without denylisted API");

  const auto syntax = classify_text("  File \"code.py\", line 3\nSyntaxError: invalid syntax", pad("def f(:\n"));
  expect(syntax.tag == FailureTag::syntax_defect, "syntax error");
}

void test_classify_wrong_value_hypothesis() {
  remedy::ExecutionResult exec;
  exec.succeeded = true;
  exec.stdout_text = "Optimal objective: 42.5";
  const auto frac = remedy::verify(exec.stdout_text, "42");
  const auto kind = remedy::classify(exec, frac, pad("print(1)"));
  expect(kind == remedy::FailureKind::wrong_value(remedy::TypeHypothesis::integer_domain),
         "fractional prediction for integral truth");

  exec.stdout_text = "Optimal objective: 42";
  const auto integral = remedy::verify(exec.stdout_text, "42.5");
  const auto kind2 = remedy::classify(exec, integral, pad("print(1)"));
  expect(kind2 == remedy::FailureKind::wrong_value(remedy::TypeHypothesis::continuous_domain),
         "integral prediction for fractional truth");
  expect(remedy::to_string(kind2) == "wrong_value(continuous_domain)", "kind rendering");

  exec.stdout_text = "no answer here";
  const auto none = remedy::verify(exec.stdout_text, "42");
  expect(remedy::classify(exec, none, pad("print(1)")).tag == remedy::FailureTag::logic_defect,
         "no extracted value falls through to logic defect");
}

void test_classify_is_idempotent() {
  remedy::ExecutionResult exec;
  exec.stderr_text = "SyntaxError: invalid syntax";
  const std::string artifact = pad("def f(:\n");
  const auto first = remedy::classify(exec, std::nullopt, artifact);
  for (int i = 0; i < 5; ++i) {
    expect(remedy::classify(exec, std::nullopt, artifact) == first, "classification is stable");
  }
}

void test_classify_config_thresholds() {
  remedy::ClassifierConfig cfg;
  cfg.min_artifact_chars = 5;
  cfg.api_denylist = {"solve_legacy("};
  remedy::ExecutionResult exec;
  exec.stderr_text = "AttributeError: nope";
  expect(remedy::classify(exec, std::nullopt, "x.solve_legacy()", cfg).tag == remedy::FailureTag::api_usage_defect,
         "custom denylist applies");
  expect(remedy::classify(exec, std::nullopt, "m.optimize()", cfg).tag == remedy::FailureTag::logic_defect,
         "default denylist replaced");
}

// ============================================================================
// Sandboxed executor
// ============================================================================

void test_exec_success_and_failure() {
  const remedy::CodeExecutor executor(sh_executor());
  const auto ok = executor.execute("echo 'Optimal objective: 42'\n");
  expect(ok.succeeded && ok.exit_status == 0, "clean exit succeeds");
  expect(ok.stdout_text.find("Optimal objective: 42") != std::string::npos, "stdout captured");
  expect(ok.stderr_text.empty(), "no error text on success");

  const auto bad = executor.execute("echo partial\necho boom >&2\nexit 3\n");
  expect(!bad.succeeded && bad.exit_status == 3, "non-zero exit reported");
  expect(bad.stderr_text == "boom", "stderr captured");
  expect(bad.stdout_text.find("partial") != std::string::npos, "stdout kept on failure");

  const auto out_only = executor.execute("echo only-out\nexit 1\n");
  expect(out_only.stderr_text == "only-out", "stdout used when stderr is empty");
}

void test_exec_timeout_kills_process_group() {
  const fs::path pidfile = test_root() / "bg.pid";
  fs::remove(pidfile);
  const remedy::CodeExecutor executor(sh_executor(1.0));
  const auto t0 = Clock::now();
  const auto r = executor.execute("sleep 30 &\necho $! > '" + pidfile.string() + "'\nwait\n");
  const double elapsed = seconds_since(t0);

  expect(r.timed_out && !r.succeeded, "timeout reported");
  expect(r.exit_status == -1, "timeout exit status");
  expect(r.stdout_text.empty(), "no stdout on timeout");
  expect(r.stderr_text == "Code execution timeout after 1 seconds", "timeout message");
  expect(elapsed < 4.0, "returns promptly after the deadline");

  std::ifstream in(pidfile);
  pid_t bg = 0;
  in >> bg;
  expect(bg > 0, "background pid recorded");
  bool gone = false;
  for (int i = 0; i < 100 && !gone; ++i) {
    gone = process_gone(bg);
    if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  expect(gone, "background descendant is not left running");
}

void test_exec_scratch_cleanup() {
  remedy::ExecutorConfig cfg = sh_executor(1.0);
  const fs::path root = test_root() / "cleanup";
  fs::create_directories(root);
  cfg.scratch_root = root.string();
  const remedy::CodeExecutor executor(cfg);

  const auto r = executor.execute("pwd\n");
  const std::string dir = trim(r.stdout_text);
  expect(r.succeeded && !dir.empty(), "ran inside a scratch directory");
  expect(dir.find("remedy-") != std::string::npos, "scratch directory naming");
  expect(!fs::exists(dir), "scratch removed after success");

  executor.execute("exit 2\n");
  executor.execute("sleep 10\n");
  expect(fs::is_empty(root), "scratch removed after failure and timeout");
}

void test_exec_environment_is_sanitized() {
  ::setenv("REMEDY_TEST_TOKEN", "s3cret", 1);
  ::setenv("REMEDY_TEST_PLAIN", "visible", 1);
  const remedy::CodeExecutor executor(sh_executor());
  const auto r = executor.execute(
      "echo \"tok=${REMEDY_TEST_TOKEN:-unset} plain=$REMEDY_TEST_PLAIN seed=$PYTHONHASHSEED\"\n");
  ::unsetenv("REMEDY_TEST_TOKEN");
  ::unsetenv("REMEDY_TEST_PLAIN");
  expect(trim(r.stdout_text) == "tok=unset plain=visible seed=0", "secrets stripped, seed injected");

  expect(remedy::is_secret_key("OPENAI_API_KEY"), "_KEY suffix is secret");
  expect(remedy::is_secret_key("AUTH_HEADER"), "AUTH prefix is secret");
  expect(!remedy::is_secret_key("PATH"), "PATH is not secret");
}

void test_exec_cancellation() {
  remedy::CancelToken token;
  const remedy::CodeExecutor executor(sh_executor(20.0));
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.cancel();
  });
  const auto t0 = Clock::now();
  const auto r = executor.execute("sleep 30\n", &token);
  canceller.join();
  expect(r.cancelled && !r.succeeded, "cancellation reported");
  expect(r.exit_status == -1, "cancel exit status");
  expect(seconds_since(t0) < 5.0, "cancellation is prompt");
}

void test_exec_spawn_failure() {
  remedy::ExecutorConfig cfg = sh_executor();
  cfg.interpreter = "/nonexistent/remedy-interpreter";
  const remedy::CodeExecutor executor(cfg);
  const auto r = executor.execute("print(1)\n");
  expect(!r.succeeded && r.exit_status == -2, "spawn failure is data, not an exception");
  expect(r.stderr_text.rfind("Execution error: ", 0) == 0, "spawn failure message");
}

void test_exec_output_truncation() {
  remedy::ExecutorConfig cfg = sh_executor();
  cfg.max_output_bytes = 16;
  const remedy::CodeExecutor executor(cfg);
  const auto r = executor.execute("i=0; while [ $i -lt 50 ]; do echo 0123456789; i=$((i+1)); done\n");
  expect(r.succeeded, "truncated run still succeeds");
  expect(r.stdout_truncated, "truncation flagged");
  expect(r.stdout_text.size() == 16 + std::string("(truncated)").size(), "output capped");
}

void test_exec_truncation_keeps_utf8_boundary() {
  remedy::ExecutorConfig cfg = sh_executor();
  cfg.max_output_bytes = 2;
  const remedy::CodeExecutor executor(cfg);
  const auto r = executor.execute("printf 'a\\303\\251\\303\\251'\n");
  expect(r.stdout_truncated, "truncation flagged");
  expect(r.stdout_text == "a(truncated)", "partial character dropped at the cap: " + r.stdout_text);
}

void test_exec_invalid_utf8_output_serializes() {
  const remedy::CodeExecutor executor(sh_executor());
  const auto r = executor.execute("printf 'Answer: 1 \\377\\n'\n");
  expect(r.succeeded, "run succeeds");
  const std::string doc = remedy::execution_result_to_json(r);
  expect(doc.find('\xff') == std::string::npos, "raw invalid byte not emitted");
  std::optional<remedy::jsonlite::JsonError> err;
  const auto obj = remedy::jsonlite::parse(doc, &err);
  expect(!err.has_value(), "execution result is valid JSON");
  expect(remedy::jsonlite::get_string(obj, "stdout").find("\xEF\xBF\xBD") != std::string::npos,
         "invalid byte replaced by U+FFFD");
}

void test_exec_cpu_time_limit() {
  remedy::ExecutorConfig cfg = sh_executor(20.0);
  cfg.cpu_time_limit_seconds = 1;
  const remedy::CodeExecutor executor(cfg);

  const auto t0 = Clock::now();
  const auto busy = executor.execute("while :; do :; done\n");
  expect(busy.timed_out && !busy.succeeded, "CPU limit reported as a timeout");
  expect(busy.stderr_text.find("seconds of CPU time") != std::string::npos, "CPU limit message: " + busy.stderr_text);
  expect(seconds_since(t0) < 10.0, "CPU limit ends the run before the wall deadline");

  const auto idle = executor.execute("sleep 2\necho 'Answer: 1'\n");
  expect(idle.succeeded && !idle.timed_out, "wall time spent sleeping is not CPU time");

  const remedy::CodeExecutor unlimited(sh_executor(20.0));
  const auto plain = unlimited.execute("i=0; while [ $i -lt 1000 ]; do i=$((i+1)); done; echo done\n");
  expect(plain.succeeded, "no CPU limit by default");
}

void test_exec_failure_text_is_not_a_spawn_error() {
  const remedy::CodeExecutor executor(sh_executor());
  const auto r = executor.execute("echo 'exec failed: x' >&2\nexit 127\n");
  expect(r.exit_status == 127, "artifact exit code kept");
  expect(r.stderr_text == "exec failed: x", "artifact stderr kept");
}

void test_exec_unrunnable_interpreter() {
  const fs::path bogus = test_root() / "not-a-program";
  {
    std::ofstream out(bogus, std::ios::binary);
    out << "\x01\x02\x03\x04 not a program\n";
  }
  fs::permissions(bogus, fs::perms::owner_exec | fs::perms::owner_read | fs::perms::owner_write);
  remedy::ExecutorConfig cfg = sh_executor();
  cfg.interpreter = bogus.string();
  const remedy::CodeExecutor executor(cfg);
  const auto r = executor.execute("print(1)\n");
  expect(r.exit_status == -2, "exec failure reported as a spawn error");
  expect(r.stderr_text.rfind("Execution error: spawn_failed: exec ", 0) == 0, "exec failure message: " + r.stderr_text);
}

void test_clean_error_text() {
  const std::string raw =
      "Traceback (most recent call last):\n"
      "  File \"/tmp/remedy-abc/code.py\", line 3, in <module>\n"
      "  File \"/tmp/other/lib.py\", line 9, in helper\n"
      "\n"
      "NameError: name 'x' is not defined\n";
  const auto cleaned = remedy::clean_error_text(raw, "/tmp/remedy-abc/code.py", "/tmp/remedy-abc", "/tmp");
  expect(cleaned == "  File \"code.py\", line 3, in <module>\nNameError: name 'x' is not defined",
         "path replaced, temp-root lines, framing and blanks dropped: " + cleaned);
}

// ============================================================================
// Repair dispatcher
// ============================================================================

void test_dispatch_is_total() {
  using remedy::FailureTag;
  std::vector<std::string> seen;
  for (auto tag : {FailureTag::incomplete_artifact, FailureTag::syntax_defect,
                   FailureTag::import_or_dependency_defect, FailureTag::api_usage_defect,
                   FailureTag::wrong_value, FailureTag::logic_defect}) {
    const auto s = remedy::strategy_for(remedy::FailureKind::of(tag));
    expect(!s.empty(), "every kind has a strategy");
    for (const auto& prev : seen) expect(prev != s, "strategies are distinct");
    seen.push_back(s);
  }
}

void test_dispatch_request_fields() {
  remedy::RepairContext ctx;
  ctx.problem = "P";
  ctx.math_model = "M";
  ctx.api_reference = "R";
  ctx.error_text = "E";
  ctx.predicted = 42.5;
  ctx.expected = 42.0;

  const auto syntax = remedy::build_repair_request(remedy::FailureKind::of(remedy::FailureTag::syntax_defect), "C", ctx);
  expect(syntax.strategy == "repair_syntax", "syntax strategy");
  expect(syntax.fields.size() == 2 && syntax.fields.at("code") == "C" && syntax.fields.at("error") == "E",
         "syntax repair carries code and error only");

  const auto api = remedy::build_repair_request(remedy::FailureKind::of(remedy::FailureTag::api_usage_defect), "C", ctx);
  expect(api.fields.count("api_reference") == 1 && api.fields.count("problem") == 0, "api repair fields");

  const auto wrong = remedy::build_repair_request(
      remedy::FailureKind::wrong_value(remedy::TypeHypothesis::integer_domain), "C", ctx);
  expect(wrong.strategy == "repair_variable_types", "wrong value strategy");
  expect(wrong.fields.at("predicted") == "42.5" && wrong.fields.at("expected") == "42.0", "numeric mismatch");
  expect(wrong.fields.at("type_hypothesis") == "integer_domain", "hypothesis forwarded");
  expect(wrong.fields.count("error") == 0, "no error field for wrong value");

  const auto json = remedy::request_to_json(syntax);
  expect(json.find("\"strategy\":\"repair_syntax\"") != std::string::npos, "request JSON");
}

void test_normalize_repair_response() {
  const std::string original = "broken";

  const auto j = remedy::normalize_repair_response(json_repair("fixed the loop", "print(1)"), original);
  expect(!j.degraded && j.repaired_artifact == "print(1)" && j.rationale == "fixed the loop", "JSON response");

  const auto fenced = remedy::normalize_repair_response(
      "Here is the fix.\n```python\nimport x\nprint(1)\n```\nDone.", original);
  expect(fenced.repaired_artifact == "import x\nprint(1)", "python fence extracted");
  expect(fenced.rationale == "Here is the fix.\nDone.", "prose kept as rationale");

  const auto bare = remedy::normalize_repair_response("```\nimport y\n```", original);
  expect(bare.repaired_artifact == "import y", "bare fence accepted when it looks like code");
  expect(bare.rationale == "no rationale provided", "placeholder rationale");

  const auto plain = remedy::normalize_repair_response("print(2)\n", original);
  expect(plain.repaired_artifact == "print(2)" && !plain.degraded, "unfenced text is code");

  const auto empty = remedy::normalize_repair_response("   \n", original);
  expect(empty.degraded && empty.repaired_artifact == original, "empty response keeps artifact");

  const auto bad_type = remedy::normalize_repair_response("{\"rationale\":\"r\",\"code\":5}", original);
  expect(bad_type.degraded && bad_type.repaired_artifact == original, "non-string code keeps artifact");
}

void test_dispatcher_degrades_on_capability_failure() {
  auto cap = std::make_shared<ThrowingCapability>();
  const remedy::RepairDispatcher dispatcher(cap);
  const auto r = dispatcher.repair(remedy::FailureKind::of(remedy::FailureTag::logic_defect), "orig", {});
  expect(cap->calls == 1, "capability invoked");
  expect(r.degraded && r.repaired_artifact == "orig", "no-op repair on failure");
  expect(r.action == "repair_logic", "action still names the strategy");
  expect(r.rationale.find("model endpoint unavailable") != std::string::npos, "rationale explains failure");
}

void test_retrying_capability() {
  auto flaky = std::make_shared<FlakyCapability>(2);
  remedy::RetryingRepairCapability retrying(flaky, 3, std::chrono::milliseconds(1));
  expect(retrying.generate_repair({}) == "ok", "succeeds after transient failures");
  expect(flaky->calls == 3 && retrying.calls_made() == 3, "two retries used");

  auto down = std::make_shared<FlakyCapability>(100);
  remedy::RetryingRepairCapability limited(down, 2, std::chrono::milliseconds(1));
  bool threw = false;
  try {
    limited.generate_repair({});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw && down->calls == 3, "gives up after max retries");
}

void test_retrying_capability_stops_on_cancel() {
  auto down = std::make_shared<FlakyCapability>(100);
  remedy::RetryingRepairCapability slow(down, 5, std::chrono::milliseconds(10000));
  remedy::CancelToken token;
  remedy::RepairRequest req;
  req.cancel = &token;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.cancel();
  });
  const auto t0 = Clock::now();
  bool threw = false;
  try {
    slow.generate_repair(req);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  canceller.join();
  expect(threw && down->calls == 1, "cancellation ends the backoff wait without retrying");
  expect(seconds_since(t0) < 5.0, "backoff wait is cut short");

  remedy::CommandRepairCapability::Options opts;
  opts.argv = {"/bin/sh", "-c", "sleep 30", "sh"};
  opts.scratch_root = test_root().string();
  opts.timeout_seconds = 60.0;
  remedy::CommandRepairCapability cmd(opts);
  remedy::CancelToken cmd_token;
  remedy::RepairRequest cmd_req;
  cmd_req.strategy = "repair_logic";
  cmd_req.cancel = &cmd_token;
  std::thread cmd_canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cmd_token.cancel();
  });
  const auto t1 = Clock::now();
  std::string message;
  try {
    cmd.generate_repair(cmd_req);
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  cmd_canceller.join();
  expect(message.find("cancelled") != std::string::npos, "cancelled repair command throws: " + message);
  expect(seconds_since(t1) < 5.0, "repair command killed on cancel");
}

void test_command_capability() {
  remedy::CommandRepairCapability::Options opts;
  opts.argv = {"/bin/sh", "-c", "cat \"$1\"; echo; echo \"key=$REMEDY_API_KEY\"", "sh"};
  opts.credential = "abc123";
  opts.scratch_root = test_root().string();
  opts.timeout_seconds = 10.0;
  remedy::CommandRepairCapability cap(opts);

  remedy::RepairRequest req;
  req.kind = remedy::FailureKind::of(remedy::FailureTag::syntax_defect);
  req.strategy = "repair_syntax";
  req.fields["code"] = "x";
  const auto out = cap.generate_repair(req);
  expect(out.find("\"strategy\":\"repair_syntax\"") != std::string::npos, "request file passed as last argument");
  expect(out.find("key=abc123") != std::string::npos, "credential exported");

  remedy::CommandRepairCapability::Options failing = opts;
  failing.argv = {"/bin/sh", "-c", "echo nope >&2; exit 4", "sh"};
  remedy::CommandRepairCapability bad(failing);
  bool threw = false;
  try {
    bad.generate_repair(req);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("exited 4") != std::string::npos;
  }
  expect(threw, "non-zero exit throws");
}

// ============================================================================
// Repair loop controller
// ============================================================================

remedy::ProblemInput problem(const std::string& id, const std::string& artifact, const std::string& expected) {
  remedy::ProblemInput p;
  p.problem_id = id;
  p.initial_artifact = artifact;
  p.expected = expected;
  p.context.problem = "Minimize cost";
  p.context.math_model = "min c'x";
  p.context.api_reference = "solver docs";
  return p;
}

void test_loop_syntax_repair_then_success() {
  const remedy::CodeExecutor executor(sh_executor());
  auto cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{
      json_repair("closed the paren", pad("echo 'Optimal objective: 42'\n"))});
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({3, 0.1}, executor, dispatcher);

  const auto r = loop.run(problem("syn", pad("echo 'SyntaxError: invalid syntax' >&2\nexit 1\n"), "42"));
  expect(r.success && r.answer_correct, "repaired artifact accepted");
  expect(r.terminal_state == remedy::TerminalState::succeeded, "succeeded state");
  expect(r.attempts == 2 && r.history.size() == 2, "two attempts recorded");
  expect(r.history[0].failure_kind && r.history[0].failure_kind->tag == remedy::FailureTag::syntax_defect,
         "first attempt classified as syntax");
  expect(r.history[0].repair_action == "repair_syntax", "syntax strategy used");
  expect(r.history[0].repair_rationale && *r.history[0].repair_rationale == "closed the paren", "rationale kept");
  expect(!r.history[1].failure_kind.has_value(), "accepted attempt has no failure kind");
  expect(cap->requests.size() == 1 && cap->requests[0].fields.at("error").find("SyntaxError") != std::string::npos,
         "error text forwarded to the capability");
  expect(r.final_artifact == r.history[1].artifact, "final artifact is the accepted one");
}

void test_loop_wrong_value_repair() {
  const remedy::CodeExecutor executor(sh_executor());
  auto cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{
      json_repair("made x integer", pad("echo 'Optimal objective: 42'\n"))});
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({3, 0.1}, executor, dispatcher);

  const auto r = loop.run(problem("wv", pad("echo 'Optimal objective: 42.5'\n"), "42"));
  expect(r.success && r.attempts == 2, "accepted on second attempt");
  expect(r.history[0].verification && r.history[0].verification->is_correct == false, "first answer rejected");
  expect(r.history[0].failure_kind ==
             remedy::FailureKind::wrong_value(remedy::TypeHypothesis::integer_domain),
         "integer domain hypothesis");
  expect(cap->requests[0].strategy == "repair_variable_types", "variable type strategy");
  expect(cap->requests[0].fields.at("predicted") == "42.5", "prediction forwarded");
}

void test_loop_exhausts_attempts() {
  const remedy::CodeExecutor executor(sh_executor());
  const std::string wrong = pad("echo 'Answer: 7'\n");
  auto cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{json_repair("tried", wrong)});
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({3, 0.1}, executor, dispatcher);

  const auto r = loop.run(problem("ex", wrong, "10"));
  expect(!r.success && !r.answer_correct, "never accepted");
  expect(r.terminal_state == remedy::TerminalState::exhausted, "exhausted state");
  expect(r.attempts == 3 && r.history.size() == 3, "history length equals attempts");
  expect(cap->requests.size() == 2, "no repair after the last attempt");
  expect(!r.history[2].repair_rationale.has_value(), "last record has no repair");
  for (std::size_t i = 0; i < r.history.size(); ++i) {
    expect(r.history[i].index == static_cast<int>(i) + 1, "attempt indices are 1-based and contiguous");
  }
}

void test_loop_unknown_ground_truth() {
  const remedy::CodeExecutor executor(sh_executor());
  auto cap = std::make_shared<ThrowingCapability>();
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({3, 0.1}, executor, dispatcher);

  const auto r = loop.run(problem("gt", pad("echo 'Optimal objective: 123'\n"), "No Best Solution"));
  expect(r.success && r.attempts == 1, "accepted on first attempt");
  expect(!r.answer_correct, "answer not verified");
  expect(cap->calls == 0, "no repair requested");
}

void test_loop_capability_failure_degrades() {
  const remedy::CodeExecutor executor(sh_executor());
  auto cap = std::make_shared<ThrowingCapability>();
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({2, 0.1}, executor, dispatcher);

  const std::string artifact = pad("echo 'name model is not defined' >&2\nexit 1\n");
  const auto r = loop.run(problem("deg", artifact, "1"));
  expect(r.attempts == 2 && !r.success, "loop continues after failed repair");
  expect(r.history[0].repair_degraded, "degraded repair recorded");
  expect(r.history[1].artifact == artifact, "artifact unchanged by no-op repair");
}

void test_loop_rejects_invalid_config() {
  const remedy::CodeExecutor executor(sh_executor());
  auto cap = std::make_shared<ThrowingCapability>();
  const remedy::RepairDispatcher dispatcher(cap);
  for (const remedy::LoopConfig cfg : {remedy::LoopConfig{0, 0.1}, remedy::LoopConfig{3, -1.0}}) {
    const remedy::RepairLoopController loop(cfg, executor, dispatcher);
    bool threw = false;
    try {
      loop.run(problem("cfg", "echo hi\n", "1"));
    } catch (const remedy::ConfigError&) {
      threw = true;
    }
    expect(threw, "invalid config raises ConfigError before any attempt");
  }
}

void test_loop_cancellation() {
  const remedy::CodeExecutor executor(sh_executor(20.0));
  auto cap = std::make_shared<ThrowingCapability>();
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({3, 0.1}, executor, dispatcher);

  remedy::CancelToken pre;
  pre.cancel();
  const auto none = loop.run(problem("c0", "echo hi\n", "1"), &pre);
  expect(none.terminal_state == remedy::TerminalState::cancelled && none.attempts == 0,
         "cancelled before the first attempt");

  remedy::CancelToken token;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.cancel();
  });
  const auto r = loop.run(problem("c1", pad("sleep 30\n"), "1"), &token);
  canceller.join();
  expect(r.terminal_state == remedy::TerminalState::cancelled && !r.success, "cancelled mid-attempt");
  expect(r.attempts == 1 && r.history[0].execution.cancelled, "in-flight attempt recorded");
  expect(cap->calls == 0, "no repair after cancellation");
}

std::atomic<int> g_hook_events{0};
void count_event(const remedy::AttemptEvent&) { g_hook_events.fetch_add(1); }

void test_loop_emits_attempt_events() {
  const remedy::CodeExecutor executor(sh_executor());
  const std::string wrong = pad("echo 'Answer: 1'\n");
  auto cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{json_repair("r", wrong)});
  const remedy::RepairDispatcher dispatcher(cap);
  const remedy::RepairLoopController loop({2, 0.1}, executor, dispatcher);

  const auto before = remedy::global_engine_stats().attempts.load();
  g_hook_events = 0;
  remedy::set_attempt_event_hook(count_event);
  const auto r = loop.run(problem("ev", wrong, "5"));
  remedy::set_attempt_event_hook(nullptr);

  expect(g_hook_events.load() == r.attempts, "one event per attempt");
  expect(remedy::global_engine_stats().attempts.load() == before + 2, "stats counted attempts");
  const auto json = remedy::global_engine_stats().to_json();
  expect(json.find("\"wrong_value\":") != std::string::npos, "per-kind failure counters serialized");

  const auto doc = remedy::loop_result_to_json(r);
  expect(doc.find("\"terminal_state\":\"exhausted\"") != std::string::npos, "result JSON terminal state");
  expect(doc.find("\"history\":[") != std::string::npos, "result JSON history");
}

void test_loop_python_scenarios() {
  if (!has_python()) {
    std::cout << " (python3 not on PATH, skipped)";
    g_tests_skipped++;
    return;
  }
  const remedy::CodeExecutor executor(python_executor());

  auto syntax_cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{
      "Closed the call.\n```python\n" + pad("print('Optimal objective: 42')") + "\n```\n"});
  const remedy::RepairDispatcher syntax_dispatcher(syntax_cap);
  const remedy::RepairLoopController syntax_loop({3, 0.1}, executor, syntax_dispatcher);
  const auto a = syntax_loop.run(problem("py-syntax", pad("print('Optimal objective: 42'\n"), "42"));
  expect(a.success && a.answer_correct && a.attempts == 2, "python syntax error repaired");
  expect(a.history[0].failure_kind->tag == remedy::FailureTag::syntax_defect, "python syntax classified");
  expect(a.history[0].execution.stderr_text.find("code.py") != std::string::npos ||
             a.history[0].execution.stderr_text.find("SyntaxError") != std::string::npos,
         "error text cleaned of scratch paths");
  expect(a.history[0].execution.stderr_text.find(test_root().string()) == std::string::npos,
         "scratch root not leaked");

  auto value_cap = std::make_shared<ScriptedCapability>(std::vector<std::string>{
      json_repair("integer variables", pad("print('Optimal objective: 42')"))});
  const remedy::RepairDispatcher value_dispatcher(value_cap);
  const remedy::RepairLoopController value_loop({3, 0.1}, executor, value_dispatcher);
  const auto b = value_loop.run(problem("py-value", pad("print('Optimal objective: 42.5')"), "42"));
  expect(b.success && b.attempts == 2, "python wrong value repaired");
  expect(b.history[0].failure_kind ==
             remedy::FailureKind::wrong_value(remedy::TypeHypothesis::integer_domain),
         "python wrong value classified");
}

// ============================================================================
// Configuration
// ============================================================================

void test_validate_config() {
  const auto ok = remedy::validate_config("{\"max_attempts\":3,\"tolerance\":0.5,\"bogus\":1}");
  expect(ok.ok && ok.warnings.size() == 1, "unknown key is only a warning");

  expect(!remedy::validate_config("{\"max_attempts\":0}").ok, "zero attempts rejected");
  expect(!remedy::validate_config("{\"tolerance\":\"wide\"}").ok, "non-numeric tolerance rejected");
  expect(!remedy::validate_config("{\"execution_timeout_seconds\":0}").ok, "zero timeout rejected");
  expect(!remedy::validate_config("{\"api_denylist\":[1]}").ok, "non-string list rejected");
  expect(!remedy::validate_config("{\"workers\":2,\"workers\":3}").ok, "duplicate keys rejected");
  expect(!remedy::validate_config("not json").ok, "malformed document rejected");
}

void test_config_rejects_out_of_range_integers() {
  const auto attempts = remedy::validate_config("{\"max_attempts\":4294967297}");
  expect(!attempts.ok, "max_attempts beyond int range rejected");
  expect(attempts.errors.front().find("out of range") != std::string::npos, "range error message");
  expect(!remedy::validate_config("{\"workers\":4294967296}").ok, "workers beyond unsigned range rejected");
  expect(remedy::validate_config("{\"max_attempts\":2147483647}").ok, "largest int accepted");

  std::optional<remedy::jsonlite::JsonError> err;
  remedy::EngineConfig cfg;
  remedy::apply_config_object(remedy::jsonlite::parse("{\"max_attempts\":4294967297,\"workers\":4294967296}", &err), cfg);
  expect(cfg.loop.max_attempts == 3 && cfg.scheduler.workers == remedy::SchedulerConfig{}.workers,
         "out-of-range values are not applied");

  ::setenv("REMEDY_MAX_ATTEMPTS", "4294967297", 1);
  ::setenv("REMEDY_WORKERS", "18446744073709551616", 1);
  remedy::EngineConfig env_cfg;
  remedy::apply_env_overrides(env_cfg);
  ::unsetenv("REMEDY_MAX_ATTEMPTS");
  ::unsetenv("REMEDY_WORKERS");
  expect(env_cfg.loop.max_attempts == 3, "out-of-range environment value ignored");
  expect(env_cfg.scheduler.workers == remedy::SchedulerConfig{}.workers, "overflowing environment value ignored");
}

void test_config_precedence() {
  ::setenv("REMEDY_MAX_ATTEMPTS", "7", 1);
  ::setenv("REMEDY_WORKERS", "5", 1);
  const fs::path file = test_root() / "engine.json";
  {
    std::ofstream out(file);
    out << "{\"workers\":2,\"interpreter\":\"/bin/sh\",\"api_denylist\":[\"foo(\"]}";
  }
  const auto cfg = remedy::load_engine_config(file.string());
  ::unsetenv("REMEDY_MAX_ATTEMPTS");
  ::unsetenv("REMEDY_WORKERS");

  expect(cfg.loop.max_attempts == 7, "environment overrides default");
  expect(cfg.scheduler.workers == 2, "file overrides environment");
  expect(cfg.executor.interpreter == "/bin/sh", "file string applied");
  expect(cfg.classifier.api_denylist.size() == 1, "file list applied");
  expect(cfg.loop.tolerance == 0.1, "default kept");

  const std::string shown = remedy::engine_config_to_json(cfg);
  expect(remedy::validate_config(shown).ok && remedy::validate_config(shown).warnings.empty(),
         "shown config is a clean config document");
  std::optional<remedy::jsonlite::JsonError> err;
  remedy::EngineConfig reloaded;
  remedy::apply_config_object(remedy::jsonlite::parse(shown, &err), reloaded);
  expect(reloaded.loop.max_attempts == 7 && reloaded.scheduler.workers == 2 &&
             reloaded.executor.interpreter == "/bin/sh" && reloaded.classifier.api_denylist == cfg.classifier.api_denylist,
         "shown config reproduces the effective settings");

  bool threw = false;
  try {
    remedy::load_engine_config((test_root() / "missing.json").string());
  } catch (const remedy::ConfigError&) {
    threw = true;
  }
  expect(threw, "missing config file raises ConfigError");
}

// ============================================================================
// Batch scheduler
// ============================================================================

void test_credential_pool_round_robin() {
  remedy::CredentialPool pool({"a", "b"});
  expect(pool.next() == "a" && pool.next() == "b" && pool.next() == "a", "round-robin order");
  remedy::CredentialPool empty;
  expect(empty.next().empty(), "empty pool yields empty credential");
}

void test_scheduler_preserves_input_order() {
  const remedy::CodeExecutor executor(sh_executor());
  std::mutex mu;
  std::vector<std::string> used;
  remedy::CapabilityFactory factory = [&](const std::string& credential) {
    std::lock_guard<std::mutex> lk(mu);
    used.push_back(credential);
    return std::make_shared<ThrowingCapability>();
  };
  remedy::BatchScheduler scheduler({3, 0.0}, {2, 0.1}, executor, {}, factory, {"k1", "k2"});

  std::vector<remedy::ProblemInput> problems;
  for (int i = 0; i < 6; ++i) {
    problems.push_back(problem("p" + std::to_string(i), pad("echo 'Answer: " + std::to_string(i) + "'\n"),
                               std::to_string(i)));
  }
  const auto report = scheduler.run(problems);
  expect(report.results.size() == problems.size(), "one result per problem");
  for (std::size_t i = 0; i < problems.size(); ++i) {
    expect(report.results[i].problem_id == problems[i].problem_id, "results in input order");
    expect(report.results[i].success && report.results[i].answer_correct, "each problem solved");
  }
  expect(report.succeeded == 6 && report.mean_attempts == 1.0, "aggregate counts");

  int k1 = 0;
  int k2 = 0;
  for (const auto& c : used) {
    if (c == "k1") ++k1;
    if (c == "k2") ++k2;
  }
  expect(k1 == 3 && k2 == 3, "credentials spread round-robin");
  expect(report.summary_json().find("\"succeeded\":6") != std::string::npos, "summary JSON");

  const std::string doc = report.to_json(false);
  std::optional<remedy::jsonlite::JsonError> err;
  const auto obj = remedy::jsonlite::parse(doc, &err);
  expect(!err.has_value(), "batch document is valid JSON");
  expect(doc.find("\"stats\":{\"attempts\":") != std::string::npos, "batch document carries engine stats");
  const auto stats = obj.find("stats");
  expect(stats != obj.end() && remedy::jsonlite::get_u64(std::get<remedy::jsonlite::Object>(stats->second.v), "attempts") >= 6,
         "engine stats count this batch's attempts");
}

void test_scheduler_deadline_cancels_remaining() {
  const remedy::CodeExecutor executor(sh_executor(20.0));
  remedy::CapabilityFactory factory = [](const std::string&) { return std::make_shared<ThrowingCapability>(); };
  remedy::BatchScheduler scheduler({1, 0.5}, {3, 0.1}, executor, {}, factory);

  std::vector<remedy::ProblemInput> problems;
  for (int i = 0; i < 3; ++i) problems.push_back(problem("slow" + std::to_string(i), pad("sleep 30\n"), "1"));
  const auto t0 = Clock::now();
  const auto report = scheduler.run(problems);
  expect(seconds_since(t0) < 8.0, "deadline stops the batch promptly");
  expect(report.cancelled == 3, "every problem reported cancelled");
  expect(report.results[0].attempts == 1, "in-flight problem recorded its attempt");
  expect(report.results[1].attempts == 0 && report.results[2].attempts == 0, "queued problems never ran");
}

void test_scheduler_deadline_reaches_repair() {
  const remedy::CodeExecutor executor(sh_executor(20.0));
  const std::string scratch = test_root().string();
  remedy::CapabilityFactory factory = [scratch](const std::string& credential) {
    remedy::CommandRepairCapability::Options opts;
    opts.argv = {"/bin/sh", "-c", "sleep 30", "sh"};
    opts.credential = credential;
    opts.scratch_root = scratch;
    opts.timeout_seconds = 60.0;
    auto inner = std::make_shared<remedy::CommandRepairCapability>(std::move(opts));
    return std::make_shared<remedy::RetryingRepairCapability>(inner, 3, std::chrono::milliseconds(5000));
  };
  remedy::BatchScheduler scheduler({1, 0.5}, {3, 0.1}, executor, {}, factory);

  const auto t0 = Clock::now();
  const auto report = scheduler.run({problem("stuck", pad("echo 'Answer: 1'\n"), "2")});
  expect(seconds_since(t0) < 5.0, "deadline ends an in-flight repair call");
  expect(report.cancelled == 1, "problem reported cancelled");
  expect(report.results[0].terminal_state == remedy::TerminalState::cancelled, "cancelled terminal state");
  expect(report.results[0].attempts == 1, "only the first attempt ran");
}

void test_scheduler_isolates_faults() {
  const remedy::CodeExecutor executor(sh_executor());
  remedy::CapabilityFactory factory = [](const std::string& credential) -> std::shared_ptr<remedy::RepairCapability> {
    if (credential == "bad") throw std::runtime_error("credential rejected");
    return std::make_shared<ThrowingCapability>();
  };
  remedy::BatchScheduler scheduler({2, 0.0}, {2, 0.1}, executor, {}, factory, {"good", "bad"});

  std::vector<remedy::ProblemInput> problems;
  for (int i = 0; i < 4; ++i) problems.push_back(problem("f" + std::to_string(i), pad("echo 'Answer: 1'\n"), "1"));
  const auto report = scheduler.run(problems);
  expect(report.faulted == 2 && report.succeeded == 2, "faults contained per problem");
  for (const auto& r : report.results) {
    if (r.terminal_state == remedy::TerminalState::faulted) {
      expect(r.error == "credential rejected", "fault message kept");
    }
  }
}

void test_parse_problem_line() {
  const auto small = remedy::parse_problem_line("{\"id\":\"a\",\"code\":\"x\",\"expected\":5e-7}", 1);
  const auto expected = remedy::parse_expected(small.expected);
  expect(expected.has_value() && *expected == 5e-7, "small expected value keeps its precision: " + small.expected);

  const auto whole = remedy::parse_problem_line("{\"code\":\"x\",\"expected\":42,\"problem\":\"p\"}", 3);
  expect(whole.expected == "42" && whole.problem_id == "problem-3", "integer expected and default id");
  expect(whole.context.problem == "p", "context fields read");

  const auto text = remedy::parse_problem_line("{\"id\":\"t\",\"expected\":\"No Best Solution\"}", 4);
  expect(text.expected == "No Best Solution", "string expected kept verbatim");

  bool threw = false;
  try {
    remedy::parse_problem_line("{\"id\":", 9);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("line 9: ", 0) == 0;
  }
  expect(threw, "malformed line names its line number");
}

void test_version_manifest() {
  const auto m = remedy::version::current_manifest();
  expect(m.hash_primitive == "blake3", "hash primitive");
  const auto json = remedy::version::manifest_to_json(m);
  expect(json.find("\"result_schema\":1") != std::string::npos, "manifest JSON");
  expect(!m.blake3_version.empty(), "blake3 version recorded");
  expect(m.blake3_version == remedy::hash_runtime_info().version, "blake3 version from runtime");
  expect(json.find("\"blake3_version\":\"" + m.blake3_version + "\"") != std::string::npos,
         "blake3 version in manifest JSON");
}

}  // namespace

int main() {
  std::cout << "=== remedy tests ===\n";

  std::cout << "\n[hash + json]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separated digests", test_domain_separated_digests);
  run_test("strict JSON parse", test_json_strict_parse);
  run_test("escape replaces invalid UTF-8", test_json_escape_replaces_invalid_utf8);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[verifier]\n";
  run_test("tolerance boundary 42.1 / 42.11", test_verify_tolerance_boundary);
  run_test("first matching label wins", test_verify_first_pattern_wins);
  run_test("unknown ground truth accepted", test_verify_unknown_ground_truth);
  run_test("no extractable answer", test_verify_no_extractable_answer);
  run_test("long digit run", test_verify_long_digit_run);

  std::cout << "\n[classifier]\n";
  run_test("rule priority", test_classify_priority_order);
  run_test("wrong value hypothesis", test_classify_wrong_value_hypothesis);
  run_test("idempotent", test_classify_is_idempotent);
  run_test("configurable thresholds", test_classify_config_thresholds);

  std::cout << "\n[executor]\n";
  run_test("success and failure", test_exec_success_and_failure);
  run_test("timeout kills process group", test_exec_timeout_kills_process_group);
  run_test("scratch cleanup", test_exec_scratch_cleanup);
  run_test("environment sanitized", test_exec_environment_is_sanitized);
  run_test("cancellation", test_exec_cancellation);
  run_test("spawn failure", test_exec_spawn_failure);
  run_test("output truncation", test_exec_output_truncation);
  run_test("truncation keeps UTF-8 boundary", test_exec_truncation_keeps_utf8_boundary);
  run_test("invalid UTF-8 output serializes", test_exec_invalid_utf8_output_serializes);
  run_test("CPU time limit", test_exec_cpu_time_limit);
  run_test("exec failure text from artifact", test_exec_failure_text_is_not_a_spawn_error);
  run_test("unrunnable interpreter", test_exec_unrunnable_interpreter);
  run_test("error text cleaning", test_clean_error_text);

  std::cout << "\n[dispatcher + capability]\n";
  run_test("dispatch is total", test_dispatch_is_total);
  run_test("request fields per strategy", test_dispatch_request_fields);
  run_test("response normalization", test_normalize_repair_response);
  run_test("capability failure degrades", test_dispatcher_degrades_on_capability_failure);
  run_test("retry with backoff", test_retrying_capability);
  run_test("retry stops on cancel", test_retrying_capability_stops_on_cancel);
  run_test("command capability", test_command_capability);

  std::cout << "\n[repair loop]\n";
  run_test("syntax repair then success", test_loop_syntax_repair_then_success);
  run_test("wrong value repair", test_loop_wrong_value_repair);
  run_test("exhausts attempts", test_loop_exhausts_attempts);
  run_test("unknown ground truth", test_loop_unknown_ground_truth);
  run_test("capability failure degrades", test_loop_capability_failure_degrades);
  run_test("invalid config", test_loop_rejects_invalid_config);
  run_test("cancellation", test_loop_cancellation);
  run_test("attempt events", test_loop_emits_attempt_events);
  run_test("python scenarios", test_loop_python_scenarios);

  std::cout << "\n[config]\n";
  run_test("validate config", test_validate_config);
  run_test("out-of-range integers", test_config_rejects_out_of_range_integers);
  run_test("config precedence", test_config_precedence);

  std::cout << "\n[scheduler]\n";
  run_test("credential round-robin", test_credential_pool_round_robin);
  run_test("input order preserved", test_scheduler_preserves_input_order);
  run_test("deadline cancels remaining", test_scheduler_deadline_cancels_remaining);
  run_test("deadline reaches repair", test_scheduler_deadline_reaches_repair);
  run_test("faults isolated", test_scheduler_isolates_faults);
  run_test("problem line parsing", test_parse_problem_line);

  std::error_code ec;
  fs::remove_all(test_root(), ec);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped) std::cout << " (" << g_tests_skipped << " skipped)";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
