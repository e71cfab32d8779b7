#include "remedy/config.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace remedy {

namespace {

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys = {
      "max_attempts",     "tolerance",          "execution_timeout_seconds",
      "interpreter",      "max_output_bytes",   "max_memory_bytes",
      "max_file_descriptors", "scratch_root",   "min_artifact_chars",
      "api_denylist",     "incomplete_symbols", "workers",
      "deadline_seconds", "cpu_time_limit_seconds",
  };
  return keys;
}

const std::set<std::string>& unsigned_keys() {
  static const std::set<std::string> keys = {
      "max_attempts", "max_output_bytes", "max_memory_bytes", "max_file_descriptors",
      "min_artifact_chars", "workers", "cpu_time_limit_seconds",
  };
  return keys;
}

// Largest value the destination field can hold.
std::uint64_t unsigned_limit(const std::string& key) {
  if (key == "max_attempts") return static_cast<std::uint64_t>(INT_MAX);
  if (key == "workers") return static_cast<std::uint64_t>(UINT_MAX);
  if (key == "max_output_bytes" || key == "min_artifact_chars") return static_cast<std::uint64_t>(SIZE_MAX);
  return UINT64_MAX;
}

// Unsigned value of `key` when present and within its field's range.
bool unsigned_in_range(const jsonlite::Object& obj, const std::string& key, std::uint64_t& out) {
  if (!jsonlite::is_unsigned(obj, key)) return false;
  const std::uint64_t v = jsonlite::get_u64(obj, key);
  if (v > unsigned_limit(key)) return false;
  out = v;
  return true;
}

const std::set<std::string>& number_keys() {
  static const std::set<std::string> keys = {"tolerance", "execution_timeout_seconds", "deadline_seconds"};
  return keys;
}

const std::set<std::string>& string_keys() {
  static const std::set<std::string> keys = {"interpreter", "scratch_root"};
  return keys;
}

bool env_u64(const char* name, unsigned long long limit, unsigned long long& out) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long n = std::strtoull(v, &end, 10);
  if (errno != 0 || *end != '\0' || v[0] == '-' || n > limit) return false;
  out = n;
  return true;
}

bool env_double(const char* name, double& out) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return false;
  errno = 0;
  char* end = nullptr;
  const double d = std::strtod(v, &end);
  if (errno != 0 || *end != '\0' || !std::isfinite(d)) return false;
  out = d;
  return true;
}

bool is_string_array(const jsonlite::Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<jsonlite::Array>(it->second.v)) return false;
  for (const auto& item : std::get<jsonlite::Array>(it->second.v)) {
    if (!std::holds_alternative<std::string>(item.v)) return false;
  }
  return true;
}

jsonlite::Array string_array(const std::vector<std::string>& items) {
  jsonlite::Array out;
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

}  // namespace

void apply_env_overrides(EngineConfig& config) {
  unsigned long long u = 0;
  double d = 0.0;
  if (env_u64("REMEDY_MAX_ATTEMPTS", INT_MAX, u)) config.loop.max_attempts = static_cast<int>(u);
  if (env_double("REMEDY_TOLERANCE", d)) config.loop.tolerance = d;
  if (env_double("REMEDY_EXEC_TIMEOUT_S", d)) config.executor.timeout_seconds = d;
  if (const char* v = std::getenv("REMEDY_INTERPRETER"); v && v[0]) config.executor.interpreter = v;
  if (env_u64("REMEDY_WORKERS", UINT_MAX, u)) config.scheduler.workers = static_cast<unsigned>(u);
  if (env_u64("REMEDY_CPU_LIMIT_S", ULLONG_MAX, u)) config.executor.cpu_time_limit_seconds = u;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [key, value] : obj) {
    (void)value;
    if (!known_keys().count(key)) {
      r.warnings.push_back("unknown key: " + key);
      continue;
    }
    if (unsigned_keys().count(key) && !jsonlite::is_unsigned(obj, key)) {
      r.errors.push_back(key + " must be a non-negative integer");
    } else if (unsigned_keys().count(key) && jsonlite::get_u64(obj, key) > unsigned_limit(key)) {
      r.errors.push_back(key + " is out of range (max " + std::to_string(unsigned_limit(key)) + ")");
    } else if (number_keys().count(key) && !jsonlite::is_number(obj, key)) {
      r.errors.push_back(key + " must be a number");
    } else if (string_keys().count(key) && !jsonlite::is_string(obj, key)) {
      r.errors.push_back(key + " must be a string");
    } else if ((key == "api_denylist" || key == "incomplete_symbols") && !is_string_array(obj, key)) {
      r.errors.push_back(key + " must be an array of strings");
    }
  }

  if (r.errors.empty()) {
    EngineConfig candidate;
    apply_config_object(obj, candidate);
    const ConfigValidationResult ranges = validate_engine_config(candidate);
    r.errors.insert(r.errors.end(), ranges.errors.begin(), ranges.errors.end());
  }
  r.ok = r.errors.empty();
  return r;
}

void apply_config_object(const jsonlite::Object& obj, EngineConfig& config) {
  using namespace jsonlite;
  std::uint64_t u = 0;
  if (unsigned_in_range(obj, "max_attempts", u)) config.loop.max_attempts = static_cast<int>(u);
  if (is_number(obj, "tolerance")) config.loop.tolerance = get_double(obj, "tolerance");
  if (is_number(obj, "execution_timeout_seconds"))
    config.executor.timeout_seconds = get_double(obj, "execution_timeout_seconds");
  if (is_string(obj, "interpreter")) config.executor.interpreter = get_string(obj, "interpreter");
  if (unsigned_in_range(obj, "max_output_bytes", u)) config.executor.max_output_bytes = static_cast<std::size_t>(u);
  if (unsigned_in_range(obj, "max_memory_bytes", u)) config.executor.max_memory_bytes = u;
  if (unsigned_in_range(obj, "max_file_descriptors", u)) config.executor.max_file_descriptors = u;
  if (unsigned_in_range(obj, "cpu_time_limit_seconds", u)) config.executor.cpu_time_limit_seconds = u;
  if (is_string(obj, "scratch_root")) config.executor.scratch_root = get_string(obj, "scratch_root");
  if (unsigned_in_range(obj, "min_artifact_chars", u))
    config.classifier.min_artifact_chars = static_cast<std::size_t>(u);
  if (is_string_array(obj, "api_denylist")) config.classifier.api_denylist = get_string_array(obj, "api_denylist");
  if (is_string_array(obj, "incomplete_symbols"))
    config.classifier.incomplete_symbols = get_string_array(obj, "incomplete_symbols");
  if (unsigned_in_range(obj, "workers", u)) config.scheduler.workers = static_cast<unsigned>(u);
  if (is_number(obj, "deadline_seconds")) config.scheduler.deadline_seconds = get_double(obj, "deadline_seconds");
}

ConfigValidationResult validate_engine_config(const EngineConfig& config) {
  ConfigValidationResult r = validate_loop_config(config.loop);
  if (!std::isfinite(config.executor.timeout_seconds) || config.executor.timeout_seconds <= 0.0) {
    r.errors.push_back("execution_timeout_seconds must be a finite number > 0");
  }
  if (config.executor.interpreter.empty()) {
    r.errors.push_back("interpreter must not be empty");
  }
  if (config.executor.max_output_bytes == 0) {
    r.errors.push_back("max_output_bytes must be > 0");
  }
  if (config.scheduler.workers == 0) {
    r.errors.push_back("workers must be >= 1");
  }
  if (!std::isfinite(config.scheduler.deadline_seconds) || config.scheduler.deadline_seconds < 0.0) {
    r.errors.push_back("deadline_seconds must be a finite number >= 0");
  }
  if (config.loop.max_attempts > 100) {
    r.warnings.push_back("max_attempts above 100 is unusually large");
  }
  r.ok = r.errors.empty();
  return r;
}

EngineConfig load_engine_config(const std::string& path) {
  EngineConfig config;
  apply_env_overrides(config);
  if (path.empty()) return config;

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw ConfigError(to_string(ErrorCode::config_invalid) + ": cannot read " + path);
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  const std::string text = ss.str();

  const ConfigValidationResult check = validate_config(text);
  if (!check.ok) {
    throw ConfigError(to_string(ErrorCode::config_invalid) + ": " + path + ": " + check.errors.front());
  }
  std::optional<jsonlite::JsonError> err;
  apply_config_object(jsonlite::parse(text, &err), config);
  return config;
}

std::string engine_config_to_json(const EngineConfig& config) {
  jsonlite::Object o;
  o["max_attempts"] = static_cast<std::uint64_t>(config.loop.max_attempts < 0 ? 0 : config.loop.max_attempts);
  o["tolerance"] = config.loop.tolerance;
  o["execution_timeout_seconds"] = config.executor.timeout_seconds;
  o["interpreter"] = config.executor.interpreter;
  o["max_output_bytes"] = static_cast<std::uint64_t>(config.executor.max_output_bytes);
  o["max_memory_bytes"] = config.executor.max_memory_bytes;
  o["max_file_descriptors"] = config.executor.max_file_descriptors;
  o["cpu_time_limit_seconds"] = config.executor.cpu_time_limit_seconds;
  o["scratch_root"] = config.executor.scratch_root;
  o["min_artifact_chars"] = static_cast<std::uint64_t>(config.classifier.min_artifact_chars);
  o["api_denylist"] = string_array(config.classifier.api_denylist);
  o["incomplete_symbols"] = string_array(config.classifier.incomplete_symbols);
  o["workers"] = static_cast<std::uint64_t>(config.scheduler.workers);
  o["deadline_seconds"] = config.scheduler.deadline_seconds;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

}  // namespace remedy
