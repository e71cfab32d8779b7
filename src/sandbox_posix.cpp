#ifndef _WIN32

#include "remedy/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

extern char** environ;

namespace fs = std::filesystem;

namespace remedy {

namespace {

constexpr std::size_t kReadChunk = 4096;
// Upper bound on reads per pipe per loop turn, so a child that writes
// without pause cannot starve the deadline check.
constexpr int kMaxReadsPerTurn = 16;
constexpr int kPollIntervalMs = 5;

inline bool starts_with(const std::string& v, const std::string& prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& v, const std::string& suffix) {
  return v.size() >= suffix.size() &&
         v.compare(v.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Drop a multi-byte UTF-8 sequence left incomplete by the byte cap.
void trim_partial_utf8(std::string& s) {
  const std::size_t n = s.size();
  for (std::size_t back = 1; back <= 4 && back <= n; ++back) {
    const unsigned char c = static_cast<unsigned char>(s[n - back]);
    if ((c & 0xC0) == 0x80) continue;  // continuation byte
    std::size_t need = 1;
    if ((c & 0xE0) == 0xC0) need = 2;
    else if ((c & 0xF0) == 0xE0) need = 3;
    else if ((c & 0xF8) == 0xF0) need = 4;
    if (need > back) s.resize(n - back);
    return;
  }
}

// Close-on-exec is set atomically where pipe2() exists, so a concurrent
// fork() on another worker thread cannot inherit the descriptors.
bool make_pipe(int fds[2]) {
#ifdef __linux__
  return ::pipe2(fds, O_CLOEXEC) == 0;
#else
  if (::pipe(fds) != 0)
    return false;
  if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 ||
      ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  return true;
#endif
}

void close_pipe(int fds[2]) {
  ::close(fds[0]);
  ::close(fds[1]);
}

// Read what is currently available on a non-blocking fd. Clears `open` on EOF.
void pump(int fd, bool& open, std::string& dst, std::size_t limit,
          bool& truncated) {
  if (!open)
    return;
  char buf[kReadChunk];
  for (int k = 0; k < kMaxReadsPerTurn; ++k) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0) {
      open = false;
    } else if (errno == EINTR) {
      continue;
    }
    return;
  }
}

void kill_group(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

void reap(pid_t pid, int& status) {
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

} // namespace

bool is_secret_key(const std::string& key) {
  if (ends_with(key, "_TOKEN") || ends_with(key, "_SECRET") || ends_with(key, "_KEY") ||
      ends_with(key, "_PASSWORD") || ends_with(key, "_CREDENTIAL") ||
      ends_with(key, "_CREDENTIALS"))
    return true;
  if (starts_with(key, "AUTH") || starts_with(key, "COOKIE") ||
      starts_with(key, "AWS_SECRET") || starts_with(key, "GH_TOKEN") ||
      starts_with(key, "GITHUB_TOKEN") || starts_with(key, "NPM_TOKEN"))
    return true;
  return false;
}

std::map<std::string, std::string> sanitized_host_environment() {
  std::map<std::string, std::string> out;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    std::string key = entry.substr(0, eq);
    if (is_secret_key(key))
      continue;
    out[std::move(key)] = entry.substr(eq + 1);
  }
  return out;
}

std::string resolve_executable(const std::string& name) {
  if (name.empty())
    return {};
  if (name.find('/') != std::string::npos)
    return ::access(name.c_str(), X_OK) == 0 ? name : std::string{};
  const char* path_env = std::getenv("PATH");
  const std::string path = (path_env && path_env[0]) ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t end = std::min(path.find(':', start), path.size());
    const std::string dir = end > start ? path.substr(start, end - start) : ".";
    const std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0)
      return candidate;
    start = end + 1;
  }
  return {};
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();
  auto finish = [&]() -> ProcessResult& {
    result.duration_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - started).count());
    return result;
  };

  const std::string command = resolve_executable(spec.command);
  if (command.empty()) {
    result.error_message = "spawn_failed: command not found: " + spec.command;
    result.exit_code = 127;
    return finish();
  }

  // Everything the child needs is prepared before fork(): only
  // async-signal-safe calls are made between fork() and execve().
  std::vector<std::string> all = {command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::map<std::string, std::string> env_map;
  if (spec.inherit_env)
    env_map = sanitized_host_environment();
  for (const auto& [k, v] : spec.env)
    env_map[k] = v;
  std::vector<std::string> envs;
  envs.reserve(env_map.size());
  for (const auto& [k, v] : env_map)
    envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2];
  int err_pipe[2];
  if (!make_pipe(out_pipe)) {
    result.error_message = "spawn_failed: pipe: " + std::string(std::strerror(errno));
    return finish();
  }
  if (!make_pipe(err_pipe)) {
    result.error_message = "spawn_failed: pipe: " + std::string(std::strerror(errno));
    close_pipe(out_pipe);
    return finish();
  }
  // The child writes its errno here when chdir() or execve() fails. A
  // successful execve() closes it, so the parent reads EOF.
  int status_pipe[2];
  if (!make_pipe(status_pipe)) {
    result.error_message = "spawn_failed: pipe: " + std::string(std::strerror(errno));
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    return finish();
  }
  const int null_in = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  pid_t pid = ::fork();
  if (pid < 0) {
    result.error_message = "spawn_failed: fork: " + std::string(std::strerror(errno));
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    close_pipe(status_pipe);
    if (null_in >= 0)
      ::close(null_in);
    return finish();
  }

  if (pid == 0) {
    ::setsid();
    if (null_in >= 0)
      ::dup2(null_in, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      const int err = errno;
      const ssize_t w = ::write(status_pipe[1], &err, sizeof(err));
      (void)w;
      ::_exit(127);
    }

    if (spec.max_memory_bytes > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_memory_bytes;
      rl.rlim_max = spec.max_memory_bytes;
      ::setrlimit(RLIMIT_AS, &rl);
    }
    if (spec.max_file_descriptors > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_file_descriptors;
      rl.rlim_max = spec.max_file_descriptors;
      ::setrlimit(RLIMIT_NOFILE, &rl);
    }
    if (spec.cpu_limit_seconds > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.cpu_limit_seconds;
      rl.rlim_max = spec.cpu_limit_seconds + 1;
      ::setrlimit(RLIMIT_CPU, &rl);
    }

    ::execve(command.c_str(), argv.data(), envp.data());
    const int err = errno;
    const ssize_t w = ::write(status_pipe[1], &err, sizeof(err));
    (void)w;
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(status_pipe[1]);
  if (null_in >= 0)
    ::close(null_in);

  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  ::close(status_pipe[0]);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    reap(pid, status);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    result.error_message = "spawn_failed: exec " + command + ": " + std::strerror(child_errno);
    result.exit_code = 127;
    return finish();
  }
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  bool out_open = true;
  bool err_open = true;
  int status = 0;
  while (true) {
    pump(out_pipe[0], out_open, result.stdout_text, spec.max_output_bytes,
         result.stdout_truncated);
    pump(err_pipe[0], err_open, result.stderr_text, spec.max_output_bytes,
         result.stderr_truncated);

    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (w < 0 && errno != EINTR) {
      // Child already reaped elsewhere; nothing left to wait for.
      kill_group(pid);
      break;
    }
    if (spec.cancel && spec.cancel->is_cancelled()) {
      kill_group(pid);
      reap(pid, status);
      result.cancelled = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill_group(pid);
      reap(pid, status);
      result.timed_out = true;
      break;
    }

    struct pollfd fds[2];
    fds[0].fd = out_open ? out_pipe[0] : -1;
    fds[0].events = POLLIN;
    fds[1].fd = err_open ? err_pipe[0] : -1;
    fds[1].events = POLLIN;
    ::poll(fds, 2, kPollIntervalMs);
  }

  // Descendants that outlived the child are part of its group.
  ::kill(-pid, SIGKILL);

  pump(out_pipe[0], out_open, result.stdout_text, spec.max_output_bytes,
       result.stdout_truncated);
  pump(err_pipe[0], err_open, result.stderr_text, spec.max_output_bytes,
       result.stderr_truncated);
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  if (result.stdout_truncated) {
    trim_partial_utf8(result.stdout_text);
    result.stdout_text += "(truncated)";
  }
  if (result.stderr_truncated) {
    trim_partial_utf8(result.stderr_text);
    result.stderr_text += "(truncated)";
  }

  if (!result.timed_out && !result.cancelled && spec.cpu_limit_seconds > 0 &&
      WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU) {
    result.timed_out = true;
    result.cpu_limit_exceeded = true;
  }

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (result.cancelled) {
    result.exit_code = 130;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return finish();
}

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

ScratchDir::ScratchDir(const std::string& root, const std::string& tag) {
  std::error_code ec;
  root_ = root.empty() ? fs::temp_directory_path(ec).string() : root;
  if (ec || root_.empty()) {
    root_ = "/tmp";
  }
  while (root_.size() > 1 && root_.back() == '/')
    root_.pop_back();
  std::string templ = root_ + "/remedy-" + tag + "-XXXXXX";
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    error_ = "mkdtemp " + templ + ": " + std::strerror(errno);
    return;
  }
  path_ = buf.data();
}

ScratchDir::~ScratchDir() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string ScratchDir::write_file(const std::string& name,
                                   const std::string& content) const {
  if (path_.empty())
    return {};
  const std::string full = path_ + "/" + name;
  std::ofstream ofs(full, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return {};
  ofs << content;
  ofs.flush();
  if (!ofs)
    return {};
  return full;
}

} // namespace remedy

#endif
