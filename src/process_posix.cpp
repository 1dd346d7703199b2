#include "kiln/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace kiln {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n) || dst.size() >= limit) {
    truncated = true;
  }
}

std::vector<char*> to_argv(std::vector<std::string>& all) {
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);
  return argv;
}

// Writes the whole buffer from a forked child. Async-signal-safe.
void child_write_all(int fd, const void* data, size_t len) {
  const char* p = static_cast<const char*>(data);
  while (len > 0) {
    const ssize_t n = ::write(fd, p, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;
    p += n;
    len -= static_cast<size_t>(n);
  }
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

bool spawn_with_channel(const std::string& executable, const std::vector<std::string>& args,
                        SpawnedProcess* out, std::string* error) {
  int sv[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
    if (error) *error = std::string("socketpair failed: ") + std::strerror(errno);
    return false;
  }
  int err_pipe[2] = {-1, -1};
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("pipe2 failed: ") + std::strerror(errno);
    close_fd(sv[0]);
    close_fd(sv[1]);
    return false;
  }

  std::vector<std::string> all = args;
  if (all.empty() || all.front() != executable) all.insert(all.begin(), executable);
  std::vector<char*> argv = to_argv(all);

  const pid_t pid = ::fork();
  if (pid < 0) {
    if (error) *error = std::string("fork failed: ") + std::strerror(errno);
    close_fd(sv[0]);
    close_fd(sv[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return false;
  }

  if (pid == 0) {
    // Move the error pipe out of the way before fd 3 is claimed.
    int err_fd = ::fcntl(err_pipe[1], F_DUPFD_CLOEXEC, 10);
    if (err_fd < 0) _exit(127);
    int child_end = sv[1];
    if (child_end == WORKER_CHANNEL_FD) {
      ::fcntl(child_end, F_SETFD, 0);
    } else {
      if (::dup2(child_end, WORKER_CHANNEL_FD) < 0) {
        const int e = errno;
        child_write_all(err_fd, &e, sizeof(e));
        _exit(127);
      }
    }
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO && devnull != WORKER_CHANNEL_FD) ::close(devnull);
    }
    ::execv(executable.c_str(), argv.data());
    const int e = errno;
    child_write_all(err_fd, &e, sizeof(e));
    _exit(127);
  }

  close_fd(sv[1]);
  close_fd(err_pipe[1]);

  // EOF means exec succeeded (the write end was close-on-exec).
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(err_pipe[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    close_fd(sv[0]);
    if (error) *error = "exec " + executable + " failed: " + std::strerror(child_errno);
    return false;
  }

  out->pid = pid;
  out->channel_fd = sv[0];
  return true;
}

bool try_reap(int pid, int* status) {
  int st = 0;
  pid_t w = 0;
  do {
    w = ::waitpid(pid, &st, WNOHANG);
  } while (w < 0 && errno == EINTR);
  if (w == pid) {
    if (status) *status = st;
    return true;
  }
  if (w < 0 && errno == ECHILD) {
    // Reaped elsewhere or never our child; report it gone with no status.
    if (status) *status = 0;
    return true;
  }
  return false;
}

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 0;
}

std::string describe_wait_status(int status) {
  if (WIFSIGNALED(status)) return "killed by signal " + std::to_string(WTERMSIG(status));
  return "exit code " + std::to_string(decode_wait_status(status));
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error_message = "spawn_failed";
    return result;
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv = to_argv(all);
  std::vector<std::string> envs;
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp = to_argv(envs);

  const pid_t pid = ::fork();
  if (pid < 0) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) _exit(127);
    if (spec.env.empty()) {
      ::execvp(spec.command.c_str(), argv.data());
    } else {
      ::execve(spec.command.c_str(), argv.data(), envp.data());
    }
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[256];
  int status = 0;
  while (true) {
    ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    n = ::read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);

    if (::waitpid(pid, &status, WNOHANG) == pid) break;
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  while (true) {
    const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
  }
  while (true) {
    const ssize_t n = ::read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  if (result.stdout_truncated) result.stdout_text += "(truncated)";
  if (result.stderr_truncated) result.stderr_text += "(truncated)";

  result.exit_code = result.timed_out ? 124 : decode_wait_status(status);
  return result;
}

}  // namespace kiln
