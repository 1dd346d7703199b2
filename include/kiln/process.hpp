#pragma once

// kiln/process.hpp - POSIX process primitives.
//
// Two kinds of child process exist:
//   1. Worker daemons: long-lived, spawned by spawn_with_channel() with one end
//      of a socketpair installed as fd 3 (WORKER_CHANNEL_FD). stdin is /dev/null,
//      stdout and stderr are inherited so worker log lines reach the host's
//      console.
//   2. Short commands run by a worker's "run" action via run_process(): output
//      captured into bounded buffers, killed on timeout.
//
// INVARIANTS:
//   - No allocation happens between fork() and exec(); argv and envp are built
//     beforehand, so spawning is safe from a multi-threaded host.
//   - Every descriptor the host creates is close-on-exec. A worker inherits only
//     its own channel, never a sibling's.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace kiln {

constexpr int WORKER_CHANNEL_FD = 3;

struct SpawnedProcess {
  int pid{-1};
  int channel_fd{-1};  // host end of the socketpair
};

/// Spawns `executable` with `args` (argv[0] is the executable itself). On
/// success fills *out and returns true. On failure (socketpair, fork or exec
/// error) returns false with *error set; exec failures are reported
/// synchronously through a close-on-exec error pipe, and the failed child is
/// reaped before returning.
bool spawn_with_channel(const std::string& executable, const std::vector<std::string>& args,
                        SpawnedProcess* out, std::string* error);

/// Non-blocking reap. Returns true once the process has been reaped and stores
/// its raw wait status.
bool try_reap(int pid, int* status);

/// Exit code for an exited process, 128 + signal for a signalled one.
int decode_wait_status(int status);

/// "exit code N" or "killed by signal N".
std::string describe_wait_status(int status);

// ---------------------------------------------------------------------------
// run_process - bounded command execution for worker actions.
// ---------------------------------------------------------------------------
struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;  // empty: inherit the worker's environment
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty if the process could not be started
};

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace kiln
