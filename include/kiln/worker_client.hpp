#pragma once

// kiln/worker_client.hpp - Host-side handle of one worker daemon process.
//
// A WorkerClient owns the process and its channel: it spawns kiln-worker with a
// command line derived from a Fingerprint, waits for the ready frame, sends
// actions one at a time, and stops or kills the process. It knows nothing
// about the registry or worker states; the allocator and eviction code drive
// it.
//
// THREADING:
//   start(), execute() and stop() are called by whichever thread currently
//   owns the worker (the allocating thread, or an evicting thread that won
//   the Idle->Stopping transition). terminate() and is_alive() may be called
//   from any thread at any time. A pid is never signalled after it has been
//   reaped.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kiln/fingerprint.hpp"
#include "kiln/protocol.hpp"
#include "kiln/types.hpp"

namespace kiln {

struct WorkerLaunchOptions {
  std::string executable;
  uint64_t parent_poll_ms{1000};
  uint64_t stop_grace_ms{2000};
};

// kiln-worker argv for `fp`, excluding argv[0]:
//   --parent-pid P --parent-poll-ms N --log-level L --kind K --fingerprint D
//   [--classpath ENTRY]... -- <vm args...>
std::vector<std::string> worker_arguments(const Fingerprint& fp, const WorkerLaunchOptions& options, int parent_pid);

class WorkerClient {
 public:
  WorkerClient(Fingerprint fingerprint, WorkerLaunchOptions options);
  // Kills and reaps the process if it is still running.
  ~WorkerClient();

  WorkerClient(const WorkerClient&) = delete;
  WorkerClient& operator=(const WorkerClient&) = delete;

  // Spawns the process and waits up to `ready_timeout_ms` for its ready frame.
  // On failure the process (if any) is killed and reaped, *code is one of
  // spawn_failed, ready_timeout or protocol_mismatch, and *detail explains.
  bool start(uint64_t ready_timeout_ms, ErrorCode* code, std::string* detail);

  // Sends one action frame and blocks until its result frame arrives or the
  // channel closes. Never throws; a dead process yields process_crash.
  ActionOutcome execute(const Action& action);

  // Graceful stop: stop frame, up to stop_grace_ms to exit, then SIGKILL.
  // Always reaps. Idempotent.
  void stop();

  // SIGKILL without reaping. Used to stop a worker that is busy on another
  // thread; that thread's execute() then returns process_crash and the
  // owner reaps.
  void terminate();

  // False once the process has exited (reaping it if needed).
  bool is_alive();

  int pid() const { return pid_; }
  const Fingerprint& fingerprint() const { return fingerprint_; }

  // Raw wait status once reaped, else 0.
  int wait_status();

 private:
  bool reap_locked(int* status);
  // Waits up to timeout_ms for exit; SIGKILLs and waits for good if needed.
  void ensure_reaped(uint64_t timeout_ms);

  Fingerprint fingerprint_;
  WorkerLaunchOptions options_;
  std::unique_ptr<protocol::LineChannel> channel_;
  int pid_{-1};
  uint64_t next_action_id_{0};
  std::atomic<bool> terminated_{false};

  std::mutex proc_mu_;  // guards reaped_ and status_ against kill-after-reap
  bool reaped_{false};
  int status_{0};
};

}  // namespace kiln
