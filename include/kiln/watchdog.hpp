#pragma once

// kiln/watchdog.hpp - Parent-liveness watchdog, run inside every worker daemon.
//
// A worker must not outlive the process that spawned it, even when that
// process is SIGKILLed and never gets to stop it. The watchdog thread compares
// getppid() with the spawning pid every poll interval; once they differ the
// worker has been re-parented and the on_gone action runs (by default: log and
// _exit(PARENT_GONE_EXIT_CODE)).
//
// Channel EOF is the other exit path (see WorkerRuntime::run); the watchdog
// covers the case where the channel is inherited by another live process.

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace kiln {

constexpr int PARENT_GONE_EXIT_CODE = 86;

class ParentWatchdog {
 public:
  using OnParentGone = void (*)(int expected_parent_pid);

  ParentWatchdog(int expected_parent_pid, uint64_t poll_interval_ms, OnParentGone on_gone = nullptr);
  ~ParentWatchdog();

  ParentWatchdog(const ParentWatchdog&) = delete;
  ParentWatchdog& operator=(const ParentWatchdog&) = delete;

  // Checks once immediately, then every poll interval on a background thread.
  void start();
  void stop();

  bool parent_alive() const;

 private:
  void run();

  const int expected_parent_pid_;
  const uint64_t poll_interval_ms_;
  OnParentGone on_gone_;
  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
};

}  // namespace kiln
