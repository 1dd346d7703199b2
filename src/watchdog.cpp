#include "kiln/watchdog.hpp"

#include <unistd.h>

#include <chrono>
#include <cstdio>

#include "kiln/log.hpp"

namespace kiln {

namespace {

void exit_on_parent_gone(int expected_parent_pid) {
  log::info("Parent process " + std::to_string(expected_parent_pid) + " is gone, worker daemon exiting.");
  std::fflush(stderr);
  _exit(PARENT_GONE_EXIT_CODE);
}

}  // namespace

ParentWatchdog::ParentWatchdog(int expected_parent_pid, uint64_t poll_interval_ms, OnParentGone on_gone)
    : expected_parent_pid_(expected_parent_pid),
      poll_interval_ms_(poll_interval_ms == 0 ? 1000 : poll_interval_ms),
      on_gone_(on_gone ? on_gone : &exit_on_parent_gone) {}

ParentWatchdog::~ParentWatchdog() { stop(); }

bool ParentWatchdog::parent_alive() const {
  return ::getppid() == expected_parent_pid_;
}

void ParentWatchdog::start() {
  if (thread_.joinable()) return;
  if (!parent_alive()) {
    on_gone_(expected_parent_pid_);
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void ParentWatchdog::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ParentWatchdog::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_for(lk, std::chrono::milliseconds(poll_interval_ms_), [this] { return stop_requested_; })) return;
    }
    if (!parent_alive()) {
      on_gone_(expected_parent_pid_);
      return;
    }
  }
}

}  // namespace kiln
