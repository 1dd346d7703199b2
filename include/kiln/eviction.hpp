#pragma once

// kiln/eviction.hpp - When worker daemons are stopped.
//
// Triggers:
//   on_log_level()    - a session or work item arrives; Idle workers started
//                       with another log level are stopped before matching.
//                       Busy ones are stopped by their releasing thread once
//                       log_level_out_of_date() reports their level.
//   on_session_end()  - workers of session-scoped kinds (config
//                       session_scoped_kinds) are stopped. Busy ones are marked
//                       retire_on_release and stopped by their releasing thread.
//   stop_all()        - every tracked worker is stopped; Busy ones are killed
//                       and finalized by their releasing thread. Blocks until
//                       every one of them has left the registry.
//   expire_idle()     - periodic pass run by ExpirationTask: idle timeout,
//                       surplus beyond max_idle_workers (LRU first), and Idle
//                       workers whose process died on its own.
//
// INVARIANT:
//   Eviction claims an Idle worker only through Idle -> Stopping. A worker an
//   allocator has already claimed (Busy) is never stopped out from under it
//   except by stop_all(), which kills it and leaves finalization to the owner.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kiln/config.hpp"
#include "kiln/observability.hpp"
#include "kiln/registry.hpp"

namespace kiln {

// "Stopped N worker daemon(s)."
std::string stopped_line(size_t count);

extern const char* const kLogLevelChangedLine;

class EvictionPolicy {
 public:
  using RecordPtr = DaemonRegistry::RecordPtr;

  EvictionPolicy(const PoolConfig& config, DaemonRegistry& registry, PoolStats& stats);

  // Returns the number of workers stopped.
  size_t on_log_level(LogLevel level);
  size_t on_session_end();
  size_t stop_all();
  size_t expire_idle(uint64_t now_ms);

  // True once a level has been seen and `level` is not it.
  bool log_level_out_of_date(LogLevel level) const;

  // Completes a stop for a record the caller owns in state Stopping: stops
  // and reaps the process, marks it Stopped and removes it.
  void finalize_stop(const RecordPtr& record, PoolEventKind reason, const std::string& detail = "");

  // Marks a record Crashed and removes it. The caller owns the record.
  void finalize_crash(const RecordPtr& record, const std::string& detail, int exit_status);

 private:
  // Claims (Idle -> Stopping) every Idle record for which pred returns true.
  template <typename Pred>
  std::vector<RecordPtr> claim_idle(Pred pred);

  size_t stop_claimed(const std::vector<RecordPtr>& claimed, PoolEventKind reason, const std::string& detail);

  const PoolConfig& config_;
  DaemonRegistry& registry_;
  PoolStats& stats_;

  std::mutex level_mu_;  // serializes log level changes and their evictions
  std::atomic<bool> has_level_{false};
  std::atomic<LogLevel> level_{LogLevel::lifecycle};
};

// ---------------------------------------------------------------------------
// ExpirationTask - runs EvictionPolicy::expire_idle() every interval.
// ---------------------------------------------------------------------------
class ExpirationTask {
 public:
  ExpirationTask(EvictionPolicy& eviction, uint64_t interval_ms);
  ~ExpirationTask();

  ExpirationTask(const ExpirationTask&) = delete;
  ExpirationTask& operator=(const ExpirationTask&) = delete;

  void start();
  // Joins the thread. Idempotent.
  void stop();

 private:
  void run();

  EvictionPolicy& eviction_;
  const uint64_t interval_ms_;
  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
};

}  // namespace kiln
