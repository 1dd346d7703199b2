#pragma once

// kiln/pool.hpp - WorkerPool: the worker daemon pool of one hosting process.
//
// DESIGN:
//   WorkerPool ties the pieces together and owns their shared state: config,
//   registry, stats, eviction policy, allocator and the expiration thread. It
//   is an explicit object, not a singleton; the host creates one and calls
//   shutdown() (or lets the destructor do it) before exiting.
//
//   Allocation is passive: there is no dispatcher thread. Every caller thread
//   runs allocate()/execute() itself and blocks only while spawning or while
//   its own worker is executing.
//
// USAGE:
//   kiln::WorkerPool pool(kiln::PoolConfig::from_env());
//   pool.begin_session(kiln::LogLevel::lifecycle);
//   auto report = pool.execute(kiln::make_work_item(requirements, action));
//   pool.end_session();
//
// EXTENSION_POINT: bounded_pool_size
//   Current: one worker per concurrent work item, no upper bound on Busy
//   workers. A cap would make allocate() wait for a release instead of
//   spawning.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "kiln/allocator.hpp"
#include "kiln/config.hpp"
#include "kiln/eviction.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/observability.hpp"
#include "kiln/registry.hpp"

namespace kiln {

struct Session {
  uint64_t id{0};
  LogLevel log_level{LogLevel::lifecycle};
  bool active{false};
};

// Result of WorkerPool::execute().
struct ExecutionReport {
  ActionOutcome outcome;
  uint64_t worker_id{0};
  int pid{0};
  bool reused{false};
  ErrorCode error{ErrorCode::none};  // allocation failure; outcome is unset then
  std::string error_detail;

  bool ok() const { return error == ErrorCode::none && outcome.ok(); }
  std::string to_json() const;
};

class WorkerPool {
 public:
  explicit WorkerPool(PoolConfig config = PoolConfig::from_env());
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Starts a session. A log level different from the previous one stops Idle
  // workers started with another level.
  Session begin_session(LogLevel level);

  // Ends the current session; stops workers of session-scoped kinds. Returns
  // the number stopped immediately.
  size_t end_session();

  Session current_session() const;

  // Low-level access: the caller owns the worker between the two calls and
  // must call release() exactly once for every ok() allocation.
  Allocation allocate(const WorkItem& item);
  void release(const Allocation& allocation, const ActionOutcome& outcome);

  // allocate + WorkerClient::execute + release.
  ExecutionReport execute(const WorkItem& item);

  // Stops every tracked worker; blocks until all are gone. Must not be called
  // by a thread that holds an unreleased allocation.
  size_t stop_all();

  // One expiration pass now, outside the periodic thread.
  size_t expire_now();

  // Stops the expiration thread, refuses further allocations and stops every
  // worker. Idempotent.
  void shutdown();
  bool is_shut_down() const { return allocator_.closed(); }

  const PoolConfig& config() const { return config_; }
  DaemonRegistry& registry() { return registry_; }
  PoolStats& stats() { return stats_; }

  // {"session":{..},"workers":[..],"stats":{..}}
  std::string status_json() const;

 private:
  const PoolConfig config_;
  DaemonRegistry registry_;
  PoolStats stats_;
  EvictionPolicy eviction_;
  WorkerAllocator allocator_;
  ExpirationTask expiration_;

  mutable std::mutex session_mu_;
  Session session_;
  uint64_t next_session_id_{0};
  std::once_flag shutdown_once_;
};

}  // namespace kiln
