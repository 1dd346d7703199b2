#pragma once

// kiln/allocator.hpp - Matching work items to worker daemons.
//
// allocate() either wins an Idle worker with an equal fingerprint (Idle -> Busy
// by compare-and-swap) or spawns a new one. The caller then owns the worker
// exclusively until release().
//
// DESIGN INVARIANTS:
//   1. Fingerprint equality is the only reuse criterion.
//   2. Two concurrent allocations can never win the same record: the CAS has
//      exactly one winner, and a freshly spawned record is published already
//      Busy.
//   3. A failed spawn leaves the registry untouched.
//   4. A worker found dead while being claimed is marked Crashed, removed, and
//      the scan continues; the caller never sees it.

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "kiln/config.hpp"
#include "kiln/eviction.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/observability.hpp"
#include "kiln/registry.hpp"

namespace kiln {

struct Allocation {
  std::shared_ptr<WorkerRecord> record;
  bool reused{false};
  ErrorCode error{ErrorCode::none};
  std::string error_detail;
  std::chrono::steady_clock::time_point acquired_at{};

  bool ok() const { return record != nullptr && error == ErrorCode::none; }
};

class WorkerAllocator {
 public:
  WorkerAllocator(const PoolConfig& config, DaemonRegistry& registry, PoolStats& stats, EvictionPolicy& eviction);

  Allocation allocate(const WorkItem& item);

  // Hands the worker back after its Busy period.
  //   success / user_failure -> Idle, or stopped if retired, closed, or its log
  //                             level is no longer current
  //   process_crash          -> Crashed and removed (Stopped if a stop killed it)
  void release(const Allocation& allocation, const ActionOutcome& outcome);

  // After close(), allocate() fails with pool_shut_down and released workers
  // are stopped instead of returning to Idle.
  void close() { closed_.store(true, std::memory_order_release); }
  bool closed() const { return closed_.load(std::memory_order_acquire); }

 private:
  std::shared_ptr<WorkerRecord> claim_idle_match(const Fingerprint& fp);
  Allocation spawn(const WorkItem& item);

  const PoolConfig& config_;
  DaemonRegistry& registry_;
  PoolStats& stats_;
  EvictionPolicy& eviction_;
  std::atomic<bool> closed_{false};
};

}  // namespace kiln
