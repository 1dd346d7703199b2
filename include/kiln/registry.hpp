#pragma once

// kiln/registry.hpp - Registry of tracked worker daemons.
//
// DESIGN:
//   The registry is a passive id -> record table. It never spawns, stops or
//   executes anything itself; the allocator and the eviction policy do that
//   after claiming a record through WorkerRecord::try_transition().
//
// INVARIANTS:
//   - mu_ guards only the table. It is never held while a process is spawned,
//     stopped or executing an action.
//   - A record's state is changed only by compare-and-swap. Whoever wins the
//     swap owns the record until it puts it back (Busy -> Idle) or removes it.
//   - Records in a terminal state (stopped, crashed) are removed promptly and
//     are never returned by idle().
//   - Records are shared_ptr: a thread holding one after removal keeps the
//     WorkerClient alive until it is done with it.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kiln/fingerprint.hpp"
#include "kiln/types.hpp"
#include "kiln/worker_client.hpp"

namespace kiln {

uint64_t now_unix_ms();

// ---------------------------------------------------------------------------
// WorkerRecord - one tracked worker daemon.
// ---------------------------------------------------------------------------
struct WorkerRecord {
  WorkerRecord(uint64_t worker_id, std::unique_ptr<WorkerClient> worker_client, WorkerState initial);

  const uint64_t id;
  const int pid;
  const Fingerprint fingerprint;
  const uint64_t created_at_unix_ms;
  const std::unique_ptr<WorkerClient> client;

  std::atomic<WorkerState> state;
  std::atomic<uint64_t> last_used_unix_ms;
  std::atomic<uint64_t> uses{0};
  // Set by session-end eviction on a Busy worker: stop it instead of
  // returning it to Idle when its action completes.
  std::atomic<bool> retire_on_release{false};

  bool try_transition(WorkerState from, WorkerState to) {
    return state.compare_exchange_strong(from, to, std::memory_order_acq_rel);
  }
  WorkerState current_state() const { return state.load(std::memory_order_acquire); }
  const std::string& kind() const { return fingerprint.kind; }
  void touch() { last_used_unix_ms.store(now_unix_ms(), std::memory_order_relaxed); }
};

// Point-in-time copy of a record for reporting.
struct WorkerSnapshot {
  uint64_t id{0};
  int pid{0};
  std::string fingerprint;
  std::string kind;
  LogLevel log_level{LogLevel::lifecycle};
  WorkerState state{WorkerState::starting};
  uint64_t created_at_unix_ms{0};
  uint64_t last_used_unix_ms{0};
  uint64_t uses{0};
};

class DaemonRegistry {
 public:
  using RecordPtr = std::shared_ptr<WorkerRecord>;

  uint64_t next_id() { return next_id_.fetch_add(1, std::memory_order_relaxed) + 1; }

  void add(RecordPtr record);

  // Removes the record with `id` and wakes wait_until_removed(). Returns false
  // if it was not present.
  bool remove(uint64_t id);

  RecordPtr find(uint64_t id) const;

  // Snapshot of every tracked record.
  std::vector<RecordPtr> all() const;

  // Records that were Idle when the snapshot was taken. Callers must still win
  // try_transition() before using one.
  std::vector<RecordPtr> idle() const;

  size_t size() const;

  // Blocks until none of `ids` remains in the registry.
  void wait_until_removed(const std::vector<uint64_t>& ids) const;

  std::vector<WorkerSnapshot> snapshot() const;
  std::string workers_to_json() const;

 private:
  // Must be called with mu_ held. -1 if absent.
  int find_index(uint64_t id) const;

  mutable std::mutex mu_;
  mutable std::condition_variable removed_cv_;
  std::vector<RecordPtr> workers_;
  std::atomic<uint64_t> next_id_{0};
};

}  // namespace kiln
