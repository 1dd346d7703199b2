#pragma once

// kiln/observability.hpp - Pool statistics and lifecycle events.
//
// DESIGN:
//   PoolEvent is the canonical observable unit. Every spawn, reuse, release,
//   crash and stop emits one PoolEvent, which is:
//     - recorded into the owning pool's PoolStats (counters + recent ring);
//     - passed to the optional hook (set_pool_event_hook);
//     - appended as one JSON line to $KILN_EVENT_LOG when that is set and no
//       hook is installed.
//
// Event emission never blocks allocation for longer than the ring mutex.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kiln {

enum class PoolEventKind {
  spawned,
  spawn_failed,
  reused,
  released,
  action_failed,
  crashed,
  stopped,
  evicted_log_level,
  evicted_session,
  expired,
};

const char* to_string(PoolEventKind kind);

struct PoolEvent {
  PoolEventKind kind{PoolEventKind::spawned};
  uint64_t worker_id{0};
  int pid{0};
  std::string daemon_kind;
  std::string fingerprint;   // short digest
  std::string detail;
  uint64_t duration_ns{0};   // action duration for released/action_failed/crashed
};

std::string to_json(const PoolEvent& ev);

// ---------------------------------------------------------------------------
// DurationHistogram - millisecond histogram for worker timings.
// ---------------------------------------------------------------------------
// Bounds run from 1 ms (a reused worker answering identify) to 30 s (a JVM
// spawn under load). The last bucket holds everything slower.
class DurationHistogram {
 public:
  static constexpr std::array<uint64_t, 10> kUpperBoundsMs{1, 5, 25, 100, 250, 1000, 2500, 5000, 10000, 30000};
  static constexpr size_t kBuckets = kUpperBoundsMs.size() + 1;

  void record(uint64_t duration_ns);

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t max_ms() const { return max_ms_.load(std::memory_order_relaxed); }
  uint64_t bucket(size_t i) const { return buckets_[i].load(std::memory_order_relaxed); }

  // Upper bound of the bucket holding the q-th sample, q in [0.0, 1.0].
  // The overflow bucket reports max_ms(). 0 with no samples.
  uint64_t quantile_bound_ms(double q) const;

  // {"count":N,"total_ms":T,"max_ms":M,"p50_ms":..,"p95_ms":..,"le_ms":[..]}
  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> total_ms_{0};
  std::atomic<uint64_t> max_ms_{0};
};

// ---------------------------------------------------------------------------
// PoolStats - per-pool aggregated statistics.
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the ring buffer uses a mutex.
class PoolStats {
 public:
  void record(const PoolEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> spawned{0};
  std::atomic<uint64_t> spawn_failures{0};
  std::atomic<uint64_t> reused{0};
  std::atomic<uint64_t> crashed{0};
  std::atomic<uint64_t> stopped{0};
  std::atomic<uint64_t> evicted_log_level{0};
  std::atomic<uint64_t> evicted_session{0};
  std::atomic<uint64_t> expired{0};
  std::atomic<uint64_t> actions_ok{0};
  std::atomic<uint64_t> actions_failed{0};

  DurationHistogram action_time;  // allocation to release, failures included
  DurationHistogram spawn_time;   // process start to ready handshake

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<PoolEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<PoolEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

using PoolEventHook = void (*)(const PoolEvent&);
void set_pool_event_hook(PoolEventHook hook);

// Records into `stats`, then forwards to the hook or the JSONL event log.
void emit_pool_event(PoolStats& stats, const PoolEvent& ev);

}  // namespace kiln
