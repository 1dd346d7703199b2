#include "kiln/observability.hpp"

#include <cstdio>
#include <cstdlib>

#include "kiln/jsonlite.hpp"

namespace kiln {

namespace {

std::atomic<PoolEventHook> g_event_hook{nullptr};

}  // namespace

const char* to_string(PoolEventKind kind) {
  switch (kind) {
    case PoolEventKind::spawned: return "spawned";
    case PoolEventKind::spawn_failed: return "spawn_failed";
    case PoolEventKind::reused: return "reused";
    case PoolEventKind::released: return "released";
    case PoolEventKind::action_failed: return "action_failed";
    case PoolEventKind::crashed: return "crashed";
    case PoolEventKind::stopped: return "stopped";
    case PoolEventKind::evicted_log_level: return "evicted_log_level";
    case PoolEventKind::evicted_session: return "evicted_session";
    case PoolEventKind::expired: return "expired";
  }
  return "unknown";
}

std::string to_json(const PoolEvent& ev) {
  std::string line;
  line.reserve(192);
  line += "{\"event\":\"";
  line += to_string(ev.kind);
  line += "\",\"worker_id\":";
  line += std::to_string(ev.worker_id);
  line += ",\"pid\":";
  line += std::to_string(ev.pid);
  line += ",\"kind\":\"";
  line += jsonlite::escape(ev.daemon_kind);
  line += "\",\"fingerprint\":\"";
  line += ev.fingerprint;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// DurationHistogram
// ---------------------------------------------------------------------------

void DurationHistogram::record(uint64_t duration_ns) {
  const uint64_t ms = duration_ns / 1000000u;
  size_t i = 0;
  while (i < kUpperBoundsMs.size() && ms > kUpperBoundsMs[i]) ++i;
  buckets_[i].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  total_ms_.fetch_add(ms, std::memory_order_relaxed);

  uint64_t seen = max_ms_.load(std::memory_order_relaxed);
  while (ms > seen && !max_ms_.compare_exchange_weak(seen, ms, std::memory_order_relaxed)) {
  }
}

uint64_t DurationHistogram::quantile_bound_ms(double q) const {
  const uint64_t n = count();
  if (n == 0) return 0;
  // Rank of the sample, 1-based.
  uint64_t rank = static_cast<uint64_t>(q * static_cast<double>(n) + 0.5);
  if (rank == 0) rank = 1;
  if (rank > n) rank = n;

  uint64_t seen = 0;
  for (size_t i = 0; i < kUpperBoundsMs.size(); ++i) {
    seen += bucket(i);
    if (seen >= rank) return kUpperBoundsMs[i];
  }
  return max_ms();
}

std::string DurationHistogram::to_json() const {
  std::string out = "{\"count\":" + std::to_string(count());
  out += ",\"total_ms\":" + std::to_string(total_ms_.load(std::memory_order_relaxed));
  out += ",\"max_ms\":" + std::to_string(max_ms());
  out += ",\"p50_ms\":" + std::to_string(quantile_bound_ms(0.50));
  out += ",\"p95_ms\":" + std::to_string(quantile_bound_ms(0.95));
  out += ",\"le_ms\":[";
  for (size_t i = 0; i < kBuckets; ++i) {
    if (i > 0) out += ',';
    out += std::to_string(bucket(i));
  }
  out += "]}";
  return out;
}

// ---------------------------------------------------------------------------
// PoolStats
// ---------------------------------------------------------------------------

void PoolStats::record(const PoolEvent& ev) {
  switch (ev.kind) {
    case PoolEventKind::spawned:
      spawned.fetch_add(1, std::memory_order_relaxed);
      spawn_time.record(ev.duration_ns);
      break;
    case PoolEventKind::spawn_failed: spawn_failures.fetch_add(1, std::memory_order_relaxed); break;
    case PoolEventKind::reused: reused.fetch_add(1, std::memory_order_relaxed); break;
    case PoolEventKind::released:
      actions_ok.fetch_add(1, std::memory_order_relaxed);
      action_time.record(ev.duration_ns);
      break;
    case PoolEventKind::action_failed:
      actions_failed.fetch_add(1, std::memory_order_relaxed);
      action_time.record(ev.duration_ns);
      break;
    case PoolEventKind::crashed: crashed.fetch_add(1, std::memory_order_relaxed); break;
    case PoolEventKind::stopped: break;
    case PoolEventKind::evicted_log_level: evicted_log_level.fetch_add(1, std::memory_order_relaxed); break;
    case PoolEventKind::evicted_session: evicted_session.fetch_add(1, std::memory_order_relaxed); break;
    case PoolEventKind::expired: expired.fetch_add(1, std::memory_order_relaxed); break;
  }
  // `stopped` counts every stop, whatever triggered it.
  if (ev.kind == PoolEventKind::stopped || ev.kind == PoolEventKind::evicted_log_level ||
      ev.kind == PoolEventKind::evicted_session || ev.kind == PoolEventKind::expired) {
    stopped.fetch_add(1, std::memory_order_relaxed);
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<PoolEvent> PoolStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<PoolEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string PoolStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("spawned", spawned, true);
  field("spawn_failures", spawn_failures);
  field("reused", reused);
  field("crashed", crashed);
  field("stopped", stopped);
  field("evicted_log_level", evicted_log_level);
  field("evicted_session", evicted_session);
  field("expired", expired);
  field("actions_ok", actions_ok);
  field("actions_failed", actions_failed);
  out += ",\"action_time\":";
  out += action_time.to_json();
  out += ",\"spawn_time\":";
  out += spawn_time.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

void set_pool_event_hook(PoolEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_pool_event(PoolStats& stats, const PoolEvent& ev) {
  stats.record(ev);

  PoolEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: KILN_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("KILN_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = to_json(ev);
  line += '\n';
  // O_APPEND keeps short lines from concurrent writers intact.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace kiln
