#include "kiln/eviction.hpp"

#include <algorithm>
#include <chrono>

#include "kiln/log.hpp"
#include "kiln/process.hpp"

namespace kiln {

const char* const kLogLevelChangedLine =
    "Log level has changed, stopping idle worker daemon with out-of-date log level.";

std::string stopped_line(size_t count) {
  return "Stopped " + std::to_string(count) + " worker daemon(s).";
}

namespace {

PoolEvent event_for(const WorkerRecord& rec, PoolEventKind kind, const std::string& detail) {
  PoolEvent ev;
  ev.kind = kind;
  ev.worker_id = rec.id;
  ev.pid = rec.pid;
  ev.daemon_kind = rec.kind();
  ev.fingerprint = rec.fingerprint.short_digest();
  ev.detail = detail;
  return ev;
}

}  // namespace

EvictionPolicy::EvictionPolicy(const PoolConfig& config, DaemonRegistry& registry, PoolStats& stats)
    : config_(config), registry_(registry), stats_(stats) {}

template <typename Pred>
std::vector<EvictionPolicy::RecordPtr> EvictionPolicy::claim_idle(Pred pred) {
  std::vector<RecordPtr> claimed;
  for (const auto& rec : registry_.idle()) {
    if (!pred(*rec)) continue;
    if (rec->try_transition(WorkerState::idle, WorkerState::stopping)) claimed.push_back(rec);
  }
  return claimed;
}

void EvictionPolicy::finalize_stop(const RecordPtr& record, PoolEventKind reason, const std::string& detail) {
  record->client->stop();
  record->state.store(WorkerState::stopped, std::memory_order_release);
  registry_.remove(record->id);
  log::debug("Stopped worker daemon (pid " + std::to_string(record->pid) + ", " + to_string(reason) + ")");
  emit_pool_event(stats_, event_for(*record, reason, detail));
}

void EvictionPolicy::finalize_crash(const RecordPtr& record, const std::string& detail, int exit_status) {
  record->state.store(WorkerState::crashed, std::memory_order_release);
  // Normally already reaped by the failed execute(); this covers the idle case.
  record->client->stop();
  registry_.remove(record->id);
  log::info("Worker daemon (pid " + std::to_string(record->pid) + ") crashed with exit status " +
            std::to_string(exit_status) + ": " + detail);
  emit_pool_event(stats_, event_for(*record, PoolEventKind::crashed, detail));
}

size_t EvictionPolicy::stop_claimed(const std::vector<RecordPtr>& claimed, PoolEventKind reason,
                                    const std::string& detail) {
  for (const auto& rec : claimed) finalize_stop(rec, reason, detail);
  return claimed.size();
}

size_t EvictionPolicy::on_log_level(LogLevel level) {
  // Always scans: a worker Busy at the last change may have gone back to Idle.
  std::lock_guard<std::mutex> lk(level_mu_);
  level_.store(level, std::memory_order_release);
  has_level_.store(true, std::memory_order_release);

  const auto claimed = claim_idle([level](const WorkerRecord& rec) { return rec.fingerprint.log_level != level; });
  if (claimed.empty()) return 0;
  for (size_t i = 0; i < claimed.size(); ++i) log::info(kLogLevelChangedLine);
  const size_t n = stop_claimed(claimed, PoolEventKind::evicted_log_level,
                                std::string("log level changed to ") + std::string(to_string(level)));
  log::info(stopped_line(n));
  return n;
}

bool EvictionPolicy::log_level_out_of_date(LogLevel level) const {
  return has_level_.load(std::memory_order_acquire) && level_.load(std::memory_order_acquire) != level;
}

size_t EvictionPolicy::on_session_end() {
  std::vector<RecordPtr> claimed;
  for (const auto& rec : registry_.all()) {
    if (!config_.is_session_scoped(rec->kind())) continue;
    // Flag first: a release racing with this either sees the flag or leaves
    // the record Idle for the CAS below.
    rec->retire_on_release.store(true);
    if (rec->try_transition(WorkerState::idle, WorkerState::stopping)) claimed.push_back(rec);
  }
  const size_t n = stop_claimed(claimed, PoolEventKind::evicted_session, "session ended");
  if (n > 0) log::info(stopped_line(n));
  return n;
}

size_t EvictionPolicy::stop_all() {
  std::vector<RecordPtr> idle_claimed;
  std::vector<uint64_t> pending;
  size_t busy_killed = 0;

  for (const auto& rec : registry_.all()) {
    while (true) {
      const WorkerState s = rec->current_state();
      if (s == WorkerState::idle) {
        if (!rec->try_transition(WorkerState::idle, WorkerState::stopping)) continue;
        idle_claimed.push_back(rec);
      } else if (s == WorkerState::busy) {
        if (!rec->try_transition(WorkerState::busy, WorkerState::stopping)) continue;
        rec->client->terminate();
        pending.push_back(rec->id);
        ++busy_killed;
      } else if (s == WorkerState::stopping) {
        // Another thread owns this stop; it will remove the record.
        pending.push_back(rec->id);
      }
      break;
    }
  }

  stop_claimed(idle_claimed, PoolEventKind::stopped, "stop requested");
  registry_.wait_until_removed(pending);

  const size_t n = idle_claimed.size() + busy_killed;
  log::info(stopped_line(n));
  return n;
}

size_t EvictionPolicy::expire_idle(uint64_t now_ms) {
  for (const auto& rec : registry_.idle()) {
    if (rec->client->is_alive()) continue;
    if (rec->try_transition(WorkerState::idle, WorkerState::crashed)) {
      finalize_crash(rec, "worker daemon exited while idle", decode_wait_status(rec->client->wait_status()));
    }
  }

  size_t n = 0;
  if (config_.idle_timeout_ms > 0) {
    const uint64_t timeout = config_.idle_timeout_ms;
    const auto claimed = claim_idle([now_ms, timeout](const WorkerRecord& rec) {
      const uint64_t last = rec.last_used_unix_ms.load(std::memory_order_relaxed);
      return now_ms > last && now_ms - last > timeout;
    });
    n += stop_claimed(claimed, PoolEventKind::expired, "idle timeout");
  }

  if (config_.max_idle_workers > 0) {
    auto idle = registry_.idle();
    if (idle.size() > config_.max_idle_workers) {
      std::sort(idle.begin(), idle.end(), [](const RecordPtr& a, const RecordPtr& b) {
        return a->last_used_unix_ms.load(std::memory_order_relaxed) <
               b->last_used_unix_ms.load(std::memory_order_relaxed);
      });
      const size_t surplus = idle.size() - static_cast<size_t>(config_.max_idle_workers);
      std::vector<RecordPtr> claimed;
      for (size_t i = 0; i < surplus; ++i) {
        if (idle[i]->try_transition(WorkerState::idle, WorkerState::stopping)) claimed.push_back(idle[i]);
      }
      n += stop_claimed(claimed, PoolEventKind::expired, "too many idle worker daemons");
    }
  }

  if (n > 0) log::info(stopped_line(n));
  return n;
}

// ---------------------------------------------------------------------------
// ExpirationTask
// ---------------------------------------------------------------------------

ExpirationTask::ExpirationTask(EvictionPolicy& eviction, uint64_t interval_ms)
    : eviction_(eviction), interval_ms_(interval_ms == 0 ? 1000 : interval_ms) {}

ExpirationTask::~ExpirationTask() { stop(); }

void ExpirationTask::start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void ExpirationTask::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ExpirationTask::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_), [this] { return stop_requested_; })) return;
    }
    eviction_.expire_idle(now_unix_ms());
  }
}

}  // namespace kiln
