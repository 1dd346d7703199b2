#include "kiln/allocator.hpp"

#include "kiln/log.hpp"
#include "kiln/process.hpp"

namespace kiln {

namespace {

PoolEvent record_event(const WorkerRecord& rec, PoolEventKind kind, const std::string& detail = "") {
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

WorkerAllocator::WorkerAllocator(const PoolConfig& config, DaemonRegistry& registry, PoolStats& stats,
                                 EvictionPolicy& eviction)
    : config_(config), registry_(registry), stats_(stats), eviction_(eviction) {}

std::shared_ptr<WorkerRecord> WorkerAllocator::claim_idle_match(const Fingerprint& fp) {
  for (const auto& rec : registry_.idle()) {
    if (rec->fingerprint != fp) continue;
    if (!rec->try_transition(WorkerState::idle, WorkerState::busy)) continue;
    if (!rec->client->is_alive()) {
      eviction_.finalize_crash(rec, "worker daemon exited while idle",
                               decode_wait_status(rec->client->wait_status()));
      continue;
    }
    return rec;
  }
  return nullptr;
}

Allocation WorkerAllocator::spawn(const WorkItem& item) {
  Allocation a;
  WorkerLaunchOptions options;
  options.executable = config_.worker_executable;
  options.parent_poll_ms = config_.parent_poll_ms;
  options.stop_grace_ms = config_.stop_grace_ms;

  auto client = std::make_unique<WorkerClient>(item.fingerprint, options);
  const auto started = std::chrono::steady_clock::now();
  if (!client->start(config_.ready_timeout_ms, &a.error, &a.error_detail)) {
    log::error("Failed to start kiln worker daemon: " + a.error_detail);
    PoolEvent ev;
    ev.kind = PoolEventKind::spawn_failed;
    ev.daemon_kind = item.fingerprint.kind;
    ev.fingerprint = item.fingerprint.short_digest();
    ev.detail = to_string(a.error) + ": " + a.error_detail;
    emit_pool_event(stats_, ev);
    return a;
  }
  const auto startup = std::chrono::steady_clock::now() - started;
  const auto startup_ms = std::chrono::duration_cast<std::chrono::milliseconds>(startup).count();

  auto rec = std::make_shared<WorkerRecord>(registry_.next_id(), std::move(client), WorkerState::starting);
  // Not yet published, so these cannot fail.
  rec->try_transition(WorkerState::starting, WorkerState::idle);
  rec->try_transition(WorkerState::idle, WorkerState::busy);
  registry_.add(rec);

  log::info("Started kiln worker daemon (pid " + std::to_string(rec->pid) + ", kind " +
            (rec->kind().empty() ? std::string("default") : rec->kind()) + ", " + std::to_string(startup_ms) +
            " ms) with fingerprint " + rec->fingerprint.short_digest() + ".");
  PoolEvent ev = record_event(*rec, PoolEventKind::spawned);
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(startup).count());
  emit_pool_event(stats_, ev);

  a.record = std::move(rec);
  return a;
}

Allocation WorkerAllocator::allocate(const WorkItem& item) {
  if (closed()) {
    Allocation a;
    a.error = ErrorCode::pool_shut_down;
    a.error_detail = "worker pool has been shut down";
    return a;
  }

  eviction_.on_log_level(item.fingerprint.log_level);

  Allocation a;
  if (auto rec = claim_idle_match(item.fingerprint)) {
    a.record = std::move(rec);
    a.reused = true;
    log::debug("Reusing worker daemon (pid " + std::to_string(a.record->pid) + ")");
    emit_pool_event(stats_, record_event(*a.record, PoolEventKind::reused));
  } else {
    a = spawn(item);
    if (!a.ok()) return a;
  }
  a.acquired_at = std::chrono::steady_clock::now();
  return a;
}

void WorkerAllocator::release(const Allocation& allocation, const ActionOutcome& outcome) {
  const auto& rec = allocation.record;
  if (!rec) return;

  rec->uses.fetch_add(1, std::memory_order_relaxed);
  rec->touch();

  PoolEvent done = record_event(*rec, outcome.ok() ? PoolEventKind::released : PoolEventKind::action_failed,
                                outcome.ok() ? std::string() : outcome.detail);
  done.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - allocation.acquired_at).count());
  emit_pool_event(stats_, done);

  if (outcome.crashed()) {
    if (rec->try_transition(WorkerState::busy, WorkerState::crashed)) {
      eviction_.finalize_crash(rec, outcome.detail, outcome.exit_status);
    } else {
      // stop_all() killed it; the stop was already counted there.
      eviction_.finalize_stop(rec, PoolEventKind::stopped, "stopped while busy");
    }
    return;
  }

  // Stop owed by the released worker; `released` when it may go back to Idle.
  const auto owed_stop = [this, &rec]() {
    if (rec->retire_on_release.load()) return PoolEventKind::evicted_session;
    if (closed()) return PoolEventKind::stopped;
    if (eviction_.log_level_out_of_date(rec->fingerprint.log_level)) return PoolEventKind::evicted_log_level;
    return PoolEventKind::released;
  };
  const auto retire = [this, &rec](PoolEventKind kind) {
    switch (kind) {
      case PoolEventKind::evicted_session:
        eviction_.finalize_stop(rec, kind, "retired at session end");
        break;
      case PoolEventKind::evicted_log_level:
        log::info(kLogLevelChangedLine);
        eviction_.finalize_stop(rec, kind, "log level changed while busy");
        break;
      default:
        eviction_.finalize_stop(rec, PoolEventKind::stopped, "pool shut down");
        break;
    }
    log::info(stopped_line(1));
  };

  PoolEventKind owed = owed_stop();
  if (owed != PoolEventKind::released && rec->try_transition(WorkerState::busy, WorkerState::stopping)) {
    retire(owed);
    return;
  }

  if (rec->try_transition(WorkerState::busy, WorkerState::idle)) {
    // Session end or a level change may have landed between the check above
    // and the swap.
    owed = owed_stop();
    if (owed != PoolEventKind::released && rec->try_transition(WorkerState::idle, WorkerState::stopping)) {
      retire(owed);
    }
    return;
  }

  // Moved to Stopping by stop_all() while the action was finishing.
  eviction_.finalize_stop(rec, PoolEventKind::stopped, "stopped while busy");
}

}  // namespace kiln
