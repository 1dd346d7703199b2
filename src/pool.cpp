#include "kiln/pool.hpp"

#include <sstream>

#include "kiln/jsonlite.hpp"
#include "kiln/log.hpp"

namespace kiln {

std::string ExecutionReport::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok() ? "true" : "false");
  if (error != ErrorCode::none) {
    o << ",\"error\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jsonlite::escape(error_detail) << "\"}";
    return o.str();
  }
  o << ",\"outcome\":\"" << to_string(outcome.kind) << "\""
    << ",\"value\":\"" << jsonlite::escape(outcome.value) << "\""
    << ",\"detail\":\"" << jsonlite::escape(outcome.detail) << "\"";
  if (outcome.crashed()) o << ",\"exit_status\":" << outcome.exit_status;
  o << ",\"worker_id\":" << worker_id
    << ",\"pid\":" << pid
    << ",\"reused\":" << (reused ? "true" : "false")
    << "}";
  return o.str();
}

WorkerPool::WorkerPool(PoolConfig config)
    : config_(std::move(config)),
      eviction_(config_, registry_, stats_),
      allocator_(config_, registry_, stats_, eviction_),
      expiration_(eviction_, config_.expiration_interval_ms) {
  if (config_.idle_timeout_ms > 0 || config_.max_idle_workers > 0) expiration_.start();
}

WorkerPool::~WorkerPool() { shutdown(); }

Session WorkerPool::begin_session(LogLevel level) {
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    session_.id = ++next_session_id_;
    session_.log_level = level;
    session_.active = true;
  }
  eviction_.on_log_level(level);
  return current_session();
}

size_t WorkerPool::end_session() {
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    session_.active = false;
  }
  return eviction_.on_session_end();
}

Session WorkerPool::current_session() const {
  std::lock_guard<std::mutex> lk(session_mu_);
  return session_;
}

Allocation WorkerPool::allocate(const WorkItem& item) { return allocator_.allocate(item); }

void WorkerPool::release(const Allocation& allocation, const ActionOutcome& outcome) {
  allocator_.release(allocation, outcome);
}

ExecutionReport WorkerPool::execute(const WorkItem& item) {
  ExecutionReport report;
  const Allocation a = allocator_.allocate(item);
  if (!a.ok()) {
    report.error = a.error;
    report.error_detail = a.error_detail;
    return report;
  }
  report.worker_id = a.record->id;
  report.pid = a.record->pid;
  report.reused = a.reused;
  report.outcome = a.record->client->execute(item.action);
  allocator_.release(a, report.outcome);
  return report;
}

size_t WorkerPool::stop_all() { return eviction_.stop_all(); }

size_t WorkerPool::expire_now() { return eviction_.expire_idle(now_unix_ms()); }

void WorkerPool::shutdown() {
  std::call_once(shutdown_once_, [this] {
    expiration_.stop();
    allocator_.close();
    if (registry_.size() > 0) eviction_.stop_all();
  });
}

std::string WorkerPool::status_json() const {
  const Session s = current_session();
  std::ostringstream o;
  o << "{\"session\":{\"id\":" << s.id
    << ",\"log_level\":\"" << to_string(s.log_level) << "\""
    << ",\"active\":" << (s.active ? "true" : "false") << "}"
    << ",\"shut_down\":" << (allocator_.closed() ? "true" : "false")
    << ",\"workers\":" << registry_.workers_to_json()
    << ",\"stats\":" << stats_.to_json()
    << "}";
  return o.str();
}

}  // namespace kiln
