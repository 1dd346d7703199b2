#include "kiln/registry.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "kiln/jsonlite.hpp"

namespace kiln {

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

WorkerRecord::WorkerRecord(uint64_t worker_id, std::unique_ptr<WorkerClient> worker_client, WorkerState initial)
    : id(worker_id),
      pid(worker_client->pid()),
      fingerprint(worker_client->fingerprint()),
      created_at_unix_ms(now_unix_ms()),
      client(std::move(worker_client)),
      state(initial),
      last_used_unix_ms(created_at_unix_ms) {}

int DaemonRegistry::find_index(uint64_t id) const {
  for (size_t i = 0; i < workers_.size(); ++i) {
    if (workers_[i]->id == id) return static_cast<int>(i);
  }
  return -1;
}

void DaemonRegistry::add(RecordPtr record) {
  std::lock_guard<std::mutex> lk(mu_);
  workers_.push_back(std::move(record));
}

bool DaemonRegistry::remove(uint64_t id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    const int idx = find_index(id);
    if (idx < 0) return false;
    workers_.erase(workers_.begin() + idx);
  }
  removed_cv_.notify_all();
  return true;
}

DaemonRegistry::RecordPtr DaemonRegistry::find(uint64_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const int idx = find_index(id);
  return idx < 0 ? nullptr : workers_[static_cast<size_t>(idx)];
}

std::vector<DaemonRegistry::RecordPtr> DaemonRegistry::all() const {
  std::lock_guard<std::mutex> lk(mu_);
  return workers_;
}

std::vector<DaemonRegistry::RecordPtr> DaemonRegistry::idle() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<RecordPtr> out;
  for (const auto& w : workers_) {
    if (w->current_state() == WorkerState::idle) out.push_back(w);
  }
  return out;
}

size_t DaemonRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return workers_.size();
}

void DaemonRegistry::wait_until_removed(const std::vector<uint64_t>& ids) const {
  std::unique_lock<std::mutex> lk(mu_);
  removed_cv_.wait(lk, [&] {
    return std::none_of(ids.begin(), ids.end(), [&](uint64_t id) { return find_index(id) >= 0; });
  });
}

std::vector<WorkerSnapshot> DaemonRegistry::snapshot() const {
  std::vector<WorkerSnapshot> out;
  for (const auto& w : all()) {
    WorkerSnapshot s;
    s.id = w->id;
    s.pid = w->pid;
    s.fingerprint = w->fingerprint.short_digest();
    s.kind = w->kind();
    s.log_level = w->fingerprint.log_level;
    s.state = w->current_state();
    s.created_at_unix_ms = w->created_at_unix_ms;
    s.last_used_unix_ms = w->last_used_unix_ms.load(std::memory_order_relaxed);
    s.uses = w->uses.load(std::memory_order_relaxed);
    out.push_back(std::move(s));
  }
  return out;
}

std::string DaemonRegistry::workers_to_json() const {
  std::ostringstream o;
  o << "[";
  bool first = true;
  for (const auto& s : snapshot()) {
    if (!first) o << ",";
    first = false;
    o << "{\"id\":" << s.id
      << ",\"pid\":" << s.pid
      << ",\"fingerprint\":\"" << s.fingerprint << "\""
      << ",\"kind\":\"" << jsonlite::escape(s.kind) << "\""
      << ",\"log_level\":\"" << to_string(s.log_level) << "\""
      << ",\"state\":\"" << to_string(s.state) << "\""
      << ",\"created_at_unix_ms\":" << s.created_at_unix_ms
      << ",\"last_used_unix_ms\":" << s.last_used_unix_ms
      << ",\"uses\":" << s.uses
      << "}";
  }
  o << "]";
  return o.str();
}

}  // namespace kiln
