#include "kiln/worker_client.hpp"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <climits>
#include <thread>

#include "kiln/log.hpp"
#include "kiln/process.hpp"
#include "kiln/version.hpp"

namespace kiln {

std::vector<std::string> worker_arguments(const Fingerprint& fp, const WorkerLaunchOptions& options, int parent_pid) {
  std::vector<std::string> args = {
      "--parent-pid",     std::to_string(parent_pid),
      "--parent-poll-ms", std::to_string(options.parent_poll_ms),
      "--log-level",      std::string(to_string(fp.log_level)),
      "--kind",           fp.kind,
      "--fingerprint",    fp.short_digest(),
  };
  for (const auto& entry : fp.classpath) {
    args.push_back("--classpath");
    args.push_back(entry);
  }
  args.push_back("--");
  args.insert(args.end(), fp.vm_args.begin(), fp.vm_args.end());
  return args;
}

WorkerClient::WorkerClient(Fingerprint fingerprint, WorkerLaunchOptions options)
    : fingerprint_(std::move(fingerprint)),
      options_(std::move(options)),
      channel_(std::make_unique<protocol::LineChannel>()) {}

WorkerClient::~WorkerClient() {
  if (pid_ > 0) ensure_reaped(0);
}

bool WorkerClient::reap_locked(int* status) {
  if (!reaped_) {
    if (pid_ <= 0) {
      reaped_ = true;
    } else {
      int st = 0;
      if (try_reap(pid_, &st)) {
        reaped_ = true;
        status_ = st;
      }
    }
  }
  if (reaped_ && status) *status = status_;
  return reaped_;
}

void WorkerClient::ensure_reaped(uint64_t timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  bool killed = false;
  while (true) {
    {
      std::lock_guard<std::mutex> lk(proc_mu_);
      if (reap_locked(nullptr)) return;
      if (!killed && std::chrono::steady_clock::now() >= deadline) {
        ::kill(pid_, SIGKILL);
        killed = true;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

bool WorkerClient::start(uint64_t ready_timeout_ms, ErrorCode* code, std::string* detail) {
  const auto fail = [&](ErrorCode c, std::string d) {
    if (code) *code = c;
    if (detail) *detail = std::move(d);
    return false;
  };

  SpawnedProcess sp;
  std::string err;
  if (!spawn_with_channel(options_.executable, worker_arguments(fingerprint_, options_, ::getpid()), &sp, &err)) {
    std::lock_guard<std::mutex> lk(proc_mu_);
    reaped_ = true;
    return fail(ErrorCode::spawn_failed, err);
  }
  pid_ = sp.pid;
  channel_ = std::make_unique<protocol::LineChannel>(sp.channel_fd);

  const int timeout = ready_timeout_ms > static_cast<uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(ready_timeout_ms);
  std::string line;
  const auto st = channel_->read_line(&line, timeout);
  if (st == protocol::LineChannel::ReadStatus::timeout) {
    ensure_reaped(0);
    channel_->close();
    return fail(ErrorCode::ready_timeout,
                "worker daemon (pid " + std::to_string(pid_) + ") did not become ready within " +
                    std::to_string(ready_timeout_ms) + " ms");
  }
  if (st != protocol::LineChannel::ReadStatus::ok) {
    channel_->close();
    ensure_reaped(options_.stop_grace_ms);
    return fail(ErrorCode::spawn_failed,
                "worker daemon (pid " + std::to_string(pid_) + ") exited before becoming ready (" +
                    describe_wait_status(wait_status()) + ")");
  }

  const protocol::Frame frame = protocol::decode(line);
  if (frame.type != protocol::FrameType::ready) {
    ensure_reaped(0);
    channel_->close();
    return fail(ErrorCode::spawn_failed, "unexpected frame before ready: " + line);
  }
  const auto compat = version::check_protocol(frame.protocol);
  if (!compat.ok) {
    ensure_reaped(0);
    channel_->close();
    return fail(ErrorCode::protocol_mismatch, compat.description);
  }
  return true;
}

ActionOutcome WorkerClient::execute(const Action& action) {
  const uint64_t id = ++next_action_id_;

  const auto crash = [this]() {
    channel_->close();
    ensure_reaped(options_.stop_grace_ms);
    const int status = wait_status();
    if (terminated_.load(std::memory_order_acquire)) {
      return ActionOutcome::process_crash("worker daemon was stopped while busy", decode_wait_status(status));
    }
    return ActionOutcome::process_crash(
        "worker daemon (pid " + std::to_string(pid_) + ") exited unexpectedly: " + describe_wait_status(status),
        decode_wait_status(status));
  };

  if (!channel_->write_line(protocol::encode_action(id, action))) return crash();

  std::string line;
  while (true) {
    if (channel_->read_line(&line, -1) != protocol::LineChannel::ReadStatus::ok) return crash();
    const protocol::Frame frame = protocol::decode(line);
    if (frame.type == protocol::FrameType::result && frame.id == id) {
      if (frame.ok) return ActionOutcome::success(frame.value);
      return ActionOutcome::user_failure(frame.detail.empty() ? frame.value : frame.detail);
    }
    log::warn("ignoring unexpected frame from worker daemon (pid " + std::to_string(pid_) + "): " + line);
  }
}

void WorkerClient::stop() {
  {
    std::lock_guard<std::mutex> lk(proc_mu_);
    if (reap_locked(nullptr)) {
      channel_->close();
      return;
    }
  }
  // A failed write means the worker is already gone; reaping below covers it.
  if (!channel_->write_line(protocol::encode_stop())) {
    log::debug("worker daemon (pid " + std::to_string(pid_) + ") channel already closed");
  }
  ensure_reaped(options_.stop_grace_ms);
  channel_->close();
}

void WorkerClient::terminate() {
  terminated_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lk(proc_mu_);
  if (!reap_locked(nullptr)) ::kill(pid_, SIGKILL);
}

bool WorkerClient::is_alive() {
  std::lock_guard<std::mutex> lk(proc_mu_);
  return !reap_locked(nullptr);
}

int WorkerClient::wait_status() {
  std::lock_guard<std::mutex> lk(proc_mu_);
  return reaped_ ? status_ : 0;
}

}  // namespace kiln
