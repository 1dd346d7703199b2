#pragma once

// kiln/types.hpp - Core value types shared by the pool, the allocator and the worker.
//
// DESIGN:
//   Everything in this header is a plain value type. No type here owns an OS
//   resource; process handles live in WorkerClient (worker_client.hpp) and
//   nowhere else.
//
// ERROR MODEL:
//   kiln does not throw across its public API. Operations that can fail return
//   a result struct carrying an ErrorCode plus a human-readable detail string,
//   in the same way for every module.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kiln {

enum class ErrorCode {
  none,
  spawn_failed,        // fork/exec of the worker executable failed
  ready_timeout,       // worker did not send its ready frame in time
  protocol_mismatch,   // worker speaks another framing version
  pool_shut_down,      // allocation attempted after WorkerPool::shutdown()
  config_invalid,
  json_parse_error,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// LogLevel - ordered from most to least verbose.
// ---------------------------------------------------------------------------
// Used for two things: the host logger threshold, and the log level a worker
// daemon was started with (part of its Fingerprint).
enum class LogLevel {
  debug,
  info,
  lifecycle,
  warn,
  quiet,
  error,
};

std::string_view to_string(LogLevel level);

// Accepts the lower-case names above plus "warning". Returns nullopt otherwise.
std::optional<LogLevel> parse_log_level(std::string_view text);

// ---------------------------------------------------------------------------
// WorkerState - lifecycle of a tracked worker daemon.
// ---------------------------------------------------------------------------
//   starting -> idle -> busy -> idle ...
//   idle|busy -> stopping -> stopped
//   busy|idle -> crashed
// stopped and crashed are terminal; such records leave the registry.
enum class WorkerState : uint8_t {
  starting,
  idle,
  busy,
  stopping,
  stopped,
  crashed,
};

std::string_view to_string(WorkerState state);

inline bool is_terminal(WorkerState state) {
  return state == WorkerState::stopped || state == WorkerState::crashed;
}

// ---------------------------------------------------------------------------
// Action - the opaque unit of work sent to a worker.
// ---------------------------------------------------------------------------
// `type` selects the handler inside the worker; `payload` is never inspected
// by the host.
struct Action {
  std::string type;
  std::string payload;
};

// ---------------------------------------------------------------------------
// ActionOutcome - tagged result of one Busy period.
// ---------------------------------------------------------------------------
// success        : handler completed, `value` holds its result.
// user_failure   : handler reported an error; the worker process is healthy.
// process_crash  : the worker exited or its channel closed outside the protocol.
//                  `exit_status` holds the decoded status when it was reaped.
struct ActionOutcome {
  enum class Kind { success, user_failure, process_crash };

  Kind kind{Kind::success};
  std::string value;
  std::string detail;
  int exit_status{0};

  bool ok() const { return kind == Kind::success; }
  bool crashed() const { return kind == Kind::process_crash; }

  static ActionOutcome success(std::string value);
  static ActionOutcome user_failure(std::string detail);
  static ActionOutcome process_crash(std::string detail, int exit_status);
};

std::string_view to_string(ActionOutcome::Kind kind);

}  // namespace kiln
