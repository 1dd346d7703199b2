#pragma once

// kiln/config.hpp - Pool configuration.
//
// Every field has a working default. PoolConfig::from_env() overlays KILN_*
// environment variables; from_json() overlays a config file in the same flat
// shape that `kiln config show` prints.

#include <cstdint>
#include <string>
#include <vector>

#include "kiln/types.hpp"

namespace kiln {

/// @brief Tunables of one WorkerPool.
///
/// Durations are milliseconds. A zero idle_timeout_ms or max_idle_workers
/// disables that expiration rule.
struct PoolConfig {
  /// Path of the kiln-worker executable. Defaults to kiln-worker next to the
  /// running executable. KILN_WORKER_EXECUTABLE.
  std::string worker_executable;
  /// Bound on spawn-to-ready. KILN_READY_TIMEOUT_MS.
  uint64_t ready_timeout_ms{10000};
  /// Time a worker gets to exit after a stop frame before SIGKILL. KILN_STOP_GRACE_MS.
  uint64_t stop_grace_ms{2000};
  /// Parent-liveness poll interval passed to each worker. KILN_PARENT_POLL_MS.
  uint64_t parent_poll_ms{1000};
  /// Idle workers unused for longer than this are stopped. KILN_IDLE_TIMEOUT_MS.
  uint64_t idle_timeout_ms{0};
  /// Upper bound on Idle workers; least recently used surplus is stopped.
  /// KILN_MAX_IDLE_WORKERS.
  uint64_t max_idle_workers{0};
  /// Period of the expiration pass. KILN_EXPIRATION_INTERVAL_MS.
  uint64_t expiration_interval_ms{1000};
  /// Daemon kinds torn down at the end of every session. KILN_SESSION_SCOPED_KINDS
  /// (comma-separated).
  std::vector<std::string> session_scoped_kinds{"compiler"};
  /// Host logger threshold. KILN_LOG_LEVEL.
  LogLevel log_level{LogLevel::lifecycle};

  bool is_session_scoped(const std::string& kind) const;

  /// Defaults overlaid with KILN_* variables. Malformed values are ignored with
  /// a warning.
  static PoolConfig from_env();

  /// Overlays the keys present in `json` onto this config. Returns false and
  /// sets *error on a malformed value; the config is left unchanged then.
  bool merge_json(const std::string& json, std::string* error);

  std::string to_json() const;
};

/// Location of kiln-worker beside the running executable (via /proc/self/exe).
std::string default_worker_executable();

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/// Checks a config document: value types, ranges, unknown keys (warning) and
/// whether the worker executable exists and is executable.
ConfigValidationResult validate_config(const std::string& json);

std::string to_json(const ConfigValidationResult& r);

}  // namespace kiln
