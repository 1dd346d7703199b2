#include "kiln/types.hpp"

#include <utility>

namespace kiln {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::ready_timeout: return "ready_timeout";
    case ErrorCode::protocol_mismatch: return "protocol_mismatch";
    case ErrorCode::pool_shut_down: return "pool_shut_down";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
  }
  return "";
}

std::string_view to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::lifecycle: return "lifecycle";
    case LogLevel::warn: return "warn";
    case LogLevel::quiet: return "quiet";
    case LogLevel::error: return "error";
  }
  return "lifecycle";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
  if (text == "debug") return LogLevel::debug;
  if (text == "info") return LogLevel::info;
  if (text == "lifecycle") return LogLevel::lifecycle;
  if (text == "warn" || text == "warning") return LogLevel::warn;
  if (text == "quiet") return LogLevel::quiet;
  if (text == "error") return LogLevel::error;
  return std::nullopt;
}

std::string_view to_string(WorkerState state) {
  switch (state) {
    case WorkerState::starting: return "starting";
    case WorkerState::idle: return "idle";
    case WorkerState::busy: return "busy";
    case WorkerState::stopping: return "stopping";
    case WorkerState::stopped: return "stopped";
    case WorkerState::crashed: return "crashed";
  }
  return "unknown";
}

std::string_view to_string(ActionOutcome::Kind kind) {
  switch (kind) {
    case ActionOutcome::Kind::success: return "success";
    case ActionOutcome::Kind::user_failure: return "user_failure";
    case ActionOutcome::Kind::process_crash: return "process_crash";
  }
  return "unknown";
}

ActionOutcome ActionOutcome::success(std::string value) {
  ActionOutcome o;
  o.kind = Kind::success;
  o.value = std::move(value);
  return o;
}

ActionOutcome ActionOutcome::user_failure(std::string detail) {
  ActionOutcome o;
  o.kind = Kind::user_failure;
  o.detail = std::move(detail);
  return o;
}

ActionOutcome ActionOutcome::process_crash(std::string detail, int exit_status) {
  ActionOutcome o;
  o.kind = Kind::process_crash;
  o.detail = std::move(detail);
  o.exit_status = exit_status;
  return o;
}

}  // namespace kiln
