#pragma once

// kiln/worker_runtime.hpp - The worker daemon side of the protocol.
//
// kiln-worker parses its command line into WorkerSettings, announces itself
// with a ready frame, then serves action frames one at a time until the host
// sends a stop frame or closes the channel.
//
// Handlers are looked up by action type. A handler reports a user failure by
// returning ActionReply::failure() or by throwing a std::exception; either way
// the worker stays up. Built-in handlers:
//   echo         value = payload
//   identify     pid, parent pid, log level, kind, classpath, vm args, properties
//   fail         failure with payload "message"
//   exit         _exit(payload "code"), used to simulate a crash
//   sleep        sleeps payload "ms" milliseconds
//   write_files  writes the worker pid into every path in payload "files"
//   run          runs payload "command" with "args", bounded by "timeout_ms"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "kiln/process.hpp"
#include "kiln/protocol.hpp"
#include "kiln/types.hpp"

namespace kiln {

struct WorkerSettings {
  int channel_fd{WORKER_CHANNEL_FD};
  int parent_pid{0};
  uint64_t parent_poll_ms{1000};
  LogLevel log_level{LogLevel::lifecycle};
  std::string kind;
  std::string fingerprint;
  std::vector<std::string> classpath;
  std::vector<std::string> vm_args;
  // -Dkey=value VM arguments.
  std::map<std::string, std::string> properties;
};

// Parses kiln-worker arguments (without argv[0]). Returns false and sets
// *error on an unknown option or a malformed value.
bool parse_worker_args(const std::vector<std::string>& args, WorkerSettings* out, std::string* error);

struct ActionReply {
  bool ok{true};
  std::string value;
  std::string detail;

  static ActionReply success(std::string value) { return ActionReply{true, std::move(value), {}}; }
  static ActionReply failure(std::string detail) { return ActionReply{false, {}, std::move(detail)}; }
};

using ActionHandler = std::function<ActionReply(const std::string& payload, const WorkerSettings& settings)>;

class WorkerRuntime {
 public:
  explicit WorkerRuntime(WorkerSettings settings);

  void register_handler(const std::string& type, ActionHandler handler);
  void register_builtin_handlers();

  // Serves the channel. Returns the process exit code: 0 after a stop frame
  // or channel EOF, 1 if the channel is unusable.
  int run();

  const WorkerSettings& settings() const { return settings_; }

 private:
  ActionReply dispatch(const protocol::Frame& frame) const;

  WorkerSettings settings_;
  std::map<std::string, ActionHandler> handlers_;
};

}  // namespace kiln
