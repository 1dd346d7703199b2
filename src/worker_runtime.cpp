#include "kiln/worker_runtime.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "kiln/jsonlite.hpp"
#include "kiln/log.hpp"

namespace kiln {

namespace {

bool parse_number(const std::string& text, uint64_t* out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
  try {
    *out = std::stoull(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

std::string properties_json(const std::map<std::string, std::string>& props) {
  std::string o = "{";
  bool first = true;
  for (const auto& [k, v] : props) {
    if (!first) o += ',';
    first = false;
    o += "\"" + jsonlite::escape(k) + "\":\"" + jsonlite::escape(v) + "\"";
  }
  o += "}";
  return o;
}

ActionReply handle_echo(const std::string& payload, const WorkerSettings&) {
  return ActionReply::success(payload);
}

ActionReply handle_identify(const std::string&, const WorkerSettings& s) {
  std::ostringstream o;
  o << "{\"pid\":" << ::getpid()
    << ",\"parent_pid\":" << ::getppid()
    << ",\"log_level\":\"" << to_string(s.log_level) << "\""
    << ",\"kind\":\"" << jsonlite::escape(s.kind) << "\""
    << ",\"fingerprint\":\"" << jsonlite::escape(s.fingerprint) << "\""
    << ",\"classpath\":" << jsonlite::string_array(s.classpath)
    << ",\"vm_args\":" << jsonlite::string_array(s.vm_args)
    << ",\"properties\":" << properties_json(s.properties)
    << "}";
  return ActionReply::success(o.str());
}

ActionReply handle_fail(const std::string& payload, const WorkerSettings&) {
  std::string message = jsonlite::get_string(payload, "message");
  if (message.empty()) message = payload.empty() ? "action failed" : payload;
  return ActionReply::failure(message);
}

ActionReply handle_exit(const std::string& payload, const WorkerSettings&) {
  const int code = static_cast<int>(jsonlite::get_u64(payload, "code", 1));
  log::debug("exit action, terminating with code " + std::to_string(code));
  std::fflush(stderr);
  _exit(code);
}

ActionReply handle_sleep(const std::string& payload, const WorkerSettings&) {
  const uint64_t ms = jsonlite::get_u64(payload, "ms", 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  return ActionReply::success(std::to_string(ms));
}

ActionReply handle_write_files(const std::string& payload, const WorkerSettings&) {
  const std::string pid = std::to_string(::getpid());
  for (const auto& path : jsonlite::get_string_array(payload, "files")) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << pid;
    if (!out.flush()) throw std::runtime_error("cannot write " + path);
  }
  return ActionReply::success(pid);
}

ActionReply handle_run(const std::string& payload, const WorkerSettings&) {
  ProcessSpec spec;
  spec.command = jsonlite::get_string(payload, "command");
  if (spec.command.empty()) return ActionReply::failure("run: missing command");
  spec.argv = jsonlite::get_string_array(payload, "args");
  spec.cwd = jsonlite::get_string(payload, "cwd");
  spec.timeout_ms = jsonlite::get_u64(payload, "timeout_ms", spec.timeout_ms);
  spec.max_output_bytes = static_cast<size_t>(jsonlite::get_u64(payload, "max_output_bytes", spec.max_output_bytes));

  const ProcessResult r = run_process(spec);
  if (!r.error_message.empty()) return ActionReply::failure("run: " + r.error_message);

  std::ostringstream o;
  o << "{\"exit_code\":" << r.exit_code
    << ",\"timed_out\":" << (r.timed_out ? "true" : "false")
    << ",\"stdout\":\"" << jsonlite::escape(r.stdout_text) << "\""
    << ",\"stderr\":\"" << jsonlite::escape(r.stderr_text) << "\""
    << "}";
  if (r.timed_out) return ActionReply{false, o.str(), "run: timed out after " + std::to_string(spec.timeout_ms) + " ms"};
  if (r.exit_code != 0) return ActionReply{false, o.str(), "run: exit code " + std::to_string(r.exit_code)};
  return ActionReply::success(o.str());
}

}  // namespace

bool parse_worker_args(const std::vector<std::string>& args, WorkerSettings* out, std::string* error) {
  WorkerSettings s;
  const auto fail = [error](std::string message) {
    if (error) *error = std::move(message);
    return false;
  };

  size_t i = 0;
  for (; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "--") {
      ++i;
      break;
    }
    if (i + 1 >= args.size()) return fail("missing value for " + a);
    const std::string& v = args[++i];
    uint64_t n = 0;
    if (a == "--channel-fd") {
      if (!parse_number(v, &n)) return fail("malformed --channel-fd: " + v);
      s.channel_fd = static_cast<int>(n);
    } else if (a == "--parent-pid") {
      if (!parse_number(v, &n)) return fail("malformed --parent-pid: " + v);
      s.parent_pid = static_cast<int>(n);
    } else if (a == "--parent-poll-ms") {
      if (!parse_number(v, &n) || n == 0) return fail("malformed --parent-poll-ms: " + v);
      s.parent_poll_ms = n;
    } else if (a == "--log-level") {
      auto level = parse_log_level(v);
      if (!level) return fail("unknown --log-level: " + v);
      s.log_level = *level;
    } else if (a == "--kind") {
      s.kind = v;
    } else if (a == "--fingerprint") {
      s.fingerprint = v;
    } else if (a == "--classpath") {
      s.classpath.push_back(v);
    } else {
      return fail("unknown option: " + a);
    }
  }

  for (; i < args.size(); ++i) {
    const std::string& arg = args[i];
    s.vm_args.push_back(arg);
    if (arg.rfind("-D", 0) == 0 && arg.size() > 2) {
      const auto eq = arg.find('=');
      if (eq == std::string::npos) {
        s.properties[arg.substr(2)] = "";
      } else {
        s.properties[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
      }
    }
  }
  *out = std::move(s);
  return true;
}

WorkerRuntime::WorkerRuntime(WorkerSettings settings) : settings_(std::move(settings)) {}

void WorkerRuntime::register_handler(const std::string& type, ActionHandler handler) {
  handlers_[type] = std::move(handler);
}

void WorkerRuntime::register_builtin_handlers() {
  register_handler("echo", handle_echo);
  register_handler("identify", handle_identify);
  register_handler("fail", handle_fail);
  register_handler("exit", handle_exit);
  register_handler("sleep", handle_sleep);
  register_handler("write_files", handle_write_files);
  register_handler("run", handle_run);
}

ActionReply WorkerRuntime::dispatch(const protocol::Frame& frame) const {
  auto it = handlers_.find(frame.action);
  if (it == handlers_.end()) return ActionReply::failure("unknown action type: " + frame.action);
  try {
    return it->second(frame.payload, settings_);
  } catch (const std::exception& e) {
    return ActionReply::failure(e.what());
  }
}

int WorkerRuntime::run() {
  // Commands started by the run action must not inherit the channel.
  ::fcntl(settings_.channel_fd, F_SETFD, FD_CLOEXEC);
  protocol::LineChannel channel(settings_.channel_fd);

  if (!channel.write_line(protocol::encode_ready(::getpid()))) {
    log::error("cannot write ready frame to fd " + std::to_string(settings_.channel_fd));
    return 1;
  }
  log::debug("worker daemon ready");

  std::string line;
  while (true) {
    const auto st = channel.read_line(&line, -1);
    if (st == protocol::LineChannel::ReadStatus::eof) {
      log::debug("channel closed by host, exiting");
      return 0;
    }
    if (st != protocol::LineChannel::ReadStatus::ok) {
      log::error("channel read failed, exiting");
      return 1;
    }

    const protocol::Frame frame = protocol::decode(line);
    switch (frame.type) {
      case protocol::FrameType::stop:
        log::debug("stop requested");
        return 0;
      case protocol::FrameType::action: {
        const ActionReply reply = dispatch(frame);
        if (!channel.write_line(protocol::encode_result(frame.id, reply.ok, reply.value, reply.detail))) {
          log::debug("host went away before the result was delivered");
          return 0;
        }
        break;
      }
      default:
        log::warn("ignoring unexpected frame: " + line);
        break;
    }
  }
}

}  // namespace kiln
