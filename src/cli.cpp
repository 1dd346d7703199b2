#include <signal.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "kiln/config.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/jsonlite.hpp"
#include "kiln/log.hpp"
#include "kiln/pool.hpp"
#include "kiln/version.hpp"

#ifndef KILN_VERSION
#define KILN_VERSION "0.1.0"
#endif

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

void usage() {
  std::cerr << "usage: kiln <command>\n"
               "  version                       version manifest\n"
               "  fingerprint <requirements>    fingerprint of a requirements JSON file\n"
               "  config show                   effective pool configuration\n"
               "  config validate <file>        check a pool configuration file\n"
               "  batch [--log-level L] [--config F]\n"
               "                                host a pool; NDJSON commands on stdin\n";
}

std::string error_line(const std::string& op, kiln::ErrorCode code, const std::string& detail) {
  return "{\"op\":\"" + kiln::jsonlite::escape(op) + "\",\"ok\":false,\"error\":\"" + kiln::to_string(code) +
         "\",\"detail\":\"" + kiln::jsonlite::escape(detail) + "\"}";
}

// Prefixes `{"op":"<op>",` onto a JSON object.
std::string with_op(const std::string& op, const std::string& object) {
  return "{\"op\":\"" + kiln::jsonlite::escape(op) + "\"," + object.substr(1);
}

// ---------------------------------------------------------------------------
// batch - one pool for the lifetime of the process, driven by stdin:
//   {"op":"begin_session","log_level":"info"}
//   {"op":"execute","classpath":[..],"vm_args":[..],"log_level":"..","kind":"..",
//    "action":"echo","payload":".."}
//   {"op":"status"} {"op":"end_session"} {"op":"stop_all"} {"op":"shutdown"}
// One JSON line is written to stdout per command.
// ---------------------------------------------------------------------------
int run_batch(kiln::PoolConfig config) {
  kiln::WorkerPool pool(std::move(config));
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    const std::string op = kiln::jsonlite::get_string(line, "op");
    std::string out;

    if (op == "begin_session") {
      kiln::LogLevel level = kiln::LogLevel::lifecycle;
      if (kiln::jsonlite::has_key(line, "log_level")) {
        auto parsed = kiln::parse_log_level(kiln::jsonlite::get_string(line, "log_level"));
        if (!parsed) {
          std::cout << error_line(op, kiln::ErrorCode::config_invalid, "unknown log_level") << "\n" << std::flush;
          continue;
        }
        level = *parsed;
      }
      const auto s = pool.begin_session(level);
      out = "{\"op\":\"begin_session\",\"ok\":true,\"session\":" + std::to_string(s.id) + "}";
    } else if (op == "end_session") {
      out = "{\"op\":\"end_session\",\"ok\":true,\"stopped\":" + std::to_string(pool.end_session()) + "}";
    } else if (op == "execute") {
      kiln::WorkRequirements req;
      std::string err;
      if (!kiln::requirements_from_json(line, &req, &err)) {
        out = error_line(op, kiln::ErrorCode::config_invalid, err);
      } else {
        if (!kiln::jsonlite::has_key(line, "log_level")) req.log_level = pool.current_session().log_level;
        kiln::Action action{kiln::jsonlite::get_string(line, "action"), kiln::jsonlite::get_string(line, "payload")};
        const auto report = pool.execute(kiln::make_work_item(std::move(req), std::move(action)));
        out = with_op(op, report.to_json());
      }
    } else if (op == "status") {
      out = with_op(op, pool.status_json());
    } else if (op == "stop_all") {
      out = "{\"op\":\"stop_all\",\"ok\":true,\"stopped\":" + std::to_string(pool.stop_all()) + "}";
    } else if (op == "shutdown") {
      pool.shutdown();
      std::cout << "{\"op\":\"shutdown\",\"ok\":true}\n" << std::flush;
      return 0;
    } else {
      out = error_line(op, kiln::ErrorCode::json_parse_error, "unknown op");
    }
    std::cout << out << "\n" << std::flush;
  }
  pool.shutdown();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  ::signal(SIGPIPE, SIG_IGN);

  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    usage();
    return 1;
  }

  kiln::PoolConfig config = kiln::PoolConfig::from_env();
  kiln::log::set_level(config.log_level);

  if (cmd == "version") {
    const auto manifest = kiln::version::current_manifest(KILN_VERSION);
    std::cout << kiln::version::manifest_to_json(manifest) << "\n";
    return 0;
  }

  if (cmd == "fingerprint" && argc >= 3) {
    std::string text;
    if (!read_file(argv[2], &text)) {
      std::cout << "{\"ok\":false,\"error\":\"cannot read " << kiln::jsonlite::escape(argv[2]) << "\"}\n";
      return 2;
    }
    kiln::WorkRequirements req;
    std::string err;
    if (!kiln::requirements_from_json(text, &req, &err)) {
      std::cout << "{\"ok\":false,\"error\":\"" << kiln::jsonlite::escape(err) << "\"}\n";
      return 2;
    }
    std::cout << kiln::to_json(kiln::fingerprint(req)) << "\n";
    return 0;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    std::cout << "{\"config\":" << config.to_json() << ",\"version\":\"" << KILN_VERSION << "\"}\n";
    return 0;
  }

  if (cmd == "config" && argc >= 4 && std::string(argv[2]) == "validate") {
    std::string text;
    if (!read_file(argv[3], &text)) {
      std::cout << "{\"ok\":false,\"errors\":[\"cannot read " << kiln::jsonlite::escape(argv[3]) << "\"]}\n";
      return 2;
    }
    const auto result = kiln::validate_config(text);
    std::cout << kiln::to_json(result) << "\n";
    return result.ok ? 0 : 2;
  }

  if (cmd == "batch") {
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--log-level" && i + 1 < argc) {
        auto level = kiln::parse_log_level(argv[++i]);
        if (!level) {
          std::cerr << "kiln: unknown log level " << argv[i] << "\n";
          return 2;
        }
        config.log_level = *level;
      } else if (a == "--config" && i + 1 < argc) {
        std::string text, err;
        if (!read_file(argv[++i], &text) || !config.merge_json(text, &err)) {
          std::cerr << "kiln: invalid config " << argv[i] << ": " << err << "\n";
          return 2;
        }
      }
    }
    kiln::log::set_level(config.log_level);
    return run_batch(std::move(config));
  }

  usage();
  return 1;
}
