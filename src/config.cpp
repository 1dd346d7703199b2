#include "kiln/config.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>
#include <system_error>

#include "kiln/jsonlite.hpp"
#include "kiln/log.hpp"

namespace fs = std::filesystem;

namespace kiln {

namespace {

const char* const kKnownKeys[] = {
    "worker_executable", "ready_timeout_ms",       "stop_grace_ms",
    "parent_poll_ms",    "idle_timeout_ms",        "max_idle_workers",
    "expiration_interval_ms", "session_scoped_kinds", "log_level",
};

bool parse_u64(const char* text, uint64_t* out) {
  if (!text || !text[0]) return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (errno != 0 || *end != '\0' || text[0] == '-') return false;
  *out = v;
  return true;
}

void env_u64(const char* name, uint64_t* field) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  if (!parse_u64(e, field)) {
    log::warn(std::string("ignoring malformed ") + name + "=" + e);
  }
}

std::vector<std::string> split_kinds(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    if (b == std::string::npos) continue;
    const auto e = item.find_last_not_of(" \t");
    out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}

// Number value of `key` when present. A present key with a non-numeric value
// is reported through *malformed.
bool json_u64(const std::string& json, const std::string& key, uint64_t* out, bool* malformed) {
  if (!jsonlite::has_key(json, key)) return false;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*[0-9]+\\s*[,}]");
  if (!std::regex_search(json, re)) {
    *malformed = true;
    return false;
  }
  *out = jsonlite::get_u64(json, key);
  return true;
}

bool is_executable(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

bool PoolConfig::is_session_scoped(const std::string& kind) const {
  for (const auto& k : session_scoped_kinds) {
    if (k == kind) return true;
  }
  return false;
}

std::string default_worker_executable() {
  std::error_code ec;
  const fs::path self = fs::read_symlink("/proc/self/exe", ec);
  if (ec) return "kiln-worker";
  return (self.parent_path() / "kiln-worker").string();
}

PoolConfig PoolConfig::from_env() {
  PoolConfig c;
  c.worker_executable = default_worker_executable();
  if (const char* e = std::getenv("KILN_WORKER_EXECUTABLE")) {
    if (e[0]) c.worker_executable = e;
  }
  env_u64("KILN_READY_TIMEOUT_MS", &c.ready_timeout_ms);
  env_u64("KILN_STOP_GRACE_MS", &c.stop_grace_ms);
  env_u64("KILN_PARENT_POLL_MS", &c.parent_poll_ms);
  env_u64("KILN_IDLE_TIMEOUT_MS", &c.idle_timeout_ms);
  env_u64("KILN_MAX_IDLE_WORKERS", &c.max_idle_workers);
  env_u64("KILN_EXPIRATION_INTERVAL_MS", &c.expiration_interval_ms);
  if (const char* e = std::getenv("KILN_SESSION_SCOPED_KINDS")) {
    c.session_scoped_kinds = split_kinds(e);
  }
  if (const char* e = std::getenv("KILN_LOG_LEVEL")) {
    if (e[0]) {
      if (auto level = parse_log_level(e)) {
        c.log_level = *level;
      } else {
        log::warn(std::string("ignoring unknown KILN_LOG_LEVEL=") + e);
      }
    }
  }
  if (c.parent_poll_ms == 0) c.parent_poll_ms = 1000;
  if (c.expiration_interval_ms == 0) c.expiration_interval_ms = 1000;
  return c;
}

bool PoolConfig::merge_json(const std::string& json, std::string* error) {
  PoolConfig next = *this;
  bool malformed = false;
  const auto number = [&](const char* key, uint64_t* field) {
    bool bad = false;
    json_u64(json, key, field, &bad);
    if (bad) {
      malformed = true;
      if (error) *error = std::string(key) + " must be a non-negative integer";
    }
  };
  number("ready_timeout_ms", &next.ready_timeout_ms);
  number("stop_grace_ms", &next.stop_grace_ms);
  number("parent_poll_ms", &next.parent_poll_ms);
  number("idle_timeout_ms", &next.idle_timeout_ms);
  number("max_idle_workers", &next.max_idle_workers);
  number("expiration_interval_ms", &next.expiration_interval_ms);
  if (malformed) return false;

  if (jsonlite::has_key(json, "worker_executable")) {
    next.worker_executable = jsonlite::get_string(json, "worker_executable");
  }
  if (jsonlite::has_key(json, "session_scoped_kinds")) {
    next.session_scoped_kinds = jsonlite::get_string_array(json, "session_scoped_kinds");
  }
  if (jsonlite::has_key(json, "log_level")) {
    const std::string text = jsonlite::get_string(json, "log_level");
    auto level = parse_log_level(text);
    if (!level) {
      if (error) *error = "unknown log_level: " + text;
      return false;
    }
    next.log_level = *level;
  }
  if (next.parent_poll_ms == 0 || next.expiration_interval_ms == 0) {
    if (error) *error = "parent_poll_ms and expiration_interval_ms must be positive";
    return false;
  }
  *this = std::move(next);
  return true;
}

std::string PoolConfig::to_json() const {
  std::ostringstream o;
  o << "{\"worker_executable\":\"" << jsonlite::escape(worker_executable) << "\""
    << ",\"ready_timeout_ms\":" << ready_timeout_ms
    << ",\"stop_grace_ms\":" << stop_grace_ms
    << ",\"parent_poll_ms\":" << parent_poll_ms
    << ",\"idle_timeout_ms\":" << idle_timeout_ms
    << ",\"max_idle_workers\":" << max_idle_workers
    << ",\"expiration_interval_ms\":" << expiration_interval_ms
    << ",\"session_scoped_kinds\":" << jsonlite::string_array(session_scoped_kinds)
    << ",\"log_level\":\"" << to_string(log_level) << "\""
    << "}";
  return o.str();
}

ConfigValidationResult validate_config(const std::string& json) {
  ConfigValidationResult r;

  const auto b = json.find_first_not_of(" \t\r\n");
  const auto e = json.find_last_not_of(" \t\r\n");
  if (b == std::string::npos || json[b] != '{' || json[e] != '}') {
    r.ok = false;
    r.errors.push_back("config must be a JSON object");
    return r;
  }

  PoolConfig c = PoolConfig::from_env();
  std::string err;
  if (!c.merge_json(json, &err)) {
    r.ok = false;
    r.errors.push_back(err);
  }

  // Every top-level key must be known.
  std::regex key_re("\\\"([A-Za-z0-9_]+)\\\"\\s*:");
  for (auto it = std::sregex_iterator(json.begin(), json.end(), key_re); it != std::sregex_iterator(); ++it) {
    const std::string key = (*it)[1].str();
    bool known = false;
    for (const char* k : kKnownKeys) {
      if (key == k) known = true;
    }
    if (!known) r.warnings.push_back("unknown key: " + key);
  }

  if (r.ok && !is_executable(c.worker_executable)) {
    r.warnings.push_back("worker_executable is not an executable file: " + c.worker_executable);
  }
  if (r.ok && c.ready_timeout_ms == 0) {
    r.warnings.push_back("ready_timeout_ms is 0; every spawn will time out");
  }
  if (r.ok && c.idle_timeout_ms > 0 && c.idle_timeout_ms < c.expiration_interval_ms) {
    r.warnings.push_back("idle_timeout_ms is shorter than expiration_interval_ms");
  }
  return r;
}

std::string to_json(const ConfigValidationResult& r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false")
    << ",\"errors\":" << jsonlite::string_array(r.errors)
    << ",\"warnings\":" << jsonlite::string_array(r.warnings)
    << "}";
  return o.str();
}

}  // namespace kiln
