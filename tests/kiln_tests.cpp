#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "kiln/config.hpp"
#include "kiln/eviction.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/hash.hpp"
#include "kiln/jsonlite.hpp"
#include "kiln/log.hpp"
#include "kiln/observability.hpp"
#include "kiln/pool.hpp"
#include "kiln/process.hpp"
#include "kiln/protocol.hpp"
#include "kiln/registry.hpp"
#include "kiln/version.hpp"
#include "kiln/watchdog.hpp"
#include "kiln/worker_client.hpp"
#include "kiln/worker_runtime.hpp"

#ifndef KILN_TEST_WORKER_EXECUTABLE
#define KILN_TEST_WORKER_EXECUTABLE "kiln-worker"
#endif
#ifndef KILN_TEST_CLI_EXECUTABLE
#define KILN_TEST_CLI_EXECUTABLE "kiln"
#endif

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

std::mutex g_log_mu;
std::vector<std::string> g_log_lines;

void capture_sink(kiln::LogLevel, std::string_view message) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_lines.emplace_back(message);
}

void clear_log() {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_lines.clear();
}

size_t count_log(const std::string& line) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  return static_cast<size_t>(std::count(g_log_lines.begin(), g_log_lines.end(), line));
}

size_t count_log_prefix(const std::string& prefix) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  return static_cast<size_t>(std::count_if(g_log_lines.begin(), g_log_lines.end(),
                                           [&prefix](const std::string& l) { return l.rfind(prefix, 0) == 0; }));
}

bool log_contains(const std::string& fragment) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  for (const auto& l : g_log_lines) {
    if (l.find(fragment) != std::string::npos) return true;
  }
  return false;
}

fs::path make_temp_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("kiln_test_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_text(const fs::path& path, const std::string& text) {
  std::ofstream ofs(path, std::ios::trunc);
  ofs << text;
}

// Shell script standing in for a misbehaving worker executable.
std::string write_script(const fs::path& dir, const std::string& name, const std::string& body) {
  const fs::path path = dir / name;
  write_text(path, "#!/bin/sh\n" + body + "\n");
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path.string();
}

kiln::PoolConfig test_config() {
  kiln::PoolConfig c;
  c.worker_executable = KILN_TEST_WORKER_EXECUTABLE;
  c.ready_timeout_ms = 10000;
  c.stop_grace_ms = 2000;
  c.parent_poll_ms = 200;
  c.expiration_interval_ms = 60000;
  return c;
}

kiln::WorkRequirements requirements(std::vector<std::string> classpath, const std::string& kind = "test",
                                    kiln::LogLevel level = kiln::LogLevel::lifecycle) {
  kiln::WorkRequirements r;
  r.classpath = std::move(classpath);
  r.kind = kind;
  r.log_level = level;
  return r;
}

kiln::WorkItem work(const kiln::WorkRequirements& r, const std::string& type = "identify",
                    const std::string& payload = "") {
  return kiln::make_work_item(r, kiln::Action{type, payload});
}

// Dead or zombie.
bool process_gone(int pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return true;
  std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
  const auto paren = content.rfind(')');
  if (paren == std::string::npos || paren + 2 >= content.size()) return true;
  const char state = content[paren + 2];
  return state == 'Z' || state == 'X';
}

bool wait_until_gone(int pid, int timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (process_gone(pid)) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return process_gone(pid);
}

bool registry_has_pid(kiln::WorkerPool& pool, int pid) {
  for (const auto& s : pool.registry().snapshot()) {
    if (s.pid == pid) return true;
  }
  return false;
}

// ============================================================================
// Hashing & fingerprints
// ============================================================================

void test_blake3_known_vectors() {
  expect(kiln::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(kiln::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const auto a = kiln::hash_domain("cp:", "payload");
  const auto b = kiln::hash_domain("fp:", "payload");
  expect(a != b, "different domains must give different digests");
  expect(a == kiln::hash_domain("cp:", "payload"), "domain hash must be deterministic");
}

void test_fingerprint_deterministic_and_order_insensitive() {
  const auto dir = make_temp_dir("fp_order");
  write_text(dir / "a.jar", "alpha");
  write_text(dir / "b.jar", "beta");
  const std::string a = (dir / "a.jar").string();
  const std::string b = (dir / "b.jar").string();

  const auto fp1 = kiln::fingerprint(requirements({a, b}));
  const auto fp2 = kiln::fingerprint(requirements({b, a}));
  const auto fp3 = kiln::fingerprint(requirements({a, b, a}));
  expect(fp1.digest.size() == 64, "fingerprint digest must be 64 hex chars");
  expect(fp1 == fp2, "classpath order must not matter");
  expect(fp1.digest == fp2.digest, "classpath order must not change the digest");
  expect(fp1 == fp3, "duplicate classpath entries collapse");
  expect(fp1.classpath.size() == 2, "normalized classpath has two entries");
  expect(std::hash<kiln::Fingerprint>{}(fp1) == std::hash<kiln::Fingerprint>{}(fp2), "hash follows equality");
  fs::remove_all(dir);
}

void test_fingerprint_content_sensitive() {
  const auto dir = make_temp_dir("fp_content");
  const fs::path jar = dir / "lib.jar";
  write_text(jar, "v1");
  const auto before = kiln::fingerprint(requirements({jar.string()}));
  write_text(jar, "v2");
  const auto after = kiln::fingerprint(requirements({jar.string()}));
  expect(before.classpath == after.classpath, "same paths");
  expect(before != after, "edited classpath file must change the fingerprint");
  expect(before.classpath_digest != after.classpath_digest, "edited file changes classpath digest");

  fs::create_directories(dir / "classes" / "pkg");
  write_text(dir / "classes" / "pkg" / "A.class", "one");
  const auto d1 = kiln::fingerprint(requirements({(dir / "classes").string()}));
  write_text(dir / "classes" / "pkg" / "B.class", "two");
  const auto d2 = kiln::fingerprint(requirements({(dir / "classes").string()}));
  expect(d1 != d2, "new file inside a classpath directory must change the fingerprint");

  const auto missing = kiln::fingerprint(requirements({(dir / "nope.jar").string()}));
  write_text(dir / "nope.jar", "");
  const auto present = kiln::fingerprint(requirements({(dir / "nope.jar").string()}));
  expect(missing != present, "missing and empty entries must differ");

  const auto one = kiln::fingerprint(requirements({jar.string()}));
  const auto two = kiln::fingerprint(requirements({jar.string(), (dir / "nope.jar").string()}));
  expect(one != two, "added classpath entry must change the fingerprint");
  fs::remove_all(dir);
}

void test_fingerprint_other_fields() {
  auto base = requirements({"/nonexistent/x.jar"});
  base.vm_args = {"-Xmx256m", "-Dk=v"};
  const auto fp = kiln::fingerprint(base);

  auto reordered = base;
  reordered.vm_args = {"-Dk=v", "-Xmx256m"};
  expect(kiln::fingerprint(reordered) != fp, "vm arg order is significant");

  auto debug = base;
  debug.log_level = kiln::LogLevel::debug;
  const auto fp_debug = kiln::fingerprint(debug);
  expect(fp_debug != fp, "log level is part of the fingerprint");

  auto other_kind = base;
  other_kind.kind = "compiler";
  expect(kiln::fingerprint(other_kind) != fp, "daemon kind is part of the fingerprint");
}

void test_requirements_from_json() {
  kiln::WorkRequirements r;
  std::string err;
  const std::string json =
      R"({"classpath":["/a.jar","/b.jar"],"vm_args":["-Xmx1g"],"log_level":"debug","kind":"compiler"})";
  expect(kiln::requirements_from_json(json, &r, &err), "valid requirements parse: " + err);
  expect(r.classpath.size() == 2 && r.classpath[1] == "/b.jar", "classpath parsed");
  expect(r.vm_args.size() == 1 && r.vm_args[0] == "-Xmx1g", "vm args parsed");
  expect(r.log_level == kiln::LogLevel::debug, "log level parsed");
  expect(r.kind == "compiler", "kind parsed");

  kiln::WorkRequirements bad;
  expect(!kiln::requirements_from_json(R"({"log_level":"loud"})", &bad, &err), "unknown log level rejected");
  expect(!err.empty(), "rejection carries a message");

  const auto fp_json = kiln::to_json(kiln::fingerprint(r));
  expect(kiln::jsonlite::get_string(fp_json, "kind") == "compiler", "fingerprint JSON has kind");
  expect(kiln::jsonlite::get_string(fp_json, "digest").size() == 64, "fingerprint JSON has digest");
}

void test_jsonlite_escaping() {
  const std::string raw = "quote\" backslash\\ newline\n tab\t ctrl\x01 end";
  const std::string json = "{\"k\":\"" + kiln::jsonlite::escape(raw) + "\",\"n\":42,\"b\":true}";
  expect(kiln::jsonlite::get_string(json, "k") == raw, "escape/unescape preserves text");
  expect(kiln::jsonlite::get_u64(json, "n") == 42, "u64 read");
  expect(kiln::jsonlite::get_bool(json, "b"), "bool read");
  expect(kiln::jsonlite::get_u64(json, "missing", 7) == 7, "default for missing key");
  const auto arr = kiln::jsonlite::get_string_array("{\"a\":" + kiln::jsonlite::string_array({"x", "y\"z"}) + "}", "a");
  expect(arr.size() == 2 && arr[1] == "y\"z", "string array survives escaping");
}

// ============================================================================
// Wire protocol & processes
// ============================================================================

void test_protocol_frames() {
  const auto ready = kiln::protocol::decode(kiln::protocol::encode_ready(1234));
  expect(ready.type == kiln::protocol::FrameType::ready, "ready frame type");
  expect(ready.pid == 1234, "ready pid");
  expect(kiln::version::check_protocol(ready.protocol).ok, "ready advertises the current framing version");
  expect(!kiln::version::check_protocol(ready.protocol + 1).ok, "other framing version is incompatible");

  const auto action = kiln::protocol::decode(kiln::protocol::encode_action(7, kiln::Action{"echo", "a\nb"}));
  expect(action.type == kiln::protocol::FrameType::action && action.id == 7, "action frame");
  expect(action.payload == "a\nb", "payload with newline survives a single line frame");

  const auto result = kiln::protocol::decode(kiln::protocol::encode_result(7, false, "", "boom"));
  expect(result.type == kiln::protocol::FrameType::result && !result.ok && result.detail == "boom", "result frame");
  expect(kiln::protocol::decode("not json").type == kiln::protocol::FrameType::unknown, "garbage is unknown");
}

void test_line_channel() {
  int fds[2];
  expect(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0, "socketpair");
  kiln::protocol::LineChannel a(fds[0]);
  kiln::protocol::LineChannel b(fds[1]);

  std::string line;
  expect(b.read_line(&line, 50) == kiln::protocol::LineChannel::ReadStatus::timeout, "empty channel times out");
  expect(a.write_line("first"), "write first");
  expect(a.write_line("second"), "write second");
  expect(b.read_line(&line, 1000) == kiln::protocol::LineChannel::ReadStatus::ok && line == "first", "read first");
  expect(b.read_line(&line, 1000) == kiln::protocol::LineChannel::ReadStatus::ok && line == "second", "read second");
  a.close();
  expect(b.read_line(&line, 1000) == kiln::protocol::LineChannel::ReadStatus::eof, "peer close is EOF");
  expect(!b.write_line("nobody listens"), "write to closed peer fails without SIGPIPE");
}

void test_run_process() {
  kiln::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo hello"};
  auto r = kiln::run_process(spec);
  expect(r.error_message.empty(), "run_process starts /bin/sh");
  expect(r.exit_code == 0 && r.stdout_text == "hello\n", "stdout captured");

  spec.argv = {"-c", "exit 3"};
  r = kiln::run_process(spec);
  expect(r.exit_code == 3, "exit code propagated");

  spec.argv = {"-c", "sleep 5"};
  spec.timeout_ms = 100;
  r = kiln::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout enforced");
}

void test_worker_args_roundtrip() {
  auto r = requirements({"/b.jar", "/a.jar"}, "compiler", kiln::LogLevel::info);
  r.vm_args = {"-Xmx1g", "-Dfile.encoding=UTF-8", "-ea"};
  const auto fp = kiln::fingerprint(r);
  kiln::WorkerLaunchOptions opts;
  opts.executable = KILN_TEST_WORKER_EXECUTABLE;
  opts.parent_poll_ms = 250;

  kiln::WorkerSettings s;
  std::string err;
  expect(kiln::parse_worker_args(kiln::worker_arguments(fp, opts, 42), &s, &err), "worker args parse: " + err);
  expect(s.parent_pid == 42, "parent pid");
  expect(s.parent_poll_ms == 250, "parent poll interval");
  expect(s.log_level == kiln::LogLevel::info, "log level");
  expect(s.kind == "compiler", "kind");
  expect(s.fingerprint == fp.short_digest(), "fingerprint tag");
  expect(s.classpath == fp.classpath, "classpath");
  expect(s.vm_args == r.vm_args, "vm args in order");
  expect(s.properties["file.encoding"] == "UTF-8", "system property from -D");

  kiln::WorkerSettings bad;
  expect(!kiln::parse_worker_args({"--bogus", "1"}, &bad, &err), "unknown option rejected");
  expect(!kiln::parse_worker_args({"--log-level", "loud"}, &bad, &err), "unknown log level rejected");
  expect(!kiln::parse_worker_args({"--parent-pid"}, &bad, &err), "missing value rejected");
}

std::atomic<int> g_parent_gone_pid{0};

void record_parent_gone(int expected_parent_pid) { g_parent_gone_pid.store(expected_parent_pid); }

void test_parent_watchdog() {
  g_parent_gone_pid.store(0);
  kiln::ParentWatchdog healthy(::getppid(), 20, record_parent_gone);
  expect(healthy.parent_alive(), "real parent is alive");
  healthy.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  healthy.stop();
  expect(g_parent_gone_pid.load() == 0, "watchdog quiet while parent lives");

  // We are never our own parent.
  kiln::ParentWatchdog orphaned(::getpid(), 20, record_parent_gone);
  expect(!orphaned.parent_alive(), "wrong parent detected");
  orphaned.start();
  expect(g_parent_gone_pid.load() == ::getpid(), "watchdog fires on start when parent is gone");
}

// ============================================================================
// Registry, config, observability
// ============================================================================

void test_registry_single_claim() {
  kiln::DaemonRegistry registry;
  kiln::WorkerLaunchOptions opts;
  opts.executable = KILN_TEST_WORKER_EXECUTABLE;
  auto rec = std::make_shared<kiln::WorkerRecord>(
      registry.next_id(), std::make_unique<kiln::WorkerClient>(kiln::fingerprint(requirements({})), opts),
      kiln::WorkerState::idle);
  registry.add(rec);
  expect(registry.idle().size() == 1, "record is idle");
  expect(registry.find(rec->id) == rec, "record found by id");

  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      if (rec->try_transition(kiln::WorkerState::idle, kiln::WorkerState::busy)) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(winners.load() == 1, "exactly one thread claims an idle worker");
  expect(registry.idle().empty(), "claimed worker is no longer idle");
  expect(registry.remove(rec->id), "remove");
  expect(!registry.remove(rec->id), "second remove is a no-op");
  expect(registry.size() == 0, "registry empty");
}

void test_config_merge_and_validate() {
  kiln::PoolConfig c = test_config();
  std::string err;
  expect(c.merge_json(R"({"idle_timeout_ms":5000,"session_scoped_kinds":["compiler","doc"],"log_level":"info"})", &err),
         "merge valid config: " + err);
  expect(c.idle_timeout_ms == 5000, "idle timeout merged");
  expect(c.is_session_scoped("doc") && !c.is_session_scoped("test"), "session scoped kinds merged");
  expect(c.log_level == kiln::LogLevel::info, "log level merged");

  const auto before = c.to_json();
  expect(!c.merge_json(R"({"log_level":"loud"})", &err), "bad log level rejected");
  expect(c.to_json() == before, "failed merge leaves config untouched");

  const auto ok = kiln::validate_config(R"({"ready_timeout_ms":1000,"colour":"blue"})");
  expect(ok.ok, "unknown keys are not errors");
  bool warned = false;
  for (const auto& w : ok.warnings) warned = warned || w.find("colour") != std::string::npos;
  expect(warned, "unknown key warned");

  const auto bad = kiln::validate_config(R"({"ready_timeout_ms":"soon"})");
  expect(!bad.ok && !bad.errors.empty(), "non-numeric timeout is an error");
  expect(!kiln::validate_config("[1,2]").ok, "non-object rejected");
}

void test_duration_histogram() {
  kiln::DurationHistogram h;
  expect(h.quantile_bound_ms(0.5) == 0, "empty histogram");
  for (int i = 0; i < 10; ++i) h.record(3 * 1000000ull);
  h.record(45000ull * 1000000ull);
  expect(h.count() == 11, "histogram count");
  expect(h.bucket(1) == 10, "3 ms lands in the 5 ms bucket");
  expect(h.bucket(kiln::DurationHistogram::kBuckets - 1) == 1, "45 s lands in the overflow bucket");
  expect(h.quantile_bound_ms(0.5) == 5, "median bound");
  expect(h.quantile_bound_ms(1.0) == 45000 && h.max_ms() == 45000, "overflow reports the maximum");
  expect(h.to_json().find("\"max_ms\":45000") != std::string::npos, "json carries max");
}

void test_pool_stats_timings() {
  kiln::WorkerPool pool(test_config());
  const auto r = requirements({});
  expect(pool.execute(work(r)).ok() && pool.execute(work(r)).ok(), "two executes");
  expect(pool.stats().spawn_time.count() == 1, "one spawn timed");
  expect(pool.stats().action_time.count() == 2, "both actions timed");
  const std::string json = pool.stats().to_json();
  expect(json.find("\"spawn_time\":{\"count\":1") != std::string::npos, "stats json has spawn time");
  expect(json.find("\"action_time\":{\"count\":2") != std::string::npos, "stats json has action time");
}

std::mutex g_events_mu;
std::vector<kiln::PoolEvent> g_events;

void capture_event(const kiln::PoolEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

bool saw_event(kiln::PoolEventKind kind) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  for (const auto& ev : g_events) {
    if (ev.kind == kind) return true;
  }
  return false;
}

// ============================================================================
// Pool lifecycle
// ============================================================================

void test_worker_reused_for_same_fingerprint() {
  kiln::WorkerPool pool(test_config());
  const auto r = requirements({"/nonexistent/lib.jar"});
  clear_log();
  const auto first = pool.execute(work(r));
  expect(first.ok(), "first execute succeeds: " + first.error_detail + first.outcome.detail);
  expect(!first.reused, "first execute spawns");
  const auto second = pool.execute(work(r, "echo", "hi"));
  expect(second.ok() && second.outcome.value == "hi", "echo through reused worker");
  expect(second.reused, "second execute reuses");
  expect(second.pid == first.pid, "same worker process reused");
  expect(count_log_prefix("Started kiln worker daemon") == 1, "one spawn logged for two executes");
  expect(pool.registry().size() == 1, "one worker tracked");
  expect(static_cast<int>(kiln::jsonlite::get_u64(first.outcome.value, "pid")) == first.pid,
         "worker reports its own pid");
  expect(pool.stats().spawned.load() == 1 && pool.stats().reused.load() == 1, "stats spawned/reused");
}

void test_stop_all_then_respawn() {
  kiln::WorkerPool pool(test_config());
  const auto r = requirements({});
  const auto first = pool.execute(work(r));
  expect(first.ok(), "execute");

  clear_log();
  expect(pool.stop_all() == 1, "one worker stopped");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "stop_all logs the stopped count");
  expect(pool.registry().size() == 0, "registry empty after stop_all");
  expect(wait_until_gone(first.pid, 5000), "stopped worker process exits");

  clear_log();
  expect(pool.stop_all() == 0, "nothing left to stop");
  expect(count_log("Stopped 0 worker daemon(s).") == 1, "stop_all with no workers still reports");

  const auto again = pool.execute(work(r));
  expect(again.ok() && !again.reused, "new worker spawned after stop_all");
  expect(again.pid != first.pid, "different process after stop_all");
  expect(count_log_prefix("Started kiln worker daemon (pid " + std::to_string(again.pid) + ",") == 1,
         "respawn logged once");
}

void test_log_level_change_stops_idle_workers() {
  kiln::WorkerPool pool(test_config());
  pool.begin_session(kiln::LogLevel::lifecycle);
  const auto r = requirements({}, "test", kiln::LogLevel::lifecycle);
  const auto first = pool.execute(work(r));
  expect(first.ok(), "execute at lifecycle");
  expect(kiln::jsonlite::get_string(first.outcome.value, "log_level") == "lifecycle", "worker started at lifecycle");

  clear_log();
  pool.begin_session(kiln::LogLevel::debug);
  expect(count_log(kiln::kLogLevelChangedLine) == 1, "log level drift reported");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "drift eviction counted");
  expect(pool.registry().size() == 0, "stale worker evicted");

  const auto second = pool.execute(work(requirements({}, "test", kiln::LogLevel::debug)));
  expect(second.ok() && !second.reused, "fresh worker at debug");
  expect(second.pid != first.pid, "different process after log level change");
  expect(kiln::jsonlite::get_string(second.outcome.value, "log_level") == "debug", "worker started at debug");

  // Same level again: nothing happens.
  clear_log();
  pool.begin_session(kiln::LogLevel::debug);
  expect(count_log(kiln::kLogLevelChangedLine) == 0, "no drift when level unchanged");
  expect(pool.registry().size() == 1, "worker kept");

  // A work item at another level also triggers the eviction.
  const auto third = pool.execute(work(requirements({}, "test", kiln::LogLevel::info)));
  expect(third.ok() && third.pid != second.pid, "work item at new level spawns fresh worker");
  expect(!registry_has_pid(pool, second.pid), "debug worker evicted by info work item");
}

void test_busy_worker_at_old_log_level_stopped_on_release() {
  kiln::WorkerPool pool(test_config());
  pool.begin_session(kiln::LogLevel::lifecycle);
  const auto item = work(requirements({}, "test", kiln::LogLevel::lifecycle));
  const auto a = pool.allocate(item);
  expect(a.ok(), "allocate at lifecycle");

  clear_log();
  expect(pool.begin_session(kiln::LogLevel::debug).log_level == kiln::LogLevel::debug, "debug session");
  expect(count_log(kiln::kLogLevelChangedLine) == 0, "busy worker not stopped at level change");
  expect(registry_has_pid(pool, a.record->pid), "busy worker still tracked");

  pool.release(a, a.record->client->execute(item.action));
  expect(!registry_has_pid(pool, a.record->pid), "out-of-date worker stopped on release");
  expect(wait_until_gone(a.record->pid, 5000), "out-of-date worker process exits");
  expect(count_log(kiln::kLogLevelChangedLine) == 1, "drift reported on release");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "release stop counted");
  expect(pool.stats().evicted_log_level.load() == 1, "counted as log level eviction");

  const auto next = pool.execute(work(requirements({}, "test", kiln::LogLevel::debug)));
  expect(next.ok() && !next.reused, "fresh worker at debug");
  pool.begin_session(kiln::LogLevel::debug);
  const auto workers = pool.registry().snapshot();
  expect(workers.size() == 1 && workers[0].pid == next.pid, "only the debug worker remains");
}

void test_classpath_change_spawns_new_worker() {
  const auto dir = make_temp_dir("cp_change");
  write_text(dir / "impl.jar", "impl-v1");
  write_text(dir / "other.jar", "other");
  kiln::WorkerPool pool(test_config());
  const auto impl = requirements({(dir / "impl.jar").string()});
  const auto other = requirements({(dir / "other.jar").string()});

  const auto a1 = pool.execute(work(impl));
  const auto b1 = pool.execute(work(other));
  expect(a1.ok() && b1.ok(), "both workers started");
  expect(a1.pid != b1.pid, "distinct fingerprints get distinct workers");

  write_text(dir / "impl.jar", "impl-v2");
  const auto a2 = pool.execute(work(impl));
  expect(a2.ok() && !a2.reused, "changed classpath content spawns");
  expect(a2.pid != a1.pid, "new worker for changed classpath");

  const auto b2 = pool.execute(work(other));
  expect(b2.ok() && b2.reused && b2.pid == b1.pid, "unrelated worker still reused");
  expect(registry_has_pid(pool, a1.pid), "stale worker stays idle until evicted");
  fs::remove_all(dir);
}

void test_vm_args_reach_worker() {
  kiln::WorkerPool pool(test_config());
  auto r = requirements({});
  r.vm_args = {"-Xmx128m", "-Dkiln.test=yes"};
  const auto rep = pool.execute(work(r));
  expect(rep.ok(), "execute");
  expect(kiln::jsonlite::get_string(rep.outcome.value, "kiln.test") == "yes", "system property visible in worker");

  r.vm_args = {"-Xmx256m", "-Dkiln.test=yes"};
  const auto other = pool.execute(work(r));
  expect(other.ok() && other.pid != rep.pid, "different vm args get a different worker");
}

// ============================================================================
// Failure handling
// ============================================================================

void test_crash_isolated_and_replaced() {
  kiln::WorkerPool pool(test_config());
  const auto x = requirements({"/nonexistent/x.jar"});
  const auto y = requirements({"/nonexistent/y.jar"});
  const auto x1 = pool.execute(work(x));
  const auto y1 = pool.execute(work(y));
  expect(x1.ok() && y1.ok(), "both workers started");

  clear_log();
  const auto crash = pool.execute(work(x, "exit", R"({"code":3})"));
  expect(crash.error == kiln::ErrorCode::none, "allocation itself succeeded");
  expect(crash.outcome.crashed(), "exit action reported as process crash");
  expect(crash.outcome.exit_status == 3, "exit status propagated");
  expect(crash.pid == x1.pid, "crash happened in the reused worker");
  expect(!registry_has_pid(pool, x1.pid), "crashed worker removed");
  expect(pool.stats().crashed.load() == 1, "crash counted");
  expect(log_contains("crashed with exit status 3"), "crash logged");

  const auto x2 = pool.execute(work(x));
  expect(x2.ok() && !x2.reused && x2.pid != x1.pid, "next work item gets a fresh worker");
  const auto y2 = pool.execute(work(y));
  expect(y2.ok() && y2.reused && y2.pid == y1.pid, "other worker unaffected by the crash");
}

void test_user_failure_keeps_worker() {
  kiln::WorkerPool pool(test_config());
  const auto r = requirements({});
  const auto failed = pool.execute(work(r, "fail", R"({"message":"compilation failed"})"));
  expect(failed.error == kiln::ErrorCode::none, "allocation succeeded");
  expect(failed.outcome.kind == kiln::ActionOutcome::Kind::user_failure, "user failure kind");
  expect(failed.outcome.detail == "compilation failed", "failure message propagated");
  expect(!failed.ok(), "report not ok");

  const auto next = pool.execute(work(r));
  expect(next.ok() && next.reused && next.pid == failed.pid, "worker survives a user failure");

  const auto unknown = pool.execute(work(r, "no_such_action"));
  expect(unknown.outcome.kind == kiln::ActionOutcome::Kind::user_failure, "unknown action is a user failure");
  expect(unknown.pid == failed.pid, "worker survives an unknown action");
  expect(pool.stats().actions_failed.load() == 2, "failed actions counted");
}

void test_spawn_failure() {
  kiln::PoolConfig c = test_config();
  c.worker_executable = "/nonexistent/kiln-worker";
  kiln::WorkerPool pool(c);
  const auto rep = pool.execute(work(requirements({})));
  expect(rep.error == kiln::ErrorCode::spawn_failed, "spawn_failed for missing executable");
  expect(!rep.error_detail.empty(), "spawn failure has detail");
  expect(pool.registry().size() == 0, "nothing registered after spawn failure");
  expect(pool.stats().spawn_failures.load() == 1, "spawn failure counted");
}

void test_ready_timeout_and_protocol_mismatch() {
  const auto dir = make_temp_dir("bad_workers");

  kiln::PoolConfig silent = test_config();
  silent.worker_executable = write_script(dir, "silent.sh", "exec sleep 30");
  silent.ready_timeout_ms = 200;
  {
    kiln::WorkerPool pool(silent);
    const auto rep = pool.execute(work(requirements({})));
    expect(rep.error == kiln::ErrorCode::ready_timeout, "silent worker times out");
    expect(pool.registry().size() == 0, "timed out worker not registered");
  }

  kiln::PoolConfig mismatch = test_config();
  mismatch.worker_executable = write_script(
      dir, "mismatch.sh", "printf '{\"type\":\"ready\",\"protocol\":99,\"pid\":0}\\n' >&3\nexec sleep 30");
  {
    kiln::WorkerPool pool(mismatch);
    const auto rep = pool.execute(work(requirements({})));
    expect(rep.error == kiln::ErrorCode::protocol_mismatch, "other framing version rejected");
    expect(pool.registry().size() == 0, "mismatched worker not registered");
  }

  kiln::PoolConfig dies = test_config();
  dies.worker_executable = write_script(dir, "dies.sh", "exit 5");
  {
    kiln::WorkerPool pool(dies);
    const auto rep = pool.execute(work(requirements({})));
    expect(rep.error == kiln::ErrorCode::spawn_failed, "worker exiting before ready is a spawn failure");
  }
  fs::remove_all(dir);
}

void test_concurrent_allocations_distinct() {
  kiln::WorkerPool pool(test_config());
  const auto item = work(requirements({}));
  constexpr int kThreads = 4;
  std::atomic<int> allocated{0};
  std::mutex pids_mu;
  std::set<int> pids;
  std::atomic<bool> all_ok{true};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      const auto a = pool.allocate(item);
      if (!a.ok()) {
        all_ok.store(false);
        allocated.fetch_add(1);
        return;
      }
      {
        std::lock_guard<std::mutex> lk(pids_mu);
        pids.insert(a.record->pid);
      }
      allocated.fetch_add(1);
      // Hold the worker until everyone has one.
      while (allocated.load() < kThreads) std::this_thread::sleep_for(std::chrono::milliseconds(5));
      pool.release(a, a.record->client->execute(item.action));
    });
  }
  for (auto& t : threads) t.join();
  expect(all_ok.load(), "all concurrent allocations succeed");
  expect(pids.size() == static_cast<size_t>(kThreads), "concurrent work items never share a worker");
  expect(pool.registry().idle().size() == static_cast<size_t>(kThreads), "all workers idle after release");

  const auto again = pool.execute(item);
  expect(again.ok() && again.reused && pids.count(again.pid) == 1, "one of the idle workers is reused");
}

void test_stop_all_interrupts_busy_worker() {
  kiln::WorkerPool pool(test_config());
  const auto r = requirements({});
  kiln::ExecutionReport busy_report;
  std::thread busy([&] { busy_report = pool.execute(work(r, "sleep", R"({"ms":30000})")); });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  bool saw_busy = false;
  while (!saw_busy && std::chrono::steady_clock::now() < deadline) {
    for (const auto& s : pool.registry().snapshot()) saw_busy = saw_busy || s.state == kiln::WorkerState::busy;
    if (!saw_busy) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(saw_busy, "worker became busy");

  clear_log();
  expect(pool.stop_all() == 1, "busy worker counted as stopped");
  busy.join();
  expect(busy_report.outcome.crashed(), "interrupted action reported as process crash");
  expect(busy_report.outcome.detail == "worker daemon was stopped while busy", "interruption detail");
  expect(pool.registry().size() == 0, "registry empty");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "stop_all reports the busy worker");
  expect(pool.stats().crashed.load() == 0, "stopped busy worker is not a crash");
}

// ============================================================================
// Expiration & sessions
// ============================================================================

void test_idle_timeout_expiration() {
  kiln::PoolConfig c = test_config();
  c.idle_timeout_ms = 1;
  kiln::WorkerPool pool(c);
  const auto rep = pool.execute(work(requirements({})));
  expect(rep.ok(), "execute");
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  clear_log();
  expect(pool.expire_now() == 1, "idle worker expired");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "expiration logs stopped count");
  expect(pool.registry().size() == 0, "expired worker removed");
  expect(pool.stats().expired.load() == 1, "expiration counted");
}

void test_max_idle_workers() {
  kiln::PoolConfig c = test_config();
  c.max_idle_workers = 1;
  kiln::WorkerPool pool(c);
  const auto older = pool.execute(work(requirements({"/nonexistent/a.jar"})));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  const auto newer = pool.execute(work(requirements({"/nonexistent/b.jar"})));
  expect(older.ok() && newer.ok(), "two workers");
  expect(pool.expire_now() == 1, "surplus idle worker stopped");
  expect(!registry_has_pid(pool, older.pid), "least recently used worker stopped");
  expect(registry_has_pid(pool, newer.pid), "most recently used worker kept");
}

void test_dead_idle_worker_reaped() {
  kiln::WorkerPool pool(test_config());
  const auto rep = pool.execute(work(requirements({})));
  expect(rep.ok(), "execute");
  expect(::kill(rep.pid, SIGKILL) == 0, "kill idle worker");
  expect(wait_until_gone(rep.pid, 5000), "worker died");
  pool.expire_now();
  expect(!registry_has_pid(pool, rep.pid), "dead idle worker dropped");
  const auto next = pool.execute(work(requirements({})));
  expect(next.ok() && !next.reused, "fresh worker after idle death");
}

void test_session_scoped_teardown() {
  kiln::WorkerPool pool(test_config());
  pool.begin_session(kiln::LogLevel::lifecycle);
  const auto compiler = pool.execute(work(requirements({}, "compiler")));
  const auto regular = pool.execute(work(requirements({}, "test")));
  expect(compiler.ok() && regular.ok(), "both kinds started");

  clear_log();
  expect(pool.end_session() == 1, "session-scoped worker stopped at session end");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "session end logs stopped count");
  expect(!registry_has_pid(pool, compiler.pid), "compiler daemon gone");
  expect(registry_has_pid(pool, regular.pid), "regular worker survives session end");
  expect(!pool.current_session().active, "session inactive");

  // Busy at session end: retired on release.
  pool.begin_session(kiln::LogLevel::lifecycle);
  const auto item = work(requirements({}, "compiler"));
  const auto a = pool.allocate(item);
  expect(a.ok(), "allocate compiler daemon");
  expect(pool.end_session() == 0, "busy compiler daemon not stopped immediately");
  clear_log();
  pool.release(a, a.record->client->execute(item.action));
  expect(!registry_has_pid(pool, a.record->pid), "busy compiler daemon retired on release");
  expect(count_log("Stopped 1 worker daemon(s).") == 1, "retirement logged");
  expect(pool.stats().evicted_session.load() == 2, "both session evictions counted");
}

void test_shutdown_refuses_work() {
  kiln::set_pool_event_hook(capture_event);
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  kiln::WorkerPool pool(test_config());
  const auto rep = pool.execute(work(requirements({})));
  expect(rep.ok(), "execute");
  pool.shutdown();
  pool.shutdown();
  expect(pool.is_shut_down(), "pool shut down");
  expect(pool.registry().size() == 0, "workers stopped at shutdown");
  expect(wait_until_gone(rep.pid, 5000), "worker process exited");
  const auto refused = pool.execute(work(requirements({})));
  expect(refused.error == kiln::ErrorCode::pool_shut_down, "allocation after shutdown refused");

  expect(saw_event(kiln::PoolEventKind::spawned), "spawned event emitted");
  expect(saw_event(kiln::PoolEventKind::released), "released event emitted");
  expect(saw_event(kiln::PoolEventKind::stopped), "stopped event emitted");
  expect(pool.stats().recent_events_snapshot().size() >= 3, "events kept in the ring");
  const auto status = pool.status_json();
  expect(kiln::jsonlite::get_bool(status, "shut_down"), "status reports shutdown");
  kiln::set_pool_event_hook(nullptr);
}

// ============================================================================
// Host process death
// ============================================================================

struct CliProcess {
  int pid{-1};
  int in_fd{-1};
  int out_fd{-1};
};

CliProcess start_cli() {
  int in_pipe[2];
  int out_pipe[2];
  expect(::pipe2(in_pipe, O_CLOEXEC) == 0 && ::pipe2(out_pipe, O_CLOEXEC) == 0, "pipes");
  const pid_t pid = ::fork();
  expect(pid >= 0, "fork");
  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::setenv("KILN_WORKER_EXECUTABLE", KILN_TEST_WORKER_EXECUTABLE, 1);
    ::setenv("KILN_PARENT_POLL_MS", "100", 1);
    ::setenv("KILN_LOG_LEVEL", "quiet", 1);
    ::execl(KILN_TEST_CLI_EXECUTABLE, KILN_TEST_CLI_EXECUTABLE, "batch", static_cast<char*>(nullptr));
    _exit(127);
  }
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  return CliProcess{pid, in_pipe[1], out_pipe[0]};
}

std::string cli_request(kiln::protocol::LineChannel& out, int in_fd, const std::string& line) {
  const std::string framed = line + "\n";
  expect(::write(in_fd, framed.data(), framed.size()) == static_cast<ssize_t>(framed.size()), "write to kiln");
  std::string reply;
  expect(out.read_line(&reply, 20000) == kiln::protocol::LineChannel::ReadStatus::ok, "reply from kiln");
  return reply;
}

void test_worker_exits_when_host_killed() {
  CliProcess cli = start_cli();
  kiln::protocol::LineChannel out(cli.out_fd);
  const std::string reply =
      cli_request(out, cli.in_fd, R"({"op":"execute","classpath":[],"kind":"test","action":"echo","payload":"x"})");
  expect(kiln::jsonlite::get_bool(reply, "ok"), "execute through kiln batch: " + reply);
  const int worker_pid = static_cast<int>(kiln::jsonlite::get_u64(reply, "pid"));
  expect(worker_pid > 0, "worker pid reported");
  expect(!process_gone(worker_pid), "worker running");

  expect(::kill(cli.pid, SIGKILL) == 0, "kill host");
  int status = 0;
  ::waitpid(cli.pid, &status, 0);
  ::close(cli.in_fd);
  expect(wait_until_gone(worker_pid, 10000), "worker exits after its host was killed");
}

void test_batch_shutdown_stops_workers() {
  CliProcess cli = start_cli();
  kiln::protocol::LineChannel out(cli.out_fd);
  const std::string reply =
      cli_request(out, cli.in_fd, R"({"op":"execute","classpath":[],"kind":"test","action":"echo","payload":"x"})");
  const int worker_pid = static_cast<int>(kiln::jsonlite::get_u64(reply, "pid"));
  expect(worker_pid > 0, "worker pid reported");

  const std::string status = cli_request(out, cli.in_fd, R"({"op":"status"})");
  expect(kiln::jsonlite::get_string(status, "op") == "status", "status reply");
  expect(status.find("\"pid\":" + std::to_string(worker_pid)) != std::string::npos, "status lists the worker");

  const std::string bye = cli_request(out, cli.in_fd, R"({"op":"shutdown"})");
  expect(kiln::jsonlite::get_bool(bye, "ok"), "shutdown acknowledged");
  int status_code = 0;
  ::waitpid(cli.pid, &status_code, 0);
  ::close(cli.in_fd);
  expect(WIFEXITED(status_code) && WEXITSTATUS(status_code) == 0, "kiln batch exits cleanly");
  expect(wait_until_gone(worker_pid, 5000), "worker stopped by host shutdown");
}

}  // namespace

int main() {
  ::signal(SIGPIPE, SIG_IGN);
  kiln::log::set_sink(capture_sink);
  kiln::log::set_level(kiln::LogLevel::info);

  std::cout << "=== Kiln Worker Pool Test Suite ===\n";

  std::cout << "\n[Fingerprints]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("deterministic + order insensitive", test_fingerprint_deterministic_and_order_insensitive);
  run_test("classpath content sensitive", test_fingerprint_content_sensitive);
  run_test("vm args, log level, kind", test_fingerprint_other_fields);
  run_test("requirements from JSON", test_requirements_from_json);
  run_test("jsonlite escaping", test_jsonlite_escaping);

  std::cout << "\n[Protocol & processes]\n";
  run_test("frame encode/decode", test_protocol_frames);
  run_test("line channel", test_line_channel);
  run_test("run_process", test_run_process);
  run_test("worker argument round trip", test_worker_args_roundtrip);
  run_test("parent watchdog", test_parent_watchdog);

  std::cout << "\n[Registry, config, observability]\n";
  run_test("single claim of an idle worker (16 threads)", test_registry_single_claim);
  run_test("config merge + validate", test_config_merge_and_validate);
  run_test("duration histogram", test_duration_histogram);

  std::cout << "\n[Pool lifecycle]\n";
  run_test("reuse for same fingerprint", test_worker_reused_for_same_fingerprint);
  run_test("stop_all then respawn", test_stop_all_then_respawn);
  run_test("log level change stops idle workers", test_log_level_change_stops_idle_workers);
  run_test("busy worker at old log level stopped on release", test_busy_worker_at_old_log_level_stopped_on_release);
  run_test("pool stats timings", test_pool_stats_timings);
  run_test("classpath change spawns new worker", test_classpath_change_spawns_new_worker);
  run_test("vm args reach worker", test_vm_args_reach_worker);

  std::cout << "\n[Failure handling]\n";
  run_test("crash isolated and replaced", test_crash_isolated_and_replaced);
  run_test("user failure keeps worker", test_user_failure_keeps_worker);
  run_test("spawn failure", test_spawn_failure);
  run_test("ready timeout + protocol mismatch", test_ready_timeout_and_protocol_mismatch);
  run_test("concurrent allocations distinct (4 threads)", test_concurrent_allocations_distinct);
  run_test("stop_all interrupts busy worker", test_stop_all_interrupts_busy_worker);

  std::cout << "\n[Expiration & sessions]\n";
  run_test("idle timeout expiration", test_idle_timeout_expiration);
  run_test("max idle workers", test_max_idle_workers);
  run_test("dead idle worker reaped", test_dead_idle_worker_reaped);
  run_test("session-scoped teardown", test_session_scoped_teardown);
  run_test("shutdown refuses work", test_shutdown_refuses_work);

  std::cout << "\n[Host process death]\n";
  run_test("worker exits when host killed", test_worker_exits_when_host_killed);
  run_test("batch shutdown stops workers", test_batch_shutdown_stops_workers);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
