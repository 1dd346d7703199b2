#include "kiln/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace kiln::log {

namespace {

std::atomic<LogLevel> g_level{LogLevel::lifecycle};
std::atomic<LogSink> g_sink{nullptr};
std::mutex g_stderr_mu;
std::string g_component{"kiln"};

const char* level_label(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info: return "INFO";
    case LogLevel::lifecycle: return "LIFECYCLE";
    case LogLevel::warn: return "WARN";
    case LogLevel::quiet: return "QUIET";
    case LogLevel::error: return "ERROR";
  }
  return "INFO";
}

void stderr_sink(LogLevel level, std::string_view message) {
  // One fprintf per line keeps lines whole when several threads log at once.
  std::lock_guard<std::mutex> lk(g_stderr_mu);
  std::fprintf(stderr, "[%s] %s %.*s\n", g_component.c_str(), level_label(level),
               static_cast<int>(message.size()), message.data());
}

}  // namespace

void set_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel level() { return g_level.load(std::memory_order_relaxed); }

bool enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void set_sink(LogSink sink) { g_sink.store(sink, std::memory_order_release); }

void set_component(const std::string& component) {
  std::lock_guard<std::mutex> lk(g_stderr_mu);
  g_component = component;
}

void write(LogLevel level, std::string_view message) {
  if (!enabled(level)) return;
  LogSink sink = g_sink.load(std::memory_order_acquire);
  if (sink) {
    sink(level, message);
    return;
  }
  stderr_sink(level, message);
}

}  // namespace kiln::log
