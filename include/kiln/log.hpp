#pragma once

// kiln/log.hpp - Level-filtered logging for the host and the worker.
//
// Lines go to the active sink. The default sink writes "[kiln] LEVEL message"
// to stderr; embedders (and the tests) install their own with set_sink().
// Sinks are plain function pointers and may be called from any thread.
//
// Audit lines that other components rely on are emitted at LogLevel::info:
//   "Started kiln worker daemon ..."
//   "Stopped N worker daemon(s)."
//   "Log level has changed, stopping idle worker daemon with out-of-date log level."

#include <string>
#include <string_view>

#include "kiln/types.hpp"

namespace kiln::log {

using LogSink = void (*)(LogLevel level, std::string_view message);

void set_level(LogLevel level);
LogLevel level();
bool enabled(LogLevel level);

// Passing nullptr restores the default stderr sink.
void set_sink(LogSink sink);

// Prefix for the default sink; the worker uses "kiln-worker <pid>".
void set_component(const std::string& component);

void write(LogLevel level, std::string_view message);

inline void debug(std::string_view m) { write(LogLevel::debug, m); }
inline void info(std::string_view m) { write(LogLevel::info, m); }
inline void warn(std::string_view m) { write(LogLevel::warn, m); }
inline void error(std::string_view m) { write(LogLevel::error, m); }

}  // namespace kiln::log
