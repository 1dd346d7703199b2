// kiln-worker - worker daemon executable spawned by kiln::WorkerPool.

#include <signal.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "kiln/log.hpp"
#include "kiln/watchdog.hpp"
#include "kiln/worker_runtime.hpp"

int main(int argc, char** argv) {
  ::signal(SIGPIPE, SIG_IGN);

  std::vector<std::string> args(argv + 1, argv + argc);
  kiln::WorkerSettings settings;
  std::string error;
  if (!kiln::parse_worker_args(args, &settings, &error)) {
    std::cerr << "kiln-worker: " << error << "\n";
    return 2;
  }

  kiln::log::set_component("kiln-worker " + std::to_string(::getpid()));
  kiln::log::set_level(settings.log_level);

  kiln::ParentWatchdog watchdog(settings.parent_pid, settings.parent_poll_ms);
  if (settings.parent_pid > 0) watchdog.start();

  kiln::WorkerRuntime runtime(std::move(settings));
  runtime.register_builtin_handlers();
  const int rc = runtime.run();

  watchdog.stop();
  return rc;
}
