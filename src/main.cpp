#include "burrow/burrow.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

namespace {

/// Turn SIGINT/SIGTERM into run_control::stop(). The signals are blocked in
/// every thread and collected here, so no handler touches shared state.
void watch_signals(const sigset_t &signals, burrow::run_control &control) {
  const timespec poll_interval{0, 200 * 1000 * 1000};
  while (!control.stopped()) {
    int sig = ::sigtimedwait(&signals, nullptr, &poll_interval);
    if (sig == SIGINT || sig == SIGTERM) {
      spdlog::info("Shutting down...");
      control.stop();
      return;
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  burrow::tunnel_options options;
  try {
    options = burrow::parse_options(std::vector<std::string>(argv + 1,
                                                             argv + argc));
  } catch (const std::invalid_argument &e) {
    std::fprintf(stderr, "ERROR: %s\n%s", e.what(),
                 std::string(burrow::kUsage).c_str());
    return 1;
  }
  if (options.show_help) {
    std::fputs(std::string(burrow::kUsage).c_str(), stdout);
    return 0;
  }

  burrow::init_logging(options.verbose);

  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  burrow::run_control control;
  std::thread watcher([&signals, &control]() { watch_signals(signals, control); });

  int ret = 0;
  try {
    burrow::tunnel_client client(options);
    if (client.run(control) == burrow::run_result::auth_rejected) {
      ret = 1;
    }
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    ret = 1;
  }

  control.stop();
  watcher.join();
  return ret;
}
