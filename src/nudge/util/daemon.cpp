#include "nudge/util/daemon.hpp"

#include <csignal>
#include <cstdio>
#include <unistd.h>

namespace nudge {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    _exit(0);

  if (setsid() < 0)
    return false;

  pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    _exit(0);

  if (!std::freopen("/dev/null", "r", stdin) ||
      !std::freopen("/dev/null", "w", stdout) ||
      !std::freopen("/dev/null", "w", stderr)) {
    return false;
  }
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

}  // namespace nudge
