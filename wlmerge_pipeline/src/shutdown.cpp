#include "wlmerge/shutdown.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>

#include "wlmerge/errors.hpp"
#include "wlmerge/progress_state.hpp"

namespace wlmerge {

const char* ToString(ShutdownState state) {
  switch (state) {
    case ShutdownState::Running:
      return "running";
    case ShutdownState::ShutdownRequested:
      return "shutdown-requested";
    case ShutdownState::Stopped:
      return "stopped";
  }
  return "unknown";
}

bool ShutdownCoordinator::RequestShutdown() {
  ShutdownState expected = ShutdownState::Running;
  if (!state_.compare_exchange_strong(expected,
                                      ShutdownState::ShutdownRequested)) {
    return false;
  }

  std::cerr << "[shutdown] stop requested, saving checkpoint\n";
  try {
    checkpoint_.Save();
  } catch (const IoError& e) {
    // Still stop: the next file completion retries the save.
    std::cerr << "[shutdown] checkpoint save failed: " << e.what() << "\n";
  }
  flag_.Request();
  return true;
}

void ShutdownCoordinator::MarkStopped() {
  state_.store(ShutdownState::Stopped);
}

SignalWatcher::SignalWatcher(ShutdownCoordinator& coordinator)
    : coordinator_(coordinator) {
  sigemptyset(&watched_);
  sigaddset(&watched_, SIGINT);
  sigaddset(&watched_, SIGTERM);
  const int rc = pthread_sigmask(SIG_BLOCK, &watched_, &previous_);
  if (rc != 0) {
    throw MergeError(std::string("pthread_sigmask failed: ") +
                     std::strerror(rc));
  }
  thread_ = std::thread([this] { Loop(); });
}

SignalWatcher::~SignalWatcher() {
  stop_.store(true);
  if (thread_.joinable()) thread_.join();
  pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::Loop() {
  while (!stop_.load()) {
    timespec timeout{};
    timeout.tv_nsec = 200 * 1000 * 1000;
    const int sig = sigtimedwait(&watched_, nullptr, &timeout);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      std::cerr << "[shutdown] sigtimedwait failed: " << std::strerror(errno)
                << "\n";
      return;
    }

    received_.store(sig);
    std::cerr << "[shutdown] received " << strsignal(sig) << "\n";
    if (!coordinator_.RequestShutdown()) {
      std::cerr << "[shutdown] already stopping, waiting for in-flight work\n";
    }
  }
}

}  // namespace wlmerge
