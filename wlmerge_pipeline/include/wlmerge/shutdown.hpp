#pragma once

#include <signal.h>

#include <atomic>
#include <thread>

namespace wlmerge {

class Checkpoint;

// Set once per run, never reset. Polled by workers before each file and by
// the driving loops.
class ShutdownFlag {
 public:
  void Request() { flag_.store(true, std::memory_order_release); }
  bool IsSet() const { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

enum class ShutdownState { Running, ShutdownRequested, Stopped };

const char* ToString(ShutdownState state);

// Running -> ShutdownRequested -> Stopped.
class ShutdownCoordinator {
 public:
  ShutdownCoordinator(Checkpoint& checkpoint, ShutdownFlag& flag)
      : checkpoint_(checkpoint), flag_(flag) {}

  // The first call saves the checkpoint and then raises the flag; returns
  // true. Every later call is a no-op returning false.
  bool RequestShutdown();

  // Pipeline has unwound.
  void MarkStopped();

  ShutdownState state() const { return state_.load(); }

 private:
  Checkpoint& checkpoint_;
  ShutdownFlag& flag_;
  std::atomic<ShutdownState> state_{ShutdownState::Running};
};

// Turns SIGINT/SIGTERM into ShutdownCoordinator::RequestShutdown().
//
// The constructor blocks both signals in the calling thread; construct it
// before any worker thread so every thread inherits the mask. A dedicated
// thread collects them with sigtimedwait. The destructor stops the thread
// and restores the previous mask.
class SignalWatcher {
 public:
  explicit SignalWatcher(ShutdownCoordinator& coordinator);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  // 0 until a signal arrives.
  int received_signal() const { return received_.load(); }

 private:
  void Loop();

  ShutdownCoordinator& coordinator_;
  sigset_t watched_;
  sigset_t previous_;
  std::atomic<bool> stop_{false};
  std::atomic<int> received_{0};
  std::thread thread_;
};

}  // namespace wlmerge
