#ifndef EXECUTOR_SHUTDOWN_HANDLER_HPP
#define EXECUTOR_SHUTDOWN_HANDLER_HPP

#include <signal.h>

#include <atomic>
#include <functional>
#include <thread>

namespace executor {

// Turns SIGINT, SIGTERM and SIGHUP into a call to a callback, made at most
// once from a dedicated thread. The signals are blocked in the constructing
// thread, so it must be created before any other thread. Throws
// std::system_error if the signal mask cannot be changed.
class ShutdownHandler {
 public:
  explicit ShutdownHandler(std::function<void(int)> callback);
  ~ShutdownHandler();

  // The signal that was received, or 0.
  int Signal() const { return signal_; }

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;
  ShutdownHandler(ShutdownHandler&&) = delete;
  ShutdownHandler& operator=(ShutdownHandler&&) = delete;

 private:
  void Loop();

  std::function<void(int)> callback_;
  sigset_t signals_;
  sigset_t old_mask_;
  std::atomic<int> signal_{0};
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

}  // namespace executor

#endif
