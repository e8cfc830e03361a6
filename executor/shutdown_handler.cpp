#include "executor/shutdown_handler.hpp"

#include <pthread.h>
#include <string.h>

#include <system_error>

#include "glog/logging.h"

namespace executor {

ShutdownHandler::ShutdownHandler(std::function<void(int)> callback)
    : callback_(std::move(callback)) {
  sigemptyset(&signals_);
  sigaddset(&signals_, SIGINT);
  sigaddset(&signals_, SIGTERM);
  sigaddset(&signals_, SIGHUP);
  // Threads created from now on inherit the mask.
  int ret = pthread_sigmask(SIG_BLOCK, &signals_, &old_mask_);
  if (ret != 0) {
    throw std::system_error(ret, std::system_category(), "pthread_sigmask");
  }
  thread_ = std::thread(&ShutdownHandler::Loop, this);
}

ShutdownHandler::~ShutdownHandler() {
  stopping_ = true;
  // Wakes up sigwait if no signal was received.
  if (signal_ == 0) pthread_kill(thread_.native_handle(), SIGHUP);
  thread_.join();
  pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

void ShutdownHandler::Loop() {
  int sig = 0;
  int ret = sigwait(&signals_, &sig);
  if (ret != 0) {
    LOG(ERROR) << "sigwait: " << strerror(ret);
    return;
  }
  if (stopping_) return;
  signal_ = sig;
  LOG(WARNING) << "Received " << strsignal(sig) << ", shutting down";
  callback_(sig);
}

}  // namespace executor
