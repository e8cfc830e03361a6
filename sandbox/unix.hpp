#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <atomic>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Process isolation for UNIX-like systems: the program runs in a new session
// with resource limits, a scrubbed environment and no way to gain privileges.
// On timeout its whole process group is killed.
class Unix : public Backend {
 public:
  static const constexpr BackendType kType = BackendType::PROCESS;

  BackendType Type() const override { return kType; }
  bool Setup(const SandboxConfig& config, const std::string& work_dir,
             std::string* error_msg) override;
  void PrepareEnvironment(
      const std::string& work_dir,
      std::map<std::string, std::string>* environment) const override;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  void Kill() override;

  static Backend* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Prepare(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed just before exec. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Kills the process group of the running child, if any.
  void KillChild();

  // Executed after the process group of a running child has been killed.
  virtual void OnKill() {}

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* info) {}

  std::string work_dir_;
  int pipe_fds_[2] = {-1, -1};
  const ExecutionOptions* options_ = nullptr;

  // Arguments and environment of the child, built before forking.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> env_;

  absl::Mutex pid_mutex_;
  pid_t child_pid_ ABSL_GUARDED_BY(pid_mutex_) = 0;
  std::atomic<bool> kill_requested_{false};
};

}  // namespace sandbox
#endif
