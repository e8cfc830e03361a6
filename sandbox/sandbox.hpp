#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "util/file.hpp"

namespace sandbox {

enum class BackendType { DOCKER, VM, PROCESS, WASM };

const char* BackendName(BackendType type);
// Accepts the lowercase names returned by BackendName.
bool ParseBackendType(const std::string& name, BackendType* type);

struct ResourceAllocation {
  int32_t cpu_percent = 50;
  int64_t memory_mb = 512;
  int64_t disk_mb = 1024;
  bool network_enabled = false;
};

struct Mount {
  std::string source;
  std::string target;
  bool read_only = true;
};

struct SecurityOptions {
  bool no_new_privileges = true;
  bool read_only_root = false;
  std::vector<std::string> cap_drop = {"ALL"};
  std::vector<std::string> cap_add = {"CHOWN", "SETUID", "SETGID"};
};

struct SandboxConfig {
  std::string id;
  BackendType type = BackendType::PROCESS;
  ResourceAllocation resources;
  std::vector<Mount> mounts;
  SecurityOptions security;
  std::map<std::string, std::string> environment;
  // Container image, for backends that use one.
  std::string image;
};

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;
  // The program sees exactly these variables.
  std::map<std::string, std::string> environment;

  // Required values
  // Working directory, inside the sandbox workspace.
  std::string root = "";
  // Absolute path of the program.
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The program was killed for exceeding the wall time limit.
  bool timed_out = false;
  // The program was killed for exceeding the memory limit.
  bool memory_exceeded = false;
};

// Isolation mechanism behind a Sandbox. Implementations need to register
// themselves by creating a global object of type Backend::Register<Impl> and
// should define kType and the Create and Score static functions. Create
// should return a pointer to a newly allocated instance of the given
// implementation, while Score should return a value that defines how "good"
// that backend is: negative if the backend should not/cannot be used in the
// current configuration, positive otherwise (a bigger value means a better
// backend).
// Registering a backend is not thread-safe and should be done before any
// threads are created.
class Backend {
 public:
  using create_t = std::function<Backend*()>;
  using score_t = std::function<int()>;

  // Returns a new backend of the given type, or nullptr if that type is not
  // registered or not usable.
  static std::unique_ptr<Backend> Create(BackendType type);

  // Usable backend types, best first.
  static std::vector<BackendType> Ranked();

  virtual BackendType Type() const = 0;

  // Prepares the backend for the sandbox with the given configuration, whose
  // workspace is work_dir. Returns false on error, and sets error_msg.
  virtual bool Setup(const SandboxConfig& config, const std::string& work_dir,
                     std::string* error_msg) {
    return true;
  }

  // Adjusts the environment of programs run in the workspace.
  virtual void PrepareEnvironment(
      const std::string& work_dir,
      std::map<std::string, std::string>* environment) const {}

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Kills the running program, if any, and makes every later Execute fail.
  // Thread-safe.
  virtual void Kill() = 0;

  // Releases what Setup acquired. Returns false on error, and sets error_msg.
  virtual bool Teardown(std::string* error_msg) { return true; }

  // Constructor and destructors
  virtual ~Backend() = default;
  Backend() = default;
  Backend(const Backend&) = delete;
  Backend(Backend&&) = delete;
  Backend& operator=(const Backend&) = delete;
  Backend& operator=(Backend&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Backend::Register_(T::kType, &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    BackendType type;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Backends_();
  static void Register_(BackendType type, create_t create, score_t score);
  template <typename T>
  friend class Register;
};

// An isolated execution environment owned by a single job: an exclusive root
// directory, a workspace inside it and the backend that runs programs there.
// Created and destroyed by SandboxManager.
class Sandbox {
 public:
  static const constexpr char* kBoxDir = "box";

  const std::string& Id() const { return config_.id; }
  const SandboxConfig& Config() const { return config_; }
  BackendType Type() const { return config_.type; }
  // Private to the sandbox, outside the workspace.
  const std::string& Root() const { return root_->Path(); }
  // The directory programs can access.
  std::string WorkDir() const {
    return util::File::JoinPath(root_->Path(), kBoxDir);
  }
  absl::Time CreatedAt() const { return created_at_; }

  // Runs a program in the sandbox. Executions in the same sandbox are
  // serialized. Fails once the sandbox is cancelled or destroyed.
  bool Execute(ExecutionOptions options, ExecutionInfo* info,
               std::string* error_msg);

  // Kills the running program, if any. Permanent.
  void Cancel();
  bool Cancelled() const { return cancelled_; }

  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
  ~Sandbox() = default;

 private:
  friend class SandboxManager;
  Sandbox(SandboxConfig config, std::unique_ptr<util::TempDir> root,
          std::unique_ptr<Backend> backend);

  SandboxConfig config_;
  std::unique_ptr<util::TempDir> root_;
  std::unique_ptr<Backend> backend_;
  absl::Time created_at_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> destroyed_{false};
  absl::Mutex execute_mutex_;
};

}  // namespace sandbox

#endif
