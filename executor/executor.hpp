#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <stdint.h>

#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "executor/collaborators.hpp"
#include "executor/event_queue.hpp"
#include "executor/job_runner.hpp"
#include "policy/policy_engine.hpp"
#include "proto/job.pb.h"
#include "proto/result.pb.h"
#include "sandbox/execution_context.hpp"
#include "sandbox/sandbox_manager.hpp"

namespace executor {

class too_many_executions : public std::runtime_error {
 public:
  explicit too_many_executions(const std::string& msg)
      : std::runtime_error(msg) {}
};

struct ExecutorOptions {
  size_t max_concurrent_jobs = 10;
  // Used for jobs that do not set timeout_millis.
  int64_t default_timeout_millis = 300000;
  int32_t default_cpu_percent = 50;
  int64_t default_memory_mb = 512;
  int64_t default_disk_mb = 1024;
  // Number of Results kept in the history. 0 means unbounded.
  size_t max_history = 1000;
  std::string script_interpreter = "/bin/sh";
  // Environment every job starts from.
  std::map<std::string, std::string> base_environment = {
      {"PATH", "/usr/local/bin:/usr/bin:/bin"},
      {"HOME", "/workspace"},
      {"USER", "bruno"},
      {"SHELL", "/bin/sh"},
      {"BRUNO_SECURITY", "enforced"},
      {"BRUNO_SANDBOX", "active"}};
};

// Runs jobs: each job is validated, admitted, given its own sandbox,
// dispatched by type and its sandbox destroyed, whatever the outcome.
// Execute may be called from many threads at once. The policy engine, the
// sandbox manager and the collaborators must outlive the executor.
class Executor {
 public:
  Executor(ExecutorOptions options, policy::PolicyEngine* policy,
           sandbox::SandboxManager* sandboxes, ApiTransport* api = nullptr,
           DatabaseClient* database = nullptr);
  ~Executor();

  // Runs job on the calling thread and returns its Result. Never throws:
  // every failure is reported in the Result. If events is not null, the
  // lifecycle of the job is published there.
  proto::Result Execute(const proto::Job& job, EventQueue* events = nullptr);

  // Kills the running job. Returns false if it is not running.
  bool Cancel(const std::string& job_id);

  std::vector<std::string> GetActiveJobs() const;
  absl::optional<proto::Result> GetJobHistory(const std::string& job_id) const;
  // Oldest first.
  std::vector<proto::Result> GetJobHistory() const;
  void ClearJobHistory();
  std::vector<proto::SecurityEvent> GetSecurityEvents(size_t limit = 0) const;

  // Applies to admissions from now on; running jobs are not affected.
  void SetMaxConcurrentJobs(size_t num);
  size_t MaxConcurrentJobs() const;

  // Accepts jobs again after a Shutdown. A new executor is already started.
  void Start();
  // Stops accepting jobs, cancels the running ones and destroys every
  // sandbox. Idempotent.
  void Shutdown();
  bool IsRunning() const;

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;

 private:
  // Holds one of the max_concurrent_jobs slots, and registers the context of
  // the job for its lifetime.
  class ExecutionSlot {
   public:
    ExecutionSlot(Executor* executor, const sandbox::ExecutionContext* context);
    ~ExecutionSlot();
    ExecutionSlot(const ExecutionSlot&) = delete;
    ExecutionSlot& operator=(const ExecutionSlot&) = delete;
    ExecutionSlot(ExecutionSlot&&) = delete;
    ExecutionSlot& operator=(ExecutionSlot&&) = delete;

   private:
    Executor* executor_;
    std::string job_id_;
  };

  // Destroys the sandbox when the job is done.
  class SandboxLease {
   public:
    SandboxLease(sandbox::SandboxManager* manager,
                 std::shared_ptr<sandbox::Sandbox> sandbox)
        : manager_(manager), sandbox_(std::move(sandbox)) {}
    ~SandboxLease();
    sandbox::Sandbox* operator->() const { return sandbox_.get(); }
    sandbox::Sandbox* get() const { return sandbox_.get(); }
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;
    SandboxLease(SandboxLease&&) = delete;
    SandboxLease& operator=(SandboxLease&&) = delete;

   private:
    sandbox::SandboxManager* manager_;
    std::shared_ptr<sandbox::Sandbox> sandbox_;
  };

  // Admits the job and runs it in a new sandbox.
  proto::Result Run(const proto::Job& job, EventQueue* events);
  sandbox::ExecutionContext BuildContext(const proto::Job& job);
  std::string NewSandboxId(const std::string& job_id);
  void Finish(const proto::Job& job, absl::Time start,
              const std::vector<proto::SecurityEvent>& violations,
              proto::Result* result, EventQueue* events);

  ExecutorOptions options_;
  policy::PolicyEngine* policy_;
  sandbox::SandboxManager* sandboxes_;
  JobRunner runner_;

  mutable absl::Mutex mutex_;
  bool running_ ABSL_GUARDED_BY(mutex_) = true;
  size_t max_concurrent_jobs_ ABSL_GUARDED_BY(mutex_);
  int64_t sandbox_counter_ ABSL_GUARDED_BY(mutex_) = 0;
  struct ActiveJob {
    std::string sandbox_id;
    bool cancelled = false;
  };
  std::map<std::string, ActiveJob> active_ ABSL_GUARDED_BY(mutex_);
  std::deque<proto::Result> history_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace executor

#endif
