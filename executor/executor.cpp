#include "executor/executor.hpp"

#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "executor/results.hpp"
#include "glog/logging.h"

namespace executor {

namespace {
// Container names only allow a restricted set of characters.
const constexpr size_t kMaxSandboxIdPrefix = 40;

std::string SanitizeId(const std::string& id) {
  std::string sanitized;
  for (char c : id.substr(0, kMaxSandboxIdPrefix)) {
    bool valid = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    sanitized.push_back(valid ? c : '_');
  }
  return sanitized;
}

std::string FirstBlocked(const std::vector<proto::SecurityEvent>& events) {
  for (const proto::SecurityEvent& event : events) {
    if (event.action() == proto::SecurityEvent::BLOCKED) return event.details();
  }
  return "job rejected";
}
}  // namespace

Executor::Executor(ExecutorOptions options, policy::PolicyEngine* policy,
                   sandbox::SandboxManager* sandboxes, ApiTransport* api,
                   DatabaseClient* database)
    : options_(std::move(options)),
      policy_(policy),
      sandboxes_(sandboxes),
      runner_(policy, api, database, options_.script_interpreter),
      max_concurrent_jobs_(options_.max_concurrent_jobs) {}

Executor::~Executor() { Shutdown(); }

proto::Result Executor::Execute(const proto::Job& job, EventQueue* events) {
  absl::Time start = absl::Now();
  std::vector<proto::SecurityEvent> violations;
  proto::Result result;
  if (!IsRunning()) {
    result = MakeCancelled(job.id(), "Executor is not running");
  } else if (job.id().empty()) {
    result = MakeFailure(job.id(), proto::Result::INVALID_JOB,
                         "Job id must not be empty");
  } else if (job.body_case() == proto::Job::BODY_NOT_SET) {
    result = MakeFailure(job.id(), proto::Result::UNSUPPORTED_JOB_TYPE,
                         "Job has no body");
  } else {
    try {
      policy::ValidationResult validation = policy_->ValidateJob(job);
      violations = std::move(validation.violations);
      if (!validation.allowed) {
        result = MakeFailure(job.id(), proto::Result::POLICY_VIOLATION,
                             "Security policy violation: " +
                                 FirstBlocked(violations));
      } else {
        result = Run(job, events);
      }
    } catch (const std::exception& e) {
      LOG(ERROR) << "Job " << job.id() << ": " << e.what();
      result = MakeFailure(job.id(), proto::Result::RUNTIME_FAILURE, e.what());
    }
  }
  Finish(job, start, violations, &result, events);
  return result;
}

proto::Result Executor::Run(const proto::Job& job, EventQueue* events) {
  sandbox::ExecutionContext context = BuildContext(job);
  std::unique_ptr<ExecutionSlot> slot;
  try {
    slot = absl::make_unique<ExecutionSlot>(this, &context);
  } catch (const too_many_executions& e) {
    LOG(WARNING) << "Job " << job.id() << " rejected: " << e.what();
    return MakeFailure(job.id(), proto::Result::CONCURRENCY_LIMIT, e.what());
  } catch (const std::invalid_argument& e) {
    return MakeFailure(job.id(), proto::Result::INVALID_JOB, e.what());
  } catch (const std::runtime_error& e) {
    return MakeCancelled(job.id(), e.what());
  }
  if (events) events->JobStarted(job.id());

  std::shared_ptr<sandbox::Sandbox> created;
  try {
    created = sandboxes_->CreateSandbox(context);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Job " << job.id() << ": " << e.what();
    return MakeFailure(job.id(), proto::Result::SANDBOX_FAILURE, e.what());
  }
  SandboxLease sandbox(sandboxes_, std::move(created));
  {
    absl::MutexLock lck(&mutex_);
    if (active_[job.id()].cancelled) sandbox->Cancel();
  }
  if (sandbox->Cancelled()) {
    proto::Result result = MakeCancelled(job.id(), "Job cancelled");
    result.set_sandbox_id(sandbox->Id());
    return result;
  }

  try {
    return runner_.Run(job, context, sandbox.get());
  } catch (const std::exception& e) {
    LOG(ERROR) << "Job " << job.id() << ": " << e.what();
    return MakeFailure(job.id(), proto::Result::RUNTIME_FAILURE, e.what());
  }
}

void Executor::Finish(const proto::Job& job, absl::Time start,
                      const std::vector<proto::SecurityEvent>& violations,
                      proto::Result* result, EventQueue* events) {
  absl::Time now = absl::Now();
  result->set_job_id(job.id());
  result->set_duration_millis(absl::ToInt64Milliseconds(now - start));
  result->set_finished_at_millis(absl::ToUnixMillis(now));
  // Events of validation come before the ones of the execution.
  google::protobuf::RepeatedPtrField<proto::SecurityEvent> execution_events;
  execution_events.Swap(result->mutable_security_events());
  for (const proto::SecurityEvent& event : violations) {
    *result->add_security_events() = event;
  }
  for (const proto::SecurityEvent& event : execution_events) {
    *result->add_security_events() = event;
  }

  if (IsFailure(*result)) {
    LOG(INFO) << "Job " << job.id() << " "
              << proto::Result::Status_Name(result->status()) << " ("
              << proto::Result::ErrorKind_Name(result->error_kind())
              << "): " << result->error();
  } else {
    LOG(INFO) << "Job " << job.id() << " succeeded in "
              << result->duration_millis() << "ms";
  }

  {
    absl::MutexLock lck(&mutex_);
    history_.push_back(*result);
    while (options_.max_history && history_.size() > options_.max_history) {
      history_.pop_front();
    }
  }
  if (events) {
    if (IsFailure(*result)) {
      events->JobFailed(*result);
    } else {
      events->JobCompleted(*result);
    }
  }
}

sandbox::ExecutionContext Executor::BuildContext(const proto::Job& job) {
  sandbox::ExecutionContext context;
  context.job_id = job.id();
  context.sandbox_id = NewSandboxId(job.id());
  context.start_time = absl::Now();
  context.environment = options_.base_environment;
  for (const auto& var : job.environment()) {
    context.environment[var.first] = var.second;
  }
  context.environment["BRUNO_JOB_ID"] = context.job_id;
  context.environment["BRUNO_SANDBOX_ID"] = context.sandbox_id;
  context.permissions.insert(job.permissions().begin(),
                             job.permissions().end());
  context.working_directory = job.working_directory();
  context.limits.cpu_percent = options_.default_cpu_percent;
  context.limits.memory_mb = options_.default_memory_mb;
  context.limits.disk_mb = options_.default_disk_mb;
  context.limits.network_enabled = context.HasPermission("network");
  context.limits.timeout_millis = job.timeout_millis() > 0
                                      ? job.timeout_millis()
                                      : options_.default_timeout_millis;
  return context;
}

std::string Executor::NewSandboxId(const std::string& job_id) {
  int64_t counter;
  {
    absl::MutexLock lck(&mutex_);
    counter = ++sandbox_counter_;
  }
  return absl::StrCat(SanitizeId(job_id), "-", absl::ToUnixMillis(absl::Now()),
                      "-", counter);
}

bool Executor::Cancel(const std::string& job_id) {
  std::string sandbox_id;
  {
    absl::MutexLock lck(&mutex_);
    auto it = active_.find(job_id);
    if (it == active_.end()) return false;
    it->second.cancelled = true;
    sandbox_id = it->second.sandbox_id;
  }
  LOG(INFO) << "Cancelling job " << job_id;
  // The sandbox may not exist yet: Run checks the flag once it does.
  sandboxes_->CancelSandbox(sandbox_id);
  return true;
}

std::vector<std::string> Executor::GetActiveJobs() const {
  absl::MutexLock lck(&mutex_);
  std::vector<std::string> jobs;
  for (const auto& job : active_) jobs.push_back(job.first);
  return jobs;
}

absl::optional<proto::Result> Executor::GetJobHistory(
    const std::string& job_id) const {
  absl::MutexLock lck(&mutex_);
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->job_id() == job_id) return *it;
  }
  return {};
}

std::vector<proto::Result> Executor::GetJobHistory() const {
  absl::MutexLock lck(&mutex_);
  return std::vector<proto::Result>(history_.begin(), history_.end());
}

void Executor::ClearJobHistory() {
  absl::MutexLock lck(&mutex_);
  history_.clear();
}

std::vector<proto::SecurityEvent> Executor::GetSecurityEvents(
    size_t limit) const {
  return policy_->GetSecurityEvents(limit);
}

void Executor::SetMaxConcurrentJobs(size_t num) {
  absl::MutexLock lck(&mutex_);
  max_concurrent_jobs_ = num;
}

size_t Executor::MaxConcurrentJobs() const {
  absl::MutexLock lck(&mutex_);
  return max_concurrent_jobs_;
}

void Executor::Start() {
  absl::MutexLock lck(&mutex_);
  running_ = true;
}

void Executor::Shutdown() {
  std::vector<std::string> sandbox_ids;
  {
    absl::MutexLock lck(&mutex_);
    if (!running_) return;
    running_ = false;
    for (auto& job : active_) {
      job.second.cancelled = true;
      sandbox_ids.push_back(job.second.sandbox_id);
    }
  }
  LOG(INFO) << "Shutting down, cancelling " << sandbox_ids.size() << " jobs";
  for (const std::string& id : sandbox_ids) sandboxes_->CancelSandbox(id);
  sandboxes_->DestroyAllSandboxes();
}

bool Executor::IsRunning() const {
  absl::MutexLock lck(&mutex_);
  return running_;
}

Executor::ExecutionSlot::ExecutionSlot(Executor* executor,
                                       const sandbox::ExecutionContext* context)
    : executor_(executor), job_id_(context->job_id) {
  absl::MutexLock lck(&executor_->mutex_);
  if (!executor_->running_) {
    throw std::runtime_error("Executor is not running");
  }
  if (executor_->active_.count(job_id_)) {
    throw std::invalid_argument("Job " + job_id_ + " is already running");
  }
  if (executor_->active_.size() >= executor_->max_concurrent_jobs_) {
    throw too_many_executions(
        absl::StrCat("too many concurrent jobs (limit ",
                     executor_->max_concurrent_jobs_, ")"));
  }
  executor_->active_[job_id_].sandbox_id = context->sandbox_id;
}

Executor::ExecutionSlot::~ExecutionSlot() {
  absl::MutexLock lck(&executor_->mutex_);
  executor_->active_.erase(job_id_);
}

Executor::SandboxLease::~SandboxLease() {
  manager_->DestroySandbox(sandbox_->Id());
}

}  // namespace executor
