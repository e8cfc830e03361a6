#include "executor/job_runner.hpp"

#include <system_error>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/types/optional.h"
#include "executor/results.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/sha256.hpp"

namespace executor {

namespace {
const constexpr char* kShell = "/bin/sh";
const constexpr char* kEnv = "/usr/bin/env";
const constexpr size_t kScriptHashLength = 8;

void SetUsage(const sandbox::ExecutionInfo& info, proto::Result* result) {
  proto::ResourceUsage* usage = result->mutable_resource_usage();
  usage->set_cpu_millis(info.cpu_time_millis);
  usage->set_sys_millis(info.sys_time_millis);
  usage->set_wall_millis(info.wall_time_millis);
  usage->set_memory_kb(info.memory_usage_kb);
}

std::string ReadIfExists(const std::string& path) {
  if (!util::File::Exists(path)) return "";
  return util::File::Read(path);
}
}  // namespace

JobRunner::JobRunner(policy::PolicyEngine* policy, ApiTransport* api,
                     DatabaseClient* database, std::string script_interpreter)
    : policy_(policy),
      api_(api),
      database_(database),
      script_interpreter_(std::move(script_interpreter)) {}

proto::Result JobRunner::Run(const proto::Job& job,
                             const sandbox::ExecutionContext& context,
                             sandbox::Sandbox* sandbox) const {
  proto::Result result;
  switch (job.body_case()) {
    case proto::Job::kShell:
      result = RunShell(job, context, sandbox);
      break;
    case proto::Job::kScript:
      result = RunScript(job, context, sandbox);
      break;
    case proto::Job::kFile:
      result = RunFile(job, context, sandbox);
      break;
    case proto::Job::kApi:
      result = RunApi(job, context);
      break;
    case proto::Job::kDatabase:
      result = RunDatabase(job, context);
      break;
    case proto::Job::BODY_NOT_SET:
      result = MakeFailure(job.id(), proto::Result::UNSUPPORTED_JOB_TYPE,
                           "Unsupported job type");
      break;
  }
  result.set_sandbox_id(sandbox->Id());
  result.set_backend(sandbox::BackendName(sandbox->Type()));
  return result;
}

void JobRunner::AddEvent(const std::string& job_id,
                         proto::SecurityEvent::Type type,
                         proto::Severity severity, const std::string& rule_id,
                         const std::string& details,
                         proto::Result* result) const {
  proto::SecurityEvent event;
  event.set_type(type);
  event.set_severity(severity);
  event.set_action(proto::SecurityEvent::BLOCKED);
  event.set_rule_id(rule_id);
  event.set_details(details);
  event.set_job_id(job_id);
  policy_->RecordEvent(event);
  *result->add_security_events() = event;
}

bool JobRunner::WorkingDirectory(const sandbox::ExecutionContext& context,
                                 const sandbox::Sandbox& sandbox,
                                 std::string* directory) const {
  if (!util::File::ResolveWithin(sandbox.WorkDir(), context.working_directory,
                                 directory)) {
    return false;
  }
  util::File::MakeDirs(*directory);
  return true;
}

proto::Result JobRunner::RunShell(const proto::Job& job,
                                  const sandbox::ExecutionContext& context,
                                  sandbox::Sandbox* sandbox) const {
  const std::string& command = job.shell().command();
  if (command.empty()) {
    return MakeFailure(job.id(), proto::Result::INVALID_JOB, "Empty command");
  }
  absl::optional<proto::SecurityEvent> event =
      policy_->CheckCommand(job.id(), command);
  if (event) {
    proto::Result result =
        MakeFailure(job.id(), proto::Result::DANGEROUS_COMMAND,
                    "Command not allowed by security policy");
    *result.add_security_events() = *event;
    return result;
  }
  std::string directory;
  if (!WorkingDirectory(context, *sandbox, &directory)) {
    proto::Result result = MakeFailure(
        job.id(), proto::Result::PATH_TRAVERSAL,
        "Path traversal attempt blocked: " + context.working_directory);
    AddEvent(job.id(), proto::SecurityEvent::SUSPICIOUS_ACTIVITY,
             proto::HIGH, "path-traversal", result.error(), &result);
    return result;
  }
  return RunCommand(command, directory, context, sandbox);
}

proto::Result JobRunner::RunScript(const proto::Job& job,
                                   const sandbox::ExecutionContext& context,
                                   sandbox::Sandbox* sandbox) const {
  const proto::ScriptJob& script = job.script();
  if (script.content().empty()) {
    return MakeFailure(job.id(), proto::Result::INVALID_JOB, "Empty script");
  }
  const std::string& interpreter = script.interpreter().empty()
                                       ? script_interpreter_
                                       : script.interpreter();
  std::vector<std::string> words =
      absl::StrSplit(interpreter, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (words.empty()) {
    return MakeFailure(job.id(), proto::Result::INVALID_JOB,
                       "Empty interpreter");
  }
  absl::optional<proto::SecurityEvent> event =
      policy_->CheckCommand(job.id(), script.content());
  if (!event) event = policy_->CheckCommand(job.id(), interpreter);
  if (event) {
    proto::Result result =
        MakeFailure(job.id(), proto::Result::DANGEROUS_COMMAND,
                    "Script not allowed by security policy");
    *result.add_security_events() = *event;
    return result;
  }
  std::string directory;
  if (!WorkingDirectory(context, *sandbox, &directory)) {
    proto::Result result = MakeFailure(
        job.id(), proto::Result::PATH_TRAVERSAL,
        "Path traversal attempt blocked: " + context.working_directory);
    AddEvent(job.id(), proto::SecurityEvent::SUSPICIOUS_ACTIVITY,
             proto::HIGH, "path-traversal", result.error(), &result);
    return result;
  }
  std::string name = "script-" + util::SHA256::Hex(script.content())
                                     .substr(0, kScriptHashLength);
  util::File::Write(util::File::JoinPath(directory, name), script.content());
  // The interpreter is never parsed by a shell. Relative names are looked up
  // on the PATH of the sandbox.
  std::string executable = kEnv;
  std::vector<std::string> args = {"--"};
  if (words[0].find('/') != std::string::npos) {
    executable = words[0];
    args.clear();
    words.erase(words.begin());
  }
  args.insert(args.end(), words.begin(), words.end());
  args.push_back("./" + name);
  return RunProgram(executable, args, directory, context, sandbox);
}

proto::Result JobRunner::RunCommand(const std::string& command,
                                    const std::string& directory,
                                    const sandbox::ExecutionContext& context,
                                    sandbox::Sandbox* sandbox) const {
  return RunProgram(kShell, {"-c", command}, directory, context, sandbox);
}

proto::Result JobRunner::RunProgram(const std::string& executable,
                                    const std::vector<std::string>& args,
                                    const std::string& directory,
                                    const sandbox::ExecutionContext& context,
                                    sandbox::Sandbox* sandbox) const {
  const std::string& job_id = context.job_id;
  const sandbox::ResourceLimits& limits = context.limits;
  sandbox::ExecutionOptions options(directory, executable);
  options.args = args;
  options.environment = context.environment;
  options.stdout_file = util::File::JoinPath(sandbox->Root(), "stdout");
  options.stderr_file = util::File::JoinPath(sandbox->Root(), "stderr");
  options.wall_limit_millis = limits.timeout_millis;
  options.memory_limit_kb = limits.memory_mb * 1024;
  options.max_file_size_kb = limits.disk_mb * 1024;

  sandbox::ExecutionInfo info;
  std::string error_msg;
  VLOG(1) << "Job " << job_id << " running: " << executable << " "
          << absl::StrJoin(args, " ");
  if (!sandbox->Execute(options, &info, &error_msg)) {
    if (sandbox->Cancelled()) return MakeCancelled(job_id, "Job cancelled");
    return MakeFailure(job_id, proto::Result::RUNTIME_FAILURE,
                       "Cannot run command: " + error_msg);
  }

  proto::Result result;
  if (sandbox->Cancelled()) {
    result = MakeCancelled(job_id, "Job cancelled");
  } else if (info.timed_out) {
    result = MakeTimeout(job_id, limits.timeout_millis);
    AddEvent(job_id, proto::SecurityEvent::RESOURCE_EXCEEDED, proto::MEDIUM,
             "timeout", result.error(), &result);
  } else if (info.memory_exceeded) {
    result = MakeFailure(
        job_id, proto::Result::RESOURCE_LIMIT,
        absl::StrCat("Job exceeded memory limit of ", limits.memory_mb, "MB"));
    AddEvent(job_id, proto::SecurityEvent::RESOURCE_EXCEEDED, proto::MEDIUM,
             "memory-limit", result.error(), &result);
  } else if (info.signal != 0) {
    result = MakeFailure(job_id, proto::Result::NONZERO_EXIT,
                         absl::StrCat("Killed by signal ", info.signal));
  } else if (info.status_code != 0) {
    result = MakeFailure(job_id, proto::Result::NONZERO_EXIT,
                         absl::StrCat("Exited with code ", info.status_code));
  } else {
    result = MakeSuccess(job_id);
  }
  result.set_exit_code(info.status_code);
  result.set_signal(info.signal);
  result.set_stdout(ReadIfExists(options.stdout_file));
  result.set_stderr(ReadIfExists(options.stderr_file));
  result.set_output(result.stdout());
  SetUsage(info, &result);
  return result;
}

proto::Result JobRunner::RunFile(const proto::Job& job,
                                 const sandbox::ExecutionContext& context,
                                 sandbox::Sandbox* sandbox) const {
  proto::Result result = MakeSuccess(job.id());
  for (const proto::FileOperation& op : job.file().operations()) {
    std::string path;
    if (op.path().empty()) {
      return MakeFailure(job.id(), proto::Result::INVALID_JOB,
                         "File operation without a path");
    }
    if (!util::File::ResolveWithin(sandbox->WorkDir(), op.path(), &path)) {
      result = MakeFailure(job.id(), proto::Result::PATH_TRAVERSAL,
                           "Path traversal attempt blocked: " + op.path());
      AddEvent(job.id(), proto::SecurityEvent::SUSPICIOUS_ACTIVITY,
               proto::HIGH, "path-traversal", result.error(), &result);
      return result;
    }
    const char* permission =
        op.op() == proto::FileOperation::WRITE ? "file:write" : "file:read";
    if (!context.HasPermission(permission)) {
      return MakeFailure(job.id(), proto::Result::PERMISSION_DENIED,
                         absl::StrCat("Missing permission ", permission));
    }
    std::string output;
    try {
      if (op.op() == proto::FileOperation::READ) {
        output = util::File::Read(path);
      } else if (op.op() == proto::FileOperation::WRITE) {
        util::File::Write(path, op.content());
      } else if (op.op() == proto::FileOperation::EXISTS) {
        output = util::File::Exists(path) ? "true" : "false";
      } else {
        return MakeFailure(job.id(), proto::Result::INVALID_JOB,
                           absl::StrCat("Unknown file operation ",
                                        static_cast<int>(op.op())));
      }
    } catch (const std::system_error& e) {
      return MakeFailure(job.id(), proto::Result::RUNTIME_FAILURE,
                         absl::StrCat(op.path(), ": ", e.what()));
    }
    result.add_outputs(output);
    result.set_output(output);
  }
  return result;
}

proto::Result JobRunner::RunApi(
    const proto::Job& job, const sandbox::ExecutionContext& context) const {
  if (!context.HasPermission("network")) {
    return MakeFailure(job.id(), proto::Result::PERMISSION_DENIED,
                       "Network access denied");
  }
  if (!api_) {
    return MakeFailure(job.id(), proto::Result::TRANSPORT_UNAVAILABLE,
                       "No API transport configured");
  }
  std::string response, error_msg;
  if (!api_->Call(job.api(), &response, &error_msg)) {
    return MakeFailure(job.id(), proto::Result::RUNTIME_FAILURE,
                       "API request failed: " + error_msg);
  }
  proto::Result result = MakeSuccess(job.id());
  result.set_output(response);
  return result;
}

proto::Result JobRunner::RunDatabase(
    const proto::Job& job, const sandbox::ExecutionContext& context) const {
  const char* permission =
      job.database().write() ? "database:write" : "database:read";
  if (!context.HasPermission(permission)) {
    return MakeFailure(job.id(), proto::Result::PERMISSION_DENIED,
                       "Database access denied");
  }
  if (!database_) {
    return MakeFailure(job.id(), proto::Result::TRANSPORT_UNAVAILABLE,
                       "No database client configured");
  }
  std::string rows, error_msg;
  if (!database_->Query(job.database(), &rows, &error_msg)) {
    return MakeFailure(job.id(), proto::Result::RUNTIME_FAILURE,
                       "Query failed: " + error_msg);
  }
  proto::Result result = MakeSuccess(job.id());
  result.set_output(rows);
  return result;
}

}  // namespace executor
