#ifndef EXECUTOR_JOB_RUNNER_HPP
#define EXECUTOR_JOB_RUNNER_HPP

#include <string>
#include <vector>

#include "executor/collaborators.hpp"
#include "policy/policy_engine.hpp"
#include "proto/job.pb.h"
#include "proto/result.pb.h"
#include "sandbox/execution_context.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs an admitted job inside its sandbox and turns the outcome into a
// Result. The security events it produces are recorded in the policy engine
// and attached to the Result. Throws std::system_error on unexpected
// filesystem errors.
class JobRunner {
 public:
  // api and database may be null.
  JobRunner(policy::PolicyEngine* policy, ApiTransport* api,
            DatabaseClient* database, std::string script_interpreter);

  proto::Result Run(const proto::Job& job,
                    const sandbox::ExecutionContext& context,
                    sandbox::Sandbox* sandbox) const;

  JobRunner(const JobRunner&) = delete;
  JobRunner& operator=(const JobRunner&) = delete;
  JobRunner(JobRunner&&) = delete;
  JobRunner& operator=(JobRunner&&) = delete;

 private:
  proto::Result RunShell(const proto::Job& job,
                         const sandbox::ExecutionContext& context,
                         sandbox::Sandbox* sandbox) const;
  proto::Result RunScript(const proto::Job& job,
                          const sandbox::ExecutionContext& context,
                          sandbox::Sandbox* sandbox) const;
  proto::Result RunFile(const proto::Job& job,
                        const sandbox::ExecutionContext& context,
                        sandbox::Sandbox* sandbox) const;
  proto::Result RunApi(const proto::Job& job,
                       const sandbox::ExecutionContext& context) const;
  proto::Result RunDatabase(const proto::Job& job,
                            const sandbox::ExecutionContext& context) const;

  // Runs command with the shell from directory, which must be inside the
  // sandbox workspace.
  proto::Result RunCommand(const std::string& command,
                           const std::string& directory,
                           const sandbox::ExecutionContext& context,
                           sandbox::Sandbox* sandbox) const;
  // Runs executable with args from directory, and maps its outcome.
  proto::Result RunProgram(const std::string& executable,
                           const std::vector<std::string>& args,
                           const std::string& directory,
                           const sandbox::ExecutionContext& context,
                           sandbox::Sandbox* sandbox) const;

  // Resolves the job working directory inside the workspace and creates it.
  // Returns false if it escapes the workspace.
  bool WorkingDirectory(const sandbox::ExecutionContext& context,
                        const sandbox::Sandbox& sandbox,
                        std::string* directory) const;

  // Records a security event for the job and attaches it to result.
  void AddEvent(const std::string& job_id, proto::SecurityEvent::Type type,
                proto::Severity severity, const std::string& rule_id,
                const std::string& details, proto::Result* result) const;

  policy::PolicyEngine* policy_;
  ApiTransport* api_;
  DatabaseClient* database_;
  std::string script_interpreter_;
};

}  // namespace executor

#endif
