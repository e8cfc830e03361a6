#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP

#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Runs programs inside a detached container that lives as long as the
// sandbox. The workspace is bind-mounted at kWorkspace and every program is
// started with docker exec, so the process machinery of Unix applies to the
// docker client.
class Docker : public Unix {
 public:
  static const constexpr BackendType kType = BackendType::DOCKER;
  static const constexpr char* kWorkspace = "/workspace";

  BackendType Type() const override { return kType; }
  bool Setup(const SandboxConfig& config, const std::string& work_dir,
             std::string* error_msg) override;
  void PrepareEnvironment(
      const std::string& work_dir,
      std::map<std::string, std::string>* environment) const override;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  bool Teardown(std::string* error_msg) override;

  static Backend* Create() { return new Docker(); }
  // Positive only if the docker client is installed and the daemon answers.
  static int Score();

  // Arguments of the docker invocation that starts the container.
  static std::vector<std::string> BuildRunArgs(const SandboxConfig& config,
                                               const std::string& work_dir,
                                               const std::string& name);

  // Arguments of the docker invocation that runs options inside the
  // container. Paths in options are translated from work_dir to kWorkspace.
  static std::vector<std::string> BuildExecArgs(const ExecutionOptions& options,
                                                const std::string& work_dir,
                                                const std::string& name);

  // Starts the container name with docker run_args. On failure, removes
  // whatever docker left behind, returns false and sets error_msg.
  static bool StartContainer(const std::string& docker,
                             std::vector<std::string> run_args,
                             const std::string& name, std::string* error_msg);

  // Runs a program to completion, storing its combined output. Returns its
  // exit status, or -1 and sets error_msg if it could not be run.
  static int RunCommand(const std::vector<std::string>& args,
                        std::string* output, std::string* error_msg);

 protected:
  Docker() = default;
  void OnKill() override;

 private:
  std::string docker_;
  std::string container_;
};

}  // namespace sandbox
#endif
