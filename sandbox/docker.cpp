#include "sandbox/docker.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <stdexcept>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/which.hpp"

extern char** environ;

namespace {

std::string ContainerPath(const std::string& path,
                          const std::string& work_dir) {
  if (path == work_dir) return sandbox::Docker::kWorkspace;
  absl::string_view rest = path;
  if (absl::ConsumePrefix(&rest, work_dir + "/")) {
    return absl::StrCat(sandbox::Docker::kWorkspace, "/", rest);
  }
  return path;
}

}  // namespace

namespace sandbox {

int Docker::Score() {
  static const int score = []() {
    std::string docker;
    try {
      docker = util::which("docker");
    } catch (const std::runtime_error& e) {
      VLOG(1) << "docker lookup: " << e.what();
      return -1;
    }
    if (docker.empty()) return -1;
    std::string output, error_msg;
    if (RunCommand({docker, "info"}, &output, &error_msg) != 0) {
      VLOG(1) << "docker is not usable: " << error_msg << output;
      return -1;
    }
    return 3;
  }();
  return score;
}

std::vector<std::string> Docker::BuildRunArgs(const SandboxConfig& config,
                                              const std::string& work_dir,
                                              const std::string& name) {
  std::vector<std::string> args = {"run", "-d", "--name=" + name,
                                   absl::StrCat("--workdir=", kWorkspace)};
  args.push_back("-v");
  args.push_back(absl::StrCat(work_dir, ":", kWorkspace, ":rw"));
  args.push_back(absl::StrCat("--memory=", config.resources.memory_mb, "m"));
  args.push_back(
      absl::StrCat("--cpus=", config.resources.cpu_percent / 100.0));
  if (config.security.no_new_privileges) {
    args.push_back("--security-opt=no-new-privileges");
  }
  for (const std::string& cap : config.security.cap_drop) {
    args.push_back("--cap-drop=" + cap);
  }
  for (const std::string& cap : config.security.cap_add) {
    args.push_back("--cap-add=" + cap);
  }
  for (const auto& var : config.environment) {
    args.push_back("-e");
    args.push_back(var.first + "=" + var.second);
  }
  if (!config.resources.network_enabled) args.push_back("--network=none");
  if (config.security.read_only_root) args.push_back("--read-only");
  for (const Mount& mount : config.mounts) {
    args.push_back("-v");
    args.push_back(absl::StrCat(mount.source, ":", mount.target,
                                mount.read_only ? ":ro" : ":rw"));
  }
  args.push_back(config.image);
  args.push_back("sleep");
  args.push_back("infinity");
  return args;
}

std::vector<std::string> Docker::BuildExecArgs(const ExecutionOptions& options,
                                               const std::string& work_dir,
                                               const std::string& name) {
  std::vector<std::string> args = {"exec", "-w",
                                   ContainerPath(options.root, work_dir)};
  for (const auto& var : options.environment) {
    args.push_back("-e");
    args.push_back(var.first + "=" + var.second);
  }
  args.push_back(name);
  args.push_back(options.executable);
  for (const std::string& arg : options.args) args.push_back(arg);
  return args;
}

int Docker::RunCommand(const std::vector<std::string>& args,
                       std::string* output, std::string* error_msg) {
  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
    *error_msg = absl::StrCat("pipe2: ", strerror(errno));
    return -1;
  }
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  posix_spawn_file_actions_init(&actions);
  posix_spawnattr_init(&attr);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
  sigset_t empty_set;
  sigemptyset(&empty_set);
  posix_spawnattr_setsigmask(&attr, &empty_set);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);

  std::vector<std::vector<char>> arg_storage;
  for (const std::string& arg : args) {
    arg_storage.emplace_back(arg.begin(), arg.end());
    arg_storage.back().push_back('\0');
  }
  std::vector<char*> arg_list;
  for (std::vector<char>& arg : arg_storage) arg_list.push_back(arg.data());
  arg_list.push_back(nullptr);

  pid_t child_pid = 0;
  int ret = posix_spawn(&child_pid, arg_list[0], &actions, &attr,
                        arg_list.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  close(pipe_fds[1]);
  if (ret != 0) {
    close(pipe_fds[0]);
    *error_msg = absl::StrCat("posix_spawn ", args[0], ": ", strerror(ret));
    return -1;
  }
  char buf[4096];
  ssize_t amount;
  while ((amount = read(pipe_fds[0], buf, sizeof(buf))) != 0) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    output->append(buf, amount);
  }
  close(pipe_fds[0]);
  int child_status = 0;
  while (waitpid(child_pid, &child_status, 0) == -1) {
    if (errno != EINTR) {
      *error_msg = absl::StrCat("waitpid: ", strerror(errno));
      return -1;
    }
  }
  if (!WIFEXITED(child_status)) {
    *error_msg = absl::StrCat(args[0], " killed by signal ",
                              WTERMSIG(child_status));
    return -1;
  }
  return WEXITSTATUS(child_status);
}

bool Docker::StartContainer(const std::string& docker,
                            std::vector<std::string> run_args,
                            const std::string& name, std::string* error_msg) {
  run_args.insert(run_args.begin(), docker);
  std::string output;
  int status = RunCommand(run_args, &output, error_msg);
  if (status == 0) return true;
  if (status > 0) *error_msg = "docker run: " + output;
  // docker run may fail after creating the container.
  std::string rm_output, rm_error;
  if (RunCommand({docker, "rm", "-f", name}, &rm_output, &rm_error) != 0) {
    LOG(WARNING) << "docker rm " << name << ": " << rm_error << rm_output;
  }
  return false;
}

bool Docker::Setup(const SandboxConfig& config, const std::string& work_dir,
                   std::string* error_msg) {
  if (!Unix::Setup(config, work_dir, error_msg)) return false;
  try {
    docker_ = util::which("docker");
  } catch (const std::runtime_error& e) {
    *error_msg = e.what();
    return false;
  }
  if (docker_.empty()) {
    *error_msg = "docker not found";
    return false;
  }
  if (config.image.empty()) {
    *error_msg = "no container image configured";
    return false;
  }
  std::string name = "bruno-" + config.id;
  if (!StartContainer(docker_, BuildRunArgs(config, work_dir, name), name,
                      error_msg)) {
    return false;
  }
  container_ = name;
  LOG(INFO) << "Started container " << container_ << " from "
            << config.image;
  return true;
}

void Docker::PrepareEnvironment(
    const std::string& work_dir,
    std::map<std::string, std::string>* environment) const {
  (*environment)["HOME"] = kWorkspace;
  (*environment)["TMPDIR"] = "/tmp";
}

bool Docker::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                     std::string* error_msg) {
  if (container_.empty()) {
    *error_msg = "container not running";
    return false;
  }
  ExecutionOptions client(work_dir_, docker_);
  client.args = BuildExecArgs(options, work_dir_, container_);
  client.stdin_file = options.stdin_file;
  client.stdout_file = options.stdout_file;
  client.stderr_file = options.stderr_file;
  client.wall_limit_millis = options.wall_limit_millis;
  // Memory and disk are limited by the container.
  const char* path = getenv("PATH");
  client.environment["PATH"] = path ? path : "/usr/local/bin:/usr/bin:/bin";
  const char* home = getenv("HOME");
  if (home) client.environment["HOME"] = home;
  const char* docker_host = getenv("DOCKER_HOST");
  if (docker_host) client.environment["DOCKER_HOST"] = docker_host;
  return Unix::Execute(client, info, error_msg);
}

void Docker::OnKill() {
  // Killing the client does not stop the program inside the container.
  std::string output, error_msg;
  if (RunCommand({docker_, "kill", container_}, &output, &error_msg) != 0) {
    LOG(WARNING) << "docker kill " << container_ << ": " << error_msg
                 << output;
  }
}

bool Docker::Teardown(std::string* error_msg) {
  if (container_.empty()) return true;
  std::string output;
  int status = RunCommand({docker_, "rm", "-f", container_}, &output,
                          error_msg);
  if (status != 0) {
    if (status > 0) *error_msg = "docker rm: " + output;
    return false;
  }
  container_.clear();
  return true;
}

}  // namespace sandbox
